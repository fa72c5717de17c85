#include "secfile/detail/sector_device.hpp"
#include "boost-unit-test.hpp"

#include <algorithm>
#include <limits>

#include "memfs.hpp"
#include "mocks.hpp"
#include "test-utils.hpp"

using namespace secfile;
using namespace secfile::detail;

namespace
{
constexpr std::size_t test_sector_size = 64;
constexpr auto test_file_name = "sector-file";

struct sector_device_fixture
{
    crypto::crypto_provider *provider
            = crypto::openssl_aes_256_gcm_crypto_provider();
    std::shared_ptr<tests::memory_filesystem> fs
            = tests::memory_filesystem::create();
    test_rng rng;
    raw_key realKey;
    file_header header{};
    std::unique_ptr<sector_device> device;

    sector_device_fixture()
    {
        rng.fill(as_span(realKey));
        rng.fill(header.salt);

        auto filerx = fs->open(test_file_name, file_open_mode::readwrite
                                                       | file_open_mode::create);
        BOOST_TEST_REQUIRE(filerx.has_value());
        auto storage = std::move(filerx).assume_value();
        BOOST_TEST_REQUIRE(write_header(*storage, header).has_value());

        auto devicerx = sector_device::create(
                std::move(storage),
                sector_cipher{*provider, realKey, header.salt},
                test_sector_size);
        BOOST_TEST_REQUIRE(devicerx.has_value());
        device = std::move(devicerx).assume_value();
    }
};
} // namespace

BOOST_FIXTURE_TEST_SUITE(sector_device_tests, sector_device_fixture)

BOOST_AUTO_TEST_CASE(sector_layout)
{
    BOOST_TEST(device->sector_size() == test_sector_size);
    BOOST_TEST(device->sealed_sector_size() == test_sector_size + tag_size);

    auto offsetrx = device->physical_offset(0);
    TEST_RESULT_REQUIRE(offsetrx);
    BOOST_TEST(offsetrx.assume_value() == header_size);

    offsetrx = device->physical_offset(3);
    TEST_RESULT_REQUIRE(offsetrx);
    BOOST_TEST(offsetrx.assume_value() == header_size + 3 * (64 + 16));

    offsetrx = device->physical_offset(std::numeric_limits<std::uint64_t>::max());
    BOOST_TEST_REQUIRE(offsetrx.has_error());
    BOOST_TEST(offsetrx.assume_error() == errc::result_out_of_range);
}

BOOST_AUTO_TEST_CASE(write_read_sector)
{
    auto const data = secfile_tests::random_bytes(rng, test_sector_size);
    TEST_RESULT_REQUIRE(device->write_sector(0, data));

    auto const stored = fs->contents(test_file_name);
    BOOST_TEST(stored.size() == header_size + test_sector_size + tag_size);
    // the plaintext doesn't show up on the storage
    BOOST_TEST(!std::ranges::equal(
            std::span{stored}.subspan(header_size, test_sector_size), data));

    std::vector<std::byte> readBack(test_sector_size);
    TEST_RESULT_REQUIRE(device->read_sector(0, readBack));
    BOOST_TEST(std::ranges::equal(readBack, data));
}

BOOST_AUTO_TEST_CASE(equal_sectors_have_equal_ciphertexts)
{
    // every sector is sealed with the same nonce
    auto const data = secfile_tests::random_bytes(rng, test_sector_size);
    TEST_RESULT_REQUIRE(device->write_sector(0, data));
    TEST_RESULT_REQUIRE(device->write_sector(1, data));

    auto const stored = fs->contents(test_file_name);
    auto const sealedSize = test_sector_size + tag_size;
    BOOST_TEST(std::ranges::equal(
            std::span{stored}.subspan(header_size, sealedSize),
            std::span{stored}.subspan(header_size + sealedSize, sealedSize)));
}

BOOST_AUTO_TEST_CASE(sector_count_follows_the_storage_size)
{
    auto countrx = device->sector_count();
    TEST_RESULT_REQUIRE(countrx);
    BOOST_TEST(countrx.assume_value() == 0u);

    auto const data = secfile_tests::random_bytes(rng, test_sector_size);
    TEST_RESULT_REQUIRE(device->write_sector(4, data));

    countrx = device->sector_count();
    TEST_RESULT_REQUIRE(countrx);
    BOOST_TEST(countrx.assume_value() == 5u);

    // a trailing partial sector isn't counted
    TEST_RESULT_REQUIRE(device->storage().resize(header_size + 5 * 80 + 10));
    countrx = device->sector_count();
    TEST_RESULT_REQUIRE(countrx);
    BOOST_TEST(countrx.assume_value() == 5u);
}

BOOST_AUTO_TEST_CASE(read_beyond_the_end_fails)
{
    std::vector<std::byte> readBack(test_sector_size);
    auto readrx = device->read_sector(0, readBack);
    BOOST_TEST_REQUIRE(readrx.has_error());
    BOOST_TEST(readrx.assume_error() == secfile_errc::sector_not_found);

    auto const *index = readrx.assume_error().detail<ed::sector_index>();
    BOOST_TEST_REQUIRE(index != nullptr);
    BOOST_TEST(*index == 0u);
}

BOOST_AUTO_TEST_CASE(read_of_a_hole_fails_authentication)
{
    auto const data = secfile_tests::random_bytes(rng, test_sector_size);
    TEST_RESULT_REQUIRE(device->write_sector(2, data));

    std::vector<std::byte> readBack(test_sector_size, std::byte{0x11});
    auto readrx = device->read_sector(1, readBack);
    BOOST_TEST_REQUIRE(readrx.has_error());
    BOOST_TEST(readrx.assume_error() == secfile_errc::tag_mismatch);
    BOOST_TEST(secfile_tests::is_zero(readBack));
}

BOOST_AUTO_TEST_CASE(tampered_sector_fails_authentication)
{
    auto const data = secfile_tests::random_bytes(rng, test_sector_size);
    TEST_RESULT_REQUIRE(device->write_sector(0, data));

    {
        auto holder = fs->find(test_file_name);
        std::lock_guard lock{holder->sync};
        holder->content[header_size + 5] ^= std::byte{0x04};
    }

    std::vector<std::byte> readBack(test_sector_size);
    auto readrx = device->read_sector(0, readBack);
    BOOST_TEST_REQUIRE(readrx.has_error());
    BOOST_TEST(readrx.assume_error() == secfile_errc::tag_mismatch);
}

BOOST_AUTO_TEST_CASE(wrong_buffer_sizes_are_rejected)
{
    auto const data = secfile_tests::random_bytes(rng, test_sector_size - 1);
    auto writerx = device->write_sector(0, data);
    BOOST_TEST_REQUIRE(writerx.has_error());
    BOOST_TEST(writerx.assume_error() == errc::invalid_argument);

    std::vector<std::byte> readBack(test_sector_size + 1);
    auto readrx = device->read_sector(0, readBack);
    BOOST_TEST_REQUIRE(readrx.has_error());
    BOOST_TEST(readrx.assume_error() == errc::invalid_argument);
}

BOOST_AUTO_TEST_CASE(zero_sector_overwrites_with_random_bytes)
{
    using testing::_;

    auto const data = secfile_tests::random_bytes(rng, test_sector_size);
    TEST_RESULT_REQUIRE(device->write_sector(0, data));
    TEST_RESULT_REQUIRE(device->write_sector(1, data));

    crypto_provider_mock randomSource;
    EXPECT_CALL(randomSource, random_bytes(_))
            .WillOnce([](rw_dynblob out) -> result<void> {
                fill_blob(out, std::byte{0xab});
                return success();
            });

    TEST_RESULT_REQUIRE(device->zero_sector(0, randomSource));

    auto const stored = fs->contents(test_file_name);
    auto const sealedSize = test_sector_size + tag_size;
    BOOST_TEST(stored.size() == header_size + 2 * sealedSize);
    BOOST_TEST(std::ranges::all_of(
            std::span{stored}.subspan(header_size, sealedSize),
            [](std::byte b) { return b == std::byte{0xab}; }));

    std::vector<std::byte> readBack(test_sector_size);
    auto readrx = device->read_sector(0, readBack);
    BOOST_TEST_REQUIRE(readrx.has_error());
    BOOST_TEST(readrx.assume_error() == secfile_errc::tag_mismatch);

    // the neighbour is untouched
    TEST_RESULT_REQUIRE(device->read_sector(1, readBack));
    BOOST_TEST(std::ranges::equal(readBack, data));
}

BOOST_AUTO_TEST_CASE(zero_sector_propagates_random_failures)
{
    using testing::_;
    using testing::Return;

    crypto_provider_mock randomSource;
    EXPECT_CALL(randomSource, random_bytes(_))
            .WillOnce(Return(result<void>{errc::bad}));

    auto zerorx = device->zero_sector(0, randomSource);
    BOOST_TEST_REQUIRE(zerorx.has_error());
    BOOST_TEST(zerorx.assume_error() == errc::bad);
    BOOST_TEST(fs->contents(test_file_name).size() == header_size);
}

BOOST_AUTO_TEST_SUITE_END()
