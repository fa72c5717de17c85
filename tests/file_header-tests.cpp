#include "secfile/detail/file_header.hpp"
#include "boost-unit-test.hpp"

#include <algorithm>
#include <string_view>

#include "memfs.hpp"
#include "test-utils.hpp"

using namespace secfile;
using namespace secfile::detail;
using namespace std::string_view_literals;

namespace
{
struct file_header_fixture
{
    crypto::crypto_provider *provider
            = crypto::openssl_aes_256_gcm_crypto_provider();
    std::shared_ptr<tests::memory_filesystem> fs
            = tests::memory_filesystem::create();
    test_rng rng;

    auto create_storage() -> file::ptr
    {
        auto filerx = fs->open("header-file",
                               file_open_mode::readwrite
                                       | file_open_mode::create);
        BOOST_TEST_REQUIRE(filerx.has_value());
        return std::move(filerx).assume_value();
    }
};
} // namespace

BOOST_FIXTURE_TEST_SUITE(file_header_tests, file_header_fixture)

BOOST_AUTO_TEST_CASE(key_material_consists_of_key_and_salt_prefix)
{
    std::array<std::byte, aead_key_size> key{};
    std::array<std::byte, salt_size> salt{};
    rng.fill(key);
    rng.fill(salt);

    auto const material = make_key_material(key, salt);
    auto const view = as_span(material);
    BOOST_TEST(std::ranges::equal(view.first<aead_key_size>(), key));
    BOOST_TEST(std::ranges::equal(view.subspan<aead_key_size>(),
                                  std::span{salt}.first<aead_nonce_size>()));
}

BOOST_AUTO_TEST_CASE(raw_key_sized_passphrases_are_used_directly)
{
    auto const passphrase = secfile_tests::random_bytes(rng, raw_key_size);
    std::array<std::byte, salt_size> salt{};

    auto keyrx = derive_wrapping_key(passphrase, salt, secfile_tests::fast_kdf);
    TEST_RESULT_REQUIRE(keyrx);
    BOOST_TEST(std::ranges::equal(as_span(keyrx.assume_value()), passphrase));
}

BOOST_AUTO_TEST_CASE(derivation_is_deterministic)
{
    std::array<std::byte, salt_size> salt{};
    rng.fill(salt);

    auto firstrx = derive_wrapping_key(as_blob("my passphrase"sv), salt,
                                       secfile_tests::fast_kdf);
    auto secondrx = derive_wrapping_key(as_blob("my passphrase"sv), salt,
                                        secfile_tests::fast_kdf);
    TEST_RESULT_REQUIRE(firstrx);
    TEST_RESULT_REQUIRE(secondrx);
    BOOST_TEST(std::ranges::equal(as_span(firstrx.assume_value()),
                                  as_span(secondrx.assume_value())));

    salt[0] ^= std::byte{0xff};
    auto thirdrx = derive_wrapping_key(as_blob("my passphrase"sv), salt,
                                       secfile_tests::fast_kdf);
    TEST_RESULT_REQUIRE(thirdrx);
    BOOST_TEST(!std::ranges::equal(as_span(firstrx.assume_value()),
                                   as_span(thirdrx.assume_value())));
}

BOOST_AUTO_TEST_CASE(unwrap_reverses_wrap)
{
    raw_key wrappingKey;
    raw_key realKey;
    std::array<std::byte, salt_size> salt{};
    rng.fill(as_span(wrappingKey));
    rng.fill(as_span(realKey));
    rng.fill(salt);

    std::array<std::byte, wrapped_key_size> wrapped{};
    TEST_RESULT_REQUIRE(
            wrap_key(*provider, wrappingKey, salt, realKey, wrapped));
    BOOST_TEST(!std::ranges::equal(std::span{wrapped}.first<raw_key_size>(),
                                   as_span(realKey)));

    auto unwrappedrx = unwrap_key(*provider, wrappingKey, salt, wrapped);
    TEST_RESULT_REQUIRE(unwrappedrx);
    BOOST_TEST(std::ranges::equal(as_span(unwrappedrx.assume_value()),
                                  as_span(realKey)));
}

BOOST_AUTO_TEST_CASE(unwrap_with_wrong_key_fails)
{
    raw_key wrappingKey;
    raw_key realKey;
    std::array<std::byte, salt_size> salt{};
    rng.fill(as_span(wrappingKey));
    rng.fill(as_span(realKey));
    rng.fill(salt);

    std::array<std::byte, wrapped_key_size> wrapped{};
    TEST_RESULT_REQUIRE(
            wrap_key(*provider, wrappingKey, salt, realKey, wrapped));

    // only the first half of the wrapping key is used as AEAD key
    as_span(wrappingKey)[3] ^= std::byte{0x10};
    auto unwrappedrx = unwrap_key(*provider, wrappingKey, salt, wrapped);
    BOOST_TEST_REQUIRE(unwrappedrx.has_error());
    BOOST_TEST(unwrappedrx.assume_error() == secfile_errc::wrong_passphrase);
}

BOOST_AUTO_TEST_CASE(generated_header_unwraps_with_its_passphrase)
{
    raw_key realKey;
    auto headerrx = generate_header(*provider, as_blob("open sesame"sv),
                                    secfile_tests::fast_kdf, realKey);
    TEST_RESULT_REQUIRE(headerrx);
    auto const &header = headerrx.assume_value();

    auto wrappingKeyrx = derive_wrapping_key(as_blob("open sesame"sv),
                                             header.salt,
                                             secfile_tests::fast_kdf);
    TEST_RESULT_REQUIRE(wrappingKeyrx);
    auto unwrappedrx = unwrap_key(*provider, wrappingKeyrx.assume_value(),
                                  header.salt, header.wrappedKey);
    TEST_RESULT_REQUIRE(unwrappedrx);
    BOOST_TEST(std::ranges::equal(as_span(unwrappedrx.assume_value()),
                                  as_span(realKey)));

    auto wrongKeyrx = derive_wrapping_key(as_blob("open sesamf"sv),
                                          header.salt,
                                          secfile_tests::fast_kdf);
    TEST_RESULT_REQUIRE(wrongKeyrx);
    auto wrongrx = unwrap_key(*provider, wrongKeyrx.assume_value(),
                              header.salt, header.wrappedKey);
    BOOST_TEST_REQUIRE(wrongrx.has_error());
    BOOST_TEST(wrongrx.assume_error() == secfile_errc::wrong_passphrase);
}

BOOST_AUTO_TEST_CASE(rekey_keeps_salt_and_real_key)
{
    raw_key realKey;
    auto headerrx = generate_header(*provider, as_blob("old"sv),
                                    secfile_tests::fast_kdf, realKey);
    TEST_RESULT_REQUIRE(headerrx);

    auto rekeyedrx = rekey_header(*provider, headerrx.assume_value(),
                                  realKey, as_blob("new"sv),
                                  secfile_tests::fast_kdf);
    TEST_RESULT_REQUIRE(rekeyedrx);
    auto const &rekeyed = rekeyedrx.assume_value();
    BOOST_TEST(std::ranges::equal(rekeyed.salt, headerrx.assume_value().salt));
    BOOST_TEST(!std::ranges::equal(rekeyed.wrappedKey,
                                   headerrx.assume_value().wrappedKey));

    auto wrappingKeyrx = derive_wrapping_key(as_blob("new"sv), rekeyed.salt,
                                             secfile_tests::fast_kdf);
    TEST_RESULT_REQUIRE(wrappingKeyrx);
    auto unwrappedrx = unwrap_key(*provider, wrappingKeyrx.assume_value(),
                                  rekeyed.salt, rekeyed.wrappedKey);
    TEST_RESULT_REQUIRE(unwrappedrx);
    BOOST_TEST(std::ranges::equal(as_span(unwrappedrx.assume_value()),
                                  as_span(realKey)));
}

BOOST_AUTO_TEST_CASE(header_write_read)
{
    file_header header{};
    rng.fill(header.salt);
    rng.fill(header.wrappedKey);

    auto storage = create_storage();
    TEST_RESULT_REQUIRE(write_header(*storage, header));
    BOOST_TEST(fs->contents("header-file").size() == header_size);

    auto const stored = fs->contents("header-file");
    BOOST_TEST(std::ranges::equal(std::span{stored}.first(salt_size),
                                  header.salt));
    BOOST_TEST(std::ranges::equal(std::span{stored}.subspan(salt_size),
                                  header.wrappedKey));

    auto readrx = read_header(*storage);
    TEST_RESULT_REQUIRE(readrx);
    BOOST_TEST(std::ranges::equal(readrx.assume_value().salt, header.salt));
    BOOST_TEST(std::ranges::equal(readrx.assume_value().wrappedKey,
                                  header.wrappedKey));
}

BOOST_AUTO_TEST_CASE(short_header_is_reported_as_wrong_passphrase)
{
    auto storage = create_storage();
    auto const partial = secfile_tests::random_bytes(rng, header_size - 1);
    TEST_RESULT_REQUIRE(storage->write(partial));

    auto readrx = read_header(*storage);
    BOOST_TEST_REQUIRE(readrx.has_error());
    BOOST_TEST(readrx.assume_error() == secfile_errc::wrong_passphrase);
    auto const *area = readrx.assume_error().detail<ed::io_area>();
    BOOST_TEST_REQUIRE(area != nullptr);
    BOOST_TEST(area->end == header_size - 1);
}

BOOST_AUTO_TEST_SUITE_END()
