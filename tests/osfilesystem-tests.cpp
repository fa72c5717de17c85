#include <secfile/filesystem.hpp>
#include "boost-unit-test.hpp"

#include <cerrno>

#include <algorithm>
#include <span>
#include <vector>

#include "test-utils.hpp"

using namespace secfile;
using namespace std::string_view_literals;

namespace
{
struct scratch_file_fixture
{
    static constexpr auto fileName = "./osfs_test_file.xx"sv;

    filesystem::ptr fs = os_filesystem();

    scratch_file_fixture()
    {
        cleanup();
    }
    ~scratch_file_fixture()
    {
        cleanup();
    }

    void cleanup()
    {
        if (auto existsrx = fs->exists(fileName);
            existsrx.has_value() && existsrx.assume_value())
        {
            (void)fs->remove(fileName);
        }
    }
};
} // namespace

BOOST_FIXTURE_TEST_SUITE(osfs, scratch_file_fixture)

BOOST_AUTO_TEST_CASE(instantiation)
{
    BOOST_TEST(fs.get() != nullptr);
}

BOOST_AUTO_TEST_CASE(create_delete_file)
{
    BOOST_TEST_PASSPOINT();
    auto cfilerx = fs->open(
            fileName, file_open_mode::readwrite | file_open_mode::create);
    TEST_RESULT_REQUIRE(cfilerx);
    TEST_RESULT(cfilerx.assume_value()->close());

    auto existsrx = fs->exists(fileName);
    TEST_RESULT_REQUIRE(existsrx);
    BOOST_TEST(existsrx.assume_value());

    BOOST_TEST_CHECKPOINT("creation succeeded; trying to open the file.");
    auto ofilerx = fs->open(fileName, file_open_mode::read);
    TEST_RESULT_REQUIRE(ofilerx);
    TEST_RESULT(ofilerx.assume_value()->close());

    BOOST_TEST_CHECKPOINT("trying to delete the file");
    TEST_RESULT_REQUIRE(fs->remove(fileName));

    existsrx = fs->exists(fileName);
    TEST_RESULT_REQUIRE(existsrx);
    BOOST_TEST(!existsrx.assume_value());
}

BOOST_AUTO_TEST_CASE(exclusive_create_fails_on_existing_file)
{
    auto cfilerx = fs->open(
            fileName, file_open_mode::readwrite | file_open_mode::create);
    TEST_RESULT_REQUIRE(cfilerx);

    auto secondrx = fs->open(
            fileName, file_open_mode::readwrite | file_open_mode::create);
    BOOST_TEST_REQUIRE(secondrx.has_error());
    BOOST_TEST(secondrx.assume_error().code()
               == static_cast<secfile::error_code>(EEXIST));
    BOOST_TEST(secondrx.assume_error().detail<ed::io_file>() != nullptr);
}

BOOST_AUTO_TEST_CASE(open_missing_file_fails)
{
    auto ofilerx = fs->open(fileName, file_open_mode::read);
    BOOST_TEST_REQUIRE(ofilerx.has_error());
    BOOST_TEST(ofilerx.assume_error().code()
               == static_cast<secfile::error_code>(ENOENT));

    auto removerx = fs->remove(fileName);
    BOOST_TEST_REQUIRE(removerx.has_error());
    BOOST_TEST(removerx.assume_error().code()
               == static_cast<secfile::error_code>(ENOENT));
}

BOOST_AUTO_TEST_CASE(sync_read_write)
{
    auto const data = as_blob("some more string data right into memory..."sv);
    constexpr std::uint64_t offset = 55;

    BOOST_TEST_PASSPOINT();
    auto cfilerx = fs->open(
            fileName, file_open_mode::readwrite | file_open_mode::create);
    TEST_RESULT_REQUIRE(cfilerx);
    auto cfile = std::move(cfilerx).assume_value();

    BOOST_TEST_CHECKPOINT("trying to write some part of the file.");
    TEST_RESULT_REQUIRE(cfile->seek(offset));
    TEST_RESULT_REQUIRE(cfile->write(data));
    TEST_RESULT_REQUIRE(cfile->sync());
    auto sizerx = cfile->size();
    TEST_RESULT_REQUIRE(sizerx);
    BOOST_TEST(sizerx.assume_value() == offset + data.size());
    TEST_RESULT(cfile->close());

    BOOST_TEST_CHECKPOINT("creation succeeded; trying to open the file.");
    auto ofilerx = fs->open(fileName, file_open_mode::read);
    TEST_RESULT_REQUIRE(ofilerx);
    auto ofile = std::move(ofilerx).assume_value();

    // the read is truncated at the end of the file
    std::vector<std::byte> readBack(data.size() + 16);
    TEST_RESULT_REQUIRE(ofile->seek(offset));
    auto readrx = ofile->read(readBack);
    TEST_RESULT_REQUIRE(readrx);
    BOOST_TEST(readrx.assume_value() == data.size());
    BOOST_TEST(std::ranges::equal(std::span(readBack).first(data.size()),
                                  data));

    // the gap before the written data reads as zeros
    std::vector<std::byte> gap(offset);
    TEST_RESULT_REQUIRE(ofile->seek(0));
    readrx = ofile->read(gap);
    TEST_RESULT_REQUIRE(readrx);
    BOOST_TEST(readrx.assume_value() == offset);
    BOOST_TEST(secfile_tests::is_zero(gap));
    TEST_RESULT(ofile->close());
}

BOOST_AUTO_TEST_CASE(append_mode_writes_at_the_end)
{
    auto const head = as_blob("head"sv);
    auto const tail = as_blob("tail"sv);
    {
        auto cfilerx = fs->open(
                fileName, file_open_mode::write | file_open_mode::create);
        TEST_RESULT_REQUIRE(cfilerx);
        TEST_RESULT_REQUIRE(cfilerx.assume_value()->write(head));
        TEST_RESULT(cfilerx.assume_value()->close());
    }

    auto afilerx = fs->open(
            fileName, file_open_mode::readwrite | file_open_mode::append);
    TEST_RESULT_REQUIRE(afilerx);
    auto afile = std::move(afilerx).assume_value();
    TEST_RESULT_REQUIRE(afile->seek(0));
    TEST_RESULT_REQUIRE(afile->write(tail));

    std::vector<std::byte> content(head.size() + tail.size());
    TEST_RESULT_REQUIRE(afile->seek(0));
    auto readrx = afile->read(content);
    TEST_RESULT_REQUIRE(readrx);
    BOOST_TEST(readrx.assume_value() == content.size());
    BOOST_TEST(std::ranges::equal(as_blob("headtail"sv), content));
}

BOOST_AUTO_TEST_CASE(resize_changes_the_size)
{
    auto cfilerx = fs->open(
            fileName, file_open_mode::readwrite | file_open_mode::create);
    TEST_RESULT_REQUIRE(cfilerx);
    auto cfile = std::move(cfilerx).assume_value();

    TEST_RESULT_REQUIRE(cfile->resize(4096));
    auto sizerx = cfile->size();
    TEST_RESULT_REQUIRE(sizerx);
    BOOST_TEST(sizerx.assume_value() == 4096u);

    TEST_RESULT_REQUIRE(cfile->resize(0));
    sizerx = cfile->size();
    TEST_RESULT_REQUIRE(sizerx);
    BOOST_TEST(sizerx.assume_value() == 0u);
}

BOOST_AUTO_TEST_CASE(operations_on_a_closed_file_fail)
{
    auto cfilerx = fs->open(
            fileName, file_open_mode::readwrite | file_open_mode::create);
    TEST_RESULT_REQUIRE(cfilerx);
    auto cfile = std::move(cfilerx).assume_value();
    TEST_RESULT_REQUIRE(cfile->close());
    // closing twice is harmless
    TEST_RESULT(cfile->close());

    std::vector<std::byte> buffer(8);
    BOOST_TEST(cfile->read(buffer).has_error());
    BOOST_TEST(cfile->write(buffer).has_error());
}

BOOST_AUTO_TEST_SUITE_END()
