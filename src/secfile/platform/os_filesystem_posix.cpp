#include "os_filesystem.hpp"

#include <cerrno>

#include <algorithm>
#include <limits>
#include <new>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace secfile
{
auto os_filesystem() -> filesystem::ptr
{
    return std::make_shared<detail::os_filesystem>();
}
} // namespace secfile

namespace secfile::detail
{
namespace
{
constexpr mode_t file_permissions = S_IRUSR | S_IWUSR;

constexpr std::size_t max_io_portion
        = static_cast<std::size_t>(std::numeric_limits<ssize_t>::max());

auto to_native_path(std::string_view filePath) noexcept -> result<std::string>
{
    try
    {
        return std::string{filePath};
    }
    catch (std::bad_alloc const &)
    {
        return errc::not_enough_memory;
    }
}

auto derive_open_flags(file_open_mode_bitset mode) noexcept -> int
{
    int flags = O_CLOEXEC;
    if (mode % file_open_mode::readwrite)
    {
        flags |= O_RDWR;
    }
    else if (mode % file_open_mode::write)
    {
        flags |= O_WRONLY;
    }
    else
    {
        flags |= O_RDONLY;
    }
    if (mode % file_open_mode::append)
    {
        flags |= O_APPEND;
    }
    if (mode % file_open_mode::create)
    {
        flags |= O_CREAT | O_EXCL;
    }
    return flags;
}
} // namespace

os_file::os_file(os_handle fileHandle) noexcept
    : mFile(fileHandle)
{
}

os_file::~os_file()
{
    if (mFile != -1)
    {
        ::close(mFile);
    }
}

auto os_file::seek(std::uint64_t position) noexcept -> result<void>
{
    using namespace std::string_view_literals;

    if (position > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max()))
    {
        return errc::result_out_of_range
               << ed::error_code_api_origin{"lseek"sv};
    }
    if (::lseek(mFile, static_cast<off_t>(position), SEEK_SET) == -1)
    {
        return error{collect_system_error()}
               << ed::error_code_api_origin{"lseek"sv};
    }
    return success();
}

auto os_file::read(rw_dynblob buffer) noexcept -> result<std::size_t>
{
    using namespace std::string_view_literals;

    std::size_t bytesRead = 0;
    while (!buffer.empty())
    {
        auto const portion = std::min(max_io_portion, buffer.size());
        ssize_t const readResult = ::read(mFile, buffer.data(), portion);
        if (readResult == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return error{collect_system_error()}
                   << ed::error_code_api_origin{"read"sv};
        }
        if (readResult == 0)
        {
            break;
        }
        bytesRead += static_cast<std::size_t>(readResult);
        buffer = buffer.subspan(static_cast<std::size_t>(readResult));
    }
    return bytesRead;
}

auto os_file::write(ro_dynblob data) noexcept -> result<void>
{
    using namespace std::string_view_literals;

    while (!data.empty())
    {
        auto const portion = std::min(max_io_portion, data.size());
        ssize_t const writeResult = ::write(mFile, data.data(), portion);
        if (writeResult == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return error{collect_system_error()}
                   << ed::error_code_api_origin{"write"sv};
        }
        if (writeResult == 0)
        {
            return errc::bad << ed::error_code_api_origin{"write"sv};
        }
        data = data.subspan(static_cast<std::size_t>(writeResult));
    }
    return success();
}

auto os_file::sync() noexcept -> result<void>
{
    using namespace std::string_view_literals;

    if (::fsync(mFile) == -1)
    {
        return error{collect_system_error()}
               << ed::error_code_api_origin{"fsync"sv};
    }
    return success();
}

auto os_file::size() noexcept -> result<std::uint64_t>
{
    using namespace std::string_view_literals;

    struct ::stat status
    {
    };
    if (::fstat(mFile, &status) == -1)
    {
        return error{collect_system_error()}
               << ed::error_code_api_origin{"fstat"sv};
    }
    return static_cast<std::uint64_t>(status.st_size);
}

auto os_file::resize(std::uint64_t newSize) noexcept -> result<void>
{
    using namespace std::string_view_literals;

    if (newSize > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max()))
    {
        return errc::result_out_of_range
               << ed::error_code_api_origin{"ftruncate"sv};
    }
    if (::ftruncate(mFile, static_cast<off_t>(newSize)) == -1)
    {
        return error{collect_system_error()}
               << ed::error_code_api_origin{"ftruncate"sv};
    }
    return success();
}

auto os_file::close() noexcept -> result<void>
{
    using namespace std::string_view_literals;

    if (mFile == -1)
    {
        return success();
    }
    auto const handle = std::exchange(mFile, -1);
    if (::close(handle) == -1)
    {
        return error{collect_system_error()}
               << ed::error_code_api_origin{"close"sv};
    }
    return success();
}

auto os_filesystem::open(std::string_view filePath,
                         file_open_mode_bitset mode) noexcept
        -> result<file::ptr>
{
    using namespace std::string_view_literals;

    SECFILE_TRY(nativePath, to_native_path(filePath));

    os_handle const handle
            = ::open(nativePath.c_str(), derive_open_flags(mode),
                     file_permissions);
    if (handle == -1)
    {
        return error{collect_system_error()}
               << ed::error_code_api_origin{"open"sv}
               << ed::io_file{std::move(nativePath)};
    }

    try
    {
        return std::make_shared<os_file>(handle);
    }
    catch (std::bad_alloc const &)
    {
        ::close(handle);
        return errc::not_enough_memory;
    }
}

auto os_filesystem::remove(std::string_view filePath) noexcept -> result<void>
{
    using namespace std::string_view_literals;

    SECFILE_TRY(nativePath, to_native_path(filePath));

    if (::unlink(nativePath.c_str()) == -1)
    {
        return error{collect_system_error()}
               << ed::error_code_api_origin{"unlink"sv}
               << ed::io_file{std::move(nativePath)};
    }
    return success();
}

auto os_filesystem::exists(std::string_view filePath) noexcept -> result<bool>
{
    using namespace std::string_view_literals;

    SECFILE_TRY(nativePath, to_native_path(filePath));

    struct ::stat status
    {
    };
    if (::stat(nativePath.c_str(), &status) == 0)
    {
        return true;
    }
    if (errno == ENOENT || errno == ENOTDIR)
    {
        return false;
    }
    return error{collect_system_error()}
           << ed::error_code_api_origin{"stat"sv}
           << ed::io_file{std::move(nativePath)};
}
} // namespace secfile::detail
