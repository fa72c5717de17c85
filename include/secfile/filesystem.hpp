#pragma once

#include <cstddef>
#include <cstdint>

#include <memory>
#include <string_view>
#include <type_traits>

#include <secfile/disappointment.hpp>
#include <secfile/span.hpp>
#include <secfile/utils/enum_bitset.hpp>

namespace secfile
{
enum class file_open_mode
{
    read = 0b0001,
    write = 0b0010,
    readwrite = read | write,
    //! every write lands at the end of the file
    append = 0b0100,
    //! create the file, fail if it already exists
    create = 0b1000,
};

std::true_type allow_enum_bitset(file_open_mode &&);
using file_open_mode_bitset = enum_bitset<file_open_mode>;

/**
 * A storage resource with a single read/write position shared by all
 * operations. Implementations are not synchronized.
 */
class file
{
public:
    using ptr = std::shared_ptr<file>;

    virtual ~file() = default;

    //! moves the position to the given absolute offset, which may lie past
    //! the end of the file
    virtual auto seek(std::uint64_t position) noexcept -> result<void> = 0;

    //! reads from the current position until the buffer is full or the end
    //! of the file is reached, returns the number of bytes read
    virtual auto read(rw_dynblob buffer) noexcept -> result<std::size_t> = 0;
    //! writes all of data at the current position (or at the end in append
    //! mode)
    virtual auto write(ro_dynblob data) noexcept -> result<void> = 0;

    virtual auto sync() noexcept -> result<void> = 0;

    virtual auto size() noexcept -> result<std::uint64_t> = 0;
    virtual auto resize(std::uint64_t newSize) noexcept -> result<void> = 0;

    virtual auto close() noexcept -> result<void> = 0;
};

class filesystem
{
public:
    using ptr = std::shared_ptr<filesystem>;

    virtual ~filesystem() = default;

    virtual auto open(std::string_view filePath,
                      file_open_mode_bitset mode) noexcept
            -> result<file::ptr> = 0;
    virtual auto remove(std::string_view filePath) noexcept -> result<void> = 0;
    virtual auto exists(std::string_view filePath) noexcept -> result<bool> = 0;
};

auto os_filesystem() -> filesystem::ptr;
} // namespace secfile
