#pragma once

#include <secfile/filesystem.hpp>

namespace secfile::detail
{
using os_handle = int;

class os_file final : public file
{
public:
    explicit os_file(os_handle fileHandle) noexcept;
    ~os_file() override;

    os_file(os_file const &) = delete;
    auto operator=(os_file const &) -> os_file & = delete;

    auto seek(std::uint64_t position) noexcept -> result<void> override;
    auto read(rw_dynblob buffer) noexcept -> result<std::size_t> override;
    auto write(ro_dynblob data) noexcept -> result<void> override;
    auto sync() noexcept -> result<void> override;
    auto size() noexcept -> result<std::uint64_t> override;
    auto resize(std::uint64_t newSize) noexcept -> result<void> override;
    auto close() noexcept -> result<void> override;

private:
    os_handle mFile;
};

class os_filesystem final : public filesystem
{
public:
    auto open(std::string_view filePath, file_open_mode_bitset mode) noexcept
            -> result<file::ptr> override;
    auto remove(std::string_view filePath) noexcept -> result<void> override;
    auto exists(std::string_view filePath) noexcept -> result<bool> override;
};
} // namespace secfile::detail
