#pragma once

#include <cstddef>
#include <cstdint>

#include <mutex>
#include <vector>

#include <secfile/encrypted_file.hpp>

namespace secfile
{
/**
 * Serializes every operation on an encrypted_file so that one handle can be
 * shared between threads.
 */
class synchronized_file
{
public:
    explicit synchronized_file(encrypted_file file) noexcept;

    synchronized_file(synchronized_file const &) = delete;
    auto operator=(synchronized_file const &) -> synchronized_file & = delete;

    auto change_passphrase(ro_dynblob newPassphrase) noexcept -> result<void>;

    auto stat() noexcept -> result<file_stat>;
    auto sync() noexcept -> result<void>;
    auto close() noexcept -> result<void>;

    auto read_sector(std::uint64_t index, rw_dynblob out) noexcept
            -> result<void>;
    auto read_sector(std::uint64_t index) noexcept
            -> result<std::vector<std::byte>>;
    auto write_sector(std::uint64_t index, ro_dynblob data) noexcept
            -> result<void>;
    auto write_sector_sync(std::uint64_t index, ro_dynblob data) noexcept
            -> result<void>;
    auto write_sector_padded(std::uint64_t index, ro_dynblob data) noexcept
            -> result<void>;
    auto pad_sector(ro_dynblob data) const -> std::vector<std::byte>;

    auto zero_sector(std::uint64_t index) noexcept -> result<void>;
    auto count_sectors() noexcept -> result<std::uint64_t>;
    auto erase() noexcept -> result<void>;

    auto seek(std::int64_t offset) -> result<std::int64_t>;
    auto read_at(rw_dynblob buffer, std::int64_t offset) -> transfer_result;
    auto write_at(ro_dynblob buffer, std::int64_t offset) -> transfer_result;
    auto read(rw_dynblob buffer) -> transfer_result;
    auto write(ro_dynblob buffer) -> transfer_result;

private:
    mutable std::mutex mSync;
    encrypted_file mFile;
};
} // namespace secfile
