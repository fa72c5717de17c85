#pragma once

#include <cstddef>
#include <cstdint>

#include <vector>

#include <secfile/disappointment.hpp>
#include <secfile/filesystem.hpp>
#include <secfile/span.hpp>

#include "file_header.hpp"
#include "sector_cipher.hpp"

namespace secfile::detail
{
/**
 * Maps sector indices onto the storage resource. Sector i occupies
 * sector_size + tag_size bytes at header_size + i * (sector_size + tag_size).
 *
 * Every operation moves the position of the storage resource, therefore
 * a device must not be used concurrently.
 */
class sector_device
{
    sector_device(file::ptr storage,
                  sector_cipher cipher,
                  std::size_t sectorSize,
                  std::vector<std::byte> ioBuffer) noexcept;

public:
    static auto create(file::ptr storage,
                       sector_cipher cipher,
                       std::size_t sectorSize) noexcept
            -> result<std::unique_ptr<sector_device>>;

    auto sector_size() const noexcept -> std::size_t
    {
        return mSectorSize;
    }
    auto sealed_sector_size() const noexcept -> std::size_t
    {
        return mSectorSize + tag_size;
    }
    auto storage() const noexcept -> file &
    {
        return *mStorage;
    }

    auto physical_offset(std::uint64_t index) const noexcept
            -> result<std::uint64_t>;

    //! fails with sector_not_found if the sector isn't stored completely,
    //! the error carries the number of bytes found as ed::stored_bytes
    auto read_sector(std::uint64_t index, rw_dynblob out) noexcept
            -> result<void>;
    auto write_sector(std::uint64_t index, ro_dynblob data) noexcept
            -> result<void>;
    //! overwrites the sealed sector with random bytes
    auto zero_sector(std::uint64_t index,
                     crypto::crypto_provider const &provider) noexcept
            -> result<void>;

    auto sector_count() noexcept -> result<std::uint64_t>;

private:
    file::ptr mStorage;
    sector_cipher mCipher;
    std::size_t mSectorSize;
    std::vector<std::byte> mIoBuffer;
};
} // namespace secfile::detail
