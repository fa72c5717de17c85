#include "sector_device.hpp"

#include <limits>
#include <new>

namespace secfile::detail
{
sector_device::sector_device(file::ptr storage,
                             sector_cipher cipher,
                             std::size_t sectorSize,
                             std::vector<std::byte> ioBuffer) noexcept
    : mStorage(std::move(storage))
    , mCipher(std::move(cipher))
    , mSectorSize(sectorSize)
    , mIoBuffer(std::move(ioBuffer))
{
}

auto sector_device::create(file::ptr storage,
                           sector_cipher cipher,
                           std::size_t sectorSize) noexcept
        -> result<std::unique_ptr<sector_device>>
{
    if (!storage || sectorSize == 0
        || sectorSize > std::numeric_limits<std::size_t>::max() - tag_size)
    {
        return errc::invalid_argument;
    }

    std::vector<std::byte> ioBuffer;
    try
    {
        ioBuffer.resize(sectorSize + tag_size);
    }
    catch (std::bad_alloc const &)
    {
        return errc::not_enough_memory;
    }

    std::unique_ptr<sector_device> device{new (std::nothrow) sector_device(
            std::move(storage), std::move(cipher), sectorSize,
            std::move(ioBuffer))};
    if (!device)
    {
        return errc::not_enough_memory;
    }
    return device;
}

auto sector_device::physical_offset(std::uint64_t index) const noexcept
        -> result<std::uint64_t>
{
    auto const stride = static_cast<std::uint64_t>(sealed_sector_size());
    if (index > (std::numeric_limits<std::uint64_t>::max() - header_size)
                        / stride)
    {
        return errc::result_out_of_range << ed::sector_index{index};
    }
    return header_size + index * stride;
}

auto sector_device::read_sector(std::uint64_t index, rw_dynblob out) noexcept
        -> result<void>
{
    if (out.size() != mSectorSize)
    {
        return errc::invalid_argument << ed::sector_index{index};
    }
    SECFILE_TRY(position, physical_offset(index));

    SECFILE_TRY_INJECT(mStorage->seek(position), ed::sector_index{index});
    auto readrx = mStorage->read(mIoBuffer);
    if (readrx.has_failure())
    {
        return std::move(readrx).assume_error() << ed::sector_index{index};
    }
    if (readrx.assume_value() < mIoBuffer.size())
    {
        return secfile_errc::sector_not_found
               << ed::sector_index{index} << ed::file_position{position}
               << ed::stored_bytes{readrx.assume_value()};
    }

    SECFILE_TRY_INJECT(mCipher.open(out, mIoBuffer), ed::sector_index{index});
    return success();
}

auto sector_device::write_sector(std::uint64_t index, ro_dynblob data) noexcept
        -> result<void>
{
    if (data.size() != mSectorSize)
    {
        return errc::invalid_argument << ed::sector_index{index};
    }
    SECFILE_TRY(position, physical_offset(index));

    SECFILE_TRY_INJECT(mCipher.seal(mIoBuffer, data), ed::sector_index{index});
    SECFILE_TRY_INJECT(mStorage->seek(position), ed::sector_index{index});
    SECFILE_TRY_INJECT(mStorage->write(mIoBuffer), ed::sector_index{index});
    return success();
}

auto sector_device::zero_sector(std::uint64_t index,
                                crypto::crypto_provider const &provider) noexcept
        -> result<void>
{
    SECFILE_TRY(position, physical_offset(index));

    SECFILE_TRY(provider.random_bytes(mIoBuffer));
    SECFILE_TRY_INJECT(mStorage->seek(position), ed::sector_index{index});
    SECFILE_TRY_INJECT(mStorage->write(mIoBuffer), ed::sector_index{index});
    return success();
}

auto sector_device::sector_count() noexcept -> result<std::uint64_t>
{
    SECFILE_TRY(size, mStorage->size());
    if (size < header_size)
    {
        return 0U;
    }
    return (size - header_size) / sealed_sector_size();
}
} // namespace secfile::detail
