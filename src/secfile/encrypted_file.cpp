#include <secfile/encrypted_file.hpp>

#include <algorithm>
#include <array>
#include <new>

#include <secfile/exceptions.hpp>
#include <secfile/platform/secure_memzero.hpp>
#include <secfile/utils/misc.hpp>

#include "detail/file_header.hpp"
#include "detail/sector_cipher.hpp"
#include "detail/sector_device.hpp"

namespace secfile
{
static_assert(encrypted_file::raw_key_size == detail::raw_key_size);
static_assert(encrypted_file::salt_size == detail::salt_size);
static_assert(encrypted_file::tag_size == detail::tag_size);
static_assert(encrypted_file::header_size == detail::header_size);

namespace
{
auto resolve_filesystem(filesystem::ptr fs) noexcept -> result<filesystem::ptr>
{
    if (fs)
    {
        return fs;
    }
    try
    {
        return os_filesystem();
    }
    catch (std::bad_alloc const &)
    {
        return errc::not_enough_memory;
    }
}

auto resolve_crypto_provider(crypto::crypto_provider *provider) noexcept
        -> result<crypto::crypto_provider *>
{
    if (provider == nullptr)
    {
        provider = crypto::openssl_aes_256_gcm_crypto_provider();
    }
    if (provider->key_material_size != detail::key_material_size)
    {
        return errc::invalid_argument;
    }
    return provider;
}

auto io_file_of(std::string_view filePath) -> ed::io_file
{
    return ed::io_file{std::string{filePath}};
}

void throw_on_negative_offset(std::int64_t offset)
{
    if (offset < 0)
    {
        BOOST_THROW_EXCEPTION(invalid_argument{}
                              << errinfo_param_name{"offset"}
                              << errinfo_param_misuse_description{
                                         "negative file offset"});
    }
}

// true if nothing at all is stored at the sector position
auto is_unstored_sector(error const &e) noexcept -> bool
{
    if (e != secfile_errc::sector_not_found)
    {
        return false;
    }
    auto const *storedBytes = e.detail<ed::stored_bytes>();
    return storedBytes != nullptr && *storedBytes == 0U;
}
} // namespace

encrypted_file::encrypted_file() noexcept = default;
encrypted_file::~encrypted_file() = default;
encrypted_file::encrypted_file(encrypted_file &&other) noexcept = default;
auto encrypted_file::operator=(encrypted_file &&other) noexcept
        -> encrypted_file & = default;

auto encrypted_file::validate_sector_size(std::size_t sectorSize) noexcept
        -> result<void>
{
    if (sectorSize == 0 || sectorSize % block_size != 0)
    {
        return secfile_errc::invalid_sector_size;
    }
    return success();
}

auto encrypted_file::initialize(std::string_view filePath,
                                std::size_t sectorSize,
                                filesystem::ptr fs,
                                crypto::crypto_provider *cryptoProvider,
                                kdf_parameters const &kdf,
                                access_mode mode,
                                detail::file_header const &header,
                                file::ptr storage) noexcept -> result<void>
{
    try
    {
        mFilePath.assign(filePath);
        mSectorScratch.resize(sectorSize);
        mHeader = std::make_unique<detail::file_header>(header);
    }
    catch (std::bad_alloc const &)
    {
        return errc::not_enough_memory;
    }

    detail::sector_cipher cipher{*cryptoProvider, mRealKey, header.salt};
    SECFILE_TRY(device,
                detail::sector_device::create(std::move(storage),
                                              std::move(cipher), sectorSize));

    mDevice = std::move(device);
    mFs = std::move(fs);
    mCryptoProvider = cryptoProvider;
    mKdf = kdf;
    mMode = mode;
    mSectorSize = sectorSize;
    mCursor = -1;
    return success();
}

auto encrypted_file::create(std::string_view filePath,
                            ro_dynblob passphrase,
                            std::size_t sectorSize,
                            open_options const &options) noexcept
        -> result<encrypted_file>
{
    SECFILE_TRY(validate_sector_size(sectorSize));
    SECFILE_TRY(fs, resolve_filesystem(options.fs));
    SECFILE_TRY(cryptoProvider,
                resolve_crypto_provider(options.cryptoProvider));

    SECFILE_TRY(alreadyExists, fs->exists(filePath));
    if (alreadyExists)
    {
        return secfile_errc::file_already_exists << io_file_of(filePath);
    }

    encrypted_file handle;
    SECFILE_TRY(header,
                detail::generate_header(*cryptoProvider, passphrase,
                                        options.kdf, handle.mRealKey));

    SECFILE_TRY(storage,
                fs->open(filePath,
                         file_open_mode::readwrite | file_open_mode::create));
    SECFILE_TRY_INJECT(detail::write_header(*storage, header),
                       io_file_of(filePath));
    SECFILE_TRY_INJECT(storage->sync(), io_file_of(filePath));

    SECFILE_TRY(handle.initialize(filePath, sectorSize, fs, cryptoProvider,
                                  options.kdf, access_mode::readwrite, header,
                                  std::move(storage)));
    return handle;
}

auto encrypted_file::open_existing(std::string_view filePath,
                                   ro_dynblob passphrase,
                                   std::size_t sectorSize,
                                   open_options const &options,
                                   access_mode mode) noexcept
        -> result<encrypted_file>
{
    SECFILE_TRY(validate_sector_size(sectorSize));
    SECFILE_TRY(fs, resolve_filesystem(options.fs));
    SECFILE_TRY(cryptoProvider,
                resolve_crypto_provider(options.cryptoProvider));

    SECFILE_TRY(fileExists, fs->exists(filePath));
    if (!fileExists)
    {
        return secfile_errc::file_not_found << io_file_of(filePath);
    }

    // the header is read through a separate handle, because the requested
    // access mode may not permit reading
    SECFILE_TRY(headerFile, fs->open(filePath, file_open_mode::read));
    auto headerrx = detail::read_header(*headerFile);
    if (auto closerx = headerFile->close();
        closerx.has_failure() && headerrx.has_value())
    {
        return std::move(closerx).assume_error() << io_file_of(filePath);
    }
    if (headerrx.has_failure())
    {
        return std::move(headerrx).assume_error() << io_file_of(filePath);
    }
    auto const &header = headerrx.assume_value();

    encrypted_file handle;
    SECFILE_TRY(wrappingKey,
                detail::derive_wrapping_key(passphrase, header.salt,
                                            options.kdf));
    auto unwraprx = detail::unwrap_key(*cryptoProvider, wrappingKey,
                                       header.salt, header.wrappedKey);
    if (unwraprx.has_failure())
    {
        return std::move(unwraprx).assume_error() << io_file_of(filePath);
    }
    handle.mRealKey = unwraprx.assume_value();

    file_open_mode_bitset openMode = file_open_mode::readwrite;
    if (mode == access_mode::append)
    {
        openMode = file_open_mode::write | file_open_mode::append;
    }
    else if (mode == access_mode::view_only)
    {
        openMode = file_open_mode::read;
    }
    SECFILE_TRY(storage, fs->open(filePath, openMode));

    SECFILE_TRY(handle.initialize(filePath, sectorSize, fs, cryptoProvider,
                                  options.kdf, mode, header,
                                  std::move(storage)));
    return handle;
}

auto encrypted_file::open(std::string_view filePath,
                          ro_dynblob passphrase,
                          std::size_t sectorSize,
                          open_options const &options) noexcept
        -> result<encrypted_file>
{
    return open_existing(filePath, passphrase, sectorSize, options,
                         access_mode::readwrite);
}

auto encrypted_file::open_append(std::string_view filePath,
                                 ro_dynblob passphrase,
                                 std::size_t sectorSize,
                                 open_options const &options) noexcept
        -> result<encrypted_file>
{
    return open_existing(filePath, passphrase, sectorSize, options,
                         access_mode::append);
}

auto encrypted_file::open_view_only(std::string_view filePath,
                                    ro_dynblob passphrase,
                                    std::size_t sectorSize,
                                    open_options const &options) noexcept
        -> result<encrypted_file>
{
    return open_existing(filePath, passphrase, sectorSize, options,
                         access_mode::view_only);
}

auto encrypted_file::exists(std::string_view filePath,
                            filesystem::ptr fs) noexcept -> result<bool>
{
    SECFILE_TRY(resolvedFs, resolve_filesystem(std::move(fs)));
    return resolvedFs->exists(filePath);
}

auto encrypted_file::change_passphrase(std::string_view filePath,
                                       ro_dynblob oldPassphrase,
                                       ro_dynblob newPassphrase,
                                       open_options const &options) noexcept
        -> result<void>
{
    SECFILE_TRY(handle,
                open(filePath, oldPassphrase, block_size, options));

    auto changerx = handle.change_passphrase(newPassphrase);
    auto closerx = handle.close();
    SECFILE_TRY(changerx);
    return closerx;
}

auto encrypted_file::change_passphrase(ro_dynblob newPassphrase) noexcept
        -> result<void>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    if (mMode != access_mode::readwrite)
    {
        return errc::not_supported;
    }

    SECFILE_TRY(rekeyed,
                detail::rekey_header(*mCryptoProvider, *mHeader, mRealKey,
                                     newPassphrase, mKdf));
    SECFILE_TRY(detail::write_header(mDevice->storage(), rekeyed));
    SECFILE_TRY(mDevice->storage().sync());
    *mHeader = rekeyed;
    return success();
}

auto encrypted_file::stat() noexcept -> result<file_stat>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    SECFILE_TRY(size, mDevice->storage().size());
    SECFILE_TRY(sectorCount, mDevice->sector_count());
    return file_stat{size, sectorCount};
}

auto encrypted_file::sync() noexcept -> result<void>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    return mDevice->storage().sync();
}

auto encrypted_file::close() noexcept -> result<void>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    auto closerx = mDevice->storage().close();

    mDevice.reset();
    mHeader.reset();
    utils::secure_memzero(as_span(mRealKey));
    mCursor = -1;
    return closerx;
}

auto encrypted_file::read_sector(std::uint64_t index, rw_dynblob out) noexcept
        -> result<void>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    mCursor = -1;
    return mDevice->read_sector(index, out);
}

auto encrypted_file::read_sector(std::uint64_t index) noexcept
        -> result<std::vector<std::byte>>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    std::vector<std::byte> sector;
    try
    {
        sector.resize(mSectorSize);
    }
    catch (std::bad_alloc const &)
    {
        return errc::not_enough_memory;
    }
    SECFILE_TRY(read_sector(index, sector));
    return sector;
}

auto encrypted_file::write_sector(std::uint64_t index, ro_dynblob data) noexcept
        -> result<void>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    mCursor = -1;
    return mDevice->write_sector(index, data);
}

auto encrypted_file::write_sector_sync(std::uint64_t index,
                                       ro_dynblob data) noexcept
        -> result<void>
{
    SECFILE_TRY(write_sector(index, data));
    return sync();
}

auto encrypted_file::write_sector_padded(std::uint64_t index,
                                         ro_dynblob data) noexcept
        -> result<void>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    std::vector<std::byte> padded;
    try
    {
        padded = pad_sector(data);
    }
    catch (std::bad_alloc const &)
    {
        return errc::not_enough_memory;
    }
    SECFILE_SCOPE_EXIT
    {
        utils::secure_memzero(padded);
    };
    return write_sector(index, padded);
}

auto encrypted_file::pad_sector(ro_dynblob data) const
        -> std::vector<std::byte>
{
    std::vector<std::byte> padded(mSectorSize);
    copy(data, std::span{padded});
    return padded;
}

auto encrypted_file::zero_sector(std::uint64_t index) noexcept -> result<void>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    return mDevice->zero_sector(index, *mCryptoProvider);
}

auto encrypted_file::count_sectors() noexcept -> result<std::uint64_t>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    return mDevice->sector_count();
}

auto encrypted_file::erase() noexcept -> result<void>
{
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    if (mMode != access_mode::readwrite)
    {
        return errc::not_supported;
    }

    SECFILE_TRY(sectorCount, mDevice->sector_count());
    // the sector one past the end is wiped as well, it may only have been
    // partially written
    for (std::uint64_t i = 0; i <= sectorCount; ++i)
    {
        if (auto zerorx = zero_sector(i);
            zerorx.has_failure() && i != sectorCount)
        {
            return std::move(zerorx).assume_error();
        }
    }

    std::array<std::byte, detail::header_size> headerNoise{};
    SECFILE_TRY(mCryptoProvider->random_bytes(headerNoise));

    auto &storage = mDevice->storage();
    SECFILE_TRY(storage.seek(0));
    SECFILE_TRY(storage.write(headerNoise));
    SECFILE_TRY(storage.sync());
    SECFILE_TRY(storage.resize(0));
    SECFILE_TRY(storage.sync());

    auto fs = mFs;
    auto filePath = std::move(mFilePath);
    SECFILE_TRY(close());
    SECFILE_TRY_INJECT(fs->remove(filePath), ed::io_file{std::move(filePath)});
    return success();
}

auto encrypted_file::seek(std::int64_t offset) -> result<std::int64_t>
{
    throw_on_negative_offset(offset);
    if (!mDevice)
    {
        return secfile_errc::not_open;
    }
    mCursor = offset;
    return offset;
}

auto encrypted_file::read_at(rw_dynblob buffer, std::int64_t offset)
        -> transfer_result
{
    throw_on_negative_offset(offset);
    return read_at_impl(buffer, static_cast<std::uint64_t>(offset));
}

auto encrypted_file::write_at(ro_dynblob buffer, std::int64_t offset)
        -> transfer_result
{
    throw_on_negative_offset(offset);
    return write_at_impl(buffer, static_cast<std::uint64_t>(offset));
}

auto encrypted_file::read(rw_dynblob buffer) -> transfer_result
{
    if (!mDevice)
    {
        return {0, secfile_errc::not_open};
    }
    if (mCursor < 0)
    {
        return {0, secfile_errc::cursor_not_set};
    }
    auto transfer = read_at_impl(buffer, static_cast<std::uint64_t>(mCursor));
    mCursor += static_cast<std::int64_t>(transfer.transferred);
    return transfer;
}

auto encrypted_file::write(ro_dynblob buffer) -> transfer_result
{
    if (!mDevice)
    {
        return {0, secfile_errc::not_open};
    }
    if (mCursor < 0)
    {
        return {0, secfile_errc::cursor_not_set};
    }
    auto transfer = write_at_impl(buffer, static_cast<std::uint64_t>(mCursor));
    mCursor += static_cast<std::int64_t>(transfer.transferred);
    return transfer;
}

auto encrypted_file::read_at_impl(rw_dynblob buffer,
                                  std::uint64_t offset) noexcept
        -> transfer_result
{
    if (!mDevice)
    {
        return {0, secfile_errc::not_open};
    }

    transfer_result transfer;
    auto sectorIndex = offset / mSectorSize;
    auto skip = static_cast<std::size_t>(offset % mSectorSize);

    rw_dynblob const sector{mSectorScratch};
    SECFILE_SCOPE_EXIT
    {
        utils::secure_memzero(sector);
    };

    while (!buffer.empty())
    {
        if (auto readrx = mDevice->read_sector(sectorIndex, sector);
            readrx.has_failure())
        {
            transfer.status = std::move(readrx).assume_error();
            return transfer;
        }

        auto const chunkSize = std::min(buffer.size(), mSectorSize - skip);
        copy(ro_dynblob{sector}.subspan(skip, chunkSize), buffer);

        buffer = buffer.subspan(chunkSize);
        transfer.transferred += chunkSize;
        skip = 0;
        ++sectorIndex;
    }
    return transfer;
}

auto encrypted_file::write_at_impl(ro_dynblob buffer,
                                   std::uint64_t offset) noexcept
        -> transfer_result
{
    if (!mDevice)
    {
        return {0, secfile_errc::not_open};
    }

    transfer_result transfer;
    auto sectorIndex = offset / mSectorSize;
    auto skip = static_cast<std::size_t>(offset % mSectorSize);

    rw_dynblob const sector{mSectorScratch};
    SECFILE_SCOPE_EXIT
    {
        utils::secure_memzero(sector);
    };

    while (!buffer.empty())
    {
        std::size_t chunkSize = mSectorSize;
        if (skip == 0 && buffer.size() >= mSectorSize)
        {
            if (auto writerx = mDevice->write_sector(
                        sectorIndex, buffer.first(mSectorSize));
                writerx.has_failure())
            {
                transfer.status = std::move(writerx).assume_error();
                return transfer;
            }
        }
        else
        {
            // read-modify-write; a sector past the end of the file starts
            // out as zeros, a partially stored sector is reported
            if (auto readrx = mDevice->read_sector(sectorIndex, sector);
                readrx.has_failure())
            {
                if (!is_unstored_sector(readrx.assume_error()))
                {
                    transfer.status = std::move(readrx).assume_error();
                    return transfer;
                }
                fill_blob(sector);
            }

            chunkSize = std::min(buffer.size(), mSectorSize - skip);
            copy(buffer.first(chunkSize), sector.subspan(skip));

            if (auto writerx = mDevice->write_sector(sectorIndex, sector);
                writerx.has_failure())
            {
                transfer.status = std::move(writerx).assume_error();
                return transfer;
            }
        }

        buffer = buffer.subspan(chunkSize);
        transfer.transferred += chunkSize;
        skip = 0;
        ++sectorIndex;
    }
    return transfer;
}
} // namespace secfile
