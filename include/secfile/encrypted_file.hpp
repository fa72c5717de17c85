#pragma once

#include <cstddef>
#include <cstdint>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <secfile/crypto/kdf_parameters.hpp>
#include <secfile/crypto/provider.hpp>
#include <secfile/disappointment.hpp>
#include <secfile/filesystem.hpp>
#include <secfile/span.hpp>
#include <secfile/utils/secure_array.hpp>

namespace secfile
{
namespace detail
{
class sector_device;
struct file_header;
} // namespace detail

struct open_options
{
    kdf_parameters kdf{};
    //! defaults to os_filesystem()
    filesystem::ptr fs{};
    //! defaults to openssl_aes_256_gcm_crypto_provider()
    crypto::crypto_provider *cryptoProvider{nullptr};
};

struct file_stat
{
    //! bytes occupied on the storage resource including the header
    std::uint64_t size;
    std::uint64_t sector_count;
};

/**
 * The outcome of a partial transfer: the number of bytes moved before the
 * first failure and that failure (or success).
 */
struct transfer_result
{
    std::size_t transferred{0};
    result<void> status{success()};

    explicit operator bool() const noexcept
    {
        return status.has_value();
    }
};

/**
 * A file of fixed size sectors each of which is sealed with AES-256-GCM.
 * The sector key is stored at the beginning of the file wrapped with a key
 * derived from a passphrase.
 *
 * A handle is single threaded, see synchronized_file.
 */
class encrypted_file
{
    enum class access_mode
    {
        readwrite,
        append,
        view_only,
    };

public:
    static constexpr std::size_t block_size = 16;
    static constexpr std::size_t raw_key_size = 64;
    static constexpr std::size_t salt_size = 32;
    static constexpr std::size_t tag_size = 16;
    static constexpr std::size_t wrapped_key_size = raw_key_size + tag_size;
    static constexpr std::size_t header_size = salt_size + wrapped_key_size;

    //! an unconstructed handle, every operation fails with not_open
    encrypted_file() noexcept;
    ~encrypted_file();

    encrypted_file(encrypted_file const &) = delete;
    encrypted_file(encrypted_file &&other) noexcept;
    auto operator=(encrypted_file const &) -> encrypted_file & = delete;
    auto operator=(encrypted_file &&other) noexcept -> encrypted_file &;

    //! fails with file_already_exists if something exists at filePath
    static auto create(std::string_view filePath,
                       ro_dynblob passphrase,
                       std::size_t sectorSize,
                       open_options const &options = {}) noexcept
            -> result<encrypted_file>;
    static auto open(std::string_view filePath,
                     ro_dynblob passphrase,
                     std::size_t sectorSize,
                     open_options const &options = {}) noexcept
            -> result<encrypted_file>;
    //! all writes of the returned handle land at the end of the file
    static auto open_append(std::string_view filePath,
                            ro_dynblob passphrase,
                            std::size_t sectorSize,
                            open_options const &options = {}) noexcept
            -> result<encrypted_file>;
    static auto open_view_only(std::string_view filePath,
                               ro_dynblob passphrase,
                               std::size_t sectorSize,
                               open_options const &options = {}) noexcept
            -> result<encrypted_file>;

    static auto exists(std::string_view filePath,
                       filesystem::ptr fs = {}) noexcept -> result<bool>;

    //! opens the file, rewraps its key for newPassphrase and closes it
    static auto change_passphrase(std::string_view filePath,
                                  ro_dynblob oldPassphrase,
                                  ro_dynblob newPassphrase,
                                  open_options const &options = {}) noexcept
            -> result<void>;
    auto change_passphrase(ro_dynblob newPassphrase) noexcept -> result<void>;

    [[nodiscard]] auto is_open() const noexcept -> bool
    {
        return static_cast<bool>(mDevice);
    }
    [[nodiscard]] auto sector_size() const noexcept -> std::size_t
    {
        return mSectorSize;
    }

    auto stat() noexcept -> result<file_stat>;
    auto sync() noexcept -> result<void>;
    auto close() noexcept -> result<void>;

    //! out must be exactly one sector, invalidates the cursor
    auto read_sector(std::uint64_t index, rw_dynblob out) noexcept
            -> result<void>;
    auto read_sector(std::uint64_t index) noexcept
            -> result<std::vector<std::byte>>;
    //! data must be exactly one sector, invalidates the cursor
    auto write_sector(std::uint64_t index, ro_dynblob data) noexcept
            -> result<void>;
    auto write_sector_sync(std::uint64_t index, ro_dynblob data) noexcept
            -> result<void>;
    auto write_sector_padded(std::uint64_t index, ro_dynblob data) noexcept
            -> result<void>;
    //! truncates or zero extends data to exactly one sector
    auto pad_sector(ro_dynblob data) const -> std::vector<std::byte>;

    auto zero_sector(std::uint64_t index) noexcept -> result<void>;
    auto count_sectors() noexcept -> result<std::uint64_t>;

    /**
     * Overwrites every sector and the header with random bytes, truncates
     * the file, removes it and closes the handle.
     *
     * Append and view-only handles fail with errc::not_supported and leave
     * the file untouched.
     */
    auto erase() noexcept -> result<void>;

    //! sets the cursor of read() and write(), offset must not be negative
    auto seek(std::int64_t offset) -> result<std::int64_t>;
    auto read_at(rw_dynblob buffer, std::int64_t offset) -> transfer_result;
    auto write_at(ro_dynblob buffer, std::int64_t offset) -> transfer_result;
    //! fails with cursor_not_set before the first seek()
    auto read(rw_dynblob buffer) -> transfer_result;
    auto write(ro_dynblob buffer) -> transfer_result;

private:
    static auto open_existing(std::string_view filePath,
                              ro_dynblob passphrase,
                              std::size_t sectorSize,
                              open_options const &options,
                              access_mode mode) noexcept
            -> result<encrypted_file>;
    static auto validate_sector_size(std::size_t sectorSize) noexcept
            -> result<void>;

    auto initialize(std::string_view filePath,
                    std::size_t sectorSize,
                    filesystem::ptr fs,
                    crypto::crypto_provider *cryptoProvider,
                    kdf_parameters const &kdf,
                    access_mode mode,
                    detail::file_header const &header,
                    file::ptr storage) noexcept -> result<void>;

    auto read_at_impl(rw_dynblob buffer, std::uint64_t offset) noexcept
            -> transfer_result;
    auto write_at_impl(ro_dynblob buffer, std::uint64_t offset) noexcept
            -> transfer_result;

    std::unique_ptr<detail::sector_device> mDevice;
    std::unique_ptr<detail::file_header> mHeader;
    utils::secure_byte_array<raw_key_size> mRealKey;
    std::string mFilePath;
    filesystem::ptr mFs;
    crypto::crypto_provider *mCryptoProvider{nullptr};
    kdf_parameters mKdf{};
    access_mode mMode{access_mode::readwrite};
    std::size_t mSectorSize{0};
    std::int64_t mCursor{-1};
    std::vector<std::byte> mSectorScratch;
};
} // namespace secfile
