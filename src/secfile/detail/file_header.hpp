#pragma once

#include <cstddef>

#include <array>

#include <secfile/crypto/kdf_parameters.hpp>
#include <secfile/crypto/provider.hpp>
#include <secfile/disappointment.hpp>
#include <secfile/filesystem.hpp>
#include <secfile/span.hpp>
#include <secfile/utils/secure_array.hpp>

namespace secfile::detail
{
inline constexpr std::size_t raw_key_size = 64;
inline constexpr std::size_t salt_size = 32;
inline constexpr std::size_t tag_size = 16;
inline constexpr std::size_t aead_key_size = 32;
inline constexpr std::size_t aead_nonce_size = 12;
inline constexpr std::size_t key_material_size
        = aead_key_size + aead_nonce_size;
inline constexpr std::size_t wrapped_key_size = raw_key_size + tag_size;
inline constexpr std::size_t header_size = salt_size + wrapped_key_size;

using raw_key = utils::secure_byte_array<raw_key_size>;
using key_material = utils::secure_byte_array<key_material_size>;

/**
 * The persisted prefix of every encrypted file:
 * [0, 32) salt, [32, 112) the wrapped real key followed by its tag.
 */
struct file_header
{
    std::array<std::byte, salt_size> salt;
    std::array<std::byte, wrapped_key_size> wrappedKey;
};

//! concatenates an AEAD key and the nonce taken from the salt prefix
auto make_key_material(ro_blob<aead_key_size> key,
                       ro_blob<salt_size> salt) noexcept -> key_material;

//! a passphrase of exactly raw_key_size bytes is used as is, all other
//! passphrases are stretched with scrypt
auto derive_wrapping_key(ro_dynblob passphrase,
                         ro_blob<salt_size> salt,
                         kdf_parameters const &kdf) noexcept
        -> result<raw_key>;

auto wrap_key(crypto::crypto_provider const &provider,
              raw_key const &wrappingKey,
              ro_blob<salt_size> salt,
              raw_key const &realKey,
              rw_blob<wrapped_key_size> wrappedKey) noexcept -> result<void>;

//! fails with secfile_errc::wrong_passphrase if the tag doesn't match
auto unwrap_key(crypto::crypto_provider const &provider,
                raw_key const &wrappingKey,
                ro_blob<salt_size> salt,
                ro_blob<wrapped_key_size> wrappedKey) noexcept
        -> result<raw_key>;

/**
 * Draws a fresh salt and real key and wraps the latter with a key derived
 * from the passphrase.
 */
auto generate_header(crypto::crypto_provider const &provider,
                     ro_dynblob passphrase,
                     kdf_parameters const &kdf,
                     raw_key &realKey) noexcept -> result<file_header>;

//! rewraps the real key for a new passphrase keeping the salt
auto rekey_header(crypto::crypto_provider const &provider,
                  file_header const &header,
                  raw_key const &realKey,
                  ro_dynblob newPassphrase,
                  kdf_parameters const &kdf) noexcept -> result<file_header>;

//! a header shorter than header_size is reported as wrong_passphrase
auto read_header(file &storage) noexcept -> result<file_header>;
auto write_header(file &storage, file_header const &header) noexcept
        -> result<void>;
} // namespace secfile::detail
