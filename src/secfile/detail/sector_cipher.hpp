#pragma once

#include <secfile/crypto/provider.hpp>
#include <secfile/disappointment.hpp>
#include <secfile/span.hpp>

#include "file_header.hpp"

namespace secfile::detail
{
/**
 * Seals and opens exactly one sector with the second half of the real key
 * and the nonce taken from the file salt. A sealed sector is the
 * ciphertext followed by the tag.
 */
class sector_cipher
{
public:
    sector_cipher(crypto::crypto_provider const &provider,
                  raw_key const &realKey,
                  ro_blob<salt_size> salt) noexcept;

    //! sealed must be exactly tag_size bytes larger than plaintext
    auto seal(rw_dynblob sealed, ro_dynblob plaintext) const noexcept
            -> result<void>;
    //! plaintext is cleansed on failure
    auto open(rw_dynblob plaintext, ro_dynblob sealed) const noexcept
            -> result<void>;

private:
    crypto::crypto_provider const *mProvider;
    key_material mKeyMaterial;
};
} // namespace secfile::detail
