#pragma once

#include <secfile/crypto/provider.hpp>
#include <secfile/span.hpp>

namespace secfile::crypto::detail
{
class openssl_aes_256_gcm_provider final : public crypto_provider
{
    [[nodiscard]] auto box_seal(rw_dynblob ciphertext,
                                rw_dynblob mac,
                                ro_dynblob keyMaterial,
                                ro_dynblob plaintext) const noexcept
            -> result<void> override;

    [[nodiscard]] auto box_open(rw_dynblob plaintext,
                                ro_dynblob keyMaterial,
                                ro_dynblob ciphertext,
                                ro_dynblob mac) const noexcept
            -> result<void> override;

    [[nodiscard]] auto random_bytes(rw_dynblob out) const noexcept
            -> result<void> override;

public:
    static constexpr std::size_t key_size = 32;
    static constexpr std::size_t nonce_size = 12;
    static constexpr std::size_t key_material_size = key_size + nonce_size;

    constexpr openssl_aes_256_gcm_provider()
        : crypto_provider(openssl_aes_256_gcm_provider::key_material_size)
    {
    }
};
} // namespace secfile::crypto::detail
