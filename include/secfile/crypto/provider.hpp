#pragma once

#include <cstddef>

#include <type_traits>

#include <secfile/disappointment.hpp>
#include <secfile/span.hpp>

namespace secfile::crypto
{

class crypto_provider
{
public:
    [[nodiscard]] virtual auto box_seal(rw_dynblob ciphertext,
                                        rw_dynblob mac,
                                        ro_dynblob keyMaterial,
                                        ro_dynblob plaintext) const noexcept
            -> result<void>
            = 0;
    [[nodiscard]] virtual auto box_open(rw_dynblob plaintext,
                                        ro_dynblob keyMaterial,
                                        ro_dynblob ciphertext,
                                        ro_dynblob mac) const noexcept
            -> result<void>
            = 0;

    /**
     * calculates cryptographically save random bytes
     */
    [[nodiscard]] virtual auto random_bytes(rw_dynblob out) const noexcept
            -> result<void>
            = 0;

    //! the size of the key followed by the nonce
    std::size_t const key_material_size;

protected:
    constexpr crypto_provider(std::size_t keyMaterialSize) noexcept
        : key_material_size{keyMaterialSize}
    {
    }
    constexpr ~crypto_provider() noexcept = default;
};
static_assert(!std::is_default_constructible_v<crypto_provider>);
static_assert(!std::is_copy_constructible_v<crypto_provider>);
static_assert(!std::is_move_constructible_v<crypto_provider>);
static_assert(!std::is_copy_assignable_v<crypto_provider>);
static_assert(!std::is_move_assignable_v<crypto_provider>);
static_assert(!std::is_destructible_v<crypto_provider>);

//! AES-256-GCM with a 32 byte key, a 12 byte nonce and a 16 byte tag
auto openssl_aes_256_gcm_crypto_provider() -> crypto_provider *;

} // namespace secfile::crypto
