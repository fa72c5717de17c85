#include "crypto_provider_openssl.hpp"

#include "../platform/sysrandom.hpp"
#include "openssl_aead.hpp"

namespace secfile::crypto::detail
{
auto openssl_aes_256_gcm_provider::box_seal(rw_dynblob ciphertext,
                                            rw_dynblob mac,
                                            ro_dynblob keyMaterial,
                                            ro_dynblob plaintext) const noexcept
        -> result<void>
{
    if (keyMaterial.size() != key_material_size)
    {
        return errc::invalid_argument;
    }
    SECFILE_TRY(aead,
                openssl_aead::create(keyMaterial.subspan(0, key_size)));

    return aead.seal(ciphertext, mac, keyMaterial.subspan(key_size, nonce_size),
                     plaintext);
}

auto openssl_aes_256_gcm_provider::box_open(rw_dynblob plaintext,
                                            ro_dynblob keyMaterial,
                                            ro_dynblob ciphertext,
                                            ro_dynblob mac) const noexcept
        -> result<void>
{
    if (keyMaterial.size() != key_material_size)
    {
        return errc::invalid_argument;
    }
    SECFILE_TRY(aead,
                openssl_aead::create(keyMaterial.subspan(0, key_size)));

    return aead.open(plaintext, keyMaterial.subspan(key_size, nonce_size),
                     ciphertext, mac);
}

auto openssl_aes_256_gcm_provider::random_bytes(rw_dynblob out) const noexcept
        -> result<void>
{
    return secfile::detail::random_bytes(out);
}
} // namespace secfile::crypto::detail

namespace secfile::crypto
{
namespace
{
detail::openssl_aes_256_gcm_provider openssl_aes_256_gcm;
}

auto openssl_aes_256_gcm_crypto_provider() -> crypto_provider *
{
    return &openssl_aes_256_gcm;
}
} // namespace secfile::crypto
