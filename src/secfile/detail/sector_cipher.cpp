#include "sector_cipher.hpp"

#include <secfile/platform/secure_memzero.hpp>

namespace secfile::detail
{
sector_cipher::sector_cipher(crypto::crypto_provider const &provider,
                             raw_key const &realKey,
                             ro_blob<salt_size> salt) noexcept
    : mProvider(&provider)
    , mKeyMaterial(make_key_material(
              as_span(realKey).subspan<raw_key_size - aead_key_size>(),
              salt))
{
}

auto sector_cipher::seal(rw_dynblob sealed, ro_dynblob plaintext) const noexcept
        -> result<void>
{
    if (sealed.size() != plaintext.size() + tag_size)
    {
        return errc::invalid_argument;
    }
    auto const payloadSize = plaintext.size();
    return mProvider->box_seal(sealed.first(payloadSize),
                               sealed.subspan(payloadSize),
                               as_span(mKeyMaterial), plaintext);
}

auto sector_cipher::open(rw_dynblob plaintext, ro_dynblob sealed) const noexcept
        -> result<void>
{
    if (sealed.size() != plaintext.size() + tag_size)
    {
        return errc::invalid_argument;
    }
    auto const payloadSize = plaintext.size();
    if (auto openrx = mProvider->box_open(plaintext, as_span(mKeyMaterial),
                                          sealed.first(payloadSize),
                                          sealed.subspan(payloadSize));
        openrx.has_failure())
    {
        utils::secure_memzero(plaintext);
        return std::move(openrx).assume_error();
    }
    return success();
}
} // namespace secfile::detail
