#pragma once

#include <secfile/crypto/kdf_parameters.hpp>
#include <secfile/disappointment.hpp>
#include <secfile/span.hpp>

namespace secfile::crypto
{
/**
 * Stretches the passphrase with scrypt and fills the whole output buffer.
 */
auto scrypt(rw_dynblob out,
            ro_dynblob passphrase,
            ro_dynblob salt,
            kdf_parameters const &params) noexcept -> result<void>;
} // namespace secfile::crypto
