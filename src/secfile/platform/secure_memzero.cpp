#include <secfile/platform/secure_memzero.hpp>

#include <openssl/crypto.h>

namespace secfile::utils
{
void secure_memzero(rw_dynblob data) noexcept
{
    if (!data.empty())
    {
        OPENSSL_cleanse(data.data(), data.size());
    }
}
} // namespace secfile::utils
