#include "kdf.hpp"

#include <limits>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "openssl_aead.hpp"

namespace secfile::crypto
{
namespace
{
constexpr std::uint64_t scrypt_memory_slack = 1024 * 1024;

// scrypt needs 128 * r * (N + p) bytes, a little more is left for the
// bookkeeping of the implementation
auto scrypt_memory_limit(kdf_parameters const &params) noexcept
        -> result<std::uint64_t>
{
    constexpr auto limit = std::numeric_limits<std::uint64_t>::max();
    if (params.block_size == 0)
    {
        return secfile_errc::key_derivation_failed;
    }
    auto const blockBudget = (limit - scrypt_memory_slack) / 128
                             / params.block_size;
    if (params.parallelism > blockBudget
        || params.cost > blockBudget - params.parallelism
        || blockBudget - params.parallelism - params.cost < 2)
    {
        return secfile_errc::key_derivation_failed;
    }
    return 128 * params.block_size
                   * (params.cost + params.parallelism + 2)
           + scrypt_memory_slack;
}
} // namespace

auto scrypt(rw_dynblob out,
            ro_dynblob passphrase,
            ro_dynblob salt,
            kdf_parameters const &params) noexcept -> result<void>
{
    using namespace std::string_view_literals;

    if (out.empty())
    {
        return errc::invalid_argument
               << ed::error_code_api_origin{"scrypt"sv};
    }
    SECFILE_TRY(maxMemory, scrypt_memory_limit(params));

    ERR_clear_error();
    if (EVP_PBE_scrypt(reinterpret_cast<char const *>(passphrase.data()),
                       passphrase.size(),
                       reinterpret_cast<unsigned char const *>(salt.data()),
                       salt.size(), params.cost, params.block_size,
                       params.parallelism, maxMemory,
                       reinterpret_cast<unsigned char *>(out.data()),
                       out.size())
        != 1)
    {
        return secfile_errc::key_derivation_failed
               << ed::error_code_api_origin{"EVP_PBE_scrypt"sv}
               << detail::make_openssl_errinfo();
    }
    return success();
}
} // namespace secfile::crypto
