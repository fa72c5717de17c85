#pragma once

#include <climits>
#include <cstddef>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <secfile/disappointment.hpp>
#include <secfile/exceptions.hpp>
#include <secfile/platform/secure_memzero.hpp>
#include <secfile/span.hpp>
#include <secfile/utils/secure_array.hpp>

namespace secfile::ed
{
struct openssl_error_tag
{
};
using openssl_error = error_detail<openssl_error_tag, std::string>;
} // namespace secfile::ed

namespace secfile::crypto::detail
{
inline auto read_openssl_errors(std::string str = std::string{}) -> std::string
{
    auto printCb = [](char const *msg, size_t msgSize, void *ctx) {
        auto &cbStr = *reinterpret_cast<std::string *>(ctx);
        cbStr.append(msg, msgSize);
        cbStr.push_back('\n');
        return 1;
    };

    if (!str.empty())
    {
        str.push_back('\n');
    }
    ERR_print_errors_cb(printCb, &str);
    if (!str.empty())
    {
        str.pop_back();
    }
    str.shrink_to_fit();
    return str;
}

inline auto make_openssl_errinfo(std::string desc = std::string{})
{
    return ed::openssl_error{read_openssl_errors(std::move(desc))};
}

/**
 * AES-256-GCM through the EVP_CIPHER interface which both OpenSSL and
 * BoringSSL provide. Every seal/open call reinitializes the context with
 * the stored key and the given nonce.
 */
class openssl_aead final
{
    struct cipher_ctx_deleter
    {
        void operator()(EVP_CIPHER_CTX *ctx) const noexcept
        {
            EVP_CIPHER_CTX_free(ctx);
        }
    };
    using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter>;

    openssl_aead() = default;

public:
    static constexpr std::size_t key_size = 32;

    openssl_aead(openssl_aead const &) = delete;
    openssl_aead(openssl_aead &&other) noexcept = default;
    auto operator=(openssl_aead const &) -> openssl_aead & = delete;
    auto operator=(openssl_aead &&other) noexcept -> openssl_aead & = default;
    ~openssl_aead() = default;

    static auto create(ro_dynblob key) noexcept -> result<openssl_aead>
    {
        using namespace std::string_view_literals;

        ERR_clear_error();

        if (key.size() != key_size
            || static_cast<int>(key.size())
                       != EVP_CIPHER_key_length(EVP_aes_256_gcm()))
        {
            return errc::invalid_argument;
        }

        openssl_aead ctx;
        ctx.mCtx.reset(EVP_CIPHER_CTX_new());
        if (!ctx.mCtx)
        {
            return errc::not_enough_memory
                   << ed::error_code_api_origin{"EVP_CIPHER_CTX_new"sv};
        }
        copy(key.first<key_size>(), as_span(ctx.mKey));
        return ctx;
    }

    auto seal(rw_dynblob out,
              rw_dynblob outTag,
              ro_dynblob nonce,
              ro_dynblob plain) -> result<void>
    {
        using namespace std::string_view_literals;

        // narrow contract violations
        if (out.empty() || out.size() != plain.size())
        {
            BOOST_THROW_EXCEPTION(
                    invalid_argument{}
                    << errinfo_param_name{"out"}
                    << errinfo_param_misuse_description{
                               "the ciphertext output buffer must be as "
                               "large as the plaintext"});
        }
        if (outTag.empty())
        {
            BOOST_THROW_EXCEPTION(
                    invalid_argument{}
                    << errinfo_param_name{"outTag"}
                    << errinfo_param_misuse_description{
                               "no tag output buffer was supplied"});
        }
        if (nonce.empty())
        {
            BOOST_THROW_EXCEPTION(invalid_argument{}
                                  << errinfo_param_name{"nonce"}
                                  << errinfo_param_misuse_description{
                                             "no nonce was supplied"});
        }
        if (plain.size() > static_cast<std::size_t>(INT_MAX))
        {
            return errc::result_out_of_range;
        }

        ERR_clear_error();
        auto *const ctx = mCtx.get();
        if (!EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr,
                                   nullptr))
        {
            return errc::bad
                   << ed::error_code_api_origin{"EVP_EncryptInit_ex"sv}
                   << make_openssl_errinfo();
        }
        if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN,
                                 static_cast<int>(nonce.size()), nullptr))
        {
            return errc::bad
                   << ed::error_code_api_origin{"EVP_CIPHER_CTX_ctrl"sv}
                   << make_openssl_errinfo("EVP_CTRL_GCM_SET_IVLEN");
        }
        if (!EVP_EncryptInit_ex(
                    ctx, nullptr, nullptr,
                    reinterpret_cast<unsigned char const *>(mKey.data()),
                    reinterpret_cast<unsigned char const *>(nonce.data())))
        {
            return errc::bad
                   << ed::error_code_api_origin{"EVP_EncryptInit_ex"sv}
                   << make_openssl_errinfo();
        }

        int written = 0;
        if (!EVP_EncryptUpdate(
                    ctx, reinterpret_cast<unsigned char *>(out.data()),
                    &written,
                    reinterpret_cast<unsigned char const *>(plain.data()),
                    static_cast<int>(plain.size())))
        {
            return errc::bad
                   << ed::error_code_api_origin{"EVP_EncryptUpdate"sv}
                   << make_openssl_errinfo();
        }
        int finalWritten = 0;
        if (!EVP_EncryptFinal_ex(
                    ctx, reinterpret_cast<unsigned char *>(out.data()) + written,
                    &finalWritten))
        {
            return errc::bad
                   << ed::error_code_api_origin{"EVP_EncryptFinal_ex"sv}
                   << make_openssl_errinfo();
        }
        if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG,
                                 static_cast<int>(outTag.size()),
                                 outTag.data()))
        {
            return errc::bad
                   << ed::error_code_api_origin{"EVP_CIPHER_CTX_ctrl"sv}
                   << make_openssl_errinfo("EVP_CTRL_GCM_GET_TAG");
        }

        return success();
    }

    auto open(rw_dynblob out,
              ro_dynblob nonce,
              ro_dynblob ciphertext,
              ro_dynblob authTag) -> result<void>
    {
        using namespace std::string_view_literals;

        if (out.empty() || out.size() != ciphertext.size())
        {
            BOOST_THROW_EXCEPTION(
                    invalid_argument{}
                    << errinfo_param_name{"out"}
                    << errinfo_param_misuse_description{
                               "the plaintext output buffer must be as "
                               "large as the ciphertext"});
        }
        if (nonce.empty())
        {
            BOOST_THROW_EXCEPTION(invalid_argument{}
                                  << errinfo_param_name{"nonce"}
                                  << errinfo_param_misuse_description{
                                             "no nonce was supplied"});
        }
        if (authTag.empty())
        {
            BOOST_THROW_EXCEPTION(
                    invalid_argument{}
                    << errinfo_param_name{"authTag"}
                    << errinfo_param_misuse_description{
                               "no authentication tag buffer was supplied"});
        }
        if (ciphertext.size() > static_cast<std::size_t>(INT_MAX))
        {
            return errc::result_out_of_range;
        }

        ERR_clear_error();
        auto *const ctx = mCtx.get();
        if (!EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr,
                                   nullptr))
        {
            return errc::bad
                   << ed::error_code_api_origin{"EVP_DecryptInit_ex"sv}
                   << make_openssl_errinfo();
        }
        if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN,
                                 static_cast<int>(nonce.size()), nullptr))
        {
            return errc::bad
                   << ed::error_code_api_origin{"EVP_CIPHER_CTX_ctrl"sv}
                   << make_openssl_errinfo("EVP_CTRL_GCM_SET_IVLEN");
        }
        if (!EVP_DecryptInit_ex(
                    ctx, nullptr, nullptr,
                    reinterpret_cast<unsigned char const *>(mKey.data()),
                    reinterpret_cast<unsigned char const *>(nonce.data())))
        {
            return errc::bad
                   << ed::error_code_api_origin{"EVP_DecryptInit_ex"sv}
                   << make_openssl_errinfo();
        }

        int written = 0;
        if (!EVP_DecryptUpdate(
                    ctx, reinterpret_cast<unsigned char *>(out.data()),
                    &written,
                    reinterpret_cast<unsigned char const *>(ciphertext.data()),
                    static_cast<int>(ciphertext.size())))
        {
            utils::secure_memzero(out);
            return errc::bad
                   << ed::error_code_api_origin{"EVP_DecryptUpdate"sv}
                   << make_openssl_errinfo();
        }
        // the tag is only read by openssl, the ctrl interface isn't const
        // correct
        if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG,
                                 static_cast<int>(authTag.size()),
                                 const_cast<std::byte *>(authTag.data())))
        {
            utils::secure_memzero(out);
            return errc::bad
                   << ed::error_code_api_origin{"EVP_CIPHER_CTX_ctrl"sv}
                   << make_openssl_errinfo("EVP_CTRL_GCM_SET_TAG");
        }
        int finalWritten = 0;
        if (EVP_DecryptFinal_ex(
                    ctx, reinterpret_cast<unsigned char *>(out.data()) + written,
                    &finalWritten)
            <= 0)
        {
            // parameters etc. were formally correct, but the message is
            // _bad_
            ERR_clear_error();
            utils::secure_memzero(out);
            return secfile_errc::tag_mismatch;
        }
        return success();
    }

private:
    cipher_ctx_ptr mCtx;
    utils::secure_byte_array<key_size> mKey;
};
} // namespace secfile::crypto::detail
