#include "file_header.hpp"

#include "../crypto/kdf.hpp"

namespace secfile::detail
{
auto make_key_material(ro_blob<aead_key_size> key,
                       ro_blob<salt_size> salt) noexcept -> key_material
{
    key_material material;
    auto const materialView = as_span(material);
    copy(key, materialView.first<aead_key_size>());
    copy(salt.first<aead_nonce_size>(),
         materialView.subspan<aead_key_size, aead_nonce_size>());
    return material;
}

auto derive_wrapping_key(ro_dynblob passphrase,
                         ro_blob<salt_size> salt,
                         kdf_parameters const &kdf) noexcept
        -> result<raw_key>
{
    raw_key wrappingKey;
    if (passphrase.size() == raw_key_size)
    {
        copy(passphrase, rw_dynblob{as_span(wrappingKey)});
        return wrappingKey;
    }

    SECFILE_TRY(crypto::scrypt(as_span(wrappingKey), passphrase, salt, kdf));
    return wrappingKey;
}

auto wrap_key(crypto::crypto_provider const &provider,
              raw_key const &wrappingKey,
              ro_blob<salt_size> salt,
              raw_key const &realKey,
              rw_blob<wrapped_key_size> wrappedKey) noexcept -> result<void>
{
    auto const material = make_key_material(
            as_span(wrappingKey).first<aead_key_size>(), salt);

    return provider.box_seal(wrappedKey.first<raw_key_size>(),
                             wrappedKey.subspan<raw_key_size>(),
                             as_span(material), as_span(realKey));
}

auto unwrap_key(crypto::crypto_provider const &provider,
                raw_key const &wrappingKey,
                ro_blob<salt_size> salt,
                ro_blob<wrapped_key_size> wrappedKey) noexcept
        -> result<raw_key>
{
    auto const material = make_key_material(
            as_span(wrappingKey).first<aead_key_size>(), salt);

    raw_key realKey;
    if (auto openrx = provider.box_open(as_span(realKey), as_span(material),
                                        wrappedKey.first<raw_key_size>(),
                                        wrappedKey.subspan<raw_key_size>());
        openrx.has_failure())
    {
        if (openrx.assume_error() == secfile_errc::tag_mismatch)
        {
            return secfile_errc::wrong_passphrase;
        }
        return std::move(openrx).assume_error();
    }
    return realKey;
}

auto generate_header(crypto::crypto_provider const &provider,
                     ro_dynblob passphrase,
                     kdf_parameters const &kdf,
                     raw_key &realKey) noexcept -> result<file_header>
{
    file_header header{};
    SECFILE_TRY(provider.random_bytes(header.salt));
    SECFILE_TRY(provider.random_bytes(as_span(realKey)));

    SECFILE_TRY(wrappingKey,
                derive_wrapping_key(passphrase, header.salt, kdf));
    SECFILE_TRY(wrap_key(provider, wrappingKey, header.salt, realKey,
                         header.wrappedKey));
    return header;
}

auto rekey_header(crypto::crypto_provider const &provider,
                  file_header const &header,
                  raw_key const &realKey,
                  ro_dynblob newPassphrase,
                  kdf_parameters const &kdf) noexcept -> result<file_header>
{
    file_header rekeyed{header};
    SECFILE_TRY(wrappingKey,
                derive_wrapping_key(newPassphrase, rekeyed.salt, kdf));
    SECFILE_TRY(wrap_key(provider, wrappingKey, rekeyed.salt, realKey,
                         rekeyed.wrappedKey));
    return rekeyed;
}

auto read_header(file &storage) noexcept -> result<file_header>
{
    std::array<std::byte, header_size> serialized{};
    SECFILE_TRY(storage.seek(0));
    SECFILE_TRY(bytesRead, storage.read(serialized));
    if (bytesRead != header_size)
    {
        return secfile_errc::wrong_passphrase
               << ed::io_area{ed::file_span{
                       0, static_cast<std::uint64_t>(bytesRead)}};
    }

    file_header header{};
    std::span const serializedView{serialized};
    copy(serializedView.first<salt_size>(), std::span{header.salt});
    copy(serializedView.subspan<salt_size>(), std::span{header.wrappedKey});
    return header;
}

auto write_header(file &storage, file_header const &header) noexcept
        -> result<void>
{
    std::array<std::byte, header_size> serialized{};
    std::span const serializedView{serialized};
    copy(std::span{header.salt}, serializedView.first<salt_size>());
    copy(std::span{header.wrappedKey}, serializedView.subspan<salt_size>());

    SECFILE_TRY(storage.seek(0));
    return storage.write(serialized);
}
} // namespace secfile::detail
