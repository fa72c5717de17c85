#pragma once

#include <gmock/gmock.h>

#include <secfile/crypto/provider.hpp>

class crypto_provider_mock : public secfile::crypto::crypto_provider
{
public:
    // AES-256-GCM sized key material
    crypto_provider_mock()
        : crypto_provider(32 + 12)
    {
    }

    MOCK_METHOD(secfile::result<void>,
                box_seal,
                (secfile::rw_dynblob ciphertext,
                 secfile::rw_dynblob mac,
                 secfile::ro_dynblob keyMaterial,
                 secfile::ro_dynblob plaintext),
                (const, noexcept, override));
    MOCK_METHOD(secfile::result<void>,
                box_open,
                (secfile::rw_dynblob plaintext,
                 secfile::ro_dynblob keyMaterial,
                 secfile::ro_dynblob ciphertext,
                 secfile::ro_dynblob mac),
                (const, noexcept, override));
    MOCK_METHOD(secfile::result<void>,
                random_bytes,
                (secfile::rw_dynblob out),
                (const, noexcept, override));
};
