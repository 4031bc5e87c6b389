/*
 * SPDX-FileCopyrightText: 2024 Nextcloud GmbH and Nextcloud contributors
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "cipherdrivelib.h"

#include <QByteArray>

#include <openssl/evp.h>

namespace CDC
{
class CIPHERDRIVESYNC_EXPORT Bio
{
public:
    Bio()
        : _bio(BIO_new(BIO_s_mem()))
    {
    }

    ~Bio()
    {
        BIO_free_all(_bio);
    }

    operator const BIO *() const;
    operator BIO *();

private:
    Q_DISABLE_COPY(Bio)

    BIO *_bio;
};

class CIPHERDRIVESYNC_EXPORT CipherCtx
{
public:
    CipherCtx()
        : _ctx(EVP_CIPHER_CTX_new())
    {
    }

    ~CipherCtx()
    {
        EVP_CIPHER_CTX_free(_ctx);
    }

    operator EVP_CIPHER_CTX *()
    {
        return _ctx;
    }

private:
    Q_DISABLE_COPY(CipherCtx)

    EVP_CIPHER_CTX *_ctx;
};

class CIPHERDRIVESYNC_EXPORT PKeyCtx
{
public:
    explicit PKeyCtx(int id);

    ~PKeyCtx();

    PKeyCtx(PKeyCtx &&other);
    PKeyCtx &operator=(PKeyCtx &&other) = delete;

    static PKeyCtx forKey(EVP_PKEY *pkey);

    operator EVP_PKEY_CTX *();

private:
    Q_DISABLE_COPY(PKeyCtx)

    PKeyCtx() = default;

    EVP_PKEY_CTX *_ctx = nullptr;
};

/**
 * Owning handle of an EVP_PKEY
 *
 * A failed read or generation yields a handle that converts to nullptr.
 */
class CIPHERDRIVESYNC_EXPORT PKey
{
public:
    PKey() = default;
    ~PKey();

    PKey(PKey &&other);
    PKey &operator=(PKey &&other);

    /// DER encoded SubjectPublicKeyInfo
    static PKey readPublicKey(const QByteArray &der);

    /// DER encoded PKCS#8 PrivateKeyInfo
    static PKey readPrivateKey(const QByteArray &der);

    static PKey generate(PKeyCtx &ctx);

    [[nodiscard]] QByteArray publicKeyDer() const;
    [[nodiscard]] QByteArray privateKeyDer() const;

    [[nodiscard]] bool isNull() const { return _pkey == nullptr; }

    operator EVP_PKEY *();

    operator EVP_PKEY *() const;

private:
    Q_DISABLE_COPY(PKey)

    EVP_PKEY *_pkey = nullptr;
};

}
