/*
 * Copyright (C) 2023 by Oleksandr Zolotov <alex@nextcloud.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY
 * or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License
 * for more details.
 */

#include "clientsideencryptionprimitives.h"

#include <QLoggingCategory>

#include <openssl/x509.h>

#include <utility>

namespace CDC
{

Q_LOGGING_CATEGORY(lcCseUtility, "cipherdrive.sync.clientsideencryption.utility", QtInfoMsg)

Bio::operator const BIO *() const
{
    return _bio;
}

Bio::operator BIO *()
{
    return _bio;
}

PKeyCtx::PKeyCtx(int id)
    : _ctx(EVP_PKEY_CTX_new_id(id, nullptr))
{
}

PKeyCtx::PKeyCtx(PKeyCtx &&other)
{
    std::swap(_ctx, other._ctx);
}

PKeyCtx::~PKeyCtx()
{
    EVP_PKEY_CTX_free(_ctx);
}

PKeyCtx PKeyCtx::forKey(EVP_PKEY *pkey)
{
    PKeyCtx ctx;
    ctx._ctx = EVP_PKEY_CTX_new(pkey, nullptr);
    if (!ctx._ctx) {
        qCWarning(lcCseUtility) << "Could not create a key context";
    }
    return ctx;
}

PKeyCtx::operator EVP_PKEY_CTX *()
{
    return _ctx;
}

PKey::~PKey()
{
    EVP_PKEY_free(_pkey);
}

PKey::PKey(PKey &&other)
{
    std::swap(_pkey, other._pkey);
}

PKey &PKey::operator=(PKey &&other)
{
    if (&other != this) {
        EVP_PKEY_free(_pkey);
        _pkey = std::exchange(other._pkey, nullptr);
    }
    return *this;
}

PKey PKey::readPublicKey(const QByteArray &der)
{
    PKey result;
    auto data = reinterpret_cast<const unsigned char *>(der.constData());
    result._pkey = d2i_PUBKEY(nullptr, &data, der.size());
    if (!result._pkey) {
        qCWarning(lcCseUtility) << "Could not parse public key of" << der.size() << "bytes";
    }
    return result;
}

PKey PKey::readPrivateKey(const QByteArray &der)
{
    PKey result;
    auto data = reinterpret_cast<const unsigned char *>(der.constData());
    result._pkey = d2i_AutoPrivateKey(nullptr, &data, der.size());
    if (!result._pkey) {
        qCWarning(lcCseUtility) << "Could not parse private key";
    }
    return result;
}

PKey PKey::generate(PKeyCtx &ctx)
{
    PKey result;
    if (EVP_PKEY_keygen(ctx, &result._pkey) <= 0) {
        result._pkey = nullptr;
    }
    return result;
}

QByteArray PKey::publicKeyDer() const
{
    if (!_pkey) {
        return {};
    }
    unsigned char *buffer = nullptr;
    const auto length = i2d_PUBKEY(_pkey, &buffer);
    if (length <= 0) {
        return {};
    }
    QByteArray result(reinterpret_cast<const char *>(buffer), length);
    OPENSSL_free(buffer);
    return result;
}

QByteArray PKey::privateKeyDer() const
{
    if (!_pkey) {
        return {};
    }
    auto info = EVP_PKEY2PKCS8(_pkey);
    if (!info) {
        return {};
    }
    unsigned char *buffer = nullptr;
    const auto length = i2d_PKCS8_PRIV_KEY_INFO(info, &buffer);
    PKCS8_PRIV_KEY_INFO_free(info);
    if (length <= 0) {
        return {};
    }
    QByteArray result(reinterpret_cast<const char *>(buffer), length);
    OPENSSL_free(buffer);
    return result;
}

PKey::operator EVP_PKEY *()
{
    return _pkey;
}

PKey::operator EVP_PKEY *() const
{
    return _pkey;
}

}
