/*
 * Copyright © 2017, Tomaz Canabrava <tcanabrava@kde.org>
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

#ifndef CLIENTSIDEENCRYPTION_H
#define CLIENTSIDEENCRYPTION_H

#include "cipherdrivelib.h"

#include "clientsideencryptionprimitives.h"
#include "driveerror.h"

#include <QByteArray>

#include <openssl/evp.h>

namespace CDC {

/**
 * Stateless wrappers around the OpenSSL primitives used by the key hierarchy
 *
 * Every function that can fail reports a CryptoFailure (or KeyMismatch for
 * authentication failures) instead of returning partial output.
 */
namespace EncryptionHelper {
    CIPHERDRIVESYNC_EXPORT QByteArray generateRandom(int size);

    /// Random string over [a-zA-Z0-9], used for v2 keys, nonces and upload tokens
    CIPHERDRIVESYNC_EXPORT QByteArray generateRandomString(int length);

    CIPHERDRIVESYNC_EXPORT QByteArray pbkdf2Sha512(const QByteArray &password, const QByteArray &salt, int iterations, int keyLength);

    CIPHERDRIVESYNC_EXPORT DriveResult<QByteArray> hkdfSha256(const QByteArray &inputKey, const QByteArray &info, int keyLength);

    /// AES-256-GCM, returns ciphertext with the 16 byte tag appended
    CIPHERDRIVESYNC_EXPORT DriveResult<QByteArray> encryptSymmetric(const QByteArray &key, const QByteArray &nonce, const QByteArray &data);

    /// Inverse of encryptSymmetric, a tag mismatch yields KeyMismatch
    CIPHERDRIVESYNC_EXPORT DriveResult<QByteArray> decryptSymmetric(const QByteArray &key, const QByteArray &nonce, const QByteArray &data);

    /// OpenSSL "Salted__" AES-256-CBC blob, key and iv derived with EVP_BytesToKey(MD5)
    CIPHERDRIVESYNC_EXPORT DriveResult<QByteArray> decryptSaltedCbc(const QByteArray &password, const QByteArray &saltedData);

    /// RSA-OAEP with SHA-512 for both the label digest and MGF1
    CIPHERDRIVESYNC_EXPORT DriveResult<QByteArray> encryptStringAsymmetric(EVP_PKEY *publicKey, const QByteArray &data);
    CIPHERDRIVESYNC_EXPORT DriveResult<QByteArray> decryptStringAsymmetric(EVP_PKEY *privateKey, const QByteArray &data);

    /// Base64 DER SubjectPublicKeyInfo
    CIPHERDRIVESYNC_EXPORT DriveResult<PKey> publicKeyFromBase64(const QByteArray &base64);

    /// Base64 DER PKCS#8
    CIPHERDRIVESYNC_EXPORT DriveResult<PKey> privateKeyFromBase64(const QByteArray &base64);

    CIPHERDRIVESYNC_EXPORT DriveResult<PKey> generateRsaKeyPair(int bits);

    /// Big endian bytes of the private exponent of an RSA key
    CIPHERDRIVESYNC_EXPORT DriveResult<QByteArray> rsaPrivateExponent(EVP_PKEY *privateKey);

    /// hex(SHA1(hex(SHA512(data)))), the name hash of accounts before HMAC keys existed
    CIPHERDRIVESYNC_EXPORT QByteArray v2Hash(const QByteArray &data);
}

}
#endif
