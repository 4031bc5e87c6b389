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

#include "clientsideencryption.h"

#include "common/constants.h"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

#include <QCryptographicHash>
#include <QLoggingCategory>

namespace CDC
{

Q_LOGGING_CATEGORY(lcCse, "cipherdrive.sync.clientsideencryption", QtInfoMsg)

namespace {
constexpr char alphanumeric[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr int alphanumericCount = sizeof(alphanumeric) - 1;

// largest multiple of alphanumericCount that fits a byte, bytes above are rejected
constexpr int randomByteLimit = 256 - (256 % alphanumericCount);

constexpr char saltedPrefix[] = "Salted__";
constexpr int saltSize = 8;

unsigned char* unsignedData(QByteArray& array)
{
    return (unsigned char*)array.data();
}

const unsigned char* unsignedData(const QByteArray& array)
{
    return (const unsigned char*)array.constData();
}

QByteArray BIO2ByteArray(Bio &b)
{
    auto pending = static_cast<int>(BIO_ctrl_pending(b));
    QByteArray res(pending, '\0');
    BIO_read(b, unsignedData(res), pending);
    return res;
}

QByteArray handleErrors()
{
    Bio bioErrors;
    ERR_print_errors(bioErrors);
    return BIO2ByteArray(bioErrors);
}

DriveError cryptoFailure(const QString &message)
{
    const auto details = handleErrors();
    qCWarning(lcCse) << message << details;
    return DriveError(DriveErrorCode::CryptoFailure, message);
}
}

namespace EncryptionHelper {

QByteArray generateRandom(int size)
{
    QByteArray result(size, '\0');

    int ret = RAND_bytes(unsignedData(result), size);
    if (ret != 1) {
        qCCritical(lcCse) << "Random byte generation failed!" << handleErrors();
        return {};
    }

    return result;
}

QByteArray generateRandomString(int length)
{
    QByteArray result;
    result.reserve(length);
    while (result.size() < length) {
        const auto pool = generateRandom(length);
        if (pool.isEmpty()) {
            return {};
        }
        for (const auto byte : pool) {
            const auto value = static_cast<unsigned char>(byte);
            if (value >= randomByteLimit) {
                continue;
            }
            result.append(alphanumeric[value % alphanumericCount]);
            if (result.size() == length) {
                break;
            }
        }
    }
    return result;
}

QByteArray pbkdf2Sha512(const QByteArray &password, const QByteArray &salt, int iterations, int keyLength)
{
    QByteArray derived(keyLength, '\0');
    if (PKCS5_PBKDF2_HMAC(password.constData(), password.size(),
                          unsignedData(salt), salt.size(),
                          iterations, EVP_sha512(),
                          keyLength, unsignedData(derived)) != 1) {
        qCWarning(lcCse) << "PBKDF2 derivation failed" << handleErrors();
        return {};
    }
    return derived;
}

DriveResult<QByteArray> hkdfSha256(const QByteArray &inputKey, const QByteArray &info, int keyLength)
{
    PKeyCtx ctx(EVP_PKEY_HKDF);
    if (!ctx) {
        return cryptoFailure(QStringLiteral("Could not create the HKDF context"));
    }
    if (EVP_PKEY_derive_init(ctx) <= 0) {
        return cryptoFailure(QStringLiteral("Could not init the HKDF derivation"));
    }
    if (EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) <= 0) {
        return cryptoFailure(QStringLiteral("Could not set the HKDF digest"));
    }
    if (EVP_PKEY_CTX_set1_hkdf_key(ctx, unsignedData(inputKey), inputKey.size()) <= 0) {
        return cryptoFailure(QStringLiteral("Could not set the HKDF input key"));
    }
    if (EVP_PKEY_CTX_add1_hkdf_info(ctx, unsignedData(info), info.size()) <= 0) {
        return cryptoFailure(QStringLiteral("Could not set the HKDF info"));
    }

    QByteArray out(keyLength, '\0');
    size_t outLen = out.size();
    if (EVP_PKEY_derive(ctx, unsignedData(out), &outLen) <= 0 || outLen != static_cast<size_t>(keyLength)) {
        return cryptoFailure(QStringLiteral("HKDF derivation failed"));
    }
    return out;
}

DriveResult<QByteArray> encryptSymmetric(const QByteArray &key, const QByteArray &nonce, const QByteArray &data)
{
    if (key.size() != Constants::symmetricKeySize) {
        return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("Symmetric key must be %1 bytes").arg(Constants::symmetricKeySize));
    }

    CipherCtx ctx;

    /* Create and initialise the context */
    if(!ctx) {
        return cryptoFailure(QStringLiteral("Error creating cipher"));
    }

    /* Initialise the encryption operation. */
    if(!EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr)) {
        return cryptoFailure(QStringLiteral("Error initializing context with aes_256_gcm"));
    }

    /* Set IV length. */
    if(!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, nonce.size(), nullptr)) {
        return cryptoFailure(QStringLiteral("Error setting iv length"));
    }

    /* Initialise key and IV */
    if(!EVP_EncryptInit_ex(ctx, nullptr, nullptr, unsignedData(key), unsignedData(nonce))) {
        return cryptoFailure(QStringLiteral("Error initialising key and iv"));
    }

    // Make sure we have enough room in the cipher text
    QByteArray ctext(data.size() + Constants::e2EeTagSize, '\0');

    int len = 0;
    if(!EVP_EncryptUpdate(ctx, unsignedData(ctext), &len, unsignedData(data), data.size())) {
        return cryptoFailure(QStringLiteral("Error encrypting"));
    }

    int clen = len;

    /* Finalise the encryption. Normally ciphertext bytes may be written at
     * this stage, but this does not occur in GCM mode
     */
    if(1 != EVP_EncryptFinal_ex(ctx, unsignedData(ctext) + len, &len)) {
        return cryptoFailure(QStringLiteral("Error finalizing encryption"));
    }
    clen += len;

    /* Get the e2EeTag */
    QByteArray e2EeTag(Constants::e2EeTagSize, '\0');
    if(1 != EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, Constants::e2EeTagSize, unsignedData(e2EeTag))) {
        return cryptoFailure(QStringLiteral("Error getting the e2EeTag"));
    }

    ctext.truncate(clen);
    ctext.append(e2EeTag);
    return ctext;
}

DriveResult<QByteArray> decryptSymmetric(const QByteArray &key, const QByteArray &nonce, const QByteArray &data)
{
    if (key.size() != Constants::symmetricKeySize) {
        return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("Symmetric key must be %1 bytes").arg(Constants::symmetricKeySize));
    }
    if (data.size() < Constants::e2EeTagSize) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Cipher text shorter than the authentication tag"));
    }

    auto cipherTXT = data;
    const QByteArray e2EeTag = cipherTXT.right(Constants::e2EeTagSize);
    cipherTXT.chop(Constants::e2EeTagSize);

    CipherCtx ctx;

    /* Create and initialise the context */
    if(!ctx) {
        return cryptoFailure(QStringLiteral("Error creating cipher"));
    }

    /* Initialise the decryption operation. */
    if(!EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr)) {
        return cryptoFailure(QStringLiteral("Error initialising context with aes 256"));
    }

    /* Set IV length. Not necessary if this is 12 bytes (96 bits) */
    if(!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, nonce.size(), nullptr)) {
        return cryptoFailure(QStringLiteral("Error setting IV size"));
    }

    /* Initialise key and IV */
    if(!EVP_DecryptInit_ex(ctx, nullptr, nullptr, unsignedData(key), unsignedData(nonce))) {
        return cryptoFailure(QStringLiteral("Error initialising key and iv"));
    }

    QByteArray ptext(cipherTXT.size() + Constants::e2EeTagSize, '\0');
    int plen = 0;

    if(!EVP_DecryptUpdate(ctx, unsignedData(ptext), &plen, unsignedData(cipherTXT), cipherTXT.size())) {
        return cryptoFailure(QStringLiteral("Could not decrypt"));
    }

    /* Set expected e2EeTag value. */
    if(!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, e2EeTag.size(), (unsigned char *)e2EeTag.constData())) {
        return cryptoFailure(QStringLiteral("Could not set e2EeTag"));
    }

    /* Finalise the decryption. A positive return value indicates success,
     * anything else is a failure - the plaintext is not trustworthy.
     */
    int len = plen;
    if (EVP_DecryptFinal_ex(ctx, unsignedData(ptext) + plen, &len) == 0) {
        ERR_clear_error();
        qCDebug(lcCse) << "Tag did not match";
        return DriveError(DriveErrorCode::KeyMismatch, QStringLiteral("Authentication tag did not match"));
    }

    ptext.truncate(plen);
    return ptext;
}

DriveResult<QByteArray> decryptSaltedCbc(const QByteArray &password, const QByteArray &saltedData)
{
    if (saltedData.size() <= 2 * saltSize || !saltedData.startsWith(saltedPrefix)) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Not a salted cipher text"));
    }
    const auto salt = saltedData.mid(saltSize, saltSize);
    const auto cipherTXT = saltedData.mid(2 * saltSize);

    QByteArray key(EVP_MAX_KEY_LENGTH, '\0');
    QByteArray iv(EVP_MAX_IV_LENGTH, '\0');
    if (EVP_BytesToKey(EVP_aes_256_cbc(), EVP_md5(), unsignedData(salt),
                       unsignedData(password), password.size(), 1,
                       unsignedData(key), unsignedData(iv)) != 32) {
        return cryptoFailure(QStringLiteral("Could not derive key and iv"));
    }

    CipherCtx ctx;
    if (!ctx) {
        return cryptoFailure(QStringLiteral("Error creating cipher"));
    }
    if (!EVP_DecryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, unsignedData(key), unsignedData(iv))) {
        return cryptoFailure(QStringLiteral("Error initialising context with aes 256 cbc"));
    }

    QByteArray ptext(cipherTXT.size() + EVP_MAX_BLOCK_LENGTH, '\0');
    int plen = 0;
    if (!EVP_DecryptUpdate(ctx, unsignedData(ptext), &plen, unsignedData(cipherTXT), cipherTXT.size())) {
        return cryptoFailure(QStringLiteral("Could not decrypt"));
    }

    // a wrong key almost always shows up as broken padding
    int len = 0;
    if (EVP_DecryptFinal_ex(ctx, unsignedData(ptext) + plen, &len) != 1) {
        ERR_clear_error();
        return DriveError(DriveErrorCode::KeyMismatch, QStringLiteral("Invalid padding"));
    }

    ptext.truncate(plen + len);
    return ptext;
}

DriveResult<QByteArray> encryptStringAsymmetric(EVP_PKEY *publicKey, const QByteArray &data)
{
    if (!publicKey) {
        return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("Public key is null. Could not encrypt."));
    }

    auto ctx = PKeyCtx::forKey(publicKey);
    if (!ctx) {
        return cryptoFailure(QStringLiteral("Could not initialize the pkey context."));
    }

    if (EVP_PKEY_encrypt_init(ctx) != 1) {
        return cryptoFailure(QStringLiteral("Error initializing the encryption."));
    }

    if (EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) <= 0) {
        return cryptoFailure(QStringLiteral("Error setting the encryption padding."));
    }

    if (EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha512()) <= 0) {
        return cryptoFailure(QStringLiteral("Error setting OAEP SHA 512"));
    }

    if (EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha512()) <= 0) {
        return cryptoFailure(QStringLiteral("Error setting MGF1 padding"));
    }

    size_t outLen = 0;
    if (EVP_PKEY_encrypt(ctx, nullptr, &outLen, unsignedData(data), data.size()) != 1) {
        return cryptoFailure(QStringLiteral("Error retrieving the size of the encrypted data"));
    }

    QByteArray out(static_cast<int>(outLen), '\0');
    if (EVP_PKEY_encrypt(ctx, unsignedData(out), &outLen, unsignedData(data), data.size()) != 1) {
        return cryptoFailure(QStringLiteral("Could not encrypt data."));
    }

    out.truncate(static_cast<int>(outLen));
    return out;
}

DriveResult<QByteArray> decryptStringAsymmetric(EVP_PKEY *privateKey, const QByteArray &data)
{
    if (!privateKey) {
        return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("Private key is null. Could not decrypt."));
    }

    auto ctx = PKeyCtx::forKey(privateKey);
    if (!ctx) {
        return cryptoFailure(QStringLiteral("Could not create the PKEY context."));
    }

    if (EVP_PKEY_decrypt_init(ctx) <= 0) {
        return cryptoFailure(QStringLiteral("Could not init the decryption"));
    }

    if (EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) <= 0) {
        return cryptoFailure(QStringLiteral("Error setting the encryption padding."));
    }

    if (EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha512()) <= 0) {
        return cryptoFailure(QStringLiteral("Error setting OAEP SHA 512"));
    }

    if (EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha512()) <= 0) {
        return cryptoFailure(QStringLiteral("Error setting MGF1 padding"));
    }

    size_t outlen = 0;
    if (EVP_PKEY_decrypt(ctx, nullptr, &outlen, unsignedData(data), data.size()) <= 0) {
        return cryptoFailure(QStringLiteral("Could not determine the buffer length"));
    }

    QByteArray out(static_cast<int>(outlen), '\0');

    if (EVP_PKEY_decrypt(ctx, unsignedData(out), &outlen, unsignedData(data), data.size()) <= 0) {
        ERR_clear_error();
        return DriveError(DriveErrorCode::KeyMismatch, QStringLiteral("Could not decrypt the data."));
    }

    // we don't need extra zeroes in out, so let's only return meaningful data
    out.truncate(static_cast<int>(outlen));
    return out;
}

DriveResult<PKey> publicKeyFromBase64(const QByteArray &base64)
{
    const auto decoded = QByteArray::fromBase64Encoding(base64, QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Public key is not valid base64"));
    }
    auto key = PKey::readPublicKey(*decoded);
    if (key.isNull()) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Could not parse public key"));
    }
    if (EVP_PKEY_get_base_id(key) != EVP_PKEY_RSA) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Public key is not an RSA key"));
    }
    return DriveResult<PKey>(std::move(key));
}

DriveResult<PKey> privateKeyFromBase64(const QByteArray &base64)
{
    const auto decoded = QByteArray::fromBase64Encoding(base64, QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Private key is not valid base64"));
    }
    auto key = PKey::readPrivateKey(*decoded);
    if (key.isNull()) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Could not parse private key"));
    }
    if (EVP_PKEY_get_base_id(key) != EVP_PKEY_RSA) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("Private key is not an RSA key"));
    }
    return DriveResult<PKey>(std::move(key));
}

DriveResult<PKey> generateRsaKeyPair(int bits)
{
    PKeyCtx ctx(EVP_PKEY_RSA);
    if (!ctx) {
        return cryptoFailure(QStringLiteral("Could not create the key generation context"));
    }
    if (EVP_PKEY_keygen_init(ctx) <= 0) {
        return cryptoFailure(QStringLiteral("Could not init the key generation"));
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits) <= 0) {
        return cryptoFailure(QStringLiteral("Could not set the key length"));
    }
    auto key = PKey::generate(ctx);
    if (key.isNull()) {
        return cryptoFailure(QStringLiteral("Could not generate the key"));
    }
    return DriveResult<PKey>(std::move(key));
}

DriveResult<QByteArray> rsaPrivateExponent(EVP_PKEY *privateKey)
{
    BIGNUM *exponent = nullptr;
    if (!privateKey || EVP_PKEY_get_bn_param(privateKey, OSSL_PKEY_PARAM_RSA_D, &exponent) != 1) {
        return cryptoFailure(QStringLiteral("Could not read the private exponent"));
    }
    QByteArray bytes(BN_num_bytes(exponent), '\0');
    BN_bn2bin(exponent, unsignedData(bytes));
    BN_clear_free(exponent);
    return bytes;
}

QByteArray v2Hash(const QByteArray &data)
{
    const auto inner = QCryptographicHash::hash(data, QCryptographicHash::Sha512).toHex();
    return QCryptographicHash::hash(inner, QCryptographicHash::Sha1).toHex();
}

}

}
