/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "metacrypter.h"
#include "masterkey.h"

#include <QByteArray>

#include <memory>

namespace CDC {

/**
 * @brief A 32 byte symmetric key
 *
 * Serves as the per-object key of files and directories, as the DEK and KEK
 * of current accounts and as the key of public links. Metadata is written in
 * the "003" format; file content as nonce, ciphertext and tag.
 *
 * Keys are immutable once created.
 */
class CIPHERDRIVESYNC_EXPORT EncryptionKey : public MetaCrypter
{
public:
    /// An empty key, isValid() is false
    EncryptionKey() = default;

    /// Fresh random key for objects written with \a fileEncryptionVersion
    static DriveResult<EncryptionKey> generate(int fileEncryptionVersion);

    static DriveResult<EncryptionKey> fromBytes(const QByteArray &bytes);

    /// 64 hex chars
    static DriveResult<EncryptionKey> fromHexString(const QByteArray &hex);

    /// Either 32 raw chars (versions 1 and 2) or 64 hex chars (version 3)
    static DriveResult<EncryptionKey> fromUnknownString(const QByteArray &key);

    [[nodiscard]] bool isValid() const { return _bytes.size() == 32; }

    [[nodiscard]] const QByteArray &bytes() const { return _bytes; }

    /// Hex string for version 3, the raw key for older versions
    [[nodiscard]] QByteArray toString(int fileEncryptionVersion) const;

    [[nodiscard]] QByteArray encryptMeta(const QByteArray &metadata) const override;
    [[nodiscard]] DriveResult<QByteArray> decryptMeta(const QByteArray &encrypted) const override;

    [[nodiscard]] DriveResult<QByteArray> encryptData(const QByteArray &data) const;
    [[nodiscard]] DriveResult<QByteArray> decryptData(const QByteArray &data) const;

    /// v2 crypter over the same key, used for the per-file encrypted name, size and mime type
    [[nodiscard]] MasterKey toMasterKey() const;

    bool operator==(const EncryptionKey &other) const { return _bytes == other._bytes; }
    bool operator!=(const EncryptionKey &other) const { return _bytes != other._bytes; }

private:
    explicit EncryptionKey(const QByteArray &bytes)
        : _bytes(bytes)
    {
    }

    QByteArray _bytes;
};

/**
 * Crypter for a public link key. 64 hex chars make a current key,
 * anything else is treated as a legacy master key.
 */
CIPHERDRIVESYNC_EXPORT std::unique_ptr<MetaCrypter> metaCrypterFromKeyString(const QByteArray &key);

}
