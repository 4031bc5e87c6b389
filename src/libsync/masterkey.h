/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "metacrypter.h"

#include <QByteArray>
#include <QVector>

namespace CDC {

/**
 * @brief Legacy account key (auth versions 1 and 2)
 *
 * Encrypts in the "002" format. Decrypts both "002" strings and the
 * OpenSSL salted "U2FsdGVk" strings written by the first generation of
 * clients.
 */
class CIPHERDRIVESYNC_EXPORT MasterKey : public MetaCrypter
{
public:
    explicit MasterKey(const QByteArray &key);

    [[nodiscard]] QByteArray encryptMeta(const QByteArray &metadata) const override;
    [[nodiscard]] DriveResult<QByteArray> decryptMeta(const QByteArray &encrypted) const override;

    [[nodiscard]] DriveResult<QByteArray> decryptMetaV1(const QByteArray &encrypted) const;
    [[nodiscard]] DriveResult<QByteArray> decryptMetaV2(const QByteArray &encrypted) const;

    [[nodiscard]] const QByteArray &bytes() const { return _bytes; }
    [[nodiscard]] const QByteArray &derivedBytes() const { return _derivedBytes; }

    static bool isV1Format(const QByteArray &encrypted);
    static bool isV2Format(const QByteArray &encrypted);

private:
    QByteArray _bytes;
    QByteArray _derivedBytes;
};

/**
 * @brief Ordered master-key ring, oldest first
 *
 * Decryption scans the ring in order and returns the first success.
 * Encryption uses the newest key.
 */
class CIPHERDRIVESYNC_EXPORT MasterKeyRing : public MetaCrypter
{
public:
    MasterKeyRing() = default;
    explicit MasterKeyRing(const QVector<MasterKey> &keys);

    /**
     * Builds the ring from the key the user logged in with and the
     * '|' separated list the server keeps, oldest first. The login key
     * is the current one: its duplicates in the list are dropped and it
     * is appended as the newest entry.
     */
    static MasterKeyRing fromServerList(const MasterKey &loginKey, const QByteArray &serverKeys);

    [[nodiscard]] QByteArray encryptMeta(const QByteArray &metadata) const override;
    [[nodiscard]] DriveResult<QByteArray> decryptMeta(const QByteArray &encrypted) const override;

    [[nodiscard]] const QVector<MasterKey> &keys() const { return _keys; }
    [[nodiscard]] bool isEmpty() const { return _keys.isEmpty(); }

private:
    QVector<MasterKey> _keys;
};

}
