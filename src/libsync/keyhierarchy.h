/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "cipherdrivelib.h"
#include "clientsideencryptionprimitives.h"
#include "driveerror.h"
#include "encryptionkey.h"
#include "hmackey.h"
#include "masterkey.h"

#include <QByteArray>
#include <QSharedPointer>
#include <QString>

namespace CDC {

/**
 * @brief The account's key material
 *
 * Legacy accounts (auth versions 1 and 2) hold an ordered master-key ring,
 * current accounts (auth version 3) a single data encryption key. Both also
 * carry the RSA key pair and the HMAC key derived from it.
 *
 * The hierarchy only protects the owner's own view of the object tree.
 * Shares are encrypted for the recipient's public key and links with the
 * link key, never with the hierarchy.
 *
 * A KeyHierarchy is immutable after setup and safe to read from several
 * threads at once.
 */
class CIPHERDRIVESYNC_EXPORT KeyHierarchy
{
public:
    KeyHierarchy() = default;

    static KeyHierarchy fromMasterKeyRing(int authVersion, const MasterKeyRing &ring);
    static KeyHierarchy fromDataEncryptionKey(const EncryptionKey &dek);

    /**
     * Unlocks a legacy account: \a encryptedServerKeys is the '|' separated
     * master key list as returned by the server, encrypted with \a loginKey.
     */
    static DriveResult<KeyHierarchy> unlockMasterKeys(int authVersion, const MasterKey &loginKey, const QByteArray &encryptedServerKeys);

    /**
     * Unlocks a current account: \a encryptedDek is the hex DEK encrypted
     * with the key encryption key.
     */
    static DriveResult<KeyHierarchy> unlockDataEncryptionKey(const EncryptionKey &kek, const QByteArray &encryptedDek);

    /**
     * Installs the account key pair. The private key arrives encrypted with
     * this hierarchy, the HMAC key is derived from it.
     */
    DriveResult<void> setKeyPair(const QByteArray &publicKeyBase64, const QByteArray &encryptedPrivateKey);

    [[nodiscard]] bool isValid() const;
    [[nodiscard]] bool hasKeyPair() const { return !_privateKey.isNull(); }

    [[nodiscard]] int authVersion() const { return _authVersion; }
    [[nodiscard]] int metadataEncryptionVersion() const;
    [[nodiscard]] int fileEncryptionVersion() const;

    /// Wraps a per-object key for storage inside the owner's metadata
    [[nodiscard]] QByteArray wrapKey(const EncryptionKey &key) const;
    [[nodiscard]] DriveResult<EncryptionKey> unwrapKey(const QByteArray &wrapped) const;

    [[nodiscard]] QByteArray encryptMeta(const QByteArray &metadata) const;

    /**
     * Dispatches on the format prefix. Legacy strings go through the master
     * key ring, "003" strings through the DEK. KeyMismatch if no key fits.
     */
    [[nodiscard]] DriveResult<QByteArray> decryptMeta(const QByteArray &encrypted) const;

    /// Server-side lookup hash of a file or directory name
    [[nodiscard]] QByteArray hashFileName(const QString &name) const;

    [[nodiscard]] const HmacKey &hmacKey() const { return _hmacKey; }
    [[nodiscard]] const QByteArray &publicKey() const { return _publicKey; }
    [[nodiscard]] EVP_PKEY *privateKey() const;

    [[nodiscard]] const MasterKeyRing &masterKeys() const { return _masterKeys; }

private:
    int _authVersion = 0;
    MasterKeyRing _masterKeys;
    EncryptionKey _dek;
    QByteArray _publicKey;
    QSharedPointer<PKey> _privateKey;
    HmacKey _hmacKey;
};

}
