/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "abstractapiclient.h"
#include "cipherdrivelib.h"
#include "driveerror.h"
#include "filesystemobject.h"
#include "hmackey.h"

#include <QStringList>
#include <QVector>

namespace CDC {

/**
 * Search tokens of object names
 *
 * The server only ever sees HMAC hashes of name substrings, so the same
 * name and key must always produce the same hashes for lookups to match.
 */
namespace SearchIndexer {
    /**
     * Every substring of 2 to 16 code points of the trimmed, lowercased
     * name, plus the whole normalised name. Sorted by length, then by
     * collation order; at most 4096 entries.
     */
    CIPHERDRIVESYNC_EXPORT QStringList tokenize(const QString &name);

    CIPHERDRIVESYNC_EXPORT QVector<QByteArray> generateIndexHashes(const QString &name, const HmacKey &key);

    /// One entry per token hash of the item's name, typed for the search API
    CIPHERDRIVESYNC_EXPORT DriveResult<QVector<SearchIndexEntry>> indexEntries(const FileSystemObject &item, const HmacKey &key);
}

}
