/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "searchindexer.h"

#include "common/constants.h"

#include <QCollator>
#include <QLocale>
#include <QLoggingCategory>
#include <QPair>
#include <QSet>

#include <algorithm>

namespace CDC {

Q_LOGGING_CATEGORY(lcSearchIndexer, "cipherdrive.sync.searchindexer", QtInfoMsg)

namespace SearchIndexer {

QStringList tokenize(const QString &name)
{
    const auto normalized = name.trimmed().toLower();
    if (normalized.isEmpty()) {
        return {};
    }

    const auto codePoints = normalized.toUcs4();
    const auto *data = reinterpret_cast<const char32_t *>(codePoints.constData());
    const int length = codePoints.size();
    const int maxLength = qMin(Constants::searchTokenMaxLength, length);

    // token text and its length in code points
    QSet<QString> seen;
    QVector<QPair<QString, int>> unique;
    const auto add = [&seen, &unique](const QString &token, int size) {
        if (!seen.contains(token)) {
            seen.insert(token);
            unique.append(qMakePair(token, size));
        }
    };
    add(normalized, length);
    for (int start = 0; start < length; ++start) {
        for (int size = Constants::searchTokenMinLength; size <= maxLength && start + size <= length; ++size) {
            add(QString::fromUcs4(data + start, size), size);
        }
    }

    QCollator collator(QLocale(QLocale::English));
    std::sort(unique.begin(), unique.end(), [&collator](const QPair<QString, int> &a, const QPair<QString, int> &b) {
        if (a.second != b.second) {
            return a.second < b.second;
        }
        const auto order = collator.compare(a.first, b.first);
        if (order != 0) {
            return order < 0;
        }
        // collation may treat distinct strings as equal
        return a.first < b.first;
    });

    QStringList tokens;
    const int count = qMin(unique.size(), static_cast<qsizetype>(Constants::searchTokenLimit));
    tokens.reserve(count);
    for (int i = 0; i < count; ++i) {
        tokens.append(unique.at(i).first);
    }
    return tokens;
}

QVector<QByteArray> generateIndexHashes(const QString &name, const HmacKey &key)
{
    const auto tokens = tokenize(name);
    QVector<QByteArray> hashes;
    hashes.reserve(tokens.size());
    for (const auto &token : tokens) {
        hashes.append(key.hash(token.toUtf8()));
    }
    return hashes;
}

DriveResult<QVector<SearchIndexEntry>> indexEntries(const FileSystemObject &item, const HmacKey &key)
{
    const auto type = searchItemType(item);
    if (!type) {
        return type.error();
    }
    if (!key.isValid()) {
        return DriveError(DriveErrorCode::InvalidState, QStringLiteral("no HMAC key to index %1").arg(itemUuid(item)));
    }

    const auto uuid = itemUuid(item);
    QVector<SearchIndexEntry> entries;
    const auto hashes = generateIndexHashes(itemName(item), key);
    entries.reserve(hashes.size());
    for (const auto &hash : hashes) {
        entries.append(SearchIndexEntry{uuid, hash, *type});
    }
    qCDebug(lcSearchIndexer) << "Generated" << entries.size() << "search hashes for" << uuid;
    return entries;
}

}

}
