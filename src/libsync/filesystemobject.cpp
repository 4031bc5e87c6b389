/*
 * SPDX-FileCopyrightText: 2026 Cipherdrive contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "filesystemobject.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QMimeDatabase>
#include <QUuid>

namespace CDC {

Q_LOGGING_CATEGORY(lcFileSystemObject, "cipherdrive.sync.filesystemobject", QtInfoMsg)

namespace {
const char defaultMimeType[] = "application/octet-stream";

QString newUuid()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

// Timestamps are stored with millisecond precision on the server.
QDateTime toMilliseconds(const QDateTime &time)
{
    if (!time.isValid()) {
        return QDateTime::currentDateTimeUtc();
    }
    return QDateTime::fromMSecsSinceEpoch(time.toMSecsSinceEpoch(), Qt::UTC);
}

QString guessMimeType(const QString &name)
{
    static const QMimeDatabase db;
    const auto mime = db.mimeTypeForFile(name, QMimeDatabase::MatchExtension);
    if (!mime.isValid() || mime.isDefault()) {
        return QString::fromLatin1(defaultMimeType);
    }
    return mime.name();
}

qint64 jsonInteger(const QJsonValue &value, qint64 fallback)
{
    if (value.isDouble()) {
        return static_cast<qint64>(value.toDouble());
    }
    if (value.isString()) {
        bool ok = false;
        const auto number = value.toString().toLongLong(&ok);
        if (ok) {
            return number;
        }
    }
    return fallback;
}

DriveResult<QJsonObject> parseObject(const QByteArray &metadata)
{
    QJsonParseError error{};
    const auto doc = QJsonDocument::fromJson(metadata, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return DriveError(DriveErrorCode::ParseError, QStringLiteral("invalid metadata JSON: %1").arg(error.errorString()));
    }
    return doc.object();
}
}

DriveResult<IncompleteFile> IncompleteFile::create(int fileEncryptionVersion,
    const QString &name,
    const QString &mimeType,
    const QDateTime &created,
    const QDateTime &lastModified,
    const QString &parentUuid)
{
    if (name.isEmpty() || name.contains(QLatin1Char('/'))) {
        return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("invalid file name \"%1\"").arg(name));
    }
    if (parentUuid.isEmpty()) {
        return DriveError(DriveErrorCode::InvalidArgument, QStringLiteral("file \"%1\" has no parent").arg(name));
    }

    auto key = EncryptionKey::generate(fileEncryptionVersion);
    if (!key) {
        return key.error();
    }

    IncompleteFile file;
    file.uuid = newUuid();
    file.name = name;
    file.encryptionKey = *key;
    file.created = toMilliseconds(created);
    file.lastModified = toMilliseconds(lastModified);
    file.parentUuid = parentUuid;
    file.setMimeType(mimeType.isEmpty() ? guessMimeType(name) : mimeType);
    return file;
}

DriveResult<IncompleteFile> IncompleteFile::newFromBase(int fileEncryptionVersion) const
{
    auto key = EncryptionKey::generate(fileEncryptionVersion);
    if (!key) {
        return key.error();
    }
    auto copy = *this;
    copy.uuid = newUuid();
    copy.encryptionKey = *key;
    return copy;
}

void IncompleteFile::setMimeType(const QString &mime)
{
    // Parameters like "; charset=utf-8" are not part of the stored type
    const auto separator = mime.indexOf(QLatin1Char(';'));
    mimeType = (separator < 0 ? mime : mime.left(separator)).trimmed();
    if (mimeType.isEmpty()) {
        mimeType = QString::fromLatin1(defaultMimeType);
    }
}

QByteArray File::metadata(int fileEncryptionVersion) const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("name"), name);
    obj.insert(QStringLiteral("size"), size);
    obj.insert(QStringLiteral("mime"), mimeType);
    obj.insert(QStringLiteral("key"), QString::fromLatin1(encryptionKey.toString(fileEncryptionVersion)));
    obj.insert(QStringLiteral("lastModified"), lastModified.toMSecsSinceEpoch());
    obj.insert(QStringLiteral("creation"), created.toMSecsSinceEpoch());
    obj.insert(QStringLiteral("hash"), QString::fromLatin1(hash));
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray Directory::metadata() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("name"), name);
    obj.insert(QStringLiteral("creation"), created.toSecsSinceEpoch());
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QString itemUuid(const FileSystemObject &item)
{
    return std::visit([](const auto &object) { return object.uuid; }, item);
}

QString itemName(const FileSystemObject &item)
{
    return std::visit(detail::overloaded{
                          [](const File &file) { return file.name; },
                          [](const Directory &dir) { return dir.name; },
                          [](const RootDirectory &) { return QString(); },
                      },
        item);
}

QString itemParentUuid(const FileSystemObject &item)
{
    return std::visit(detail::overloaded{
                          [](const File &file) { return file.parentUuid; },
                          [](const Directory &dir) { return dir.parentUuid; },
                          [](const RootDirectory &) { return QString(); },
                      },
        item);
}

DriveResult<QByteArray> itemMetadata(const FileSystemObject &item, int fileEncryptionVersion)
{
    return std::visit(detail::overloaded{
                          [fileEncryptionVersion](const File &file) -> DriveResult<QByteArray> { return file.metadata(fileEncryptionVersion); },
                          [](const Directory &dir) -> DriveResult<QByteArray> { return dir.metadata(); },
                          [](const RootDirectory &) -> DriveResult<QByteArray> {
                              return DriveError(DriveErrorCode::UnsupportedObjectVariant, QStringLiteral("the root directory has no metadata"));
                          },
                      },
        item);
}

DriveResult<QString> shareItemType(const FileSystemObject &item)
{
    return std::visit(detail::overloaded{
                          [](const File &) -> DriveResult<QString> { return QStringLiteral("file"); },
                          [](const Directory &) -> DriveResult<QString> { return QStringLiteral("folder"); },
                          [](const RootDirectory &) -> DriveResult<QString> {
                              return DriveError(DriveErrorCode::UnsupportedObjectVariant, QStringLiteral("the root directory cannot be shared"));
                          },
                      },
        item);
}

DriveResult<QString> searchItemType(const FileSystemObject &item)
{
    return std::visit(detail::overloaded{
                          [](const File &) -> DriveResult<QString> { return QStringLiteral("file"); },
                          [](const Directory &) -> DriveResult<QString> { return QStringLiteral("directory"); },
                          [](const RootDirectory &) -> DriveResult<QString> {
                              return DriveError(DriveErrorCode::UnsupportedObjectVariant, QStringLiteral("the root directory is not indexed"));
                          },
                      },
        item);
}

DriveResult<File> fileFromMetadata(const QString &uuid,
    const QString &parentUuid,
    const QByteArray &metadata,
    const QString &bucket,
    const QString &region,
    qint64 chunks,
    int version)
{
    const auto parsed = parseObject(metadata);
    if (!parsed) {
        return parsed.error().wrapped(QStringLiteral("file %1").arg(uuid));
    }
    const auto &obj = *parsed;

    auto key = EncryptionKey::fromUnknownString(obj.value(QStringLiteral("key")).toString().toLatin1());
    if (!key) {
        return key.error().wrapped(QStringLiteral("file %1").arg(uuid));
    }

    File file;
    file.uuid = uuid;
    file.parentUuid = parentUuid;
    file.name = obj.value(QStringLiteral("name")).toString();
    file.setMimeType(obj.value(QStringLiteral("mime")).toString());
    file.encryptionKey = *key;
    file.size = jsonInteger(obj.value(QStringLiteral("size")), 0);
    const auto lastModified = jsonInteger(obj.value(QStringLiteral("lastModified")), 0);
    file.lastModified = QDateTime::fromMSecsSinceEpoch(lastModified, Qt::UTC);
    file.created = QDateTime::fromMSecsSinceEpoch(jsonInteger(obj.value(QStringLiteral("creation")), lastModified), Qt::UTC);
    file.hash = obj.value(QStringLiteral("hash")).toString().toLatin1();
    file.bucket = bucket;
    file.region = region;
    file.chunks = chunks;
    file.version = version;
    return file;
}

DriveResult<Directory> directoryFromMetadata(const QString &uuid,
    const QString &parentUuid,
    const QByteArray &metadata,
    qint64 fallbackTimestamp)
{
    const auto parsed = parseObject(metadata);
    if (!parsed) {
        return parsed.error().wrapped(QStringLiteral("directory %1").arg(uuid));
    }

    Directory dir;
    dir.uuid = uuid;
    dir.parentUuid = parentUuid;
    dir.name = parsed->value(QStringLiteral("name")).toString();
    auto creation = jsonInteger(parsed->value(QStringLiteral("creation")), 0);
    if (creation == 0) {
        creation = fallbackTimestamp;
    }
    dir.created = QDateTime::fromSecsSinceEpoch(creation, Qt::UTC);
    if (dir.name.isEmpty()) {
        qCWarning(lcFileSystemObject) << "Directory" << uuid << "has no name in its metadata";
    }
    return dir;
}

// listings carry the color as a lower case name, anything unknown is the default
DirectoryColor directoryColorFromName(const QString &name)
{
    if (name == QLatin1String("blue")) {
        return DirectoryColor::Blue;
    } else if (name == QLatin1String("green")) {
        return DirectoryColor::Green;
    } else if (name == QLatin1String("purple")) {
        return DirectoryColor::Purple;
    } else if (name == QLatin1String("red")) {
        return DirectoryColor::Red;
    } else if (name == QLatin1String("gray")) {
        return DirectoryColor::Gray;
    }
    return DirectoryColor::Default;
}

QDebug operator<<(QDebug debug, const FileSystemObject &item)
{
    QDebugStateSaver saver(debug);
    debug.nospace();
    std::visit(detail::overloaded{
                   [&debug](const File &file) { debug << "File(" << file.uuid << ", " << file.name << ", " << file.size << ")"; },
                   [&debug](const Directory &dir) { debug << "Directory(" << dir.uuid << ", " << dir.name << ")"; },
                   [&debug](const RootDirectory &root) { debug << "RootDirectory(" << root.uuid << ")"; },
               },
        item);
    return debug;
}

}
