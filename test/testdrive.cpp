/*
 *    This software is in the public domain, furnished "as is", without technical
 *    support, and with no warranty, express or implied, as to its usefulness for
 *    any purpose.
 *
 */

#include <QtTest>

#include "clientsideencryption.h"
#include "drive.h"
#include "fakeapiclient.h"
#include "searchindexer.h"

using namespace CDC;

class TestDrive : public QObject
{
    Q_OBJECT

    PKey _ownerKeys;
    PKey _recipientKeys;
    KeyHierarchy _hierarchy;
    EngineOptions _options;

    IncompleteFile newFile(const QString &name, const QString &parentUuid)
    {
        const auto now = QDateTime::currentDateTimeUtc();
        auto file = IncompleteFile::create(3, name, QString(), now, now, parentUuid);
        if (!file) {
            qFatal("could not create a test file: %s", qPrintable(file.error().toString()));
        }
        return *file;
    }

    File uploadedFile(const QString &name, const QString &parentUuid)
    {
        File file;
        static_cast<IncompleteFile &>(file) = newFile(name, parentUuid);
        file.size = 3;
        file.chunks = 1;
        file.version = 3;
        return file;
    }

    static Directory directory(const QString &uuid, const QString &name, const QString &parentUuid)
    {
        Directory dir;
        dir.uuid = uuid;
        dir.name = name;
        dir.parentUuid = parentUuid;
        dir.created = QDateTime::fromSecsSinceEpoch(1700000000, Qt::UTC);
        return dir;
    }

    void shareWithRecipient(FakeApiClient &api, const QString &uuid)
    {
        api.setSharedWith(uuid, {ShareRecipient{11, QStringLiteral("dana@example.com"), publicKeyBase64(_recipientKeys)}});
    }

private slots:
    void initTestCase()
    {
        auto owner = EncryptionHelper::generateRsaKeyPair(4096);
        auto recipient = EncryptionHelper::generateRsaKeyPair(4096);
        QVERIFY(owner);
        QVERIFY(recipient);
        _ownerKeys = std::move(*owner);
        _recipientKeys = std::move(*recipient);

        auto hierarchy = makeTestHierarchy(3, _ownerKeys);
        QVERIFY(hierarchy);
        _hierarchy = *hierarchy;

        _options._finalizePollInterval = std::chrono::milliseconds(10);
    }

    void testUploadIntoSharedDirectory()
    {
        // GIVEN
        FakeApiClient api;
        shareWithRecipient(api, QStringLiteral("shared-dir"));
        const Drive drive(&api, _hierarchy, _options);
        const auto incomplete = newFile(QStringLiteral("budget.ods"), QStringLiteral("shared-dir"));
        QBuffer buffer;
        buffer.setData(QByteArray(3000, 'x'));
        QVERIFY(buffer.open(QIODevice::ReadOnly));

        // WHEN
        const auto outcome = drive.uploadFile(OperationContext::create(), incomplete, &buffer);

        // THEN the file is shared below its parent and indexed
        QVERIFY(outcome);
        QVERIFY(!outcome->fanOutError);
        QCOMPARE(outcome->file.uuid, incomplete.uuid);
        QCOMPARE(outcome->file.size, Q_INT64_C(3000));

        const auto shares = api.shareRequests();
        QCOMPARE(shares.size(), 1);
        QCOMPARE(shares.first().uuid, incomplete.uuid);
        QCOMPARE(shares.first().parentUuid, QStringLiteral("shared-dir"));
        QCOMPARE(shares.first().email, QStringLiteral("dana@example.com"));
        QCOMPARE(shares.first().type, QStringLiteral("file"));

        const auto entries = api.searchEntries();
        QCOMPARE(entries.size(), SearchIndexer::tokenize(QStringLiteral("budget.ods")).size());
        for (const auto &entry : entries) {
            QCOMPARE(entry.uuid, incomplete.uuid);
            QCOMPARE(entry.type, QStringLiteral("file"));
        }
    }

    void testUploadFanOutFailureKeepsFile()
    {
        // GIVEN
        FakeApiClient api;
        api.failCall(FakeApiClient::Call::SearchAdd, DriveError::transport(QStringLiteral("index down"), 503));
        const Drive drive(&api, _hierarchy, _options);
        const auto incomplete = newFile(QStringLiteral("notes.txt"), QStringLiteral("plain-dir"));
        QBuffer buffer;
        buffer.setData(QByteArrayLiteral("hello"));
        QVERIFY(buffer.open(QIODevice::ReadOnly));

        // WHEN
        const auto outcome = drive.uploadFile(OperationContext::create(), incomplete, &buffer);

        // THEN
        QVERIFY(outcome);
        QCOMPARE(outcome->file.uuid, incomplete.uuid);
        QVERIFY(outcome->fanOutError);
        QCOMPARE(outcome->fanOutError->code, DriveErrorCode::TransportError);
        QCOMPARE(outcome->fanOutError->httpCode, 503);
        QCOMPARE(api.completionRequests().size(), 1);
    }

    void testUploadFailureSkipsFanOut()
    {
        FakeApiClient api;
        api.failCall(FakeApiClient::Call::UploadDone, DriveError::transport(QStringLiteral("full"), 507));
        const Drive drive(&api, _hierarchy, _options);
        QBuffer buffer;
        buffer.setData(QByteArrayLiteral("hello"));
        QVERIFY(buffer.open(QIODevice::ReadOnly));

        const auto outcome = drive.uploadFile(OperationContext::create(), newFile(QStringLiteral("a.txt"), QStringLiteral("dir")), &buffer);

        QVERIFY(!outcome);
        QCOMPARE(api.callCount(FakeApiClient::Call::ItemShared), 0);
        QCOMPARE(api.callCount(FakeApiClient::Call::SearchAdd), 0);
    }

    void testUpdateMetaOfFile()
    {
        // GIVEN
        FakeApiClient api;
        const Drive drive(&api, _hierarchy, _options);
        const auto file = uploadedFile(QStringLiteral("Report.PDF"), QStringLiteral("dir"));

        // WHEN
        const auto result = drive.updateMeta(OperationContext::create(), file);

        // THEN
        QVERIFY(result);
        const auto requests = api.fileMetadataRequests();
        QCOMPARE(requests.size(), 1);
        QCOMPARE(requests.first().uuid, file.uuid);
        QCOMPARE(requests.first().nameHashed, _hierarchy.hashFileName(QStringLiteral("report.pdf")));
        const auto name = file.encryptionKey.toMasterKey().decryptMeta(requests.first().name);
        QVERIFY(name);
        QCOMPARE(*name, QByteArrayLiteral("Report.PDF"));
        const auto metadata = _hierarchy.decryptMeta(requests.first().metadata);
        QVERIFY(metadata);
        QCOMPARE(*metadata, file.metadata(3));
        QCOMPARE(api.dirMetadataRequests().size(), 0);
        QVERIFY(!api.searchEntries().isEmpty());
    }

    void testUpdateMetaOfSharedDirectory()
    {
        // GIVEN
        FakeApiClient api;
        const auto dir = directory(QStringLiteral("dir-uuid"), QStringLiteral("Archive"), QStringLiteral("root-uuid"));
        shareWithRecipient(api, dir.uuid);
        const Drive drive(&api, _hierarchy, _options);

        // WHEN
        const auto result = drive.updateMeta(OperationContext::create(), dir);

        // THEN
        QVERIFY(result);
        QCOMPARE(api.dirMetadataRequests().size(), 1);
        QCOMPARE(api.dirMetadataRequests().first().nameHashed, _hierarchy.hashFileName(QStringLiteral("Archive")));
        const auto renames = api.sharedRenameRequests();
        QCOMPARE(renames.size(), 1);
        QCOMPARE(renames.first().receiverId, Q_INT64_C(11));
        const auto decrypted = EncryptionHelper::decryptStringAsymmetric(_recipientKeys, QByteArray::fromBase64(renames.first().metadata));
        QVERIFY(decrypted);
        QCOMPARE(QJsonDocument::fromJson(*decrypted).object().value(QStringLiteral("name")).toString(), QStringLiteral("Archive"));
    }

    void testUpdateMetaOfRoot()
    {
        FakeApiClient api;
        const Drive drive(&api, _hierarchy, _options);

        const auto result = drive.updateMeta(OperationContext::create(), RootDirectory{QStringLiteral("root-uuid")});

        QVERIFY(!result);
        QCOMPARE(result.error().code, DriveErrorCode::UnsupportedObjectVariant);
        QCOMPARE(api.callCount(FakeApiClient::Call::UserLock), 0);
    }

    void testUpdateMetaHoldsDriveLock()
    {
        // GIVEN a shared directory so the update fans out
        FakeApiClient api;
        const auto dir = directory(QStringLiteral("dir-uuid"), QStringLiteral("Archive"), QStringLiteral("root-uuid"));
        shareWithRecipient(api, dir.uuid);
        const Drive drive(&api, _hierarchy, _options);

        // WHEN
        const auto result = drive.updateMeta(OperationContext::create(), dir);

        // THEN the metadata and the shared copies were written under the lock
        QVERIFY(result);
        const auto locks = api.lockRequests();
        QCOMPARE(locks.size(), 2);
        QCOMPARE(locks.first().type, QStringLiteral("acquire"));
        QCOMPARE(locks.last().type, QStringLiteral("release"));
        QCOMPARE(locks.first().uuid, locks.last().uuid);
        QCOMPARE(api.callCountUnderLock(FakeApiClient::Call::DirMetadata), 1);
        QCOMPARE(api.callCountUnderLock(FakeApiClient::Call::ItemSharedRename), api.callCount(FakeApiClient::Call::ItemSharedRename));
        QCOMPARE(api.callCount(FakeApiClient::Call::ItemSharedRename), 1);
        QCOMPARE(drive.backendLock()->holders(), 0);
        QVERIFY(!api.lockHeld());
    }

    void testUpdateMetaWithoutLock()
    {
        // GIVEN another client keeps the drive lock
        FakeApiClient api;
        api.setLockRefusals(100);
        auto options = _options;
        options._lockAcquireAttempts = 3;
        options._lockRetryInterval = std::chrono::milliseconds(1);
        const Drive drive(&api, _hierarchy, options);
        const auto file = uploadedFile(QStringLiteral("locked.txt"), QStringLiteral("dir"));

        // WHEN
        const auto result = drive.updateMeta(OperationContext::create(), file);

        // THEN nothing was written
        QVERIFY(!result);
        QCOMPARE(result.error().code, DriveErrorCode::LockUnavailable);
        QCOMPARE(api.callCount(FakeApiClient::Call::UserLock), 3);
        QCOMPARE(api.callCount(FakeApiClient::Call::FileMetadata), 0);
        QVERIFY(api.searchEntries().isEmpty());
    }

    void testUpdateMetaReleasesLockOnFailure()
    {
        FakeApiClient api;
        api.failCall(FakeApiClient::Call::FileMetadata, DriveError::transport(QStringLiteral("conflict"), 409));
        const Drive drive(&api, _hierarchy, _options);

        const auto result = drive.updateMeta(OperationContext::create(), uploadedFile(QStringLiteral("a.txt"), QStringLiteral("dir")));

        QVERIFY(!result);
        QCOMPARE(result.error().httpCode, 409);
        QCOMPARE(api.lockRequests().last().type, QStringLiteral("release"));
        QCOMPARE(drive.backendLock()->holders(), 0);
        QVERIFY(!api.lockHeld());
    }

    void testRename()
    {
        // GIVEN
        FakeApiClient api;
        const Drive drive(&api, _hierarchy, _options);
        FileSystemObject item = uploadedFile(QStringLiteral("draft.txt"), QStringLiteral("dir"));

        // WHEN
        const auto result = drive.rename(OperationContext::create(), item, QStringLiteral("final.txt"));

        // THEN
        QVERIFY(result);
        QCOMPARE(itemName(item), QStringLiteral("final.txt"));
        QCOMPARE(api.fileMetadataRequests().first().nameHashed, _hierarchy.hashFileName(QStringLiteral("final.txt")));
    }

    void testRenameRollsBack()
    {
        // GIVEN
        FakeApiClient api;
        api.failCall(FakeApiClient::Call::FileMetadata, DriveError::transport(QStringLiteral("conflict"), 409));
        const Drive drive(&api, _hierarchy, _options);
        FileSystemObject item = uploadedFile(QStringLiteral("draft.txt"), QStringLiteral("dir"));

        // WHEN
        const auto result = drive.rename(OperationContext::create(), item, QStringLiteral("final.txt"));
        const auto invalid = drive.rename(OperationContext::create(), item, QStringLiteral("a/b"));

        // THEN
        QVERIFY(!result);
        QCOMPARE(result.error().httpCode, 409);
        QCOMPARE(itemName(item), QStringLiteral("draft.txt"));
        QVERIFY(api.searchEntries().isEmpty());
        QVERIFY(!invalid);
        QCOMPARE(invalid.error().code, DriveErrorCode::InvalidArgument);
        QCOMPARE(itemName(item), QStringLiteral("draft.txt"));
    }

    void testMoveIntoSharedDirectory()
    {
        // GIVEN
        FakeApiClient api;
        shareWithRecipient(api, QStringLiteral("target-dir"));
        const Drive drive(&api, _hierarchy, _options);
        FileSystemObject item = uploadedFile(QStringLiteral("move-me.txt"), QStringLiteral("source-dir"));
        const auto uuid = itemUuid(item);

        // WHEN
        const auto result = drive.moveItem(OperationContext::create(), item, QStringLiteral("target-dir"));

        // THEN
        QVERIFY(result);
        QCOMPARE(itemParentUuid(item), QStringLiteral("target-dir"));
        QCOMPARE(api.moveRequests().size(), 1);
        QCOMPARE(api.moveRequests().first(), qMakePair(uuid, QStringLiteral("target-dir")));
        QCOMPARE(api.callCount(FakeApiClient::Call::FileMove), 1);
        QCOMPARE(api.shareRequests().size(), 1);
        QCOMPARE(api.shareRequests().first().parentUuid, QStringLiteral("target-dir"));
    }

    void testMoveFailureKeepsParent()
    {
        FakeApiClient api;
        api.failCall(FakeApiClient::Call::DirMove, DriveError::transport(QStringLiteral("gone"), 404));
        const Drive drive(&api, _hierarchy, _options);
        FileSystemObject item = directory(QStringLiteral("dir-uuid"), QStringLiteral("Docs"), QStringLiteral("old-parent"));

        const auto result = drive.moveItem(OperationContext::create(), item, QStringLiteral("new-parent"));
        FileSystemObject root = RootDirectory{QStringLiteral("root-uuid")};
        const auto rootResult = drive.moveItem(OperationContext::create(), root, QStringLiteral("new-parent"));

        QVERIFY(!result);
        QCOMPARE(result.error().httpCode, 404);
        QCOMPARE(itemParentUuid(item), QStringLiteral("old-parent"));
        QCOMPARE(api.callCount(FakeApiClient::Call::ItemShared), 0);
        QVERIFY(!rootResult);
        QCOMPARE(rootResult.error().code, DriveErrorCode::UnsupportedObjectVariant);
    }

    void testMoveHoldsDriveLock()
    {
        // GIVEN
        FakeApiClient api;
        shareWithRecipient(api, QStringLiteral("target-dir"));
        const Drive drive(&api, _hierarchy, _options);
        FileSystemObject item = uploadedFile(QStringLiteral("move-me.txt"), QStringLiteral("source-dir"));

        // WHEN
        QVERIFY(drive.moveItem(OperationContext::create(), item, QStringLiteral("target-dir")));

        // THEN the check, the move and the share to the new parent ran under one lock
        const auto locks = api.lockRequests();
        QCOMPARE(locks.size(), 2);
        QCOMPARE(locks.first().type, QStringLiteral("acquire"));
        QCOMPARE(locks.last().type, QStringLiteral("release"));
        QCOMPARE(api.callCountUnderLock(FakeApiClient::Call::FileExists), 1);
        QCOMPARE(api.callCountUnderLock(FakeApiClient::Call::FileMove), 1);
        QCOMPARE(api.callCountUnderLock(FakeApiClient::Call::ItemShared), 1);
        QCOMPARE(drive.backendLock()->holders(), 0);
        QVERIFY(!api.lockHeld());
    }

    void testMoveOntoExistingName()
    {
        // GIVEN the target already holds a file of the same name
        FakeApiClient api;
        const Drive drive(&api, _hierarchy, _options);
        FileSystemObject item = uploadedFile(QStringLiteral("Taken.txt"), QStringLiteral("source-dir"));
        api.setExistingItem(QStringLiteral("target-dir"), _hierarchy.hashFileName(QStringLiteral("taken.txt")), QStringLiteral("other-file"));

        // WHEN
        const auto result = drive.moveItem(OperationContext::create(), item, QStringLiteral("target-dir"));

        // THEN
        QVERIFY(!result);
        QCOMPARE(result.error().code, DriveErrorCode::ItemExists);
        QVERIFY(result.error().message.contains(QStringLiteral("other-file")));
        QCOMPARE(itemParentUuid(item), QStringLiteral("source-dir"));
        QVERIFY(api.moveRequests().isEmpty());
        QVERIFY(api.trashRequests().isEmpty());
        QCOMPARE(drive.backendLock()->holders(), 0);
        QVERIFY(!api.lockHeld());
    }

    void testMoveOverwritesExistingName()
    {
        // GIVEN
        FakeApiClient api;
        const Drive drive(&api, _hierarchy, _options);
        FileSystemObject item = uploadedFile(QStringLiteral("taken.txt"), QStringLiteral("source-dir"));
        const auto uuid = itemUuid(item);
        api.setExistingItem(QStringLiteral("target-dir"), _hierarchy.hashFileName(QStringLiteral("taken.txt")), QStringLiteral("other-file"));

        // WHEN
        const auto result = drive.moveItem(OperationContext::create(), item, QStringLiteral("target-dir"), true);

        // THEN the old file went to the trash before the move
        QVERIFY(result);
        QCOMPARE(api.trashRequests(), QVector<QString>({QStringLiteral("other-file")}));
        QCOMPARE(api.callCount(FakeApiClient::Call::FileTrash), 1);
        QCOMPARE(api.callCount(FakeApiClient::Call::DirTrash), 0);
        QCOMPARE(api.moveRequests().size(), 1);
        QCOMPARE(api.moveRequests().first(), qMakePair(uuid, QStringLiteral("target-dir")));
        QCOMPARE(itemParentUuid(item), QStringLiteral("target-dir"));
    }

    void testMoveDirectoryOverwritesExistingName()
    {
        // GIVEN
        FakeApiClient api;
        const Drive drive(&api, _hierarchy, _options);
        FileSystemObject item = directory(QStringLiteral("dir-uuid"), QStringLiteral("Photos"), QStringLiteral("old-parent"));
        api.setExistingItem(QStringLiteral("new-parent"), _hierarchy.hashFileName(QStringLiteral("Photos")), QStringLiteral("other-dir"));

        // WHEN
        const auto result = drive.moveItem(OperationContext::create(), item, QStringLiteral("new-parent"), true);

        // THEN
        QVERIFY(result);
        QCOMPARE(api.callCount(FakeApiClient::Call::DirExists), 1);
        QCOMPARE(api.callCount(FakeApiClient::Call::FileExists), 0);
        QCOMPARE(api.callCount(FakeApiClient::Call::DirTrash), 1);
        QCOMPARE(api.trashRequests(), QVector<QString>({QStringLiteral("other-dir")}));
        QCOMPARE(api.callCount(FakeApiClient::Call::DirMove), 1);
    }

    void testMoveOntoItself()
    {
        // GIVEN the name check finds the moved item itself
        FakeApiClient api;
        const Drive drive(&api, _hierarchy, _options);
        FileSystemObject item = uploadedFile(QStringLiteral("same.txt"), QStringLiteral("dir"));
        api.setExistingItem(QStringLiteral("dir"), _hierarchy.hashFileName(QStringLiteral("same.txt")), itemUuid(item));

        // WHEN
        const auto result = drive.moveItem(OperationContext::create(), item, QStringLiteral("dir"));

        // THEN
        QVERIFY(result);
        QVERIFY(api.trashRequests().isEmpty());
        QCOMPARE(api.moveRequests().size(), 1);
    }

    void testUnlockCurrentKeyHierarchy()
    {
        // GIVEN an account with a DEK wrapped by the key encryption key from login
        FakeApiClient api;
        const auto kek = EncryptionKey::generate(3);
        const auto dek = EncryptionKey::generate(3);
        QVERIFY(kek);
        QVERIFY(dek);
        api.setEncryptedDek(kek->encryptMeta(dek->toString(3)));
        api.setKeyPair(KeyPairInfo{publicKeyBase64(_ownerKeys), dek->encryptMeta(privateKeyBase64(_ownerKeys))});

        // WHEN
        const auto hierarchy = Drive::unlockKeyHierarchy(&api, OperationContext::create(), 3, kek->toString(3));

        // THEN
        QVERIFY(hierarchy);
        QCOMPARE(hierarchy->authVersion(), 3);
        QVERIFY(hierarchy->hasKeyPair());
        QCOMPARE(api.callCount(FakeApiClient::Call::UserMasterKeys), 0);
        const auto metadata = hierarchy->decryptMeta(dek->encryptMeta(QByteArrayLiteral("{}")));
        QVERIFY(metadata);
    }

    void testUnlockLegacyKeyHierarchy()
    {
        // GIVEN
        FakeApiClient api;
        const auto login = EncryptionHelper::generateRandomString(32);
        const auto older = EncryptionHelper::generateRandomString(32);
        const MasterKey loginKey(login);
        api.setMasterKeys(loginKey.encryptMeta(older + '|' + login));
        api.setKeyPair(KeyPairInfo{publicKeyBase64(_ownerKeys), loginKey.encryptMeta(privateKeyBase64(_ownerKeys))});

        // WHEN
        const auto hierarchy = Drive::unlockKeyHierarchy(&api, OperationContext::create(), 2, login);

        // THEN
        QVERIFY(hierarchy);
        QCOMPARE(hierarchy->masterKeys().keys().size(), 2);
        QCOMPARE(hierarchy->masterKeys().keys().last().bytes(), login);
        const auto sentLoginKey = loginKey.decryptMeta(api.lastEncryptedLoginKey());
        QVERIFY(sentLoginKey);
        QCOMPARE(*sentLoginKey, login);
        QCOMPARE(api.callCount(FakeApiClient::Call::UserDek), 0);
    }

    void testUnlockFailures()
    {
        FakeApiClient api;
        api.failCall(FakeApiClient::Call::UserDek, DriveError::transport(QStringLiteral("unauthorized"), 401));

        const auto badHex = Drive::unlockKeyHierarchy(&api, OperationContext::create(), 3, QByteArrayLiteral("not hex"));
        const auto noDek = Drive::unlockKeyHierarchy(&api, OperationContext::create(), 3, EncryptionKey::generate(3)->toString(3));

        QVERIFY(!badHex);
        QCOMPARE(api.callCount(FakeApiClient::Call::UserDek), 1);
        QVERIFY(!noDek);
        QCOMPARE(noDek.error().httpCode, 401);
        QCOMPARE(api.callCount(FakeApiClient::Call::UserKeyPair), 0);
    }
};

QTEST_GUILESS_MAIN(TestDrive)
#include "testdrive.moc"
