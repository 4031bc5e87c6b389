/*
 *    This software is in the public domain, furnished "as is", without technical
 *    support, and with no warranty, express or implied, as to its usefulness for
 *    any purpose.
 *
 */

#include <QtTest>
#include <QtConcurrent>

#include "clientsideencryption.h"
#include "common/constants.h"
#include "fakeapiclient.h"
#include "uploadpipeline.h"

#include <blake3.h>

#include <algorithm>

using namespace CDC;

namespace {
constexpr qint64 testChunkSize = Constants::chunkSize;

QByteArray randomContent(qint64 size)
{
    return EncryptionHelper::generateRandom(static_cast<int>(size));
}

QByteArray blake3Hex(const QByteArray &data)
{
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.constData(), static_cast<size_t>(data.size()));
    QByteArray digest(BLAKE3_OUT_LEN, Qt::Uninitialized);
    blake3_hasher_finalize(&hasher, reinterpret_cast<uint8_t *>(digest.data()), BLAKE3_OUT_LEN);
    return digest.toHex();
}
}

class TestUploadPipeline : public QObject
{
    Q_OBJECT

    KeyHierarchy _hierarchy;
    EngineOptions _options;

    IncompleteFile newFile(const QString &name = QStringLiteral("data.bin"))
    {
        const auto now = QDateTime::currentDateTimeUtc();
        auto file = IncompleteFile::create(_hierarchy.fileEncryptionVersion(), name, QString(), now, now, QStringLiteral("parent-uuid"));
        if (!file) {
            qFatal("could not create a test file: %s", qPrintable(file.error().toString()));
        }
        return *file;
    }

private slots:
    void initTestCase()
    {
        const auto dek = EncryptionKey::generate(3);
        QVERIFY(dek);
        _hierarchy = KeyHierarchy::fromDataEncryptionKey(*dek);
        _options._finalizePollInterval = std::chrono::milliseconds(10);
    }

    void testUploadSplitsIntoChunks()
    {
        // GIVEN
        FakeApiClient api;
        api.setStorageLocation({QStringLiteral("bucket-7"), QStringLiteral("eu-2")});
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        const auto incomplete = newFile();
        const auto content = randomContent(2 * testChunkSize + 1);
        QBuffer buffer;
        buffer.setData(content);
        QVERIFY(buffer.open(QIODevice::ReadOnly));

        // WHEN
        const auto file = pipeline.upload(OperationContext::create(), incomplete, &buffer);

        // THEN
        QVERIFY(file);
        QCOMPARE(file->chunks, 3);
        QCOMPARE(file->size, 2 * testChunkSize + 1);
        QCOMPARE(file->hash, blake3Hex(content));
        QCOMPARE(file->hash.size(), 64);
        QCOMPARE(file->bucket, QStringLiteral("bucket-7"));
        QCOMPARE(file->region, QStringLiteral("eu-2"));

        auto chunks = api.chunkRequests();
        QCOMPARE(chunks.size(), 3);
        std::sort(chunks.begin(), chunks.end(), [](const ChunkUploadRequest &a, const ChunkUploadRequest &b) { return a.index < b.index; });
        QByteArray reassembled;
        for (int i = 0; i < chunks.size(); ++i) {
            QCOMPARE(chunks.at(i).index, i);
            QCOMPARE(chunks.at(i).uuid, incomplete.uuid);
            QCOMPARE(chunks.at(i).parentUuid, QStringLiteral("parent-uuid"));
            QCOMPARE(chunks.at(i).uploadKey.size(), 32);
            const auto plain = incomplete.encryptionKey.decryptData(chunks.at(i).data);
            QVERIFY(plain);
            QCOMPARE(qint64(plain->size()), i < 2 ? testChunkSize : Q_INT64_C(1));
            reassembled += *plain;
        }
        QCOMPARE(chunks.at(2).data.size(), 12 + 1 + 16);
        QCOMPARE(reassembled, content);

        const auto completions = api.completionRequests();
        QCOMPARE(completions.size(), 1);
        const auto &request = completions.first();
        QCOMPARE(request.chunks, 3);
        QCOMPARE(request.uploadKey, chunks.first().uploadKey);
        QCOMPARE(request.rm.size(), 32);
        QCOMPARE(request.version, 3);
        QCOMPARE(request.nameHashed, _hierarchy.hashFileName(QStringLiteral("data.bin")));

        const auto fileCrypter = incomplete.encryptionKey.toMasterKey();
        QCOMPARE(*fileCrypter.decryptMeta(request.name), QByteArrayLiteral("data.bin"));
        QCOMPARE(*fileCrypter.decryptMeta(request.size), QByteArray::number(2 * testChunkSize + 1));

        const auto metadata = _hierarchy.decryptMeta(request.metadata);
        QVERIFY(metadata);
        const auto json = QJsonDocument::fromJson(*metadata).object();
        QCOMPARE(json.value(QStringLiteral("name")).toString(), QStringLiteral("data.bin"));
        QCOMPARE(json.value(QStringLiteral("size")).toInteger(), 2 * testChunkSize + 1);
        QCOMPARE(json.value(QStringLiteral("hash")).toString().toLatin1(), file->hash);
        QCOMPARE(json.value(QStringLiteral("key")).toString().toLatin1(), incomplete.encryptionKey.toString(3));
    }

    void testExactMultipleOfChunkSize()
    {
        // GIVEN
        FakeApiClient api;
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        QBuffer buffer;
        buffer.setData(randomContent(2 * testChunkSize));
        QVERIFY(buffer.open(QIODevice::ReadOnly));

        // WHEN
        const auto file = pipeline.upload(OperationContext::create(), newFile(), &buffer);

        // THEN
        QVERIFY(file);
        QCOMPARE(file->chunks, 2);
        QCOMPARE(api.chunkRequests().size(), 2);
    }

    void testEmptyFile()
    {
        // GIVEN
        FakeApiClient api;
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        const auto incomplete = newFile(QStringLiteral("empty.txt"));
        QBuffer buffer;
        QVERIFY(buffer.open(QIODevice::ReadOnly));

        // WHEN
        const auto file = pipeline.upload(OperationContext::create(), incomplete, &buffer);

        // THEN
        QVERIFY(file);
        QCOMPARE(file->size, 0);
        QCOMPARE(file->chunks, 0);
        QCOMPARE(file->hash, QByteArrayLiteral("af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262"));
        QCOMPARE(file->mimeType, QStringLiteral("text/plain"));
        QCOMPARE(api.callCount(FakeApiClient::Call::UploadChunk), 0);
        QCOMPARE(api.callCount(FakeApiClient::Call::UploadDone), 0);
        QCOMPARE(api.callCount(FakeApiClient::Call::UploadEmpty), 1);

        const auto request = api.completionRequests().first();
        QCOMPARE(*incomplete.encryptionKey.toMasterKey().decryptMeta(request.size), QByteArrayLiteral("0"));
        QVERIFY(request.rm.isEmpty());
        QVERIFY(request.uploadKey.isEmpty());
    }

    void testFinalizeRejected()
    {
        // GIVEN
        FakeApiClient api;
        api.failCall(FakeApiClient::Call::UploadDone, DriveError::transport(QStringLiteral("quota exceeded"), 507));
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        auto upload = pipeline.newUpload(newFile());
        QVERIFY(upload);
        const auto context = OperationContext::create();
        QVERIFY(pipeline.uploadChunk(context, *upload, 0, randomContent(10)));

        // WHEN
        const auto file = pipeline.finalize(context, *upload, 10);

        // THEN
        QVERIFY(!file);
        QCOMPARE(file.error().code, DriveErrorCode::UploadFinalizeFailed);
        QCOMPARE(file.error().httpCode, 507);
        QCOMPARE(upload->state(), FileUpload::State::Failed);

        const auto again = pipeline.uploadChunk(context, *upload, 1, randomContent(10));
        QVERIFY(!again);
        QCOMPARE(again.error().code, DriveErrorCode::InvalidState);
    }

    void testFinalizeWithoutChunks()
    {
        // GIVEN
        FakeApiClient api;
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        auto upload = pipeline.newUpload(newFile());
        QVERIFY(upload);

        // WHEN
        const auto file = pipeline.finalize(OperationContext::create(), *upload, 10);

        // THEN
        QVERIFY(!file);
        QCOMPARE(file.error().code, DriveErrorCode::NoChunksUploaded);
        QCOMPARE(upload->state(), FileUpload::State::Failed);
        QCOMPARE(api.callCount(FakeApiClient::Call::UploadDone), 0);
    }

    void testFinalizeCancelledWhileWaiting()
    {
        // GIVEN a chunk that is still in flight
        FakeApiClient api;
        QSemaphore entered;
        QSemaphore gate;
        api.setUploadChunkHook([&entered, &gate](qint64) {
            entered.release();
            gate.acquire();
        });
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        auto upload = pipeline.newUpload(newFile());
        QVERIFY(upload);
        const auto context = OperationContext::create();
        auto &session = *upload;
        auto chunkSent = QtConcurrent::run([&pipeline, &context, &session]() {
            const auto result = pipeline.uploadChunk(context, session, 0, QByteArrayLiteral("slow chunk"));
            Q_UNUSED(result);
        });
        QVERIFY(entered.tryAcquire(1, 5000));

        // WHEN
        context->cancel();
        const auto file = pipeline.finalize(context, session, 10);

        // THEN
        QVERIFY(!file);
        QCOMPARE(file.error().code, DriveErrorCode::UploadAborted);
        QCOMPARE(session.state(), FileUpload::State::Failed);

        gate.release();
        chunkSent.waitForFinished();
        QCOMPARE(api.callCount(FakeApiClient::Call::UploadDone), 0);
    }

    void testFinalizeWaitsForLocation()
    {
        // GIVEN a chunk that answers only after finalize started waiting
        FakeApiClient api;
        api.setLatency(FakeApiClient::Call::UploadChunk, std::chrono::milliseconds(200));
        QSemaphore entered;
        api.setUploadChunkHook([&entered](qint64) {
            entered.release();
        });
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        auto upload = pipeline.newUpload(newFile());
        QVERIFY(upload);
        const auto context = OperationContext::create();
        auto &session = *upload;
        auto chunkSent = QtConcurrent::run([&pipeline, &context, &session]() {
            const auto result = pipeline.uploadChunk(context, session, 0, QByteArrayLiteral("late"));
            Q_UNUSED(result);
        });
        QVERIFY(entered.tryAcquire(1, 5000));

        // WHEN
        const auto file = pipeline.finalize(context, session, 4);
        chunkSent.waitForFinished();

        // THEN
        QVERIFY(file);
        QCOMPARE(file->chunks, 1);
        QCOMPARE(session.state(), FileUpload::State::Completed);
        QCOMPARE(api.completionRequests().size(), 1);
    }

    void testChunkFailureReportsIndex()
    {
        // GIVEN
        FakeApiClient api;
        api.failChunk(1, DriveError::transport(QStringLiteral("bad gateway"), 502));
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        QBuffer buffer;
        buffer.setData(randomContent(3 * testChunkSize));
        QVERIFY(buffer.open(QIODevice::ReadOnly));

        // WHEN
        const auto file = pipeline.upload(OperationContext::create(), newFile(), &buffer);

        // THEN
        QVERIFY(!file);
        QCOMPARE(file.error().code, DriveErrorCode::ChunkUploadFailed);
        QCOMPARE(file.error().chunkIndex, 1);
        QCOMPARE(file.error().httpCode, 502);
        QCOMPARE(api.callCount(FakeApiClient::Call::UploadDone), 0);
    }

    void testKeepsFirstLocation()
    {
        // GIVEN
        FakeApiClient api;
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        auto upload = pipeline.newUpload(newFile());
        QVERIFY(upload);
        const auto context = OperationContext::create();

        // WHEN
        api.setStorageLocation({QStringLiteral("first"), QStringLiteral("r1")});
        QVERIFY(pipeline.uploadChunk(context, *upload, 0, randomContent(testChunkSize)));
        api.setStorageLocation({QStringLiteral("second"), QStringLiteral("r2")});
        const auto secondLocation = pipeline.uploadChunk(context, *upload, 1, randomContent(5));

        // THEN
        QVERIFY(secondLocation);
        QCOMPARE(secondLocation->bucket, QStringLiteral("second"));
        QCOMPARE(upload->location()->bucket, QStringLiteral("first"));
        QCOMPARE(upload->uploadedChunks(), 2);
        const auto file = pipeline.finalize(context, *upload, testChunkSize + 5);
        QVERIFY(file);
        QCOMPARE(file->bucket, QStringLiteral("first"));
        QCOMPARE(file->chunks, 2);
    }

    void testNewUploadNeedsKey()
    {
        // GIVEN
        FakeApiClient api;
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        auto file = newFile();
        file.encryptionKey = EncryptionKey();

        // WHEN
        const auto upload = pipeline.newUpload(file);

        // THEN
        QVERIFY(!upload);
        QCOMPARE(upload.error().code, DriveErrorCode::InvalidArgument);
    }

    void testUploadKeysDiffer()
    {
        FakeApiClient api;
        const UploadPipeline pipeline(&api, _hierarchy, _options);
        const auto file = newFile();
        const auto first = pipeline.newUpload(file);
        const auto second = pipeline.newUpload(file);
        QVERIFY(first);
        QVERIFY(second);
        QVERIFY(first->uploadKey() != second->uploadKey());
        QCOMPARE(first->state(), FileUpload::State::Created);
    }
};

QTEST_GUILESS_MAIN(TestUploadPipeline)
#include "testuploadpipeline.moc"
