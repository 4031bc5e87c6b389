/*
 *    This software is in the public domain, furnished "as is", without technical
 *    support, and with no warranty, express or implied, as to its usefulness for
 *    any purpose.
 *
 */

#include <QtTest>
#include <QTemporaryDir>

#include "configfile.h"
#include "engineoptions.h"
#include "logger.h"

using namespace CDC;

Q_LOGGING_CATEGORY(lcConfigFileTest, "cipherdrive.sync.test.configfile", QtInfoMsg)

class TestConfigFile : public QObject
{
    Q_OBJECT

    QTemporaryDir _confDir;

private slots:
    void initTestCase()
    {
        QVERIFY(_confDir.isValid());
        QVERIFY(ConfigFile::setConfDir(_confDir.path()));
    }

    void testDefaults()
    {
        ConfigFile cfg;
        const EngineOptions defaults;

        QVERIFY(!cfg.exists());
        QCOMPARE(cfg.configPath(), _confDir.path() + QLatin1Char('/'));
        QCOMPARE(cfg.parallelChunkUploads(), defaults._parallelChunkUploads);
        QCOMPARE(cfg.logDir(), cfg.configPath() + QStringLiteral("logs"));
        QVERIFY(!cfg.logDebug());
    }

    void testApplyToOptions()
    {
        // GIVEN
        ConfigFile cfg;
        cfg.setParallelChunkUploads(2);
        cfg.setMaxPropagationJobs(-3);
        EngineOptions options;

        // WHEN
        cfg.applyTo(options);

        // THEN invalid values fall back to the defaults
        QVERIFY(cfg.exists());
        QCOMPARE(options._parallelChunkUploads, 2);
        QCOMPARE(options._maxPropagationJobs, EngineOptions()._maxPropagationJobs);
    }

    void testOptionsFromEnvironment()
    {
        qputenv("CIPHERDRIVE_PARALLEL_CHUNK_UPLOADS", "0");
        qputenv("CIPHERDRIVE_MAX_PROPAGATION_JOBS", "7");

        EngineOptions options;
        options.fillFromEnvironmentVariables();

        qunsetenv("CIPHERDRIVE_PARALLEL_CHUNK_UPLOADS");
        qunsetenv("CIPHERDRIVE_MAX_PROPAGATION_JOBS");

        QCOMPARE(options._parallelChunkUploads, EngineOptions()._parallelChunkUploads);
        QCOMPARE(options._maxPropagationJobs, 7);
    }

    void testVerifyResetsNonsense()
    {
        EngineOptions options;
        options._parallelChunkUploads = 0;
        options._finalizePollInterval = std::chrono::milliseconds(-1);
        options._lockAcquireAttempts = -5;
        options._lockRetryInterval = std::chrono::milliseconds(0);
        options._lockRefreshInterval = std::chrono::milliseconds(0);

        options.verify();

        QCOMPARE(options._parallelChunkUploads, EngineOptions()._parallelChunkUploads);
        QVERIFY(options._finalizePollInterval.count() > 0);
        QCOMPARE(options._lockAcquireAttempts, EngineOptions()._lockAcquireAttempts);
        QCOMPARE(options._lockRetryInterval.count(), std::chrono::milliseconds(0).count());
        QCOMPARE(options._lockRefreshInterval.count(), EngineOptions()._lockRefreshInterval.count());
    }

    void testLoggerWritesToLogDir()
    {
        // GIVEN
        ConfigFile cfg;
        const auto logDir = _confDir.filePath(QStringLiteral("custom-logs"));
        cfg.setLogDir(logDir);
        cfg.setLogFlush(true);
        cfg.setLogDebug(true);
        auto logger = Logger::instance();

        // WHEN
        cfg.applyTo(logger);
        qCInfo(lcConfigFileTest) << "first line in the new log";

        // THEN
        QVERIFY(logger->isLoggingToFile());
        QCOMPARE(logger->logDir(), logDir);
        QVERIFY(logger->logDebug());
        QVERIFY(logger->logRules().contains(QStringLiteral("cipherdrive.*.debug=true")));
        QVERIFY(logger->logFile().startsWith(logDir));

        QFile file(logger->logFile());
        QVERIFY(file.open(QIODevice::ReadOnly));
        QVERIFY(file.readAll().contains("first line in the new log"));

        logger->setLogDebug(false);
        QVERIFY(logger->logRules().isEmpty());
        logger->setLogFile(QString());
        QVERIFY(!logger->isLoggingToFile());
    }

    void testLoggerStartsNewFile()
    {
        // GIVEN
        auto logger = Logger::instance();
        logger->setLogDir(_confDir.filePath(QStringLiteral("rotated-logs")));
        logger->setLogFlush(true);
        logger->startNewLogFile();
        const auto first = logger->logFile();
        qCInfo(lcConfigFileTest) << "line in the first file";

        // WHEN
        logger->startNewLogFile();
        qCInfo(lcConfigFileTest) << "line in the second file";

        // THEN the finished file is kept, gzipped when zlib is available
        const auto second = logger->logFile();
        QVERIFY(logger->isLoggingToFile());
        QVERIFY(second != first);
        QVERIFY(QFile::exists(first) || QFile::exists(first + QStringLiteral(".gz")));

        QFile file(second);
        QVERIFY(file.open(QIODevice::ReadOnly));
        const auto content = file.readAll();
        QVERIFY(content.contains("line in the second file"));
        QVERIFY(!content.contains("line in the first file"));

        logger->setLogFile(QString());
    }
};

QTEST_GUILESS_MAIN(TestConfigFile)
#include "testconfigfile.moc"
