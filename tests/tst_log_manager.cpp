#include <QTest>
#include <QTemporaryDir>
#include <QFile>
#include <QRegularExpression>
#include "core/log_manager.h"

class TestLogManager : public QObject {
    Q_OBJECT

private slots:
    void init() {
        LogManager::instance().setConsoleEnabled(false);
        LogManager::instance().setMinimumLevel(LogManager::Info);
    }

    void cleanup() {
        LogManager::instance().shutdown();
        LogManager::instance().setConsoleEnabled(true);
    }

    void testFormat() {
        const QString line = LogManager::formatMessage(LogManager::Warning, QStringLiteral("gateway"),
                                                       QStringLiteral("upstream slow"));
        static const QRegularExpression pattern(
            QStringLiteral(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[WARN\] \[gateway\] upstream slow$)"));
        QVERIFY2(pattern.match(line).hasMatch(), qPrintable(line));
    }

    void testFileOutputHonoursLevel() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString logDir = dir.filePath(QStringLiteral("logs"));

        QVERIFY(LogManager::instance().initialize(logDir));
        QCOMPARE(LogManager::instance().logFilePath(),
                 logDir + QStringLiteral("/ollama_gateway.log"));

        LOG_DEBUG(QStringLiteral("hidden detail"));
        LOG_INFO(QStringLiteral("listening"));
        LOG_ERROR(QStringLiteral("upstream refused"));
        LogManager::instance().shutdown();

        QFile file(logDir + QStringLiteral("/ollama_gateway.log"));
        QVERIFY(file.open(QIODevice::ReadOnly));
        const QByteArray content = file.readAll();
        QVERIFY(!content.contains("hidden detail"));
        QVERIFY(content.contains("[INFO] [gateway] listening"));
        QVERIFY(content.contains("[ERROR] [gateway] upstream refused"));
        QCOMPARE(content.count('\n'), 2);
    }

    void testUnusableDirectoryWarns() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString blocker = dir.filePath(QStringLiteral("occupied"));
        QFile file(blocker);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.close();

        QTest::ignoreMessage(QtWarningMsg,
                             QRegularExpression(QStringLiteral("^LogManager: failed to create log directory:")));
        QVERIFY(!LogManager::instance().initialize(blocker + QStringLiteral("/logs")));
    }

    void testDebugLevel() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QVERIFY(LogManager::instance().initialize(dir.path()));
        LogManager::instance().setMinimumLevel(LogManager::Debug);

        LOG_DEBUG(QStringLiteral("request body"));
        LogManager::instance().shutdown();

        QFile file(dir.filePath(QStringLiteral("ollama_gateway.log")));
        QVERIFY(file.open(QIODevice::ReadOnly));
        QVERIFY(file.readAll().contains("[DEBUG] [gateway] request body"));
    }
};

QTEST_MAIN(TestLogManager)
#include "tst_log_manager.moc"
