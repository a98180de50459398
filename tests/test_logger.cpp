#include <QtTest/QtTest>
#include <QtCore/QFileInfo>
#include <atomic>
#include <thread>
#include <vector>

#include "../src/core/common/Logger.hpp"
#include "utils/TestUtils.hpp"

using namespace Whisher;
using namespace Whisher::Test;

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void cleanupTestCase() {
        // Hand the runner its file logger back
        Logger::instance().initialize("whisher-tests.log", Logger::Level::Trace);
    }

    void testConcurrentLoggingBeforeInitialize() {
        Logger::instance().shutdown();
        QVERIFY(!Logger::instance().isInitialized());

        const int threadCount = 16;
        std::atomic<int> failures{0};
        std::atomic<int> finished{0};
        std::vector<std::thread> threads;
        threads.reserve(threadCount);

        for (int i = 0; i < threadCount; ++i) {
            threads.emplace_back([i, &failures, &finished]() {
                try {
                    for (int n = 0; n < 50; ++n) {
                        Logger::instance().debug("worker {} message {}", i, n);
                    }
                    WHISHER_INFO("worker {} done", i);
                } catch (const spdlog::spdlog_ex&) {
                    ++failures;
                }
                ++finished;
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        QCOMPARE(finished.load(), threadCount);
        QCOMPARE(failures.load(), 0);

        // The stderr fallback does not count as configured
        QVERIFY(!Logger::instance().isInitialized());
    }

    void testInitializeReplacesFallback() {
        const QString dir = TestUtils::createTempDirectory("logger");
        QVERIFY(!dir.isEmpty());
        const QString logFile = dir + "/whisher.log";

        Logger::instance().shutdown();
        Logger::instance().warn("logged before initialize");

        Logger::instance().initialize(logFile.toStdString(), Logger::Level::Debug);
        QVERIFY(Logger::instance().isInitialized());
        QVERIFY(QFileInfo::exists(logFile));

        // Reinitializing must not trip over the already registered name
        Logger::instance().initialize(logFile.toStdString(), Logger::Level::Info);
        QVERIFY(Logger::instance().isInitialized());

        Logger::instance().shutdown();
        TestUtils::cleanupTempDirectory(dir);
    }
};

int runTestLogger(int argc, char** argv) {
    TestLogger test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_logger.moc"
