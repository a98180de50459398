#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Forward declarations of test classes that are defined in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestLogger(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestOutputFilter(int argc, char** argv);
extern int runTestCliLocator(int argc, char** argv);
extern int runTestModelProvisioner(int argc, char** argv);
extern int runTestTranscriptionInvoker(int argc, char** argv);
extern int runTestTranscriptionController(int argc, char** argv);
extern int runTestCommandLine(int argc, char** argv);
extern int runTestTranslations(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    app.setOrganizationName("WhisherTests");
    app.setApplicationName("WhisherTests");

    Whisher::Logger::instance().initialize("whisher-tests.log", Whisher::Logger::Level::Trace);
    Whisher::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"Logger", runTestLogger},
        {"Config", runTestConfig},
        {"OutputFilter", runTestOutputFilter},
        {"CliLocator", runTestCliLocator},
        {"ModelProvisioner", runTestModelProvisioner},
        {"TranscriptionInvoker", runTestTranscriptionInvoker},
        {"TranscriptionController", runTestTranscriptionController},
        {"CommandLine", runTestCommandLine},
        {"Translations", runTestTranslations}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    Whisher::Test::TestUtils::cleanupTestEnvironment();

    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
