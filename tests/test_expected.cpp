#include <QtTest/QtTest>
#include "../src/core/common/Expected.hpp"

using namespace Whisher;

class TestExpected : public QObject {
    Q_OBJECT

private slots:
    void testValueConstruction() {
        Expected<int, QString> result(42);

        QVERIFY(result.hasValue());
        QVERIFY(!result.hasError());
        QCOMPARE(result.value(), 42);
    }

    void testErrorConstruction() {
        Expected<int, QString> result = makeUnexpected(QString("Error occurred"));

        QVERIFY(!result.hasValue());
        QVERIFY(result.hasError());
        QCOMPARE(result.error(), QString("Error occurred"));

        bool threw = false;
        try {
            (void)result.value();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        QVERIFY(threw);
    }

    void testSameValueAndErrorType() {
        Expected<QString, QString> success(QString("/models/ggml-tiny.bin"));
        Expected<QString, QString> failure = makeUnexpected(QString("HTTP 404"));

        QVERIFY(success.hasValue());
        QCOMPARE(success.value(), QString("/models/ggml-tiny.bin"));
        QVERIFY(failure.hasError());
        QCOMPARE(failure.error(), QString("HTTP 404"));
    }

    void testTransform() {
        Expected<int, QString> success(10);
        auto doubled = success.transform([](int x) { return x * 2; });
        QVERIFY(doubled.hasValue());
        QCOMPARE(doubled.value(), 20);

        Expected<int, QString> failure = makeUnexpected(QString("Failed"));
        auto failedTransform = failure.transform([](int x) { return x * 2; });
        QVERIFY(failedTransform.hasError());
        QCOMPARE(failedTransform.error(), QString("Failed"));
    }

    void testValueOr() {
        Expected<int, QString> success(42);
        QCOMPARE(success.valueOr(0), 42);

        Expected<int, QString> failure = makeUnexpected(QString("Error"));
        QCOMPARE(failure.valueOr(99), 99);
    }

    void testCopyAndAssignment() {
        Expected<QString, int> original(QString("text"));
        Expected<QString, int> copy = original;
        QCOMPARE(copy.value(), QString("text"));
        QCOMPARE(original.value(), QString("text"));

        copy = makeUnexpected(7);
        QVERIFY(copy.hasError());
        QCOMPARE(copy.error(), 7);
    }

    void testVoidSpecialization() {
        Expected<void, QString> ok;
        QVERIFY(ok.hasValue());

        Expected<void, QString> failed = makeUnexpected(QString("nope"));
        QVERIFY(!failed);
        QCOMPARE(failed.error(), QString("nope"));
    }
};

int runTestExpected(int argc, char** argv) {
    TestExpected test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_expected.moc"
