#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>

#include "../src/cli/CommandLine.hpp"
#include "../src/core/common/Translations.hpp"
#include "../src/core/transcription/TranscriptionInvoker.hpp"

using namespace Whisher;

class TestTranslations : public QObject {
    Q_OBJECT

private slots:
    void cleanup() {
        if (translator_) {
            QCoreApplication::removeTranslator(translator_.get());
            translator_.reset();
        }
    }

    void testLocaleSelection() {
        QCOMPARE(Translations::localeFor(QString()), QLocale::system());
        QCOMPARE(Translations::localeFor(" ru ").language(), QLocale::Russian);
    }

    void testEnglishNeedsNoCatalogue() {
        QVERIFY(!Translations::load(QLocale(QLocale::English, QLocale::UnitedStates)));
    }

    void testRussianMessages() {
        translator_ = Translations::load(QLocale(QLocale::Russian, QLocale::Russia));
        QVERIFY(translator_);
        QVERIFY(QCoreApplication::installTranslator(translator_.get()));

        TranscriptionInvoker invoker{TranscriptionOptions()};
        const TranscriptionResult result = invoker.transcribe("/nonexistent/speech.wav",
                                                              "/nonexistent/whisper-cli",
                                                              "/nonexistent/model.bin");
        QVERIFY(!result.success);
        QCOMPARE(result.errorString(), QString("Файл не найден: /nonexistent/speech.wav"));

        CommandLine commandLine;
        auto parsed = commandLine.parse({"whisher", "greet"});
        QVERIFY(parsed.hasError());
        QCOMPARE(parsed.error(), QString("Неизвестная команда: greet"));
    }

    void testEnglishAfterRemoval() {
        TranscriptionInvoker invoker{TranscriptionOptions()};
        const TranscriptionResult result = invoker.transcribe("/nonexistent/speech.wav",
                                                              "/nonexistent/whisper-cli",
                                                              "/nonexistent/model.bin");
        QVERIFY(result.errorString().startsWith("Audio file not found"));
    }

private:
    std::unique_ptr<QTranslator> translator_;
};

int runTestTranslations(int argc, char** argv) {
    TestTranslations test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_translations.moc"
