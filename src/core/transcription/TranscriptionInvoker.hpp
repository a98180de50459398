#pragma once

#include <QtCore/QCoreApplication>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "OutputFilter.hpp"
#include "TranscriptionTypes.hpp"

namespace Whisher {

/**
 * @brief Runs whisper-cli on one audio file and recovers the transcript.
 *
 * Every outcome, including missing inputs and spawn failures, is returned as
 * a TranscriptionResult; nothing is thrown. The call blocks until the child
 * process exits and has no timeout, so run it off the UI thread.
 */
class TranscriptionInvoker {
    Q_DECLARE_TR_FUNCTIONS(TranscriptionInvoker)

public:
    static constexpr const char* kOutputPrefix = "whisper_output_";

    struct ProcessOutcome {
        bool started = false;
        QString startError;
        bool normalExit = false;
        int exitCode = -1;
        QString standardOutput;
        QString standardError;

        bool succeeded() const { return started && normalExit && exitCode == 0; }
    };

    explicit TranscriptionInvoker(TranscriptionOptions options,
                                  QString tempDir = QString(),
                                  OutputFilter filter = OutputFilter());

    TranscriptionResult transcribe(const QString& audioPath,
                                   const QString& cliPath,
                                   const QString& modelPath) const;

    QStringList buildArguments(const QString& audioPath,
                               const QString& modelPath,
                               const QString& outputBase) const;

    // <tempDir>/whisper_output_<unix-seconds>_<random>; the CLI appends ".txt"
    QString makeOutputBase() const;

    // Turns a finished run into a result: sidecar file first, then stdout
    TranscriptionResult interpret(const ProcessOutcome& outcome, const QString& outputBase) const;

private:
    ProcessOutcome run(const QString& program, const QStringList& arguments) const;

    TranscriptionOptions options_;
    QString tempDir_;
    OutputFilter filter_;
};

} // namespace Whisher
