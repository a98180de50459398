#include "TranscriptionInvoker.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QUuid>

namespace Whisher {

TranscriptionInvoker::TranscriptionInvoker(TranscriptionOptions options,
                                           QString tempDir,
                                           OutputFilter filter)
    : options_(std::move(options))
    , tempDir_(tempDir.isEmpty() ? QDir::tempPath() : std::move(tempDir))
    , filter_(std::move(filter)) {
}

QStringList TranscriptionInvoker::buildArguments(const QString& audioPath,
                                                 const QString& modelPath,
                                                 const QString& outputBase) const {
    QStringList args;

    args << "-f" << audioPath;
    args << "-m" << modelPath;
    args << "-l" << options_.language;
    args << "-t" << QString::number(options_.threads);

    // Plain text written to <outputBase>.txt
    args << "-otxt";
    args << "-of" << outputBase;

    args << "-pp";

    return args;
}

QString TranscriptionInvoker::makeOutputBase() const {
    // Seconds alone collide for calls within the same second
    const QString suffix = QUuid::createUuid().toString(QUuid::Id128).left(12);
    const QString name = QString::fromLatin1(kOutputPrefix) +
                         QString::number(QDateTime::currentSecsSinceEpoch()) + '_' + suffix;
    return QDir(tempDir_).filePath(name);
}

TranscriptionResult TranscriptionInvoker::transcribe(const QString& audioPath,
                                                     const QString& cliPath,
                                                     const QString& modelPath) const {
    if (!QFileInfo::exists(audioPath)) {
        Logger::instance().warn("TranscriptionInvoker: Audio file not found: {}", audioPath.toStdString());
        return TranscriptionResult::failed(tr("Audio file not found: %1").arg(audioPath));
    }

    if (!QFileInfo::exists(modelPath)) {
        Logger::instance().warn("TranscriptionInvoker: Model not found: {}", modelPath.toStdString());
        return TranscriptionResult::failed(tr("Model not found at path: %1").arg(modelPath));
    }

    if (!QFileInfo::exists(cliPath)) {
        Logger::instance().warn("TranscriptionInvoker: whisper-cli not found: {}", cliPath.toStdString());
        return TranscriptionResult::failed(tr("Whisper CLI not found at path: %1").arg(cliPath));
    }

    const QString outputBase = makeOutputBase();
    const QStringList args = buildArguments(audioPath, modelPath, outputBase);

    Logger::instance().info("TranscriptionInvoker: Running {} {}",
                            cliPath.toStdString(), args.join(' ').toStdString());

    const ProcessOutcome outcome = run(cliPath, args);
    if (!outcome.started) {
        Logger::instance().error("TranscriptionInvoker: Failed to start whisper-cli: {}",
                                 outcome.startError.toStdString());
        return TranscriptionResult::failed(tr("Failed to start Whisper CLI: %1").arg(outcome.startError));
    }

    Logger::instance().info("TranscriptionInvoker: whisper-cli finished (normal exit: {}, code {})",
                            outcome.normalExit, outcome.exitCode);
    return interpret(outcome, outputBase);
}

TranscriptionInvoker::ProcessOutcome TranscriptionInvoker::run(const QString& program,
                                                               const QStringList& arguments) const {
    ProcessOutcome outcome;

    QProcess process;
    process.setProgram(program);
    process.setArguments(arguments);
    process.start();

    if (!process.waitForStarted(-1)) {
        outcome.startError = process.errorString();
        return outcome;
    }
    outcome.started = true;

    // No timeout: model load and inference may take minutes
    process.waitForFinished(-1);

    outcome.normalExit = process.exitStatus() == QProcess::NormalExit;
    outcome.exitCode = process.exitCode();
    outcome.standardOutput = QString::fromUtf8(process.readAllStandardOutput());
    outcome.standardError = QString::fromUtf8(process.readAllStandardError());
    return outcome;
}

TranscriptionResult TranscriptionInvoker::interpret(const ProcessOutcome& outcome,
                                                    const QString& outputBase) const {
    const QString outputFile = outputBase + ".txt";

    QString text;
    QFile sidecar(outputFile);
    if (sidecar.open(QIODevice::ReadOnly | QIODevice::Text)) {
        text = QString::fromUtf8(sidecar.readAll()).trimmed();
        sidecar.close();
        if (!sidecar.remove()) {
            Logger::instance().warn("TranscriptionInvoker: Could not delete {}: {}",
                                    outputFile.toStdString(), sidecar.errorString().toStdString());
        }
    } else {
        const QString readError = sidecar.errorString();
        Logger::instance().warn("TranscriptionInvoker: Cannot read {} ({}), falling back to stdout",
                                outputFile.toStdString(), readError.toStdString());

        text = filter_.extractTranscript(outcome.standardOutput);
        if (text.isEmpty()) {
            return TranscriptionResult::failed(
                tr("Failed to read the transcription result from %1: %2\nSTDOUT: %3\nSTDERR: %4")
                    .arg(outputFile, readError, outcome.standardOutput, outcome.standardError));
        }
    }

    // whisper-cli sometimes exits non-zero after writing a usable transcript
    if (outcome.succeeded() || !text.isEmpty()) {
        if (!outcome.succeeded()) {
            Logger::instance().warn("TranscriptionInvoker: Keeping transcript despite exit code {}",
                                    outcome.exitCode);
        }
        return TranscriptionResult::succeeded(text);
    }

    return TranscriptionResult::failed(
        tr("Whisper exited with an error (exit code %1). STDERR: %2")
            .arg(outcome.exitCode)
            .arg(outcome.standardError));
}

} // namespace Whisher
