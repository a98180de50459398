#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <optional>

namespace Whisher {

enum class BuildMode {
    Development,
    Packaged
};

enum class Platform {
    Windows,
    Unix
};

constexpr Platform hostPlatform() {
#ifdef Q_OS_WIN
    return Platform::Windows;
#else
    return Platform::Unix;
#endif
}

/**
 * @brief Everything an operation needs to know about where it runs.
 *
 * Built once by Config (or by a test) and passed to every component, so no
 * component reads the process environment on its own.
 */
struct RuntimeContext {
    QString appDataDir;     // per-user writable data, holds models/
    QString projectRoot;    // source tree, used in development mode
    QString resourceDir;    // bundled read-only assets, used when packaged
    QString tempDir;        // where the CLI writes its sidecar output
    BuildMode mode = BuildMode::Packaged;
    Platform platform = hostPlatform();
};

struct TranscriptionOptions {
    // Upper bound for downloadTimeoutSeconds, one day
    static constexpr int kMaxDownloadTimeoutSeconds = 24 * 60 * 60;

    QString language = "ru";
    int threads = 4;
    QString modelFileName = "ggml-tiny.bin";
    QString modelUrl = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-tiny.bin";
    QString cliPathOverride;
    int downloadTimeoutSeconds = 600;
};

/**
 * @brief Outcome of a single transcription request.
 *
 * A successful result never carries an error, a failed one never carries
 * text. Use the factories; the fields stay public for QML/JSON marshalling.
 */
struct TranscriptionResult {
    QString text;
    bool success = false;
    std::optional<QString> error;

    static TranscriptionResult succeeded(const QString& text) {
        TranscriptionResult result;
        result.text = text;
        result.success = true;
        return result;
    }

    static TranscriptionResult failed(const QString& message) {
        TranscriptionResult result;
        result.success = false;
        result.error = message;
        return result;
    }

    QString errorString() const { return error.value_or(QString()); }
};

struct ModelStatus {
    bool installed = false;
    std::optional<QString> path;

    static ModelStatus present(const QString& modelPath) {
        return ModelStatus{true, modelPath};
    }

    static ModelStatus absent() {
        return ModelStatus{};
    }
};

} // namespace Whisher

Q_DECLARE_METATYPE(Whisher::TranscriptionResult)
Q_DECLARE_METATYPE(Whisher::ModelStatus)
