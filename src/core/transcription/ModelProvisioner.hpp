#pragma once

#include <QtCore/QCoreApplication>
#include <QtCore/QString>

#include "../common/Expected.hpp"
#include "TranscriptionTypes.hpp"

namespace Whisher {

enum class ModelError {
    NoDataDirectory
};

enum class DownloadError {
    ConfigurationError,
    InvalidUrl,
    FileSystemError,
    NetworkError,
    HttpError,
    TimeoutError
};

struct DownloadFailure {
    DownloadError error;
    QString message;
};

/**
 * @brief Keeps the recognition model available under the user's data directory.
 *
 * The model lives at <appDataDir>/models/<modelFileName>. Downloads are a
 * single blocking GET that buffers the whole body, then replace the model
 * file in one step; there is no resume and no checksum.
 */
class ModelProvisioner {
    Q_DECLARE_TR_FUNCTIONS(ModelProvisioner)

public:
    ModelProvisioner(RuntimeContext context, TranscriptionOptions options);

    Expected<QString, ModelError> resolveModelPath() const;
    Expected<ModelStatus, ModelError> checkInstalled() const;

    /**
     * @brief Downloads the model, blocking the calling thread until done.
     *
     * Safe to call from a worker thread: the network objects live for the
     * duration of the call only. A failed request leaves any existing model
     * file untouched.
     * @return The model path on success.
     */
    Expected<QString, DownloadFailure> downloadModel() const;

    /**
     * @brief Model file handed to whisper-cli.
     *
     * The downloaded model if present, otherwise one shipped with the
     * application, otherwise the per-user path (which does not exist yet).
     */
    QString locateModelForTranscription() const;

    static QString describe(ModelError error);

private:
    QStringList bundledModelCandidates() const;
    Expected<QByteArray, DownloadFailure> fetch(const QString& url) const;

    // Configured timeout, with out-of-range values replaced
    int timeoutSeconds() const;

    RuntimeContext context_;
    TranscriptionOptions options_;
};

} // namespace Whisher
