#pragma once

#include <QtCore/QFuture>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QVariantMap>

#include "../../core/common/Expected.hpp"
#include "../../core/transcription/ModelProvisioner.hpp"
#include "../../core/transcription/TranscriptionTypes.hpp"

namespace Whisher {

/**
 * @brief UI-facing entry points: model status, model download, transcription.
 *
 * Long operations run on the global thread pool and report back through the
 * returned QFuture and through signals delivered on the controller's thread.
 */
class TranscriptionController : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool isTranscribing READ isTranscribing NOTIFY transcribingChanged)
    Q_PROPERTY(bool isDownloading READ isDownloading NOTIFY downloadingChanged)
    Q_PROPERTY(bool modelInstalled READ modelInstalled NOTIFY modelInstalledChanged)
    Q_PROPERTY(QString lastTranscription READ lastTranscription NOTIFY transcriptionChanged)
    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)

public:
    // Reads the runtime context and options from Config
    explicit TranscriptionController(QObject* parent = nullptr);
    TranscriptionController(RuntimeContext context, TranscriptionOptions options,
                            QObject* parent = nullptr);

    bool isTranscribing() const { return activeTranscriptions_ > 0; }
    bool isDownloading() const { return downloading_; }
    bool modelInstalled() const;
    QString lastTranscription() const { return lastTranscription_; }
    QString lastError() const { return lastError_; }

    const RuntimeContext& context() const { return context_; }
    const TranscriptionOptions& options() const { return options_; }

    Expected<ModelStatus, ModelError> modelStatus() const;
    QFuture<Expected<QString, DownloadFailure>> downloadModel();
    QFuture<TranscriptionResult> transcribeAudio(const QString& filePath);

    // QML: {installed: bool, path: string} plus "error" when the data
    // directory cannot be resolved
    Q_INVOKABLE QVariantMap checkModelInstalled() const;
    Q_INVOKABLE void requestModelDownload();
    Q_INVOKABLE void requestTranscription(const QString& filePath);

    static QVariantMap toVariantMap(const TranscriptionResult& result);

signals:
    void transcribingChanged();
    void downloadingChanged();
    void modelInstalledChanged();
    void transcriptionChanged();
    void lastErrorChanged();
    void transcriptionFinished(const Whisher::TranscriptionResult& result);
    void transcriptionCompleted(const QString& text);
    void transcriptionError(const QString& error);
    void modelDownloadCompleted(const QString& modelPath);
    void modelDownloadFailed(const QString& error);

private:
    void onTranscriptionDone(const TranscriptionResult& result);
    void onDownloadDone(const Expected<QString, DownloadFailure>& result);
    void setDownloading(bool downloading);
    void setLastError(const QString& error);

    RuntimeContext context_;
    TranscriptionOptions options_;

    int activeTranscriptions_ = 0;
    bool downloading_ = false;
    QString lastTranscription_;
    QString lastError_;
};

} // namespace Whisher
