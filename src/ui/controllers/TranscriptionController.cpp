#include "TranscriptionController.hpp"
#include "../../core/common/Config.hpp"
#include "../../core/common/Logger.hpp"
#include "../../core/transcription/CliLocator.hpp"
#include "../../core/transcription/TranscriptionInvoker.hpp"

#include <QtConcurrent>
#include <QFutureWatcher>

namespace Whisher {

TranscriptionController::TranscriptionController(QObject* parent)
    : TranscriptionController(Config::instance().runtimeContext(),
                              Config::instance().getTranscriptionOptions(),
                              parent) {
}

TranscriptionController::TranscriptionController(RuntimeContext context,
                                                 TranscriptionOptions options,
                                                 QObject* parent)
    : QObject(parent)
    , context_(std::move(context))
    , options_(std::move(options)) {
    qRegisterMetaType<Whisher::TranscriptionResult>();
    Logger::instance().info("TranscriptionController created (data dir: {}, mode: {})",
                            context_.appDataDir.toStdString(),
                            context_.mode == BuildMode::Development ? "development" : "packaged");
}

Expected<ModelStatus, ModelError> TranscriptionController::modelStatus() const {
    return ModelProvisioner(context_, options_).checkInstalled();
}

bool TranscriptionController::modelInstalled() const {
    auto status = modelStatus();
    return status.hasValue() && status.value().installed;
}

QVariantMap TranscriptionController::checkModelInstalled() const {
    QVariantMap map;
    auto status = modelStatus();
    if (status.hasError()) {
        map["installed"] = false;
        map["error"] = ModelProvisioner::describe(status.error());
        return map;
    }
    map["installed"] = status.value().installed;
    if (status.value().path) {
        map["path"] = *status.value().path;
    }
    return map;
}

QFuture<Expected<QString, DownloadFailure>> TranscriptionController::downloadModel() {
    Logger::instance().info("Model download requested from {}", options_.modelUrl.toStdString());
    setDownloading(true);

    const RuntimeContext context = context_;
    const TranscriptionOptions options = options_;
    auto future = QtConcurrent::run([context, options]() {
        return ModelProvisioner(context, options).downloadModel();
    });

    using Watcher = QFutureWatcher<Expected<QString, DownloadFailure>>;
    auto watcher = new Watcher(this);
    connect(watcher, &Watcher::finished, this, [this, watcher]() {
        onDownloadDone(watcher->result());
        watcher->deleteLater();
    });
    watcher->setFuture(future);
    return future;
}

QFuture<TranscriptionResult> TranscriptionController::transcribeAudio(const QString& filePath) {
    Logger::instance().info("Transcribing file: {}", filePath.toStdString());

    ++activeTranscriptions_;
    if (activeTranscriptions_ == 1) {
        emit transcribingChanged();
    }

    const RuntimeContext context = context_;
    const TranscriptionOptions options = options_;
    auto future = QtConcurrent::run([context, options, filePath]() {
        const CliCandidate cli = CliLocator(context, options.cliPathOverride).locate();
        const QString modelPath = ModelProvisioner(context, options).locateModelForTranscription();
        return TranscriptionInvoker(options, context.tempDir).transcribe(filePath, cli.path, modelPath);
    });

    auto watcher = new QFutureWatcher<TranscriptionResult>(this);
    connect(watcher, &QFutureWatcher<TranscriptionResult>::finished, this, [this, watcher]() {
        onTranscriptionDone(watcher->result());
        watcher->deleteLater();
    });
    watcher->setFuture(future);
    return future;
}

void TranscriptionController::requestModelDownload() {
    if (downloading_) {
        Logger::instance().warn("Model download already in progress");
        return;
    }
    downloadModel();
}

void TranscriptionController::requestTranscription(const QString& filePath) {
    transcribeAudio(filePath);
}

QVariantMap TranscriptionController::toVariantMap(const TranscriptionResult& result) {
    QVariantMap map;
    map["text"] = result.text;
    map["success"] = result.success;
    if (result.error) {
        map["error"] = *result.error;
    }
    return map;
}

void TranscriptionController::onTranscriptionDone(const TranscriptionResult& result) {
    --activeTranscriptions_;

    if (result.success) {
        Logger::instance().info("Transcription completed ({} characters)", result.text.size());
        lastTranscription_ = result.text;
        emit transcriptionChanged();
        setLastError(QString());
    } else {
        Logger::instance().error("Transcription failed: {}", result.errorString().toStdString());
        setLastError(result.errorString());
    }

    emit transcriptionFinished(result);
    if (result.success) {
        emit transcriptionCompleted(result.text);
    } else {
        emit transcriptionError(result.errorString());
    }

    if (activeTranscriptions_ == 0) {
        emit transcribingChanged();
    }
}

void TranscriptionController::onDownloadDone(const Expected<QString, DownloadFailure>& result) {
    setDownloading(false);

    if (result.hasValue()) {
        setLastError(QString());
        emit modelInstalledChanged();
        emit modelDownloadCompleted(result.value());
    } else {
        Logger::instance().error("Model download failed: {}", result.error().message.toStdString());
        setLastError(result.error().message);
        emit modelDownloadFailed(result.error().message);
    }
}

void TranscriptionController::setDownloading(bool downloading) {
    if (downloading_ != downloading) {
        downloading_ = downloading;
        emit downloadingChanged();
    }
}

void TranscriptionController::setLastError(const QString& error) {
    if (lastError_ != error) {
        lastError_ = error;
        emit lastErrorChanged();
    }
}

} // namespace Whisher
