#include "ModelProvisioner.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QTimer>
#include <QtCore/QUrl>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>
#include <algorithm>
#include <chrono>
#include <memory>

namespace Whisher {

ModelProvisioner::ModelProvisioner(RuntimeContext context, TranscriptionOptions options)
    : context_(std::move(context))
    , options_(std::move(options)) {
}

QString ModelProvisioner::describe(ModelError error) {
    switch (error) {
    case ModelError::NoDataDirectory:
        return tr("The application data directory is not available on this system");
    }
    return tr("Unknown model error");
}

Expected<QString, ModelError> ModelProvisioner::resolveModelPath() const {
    if (context_.appDataDir.isEmpty()) {
        return makeUnexpected(ModelError::NoDataDirectory);
    }
    return QDir(context_.appDataDir).filePath("models/" + options_.modelFileName);
}

Expected<ModelStatus, ModelError> ModelProvisioner::checkInstalled() const {
    auto modelPath = resolveModelPath();
    if (modelPath.hasError()) {
        return makeUnexpected(modelPath.error());
    }

    if (QFileInfo::exists(modelPath.value())) {
        return ModelStatus::present(modelPath.value());
    }
    return ModelStatus::absent();
}

QStringList ModelProvisioner::bundledModelCandidates() const {
    if (context_.mode == BuildMode::Development) {
        return {QDir(context_.projectRoot).filePath("whisher/models/" + options_.modelFileName)};
    }
    const QDir resources(context_.resourceDir);
    return {
        resources.filePath("models/" + options_.modelFileName),
        resources.filePath(options_.modelFileName)
    };
}

QString ModelProvisioner::locateModelForTranscription() const {
    auto modelPath = resolveModelPath();
    if (modelPath.hasValue() && QFileInfo::exists(modelPath.value())) {
        return modelPath.value();
    }

    const QStringList bundled = bundledModelCandidates();
    for (const QString& candidate : bundled) {
        if (QFileInfo::exists(candidate)) {
            Logger::instance().info("ModelProvisioner: Using bundled model {}", candidate.toStdString());
            return candidate;
        }
    }

    return modelPath.valueOr(bundled.isEmpty() ? options_.modelFileName : bundled.first());
}

Expected<QString, DownloadFailure> ModelProvisioner::downloadModel() const {
    auto modelPath = resolveModelPath();
    if (modelPath.hasError()) {
        return makeUnexpected(DownloadFailure{DownloadError::ConfigurationError,
                                              describe(modelPath.error())});
    }
    const QString localPath = modelPath.value();

    const QString modelsDir = QFileInfo(localPath).absolutePath();
    if (!QDir().mkpath(modelsDir)) {
        Logger::instance().error("ModelProvisioner: Cannot create {}", modelsDir.toStdString());
        return makeUnexpected(DownloadFailure{DownloadError::FileSystemError,
                                              tr("Cannot create the models directory %1").arg(modelsDir)});
    }

    Logger::instance().info("ModelProvisioner: Downloading {} -> {}",
                            options_.modelUrl.toStdString(), localPath.toStdString());

    auto body = fetch(options_.modelUrl);
    if (body.hasError()) {
        return makeUnexpected(body.error());
    }

    const QString tempPath = localPath + ".part";
    QFile file(tempPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return makeUnexpected(DownloadFailure{DownloadError::FileSystemError,
            tr("Cannot write %1: %2").arg(tempPath, file.errorString())});
    }
    const QByteArray& payload = body.value();
    const qint64 written = file.write(payload);
    file.close();
    if (written != payload.size()) {
        const QString reason = file.errorString();
        QFile::remove(tempPath);
        return makeUnexpected(DownloadFailure{DownloadError::FileSystemError,
            tr("Cannot write %1: %2").arg(tempPath, reason)});
    }

    if (QFile::exists(localPath) && !QFile::remove(localPath)) {
        QFile::remove(tempPath);
        return makeUnexpected(DownloadFailure{DownloadError::FileSystemError,
            tr("Cannot replace existing model %1").arg(localPath)});
    }
    if (!QFile::rename(tempPath, localPath)) {
        QFile::remove(tempPath);
        return makeUnexpected(DownloadFailure{DownloadError::FileSystemError,
            tr("Cannot move the downloaded model to %1").arg(localPath)});
    }

    Logger::instance().info("ModelProvisioner: Model saved to {} ({} bytes)",
                            localPath.toStdString(), payload.size());
    return localPath;
}

int ModelProvisioner::timeoutSeconds() const {
    if (options_.downloadTimeoutSeconds <= 0) {
        return TranscriptionOptions().downloadTimeoutSeconds;
    }
    return std::min(options_.downloadTimeoutSeconds, TranscriptionOptions::kMaxDownloadTimeoutSeconds);
}

Expected<QByteArray, DownloadFailure> ModelProvisioner::fetch(const QString& url) const {
    const QUrl target(url);
    if (!target.isValid() || target.scheme().isEmpty()) {
        return makeUnexpected(DownloadFailure{DownloadError::InvalidUrl,
                                              tr("Invalid model URL: %1").arg(url)});
    }

    QNetworkAccessManager network;
    QNetworkRequest request(target);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setRawHeader("User-Agent", "WhisherDesktop/1.0");

    std::unique_ptr<QNetworkReply> reply(network.get(request));

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(std::chrono::seconds(timeoutSeconds()));

    loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        Logger::instance().error("ModelProvisioner: Timed out downloading {}", url.toStdString());
        return makeUnexpected(DownloadFailure{DownloadError::TimeoutError,
            tr("Model download timed out after %1 seconds").arg(timeoutSeconds())});
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status != 0 && (status < 200 || status >= 300)) {
        const QString reason = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        Logger::instance().error("ModelProvisioner: Server answered {} {} for {}",
                                 status, reason.toStdString(), url.toStdString());
        return makeUnexpected(DownloadFailure{DownloadError::HttpError,
            tr("Model download failed: HTTP %1 %2").arg(status).arg(reason).trimmed()});
    }

    if (reply->error() != QNetworkReply::NoError) {
        Logger::instance().error("ModelProvisioner: Network error for {}: {}",
                                 url.toStdString(), reply->errorString().toStdString());
        return makeUnexpected(DownloadFailure{DownloadError::NetworkError,
            tr("Model download failed: %1").arg(reply->errorString())});
    }

    return reply->readAll();
}

} // namespace Whisher
