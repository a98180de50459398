#include "TestUtils.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QRandomGenerator>
#include <QtCore/QStandardPaths>
#include <QtCore/QTextStream>
#include <QtNetwork/QTcpSocket>

namespace Whisher {
namespace Test {

QTemporaryDir* TestUtils::tempDir_ = nullptr;

void TestUtils::initializeTestEnvironment() {
    // Keep QSettings and AppDataLocation away from the real user profile
    QStandardPaths::setTestModeEnabled(true);

    if (!tempDir_) {
        tempDir_ = new QTemporaryDir();
        if (!tempDir_->isValid()) {
            qFatal("Failed to create temporary directory for tests");
        }
    }
}

void TestUtils::cleanupTestEnvironment() {
    delete tempDir_;
    tempDir_ = nullptr;
}

QString TestUtils::createTempDirectory(const QString& prefix) {
    if (!tempDir_) {
        initializeTestEnvironment();
    }

    QString dirName = QString("%1_%2_%3")
                     .arg(prefix)
                     .arg(QDateTime::currentMSecsSinceEpoch())
                     .arg(QRandomGenerator::global()->generate());

    QString fullPath = tempDir_->path() + "/" + dirName;
    if (!QDir().mkpath(fullPath)) {
        return QString();
    }
    return fullPath;
}

void TestUtils::cleanupTempDirectory(const QString& path) {
    QDir dir(path);
    if (dir.exists()) {
        dir.removeRecursively();
    }
}

QString TestUtils::createTestTextFile(const QString& directory, const QString& content, const QString& filename) {
    QString filePath = directory + "/" + filename;

    QFile file(filePath);
    if (file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        QTextStream stream(&file);
        stream << content;
        file.close();
    }

    return filePath;
}

QString TestUtils::createTestAudioFile(const QString& directory, const QString& filename) {
    // whisper-cli is faked in tests, so only existence matters
    QFile file(directory + "/" + filename);
    if (file.open(QIODevice::WriteOnly)) {
        file.write(QByteArray("RIFF\0\0\0\0WAVE", 12));
        file.close();
    }
    return file.fileName();
}

QString TestUtils::createTestModelFile(const QString& path) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) {
        file.write("ggml-model-placeholder");
        file.close();
    }
    return path;
}

bool TestUtils::canRunShellScripts() {
#ifdef Q_OS_WIN
    return false;
#else
    return QFileInfo::exists("/bin/sh");
#endif
}

bool TestUtils::canRestrictPermissions() {
    const QString dir = createTempDirectory("permissions");
    if (dir.isEmpty()) {
        return false;
    }
    setDirectoryWritable(dir, false);

    QFile writeCheck(dir + "/write-check");
    const bool enforced = !writeCheck.open(QIODevice::WriteOnly);
    writeCheck.close();

    setDirectoryWritable(dir, true);
    cleanupTempDirectory(dir);
    return enforced;
}

void TestUtils::setDirectoryWritable(const QString& path, bool writable) {
    QFileDevice::Permissions permissions = QFileDevice::ReadOwner | QFileDevice::ExeOwner |
                                           QFileDevice::ReadGroup | QFileDevice::ExeGroup;
    if (writable) {
        permissions |= QFileDevice::WriteOwner;
    }
    QFile::setPermissions(path, permissions);
}

QString TestUtils::createFakeWhisperCli(const QString& directory, const QString& body, const QString& filename) {
    QDir().mkpath(directory);
    const QString scriptPath = directory + "/" + filename;
    const QString argsLog = directory + "/args.log";

    QString script;
    QTextStream stream(&script);
    stream << "#!/bin/sh\n"
           << "printf '%s\\n' \"$@\" > '" << argsLog << "'\n"
           << "out=\"\"\n"
           << "while [ $# -gt 0 ]; do\n"
           << "  if [ \"$1\" = \"-of\" ]; then out=\"$2\"; shift; fi\n"
           << "  shift\n"
           << "done\n"
           << body << "\n";

    QFile file(scriptPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write(script.toUtf8());
    file.close();
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner |
                        QFileDevice::ReadGroup | QFileDevice::ExeGroup);
    return scriptPath;
}

RuntimeContext TestUtils::makeContext(const QString& root, BuildMode mode) {
    RuntimeContext context;
    context.appDataDir = root + "/data";
    context.projectRoot = root + "/project";
    context.resourceDir = root + "/resources";
    context.tempDir = root + "/tmp";
    context.mode = mode;
    context.platform = hostPlatform();
    QDir().mkpath(context.tempDir);
    return context;
}

void TestUtils::assertFileExists(const QString& filePath, const QString& context) {
    if (!QFileInfo::exists(filePath)) {
        QString message = QString("File does not exist: %1").arg(filePath);
        if (!context.isEmpty()) {
            message += QString(" (context: %1)").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

void TestUtils::assertFileNotExists(const QString& filePath, const QString& context) {
    if (QFileInfo::exists(filePath)) {
        QString message = QString("File should not exist: %1").arg(filePath);
        if (!context.isEmpty()) {
            message += QString(" (context: %1)").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

TestHttpServer::TestHttpServer(QObject* parent)
    : QObject(parent) {
    connect(&server_, &QTcpServer::newConnection, this, &TestHttpServer::onNewConnection);
}

bool TestHttpServer::start() {
    return server_.listen(QHostAddress::LocalHost, 0);
}

void TestHttpServer::respondWith(int statusCode, const QByteArray& body, const QByteArray& reason) {
    statusCode_ = statusCode;
    body_ = body;
    if (!reason.isEmpty()) {
        reason_ = reason;
    } else {
        reason_ = statusCode == 200 ? "OK" : statusCode == 404 ? "Not Found" : "Error";
    }
}

QString TestHttpServer::url(const QString& path) const {
    return QString("http://127.0.0.1:%1%2").arg(server_.serverPort()).arg(path);
}

void TestHttpServer::onNewConnection() {
    while (QTcpSocket* client = server_.nextPendingConnection()) {
        auto request = std::make_shared<QByteArray>();
        connect(client, &QTcpSocket::readyRead, client, [this, client, request]() {
            request->append(client->readAll());
            if (!request->contains("\r\n\r\n")) {
                return;
            }
            ++requestCount_;

            QByteArray response = "HTTP/1.1 " + QByteArray::number(statusCode_) + " " + reason_ + "\r\n";
            response += "Content-Type: application/octet-stream\r\n";
            response += "Content-Length: " + QByteArray::number(body_.size()) + "\r\n";
            response += "Connection: close\r\n\r\n";
            response += body_;
            client->write(response);
            client->disconnectFromHost();
        });
        connect(client, &QTcpSocket::disconnected, client, &QObject::deleteLater);
    }
}

} // namespace Test
} // namespace Whisher
