#include "CliLocator.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStandardPaths>

namespace Whisher {

const QStringList CliLocator::kPathSearchNames = {"whisper-cli", "whisper-cpp"};

CliLocator::CliLocator(RuntimeContext context,
                       QString overridePath,
                       FileProbe fileExists,
                       PathSearch findInPath)
    : context_(std::move(context))
    , overridePath_(std::move(overridePath))
    , fileExists_(std::move(fileExists))
    , findInPath_(std::move(findInPath)) {
}

QString CliLocator::executableName(Platform platform) {
    return platform == Platform::Windows ? QStringLiteral("whisper-cli.exe")
                                         : QStringLiteral("whisper-cli");
}

CliLocator::FileProbe CliLocator::defaultFileProbe() {
    return [](const QString& path) { return QFileInfo::exists(path); };
}

CliLocator::PathSearch CliLocator::defaultPathSearch() {
    return [](const QString& name) { return QStandardPaths::findExecutable(name); };
}

QString CliLocator::bundledPath(const QString& baseDir) const {
    return QDir(baseDir).filePath(QString::fromLatin1(kBundleSubdirectory) + '/' +
                                  executableName(context_.platform));
}

QList<CliLocator::Strategy> CliLocator::strategies() const {
    QList<Strategy> list;

    if (!overridePath_.isEmpty()) {
        const QString overridePath = overridePath_;
        const FileProbe exists = fileExists_;
        list.append(Strategy{"configured path", [overridePath, exists]() -> std::optional<QString> {
            if (exists(overridePath)) {
                return overridePath;
            }
            return std::nullopt;
        }});
    }

    if (context_.mode == BuildMode::Development) {
        const QString path = bundledPath(context_.projectRoot);
        list.append(Strategy{"development directory", [path]() -> std::optional<QString> {
            return path;
        }});
        return list;
    }

    const QString resourcePath = bundledPath(context_.resourceDir);
    if (context_.platform == Platform::Windows) {
        list.append(Strategy{"bundled resources", [resourcePath]() -> std::optional<QString> {
            return resourcePath;
        }});
        return list;
    }

    const FileProbe exists = fileExists_;
    list.append(Strategy{"bundled resources", [resourcePath, exists]() -> std::optional<QString> {
        if (exists(resourcePath)) {
            return resourcePath;
        }
        return std::nullopt;
    }});

    for (const QString& name : kPathSearchNames) {
        const PathSearch search = findInPath_;
        list.append(Strategy{"PATH lookup for " + name, [name, search]() -> std::optional<QString> {
            const QString found = search(name);
            if (found.isEmpty()) {
                return std::nullopt;
            }
            return found;
        }});
    }

    // Left to the OS search at spawn time
    const QString bareName = executableName(context_.platform);
    list.append(Strategy{"bare executable name", [bareName]() -> std::optional<QString> {
        return bareName;
    }});
    return list;
}

CliCandidate CliLocator::locate() const {
    const QList<Strategy> ordered = strategies();
    for (const Strategy& strategy : ordered) {
        const std::optional<QString> path = strategy.resolve();
        if (!path) {
            Logger::instance().debug("CliLocator: {} did not find whisper-cli", strategy.name.toStdString());
            continue;
        }

        CliCandidate candidate;
        candidate.path = *path;
        candidate.strategy = strategy.name;
        candidate.exists = fileExists_(candidate.path);
        Logger::instance().info("CliLocator: {} -> {} ({})", strategy.name.toStdString(),
                                candidate.path.toStdString(), candidate.exists ? "present" : "missing");
        return candidate;
    }

    // Every list ends with an unconditional strategy
    return CliCandidate{executableName(context_.platform), QStringLiteral("none"), false};
}

} // namespace Whisher
