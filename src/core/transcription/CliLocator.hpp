#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <functional>
#include <optional>

#include "TranscriptionTypes.hpp"

namespace Whisher {

struct CliCandidate {
    QString path;
    QString strategy;       // name of the strategy that produced the path
    bool exists = false;
};

/**
 * @brief Finds the whisper-cli executable for the current runtime context.
 *
 * Resolution is an ordered list of strategies; the first one that yields a
 * path wins. Filesystem and PATH access go through injectable functions so
 * the ordering can be exercised without touching the host system.
 */
class CliLocator {
public:
    using FileProbe = std::function<bool(const QString& path)>;
    using PathSearch = std::function<QString(const QString& executableName)>;

    struct Strategy {
        QString name;
        std::function<std::optional<QString>()> resolve;
    };

    static constexpr const char* kBundleSubdirectory = "whisher";
    static const QStringList kPathSearchNames;

    explicit CliLocator(RuntimeContext context,
                        QString overridePath = QString(),
                        FileProbe fileExists = defaultFileProbe(),
                        PathSearch findInPath = defaultPathSearch());

    static QString executableName(Platform platform);

    QList<Strategy> strategies() const;
    CliCandidate locate() const;

    static FileProbe defaultFileProbe();
    static PathSearch defaultPathSearch();

private:
    QString bundledPath(const QString& baseDir) const;

    RuntimeContext context_;
    QString overridePath_;
    FileProbe fileExists_;
    PathSearch findInPath_;
};

} // namespace Whisher
