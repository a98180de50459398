#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Whisher {

/**
 * @brief Lines whisper-cli prints around the transcript on stdout.
 *
 * A trimmed line is dropped when it is empty, starts with one of
 * @c prefixes, contains one of @c substrings or equals one of @c exact.
 */
struct DiagnosticLineTable {
    QStringList prefixes;
    QStringList substrings;
    QStringList exact;
};

// Engine banners, timing report, fallback counters and the silence marker
const DiagnosticLineTable& whisperCliDiagnostics();

class OutputFilter {
public:
    explicit OutputFilter(const DiagnosticLineTable& table = whisperCliDiagnostics());

    bool isDiagnostic(const QString& line) const;

    // Trimmed transcript lines joined with '\n'; empty if nothing survives
    QString extractTranscript(const QString& capturedStdout) const;

private:
    DiagnosticLineTable table_;
};

} // namespace Whisher
