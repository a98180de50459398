#pragma once

#include <QtCore/QLocale>
#include <QtCore/QString>
#include <QtCore/QTranslator>
#include <memory>

namespace Whisher {

/**
 * @brief Message catalogues compiled into the binary under :/i18n.
 */
class Translations {
public:
    static constexpr const char* kResourceDir = ":/i18n";

    // Null when no catalogue ships for the locale (English needs none)
    static std::unique_ptr<QTranslator> load(const QLocale& locale);

    // Empty name selects the system locale
    static QLocale localeFor(const QString& languageName);
};

} // namespace Whisher
