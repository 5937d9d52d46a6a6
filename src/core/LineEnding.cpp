#include "mdlog/core/LineEnding.hpp"

namespace mdlog {
namespace core {

QString lineEndingString(LineEnding lineEnding)
{
    switch (lineEnding) {
    case LineEnding::Windows:
        return QStringLiteral("\r\n");
    case LineEnding::Unix:
    default:
        return QStringLiteral("\n");
    }
}

QString lineEndingName(LineEnding lineEnding)
{
    switch (lineEnding) {
    case LineEnding::Windows:
        return QStringLiteral("crlf");
    case LineEnding::Unix:
    default:
        return QStringLiteral("lf");
    }
}

std::optional<LineEnding> lineEndingFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("lf") || normalized == QLatin1String("unix")) {
        return LineEnding::Unix;
    }
    if (normalized == QLatin1String("crlf") || normalized == QLatin1String("windows")) {
        return LineEnding::Windows;
    }
    return std::nullopt;
}

LineEnding detectLineEnding(const QString &text)
{
    return text.contains(QLatin1String("\r\n")) ? LineEnding::Windows : LineEnding::Unix;
}

} // namespace core
} // namespace mdlog
