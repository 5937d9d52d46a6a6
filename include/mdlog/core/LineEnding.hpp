#pragma once

#include <QString>
#include <optional>

namespace mdlog {
namespace core {

enum class LineEnding
{
    Unix,
    Windows,
};

QString lineEndingString(LineEnding lineEnding);
QString lineEndingName(LineEnding lineEnding);
std::optional<LineEnding> lineEndingFromName(const QString &name);

// Windows if the text contains at least one CRLF, Unix otherwise.
LineEnding detectLineEnding(const QString &text);

} // namespace core
} // namespace mdlog
