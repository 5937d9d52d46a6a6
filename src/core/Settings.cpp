#include "mdlog/core/Settings.hpp"

#include "mdlog/core/Logging.hpp"

#include <QSettings>
#include <QtGlobal>

namespace mdlog {
namespace core {

namespace {
constexpr auto KEY_LINE_ENDING = "parser/lineEnding";
constexpr auto KEY_ROSTER_FILE = "roster/file";
constexpr auto KEY_CALL_PROBABILITY = "generator/callProbability";
constexpr auto LINE_ENDING_AUTO = "auto";
} // namespace

Settings Settings::load()
{
    Settings result;
    QSettings settings;

    const QString lineEnding = settings.value(QLatin1String(KEY_LINE_ENDING), QLatin1String(LINE_ENDING_AUTO)).toString();
    if (lineEnding != QLatin1String(LINE_ENDING_AUTO)) {
        result.lineEnding = lineEndingFromName(lineEnding);
        if (!result.lineEnding) {
            qCWarning(lcSettings).noquote() << "Unknown line ending" << lineEnding << "in settings, detecting instead";
        }
    }

    result.rosterFile = settings.value(QLatin1String(KEY_ROSTER_FILE), result.rosterFile).toString();

    const double storedProbability =
        settings.value(QLatin1String(KEY_CALL_PROBABILITY), result.callProbability).toDouble();
    result.callProbability = qBound(0.0, storedProbability, 1.0);
    return result;
}

void Settings::save() const
{
    QSettings settings;
    settings.setValue(QLatin1String(KEY_LINE_ENDING),
                      lineEnding ? lineEndingName(*lineEnding) : QString::fromLatin1(LINE_ENDING_AUTO));
    settings.setValue(QLatin1String(KEY_ROSTER_FILE), rosterFile);
    settings.setValue(QLatin1String(KEY_CALL_PROBABILITY), callProbability);
}

} // namespace core
} // namespace mdlog
