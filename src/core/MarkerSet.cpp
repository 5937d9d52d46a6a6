#include "mdlog/core/MarkerSet.hpp"

namespace mdlog {
namespace core {

MarkerSet MarkerSet::forLineEnding(LineEnding lineEnding)
{
    MarkerSet markers;
    const QString le = lineEndingString(lineEnding);
    const QString item = le + QLatin1String(tag::ITEM);

    markers.lineEnding = lineEnding;
    markers.lineEnd = le;
    markers.taskTodo = item + QLatin1String(tag::TODO);
    markers.taskDone = item + QLatin1String(tag::DONE);
    markers.event = item + QLatin1String(tag::EVT);
    markers.dayHeading = le + QLatin1String(tag::DAY);
    markers.weekHeading = le + QLatin1String(tag::WEEK);
    markers.unitEnds = {
        item,
        le + le,
        markers.dayHeading,
        markers.weekHeading,
    };
    return markers;
}

} // namespace core
} // namespace mdlog
