#pragma once

#include <QDate>
#include <QString>
#include <optional>
#include <vector>

#include "mdlog/core/LineEnding.hpp"
#include "mdlog/core/MarkerSet.hpp"
#include "mdlog/core/ParseError.hpp"
#include "mdlog/data/Event.hpp"
#include "mdlog/data/Task.hpp"

namespace mdlog {
namespace core {

/**
 * Recovers tasks and events from a week/day/item outline.
 *
 * Both entry points rescan the whole text and are independent of each other.
 * On failure they return an empty list and fill @p error if given; a
 * successful call resets @p error to ParseError::NoError.
 */
class LogParser
{
public:
    explicit LogParser(LineEnding lineEnding = LineEnding::Unix);
    explicit LogParser(MarkerSet markers);

    const MarkerSet &markers() const;

    std::vector<data::Task> parseTasks(const QString &text, ParseError *error = nullptr) const;
    std::vector<data::Event> parseEvents(const QString &text, ParseError *error = nullptr) const;

    // Date of the nearest day heading above the line starting at lineStart.
    std::optional<QDate> lookupDate(const QString &text, int lineStart, ParseError *error = nullptr) const;
    // Offset of the nearest unit terminator at or after from.
    std::optional<int> lookupEndOfUnit(const QString &text, int from) const;

private:
    struct Line
    {
        int start = -1;
        int end = -1; // offset of the terminating line ending
        QString text;
    };

    std::optional<Line> isolateLine(const QString &text, int markerOffset, ParseError *error) const;
    std::optional<QStringList> unitBody(const QString &text, const Line &line, int markerOffset,
                                        ParseError *error) const;
    std::optional<data::Event> parseEventAt(const QString &text, int markerOffset, ParseError *error) const;
    std::optional<data::Task> parseTaskAt(const QString &text, int markerOffset, bool markedDone,
                                          ParseError *error) const;

    static QString stripItemPrefix(const QString &line);

    MarkerSet m_markers;
};

} // namespace core
} // namespace mdlog
