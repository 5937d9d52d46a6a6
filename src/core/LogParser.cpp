#include "mdlog/core/LogParser.hpp"

#include "mdlog/core/Logging.hpp"

#include <QStringList>
#include <algorithm>
#include <utility>

namespace mdlog {
namespace core {

namespace {
constexpr int DATE_DIGITS = 8; // ddMMyyyy

void setError(ParseError *error, ParseError::Kind kind, int offset, const QString &message)
{
    if (!error) {
        return;
    }
    error->kind = kind;
    error->offset = offset;
    error->message = message;
}

std::vector<int> matchOffsets(const QString &text, const QString &marker)
{
    std::vector<int> offsets;
    int pos = text.indexOf(marker);
    while (pos >= 0) {
        offsets.push_back(pos);
        pos = text.indexOf(marker, pos + marker.size());
    }
    return offsets;
}

// Text after the first ": ", or nullopt if the line has none.
std::optional<QString> messageAfterSeparator(const QString &line)
{
    const int separator = line.indexOf(QLatin1String(tag::MSG_SEPARATOR));
    if (separator < 0) {
        return std::nullopt;
    }
    return line.mid(separator + static_cast<int>(qstrlen(tag::MSG_SEPARATOR))).trimmed();
}
} // namespace

LogParser::LogParser(LineEnding lineEnding)
    : m_markers(MarkerSet::forLineEnding(lineEnding))
{
}

LogParser::LogParser(MarkerSet markers)
    : m_markers(std::move(markers))
{
}

const MarkerSet &LogParser::markers() const
{
    return m_markers;
}

std::vector<data::Event> LogParser::parseEvents(const QString &text, ParseError *error) const
{
    if (error) {
        *error = ParseError{};
    }

    std::vector<data::Event> events;
    for (int offset : matchOffsets(text, m_markers.event)) {
        auto event = parseEventAt(text, offset, error);
        if (!event) {
            return {};
        }
        events.push_back(std::move(*event));
    }
    qCDebug(lcParser) << "Extracted" << events.size() << "events";
    return events;
}

std::vector<data::Task> LogParser::parseTasks(const QString &text, ParseError *error) const
{
    if (error) {
        *error = ParseError{};
    }

    std::vector<std::pair<int, bool>> starts;
    for (int offset : matchOffsets(text, m_markers.taskTodo)) {
        starts.emplace_back(offset, false);
    }
    for (int offset : matchOffsets(text, m_markers.taskDone)) {
        starts.emplace_back(offset, true);
    }
    std::sort(starts.begin(), starts.end());

    std::vector<data::Task> tasks;
    tasks.reserve(starts.size());
    for (const auto &start : starts) {
        auto task = parseTaskAt(text, start.first, start.second, error);
        if (!task) {
            return {};
        }
        tasks.push_back(std::move(*task));
    }
    qCDebug(lcParser) << "Extracted" << tasks.size() << "tasks";
    return tasks;
}

std::optional<QDate> LogParser::lookupDate(const QString &text, int lineStart, ParseError *error) const
{
    const int searchFrom = lineStart - m_markers.dayHeading.size();
    const int heading = searchFrom < 0 ? -1 : text.lastIndexOf(m_markers.dayHeading, searchFrom);
    if (heading < 0) {
        setError(error, ParseError::DateResolutionError, lineStart, QStringLiteral("no preceding day heading"));
        return std::nullopt;
    }

    const int headingStart = heading + m_markers.lineEnd.size();
    int headingEnd = text.indexOf(m_markers.lineEnd, headingStart);
    if (headingEnd < 0) {
        headingEnd = text.size();
    }
    const QString headingLine = text.mid(headingStart, headingEnd - headingStart);

    // Only the digits matter, the heading is always "... dd.MM.yyyy".
    QString digits;
    for (const QChar c : headingLine) {
        if (c.isDigit()) {
            digits.append(c);
        }
    }

    if (digits.size() != DATE_DIGITS) {
        setError(error, ParseError::DateResolutionError, lineStart,
                 QStringLiteral("expected %1 digits in day heading '%2'").arg(DATE_DIGITS).arg(headingLine));
        return std::nullopt;
    }

    const QDate date(digits.mid(4, 4).toInt(), digits.mid(2, 2).toInt(), digits.left(2).toInt());
    if (!date.isValid()) {
        setError(error, ParseError::DateResolutionError, lineStart,
                 QStringLiteral("'%1' is not a valid date").arg(headingLine));
        return std::nullopt;
    }
    return date;
}

std::optional<int> LogParser::lookupEndOfUnit(const QString &text, int from) const
{
    std::optional<int> end;
    for (const QString &unitEnd : m_markers.unitEnds) {
        const int pos = text.indexOf(unitEnd, from);
        if (pos >= 0 && (!end || pos < *end)) {
            end = pos;
        }
    }
    return end;
}

std::optional<LogParser::Line> LogParser::isolateLine(const QString &text, int markerOffset, ParseError *error) const
{
    Line line;
    line.start = markerOffset + m_markers.lineEnd.size();
    line.end = text.indexOf(m_markers.lineEnd, line.start);
    if (line.end < 0) {
        setError(error, ParseError::StructuralError, markerOffset, QStringLiteral("line is not terminated"));
        return std::nullopt;
    }
    line.text = text.mid(line.start, line.end - line.start);
    return line;
}

std::optional<QStringList> LogParser::unitBody(const QString &text, const Line &line, int markerOffset,
                                               ParseError *error) const
{
    const auto end = lookupEndOfUnit(text, line.end);
    if (!end) {
        setError(error, ParseError::StructuralError, markerOffset,
                 QStringLiteral("no end of unit found after '%1'").arg(line.text));
        return std::nullopt;
    }

    QStringList children;
    const QStringList lines = text.mid(line.end, *end - line.end).split(m_markers.lineEnd);
    for (const QString &child : lines) {
        const QString stripped = stripItemPrefix(child);
        if (!stripped.isEmpty()) {
            children << stripped;
        }
    }
    return children;
}

std::optional<data::Event> LogParser::parseEventAt(const QString &text, int markerOffset, ParseError *error) const
{
    const auto line = isolateLine(text, markerOffset, error);
    if (!line) {
        return std::nullopt;
    }

    data::Event event;
    const QString item = QLatin1String(tag::ITEM);
    const QString plainPrefix = item + QLatin1String(tag::EVT) + QLatin1Char(':');
    const QString timedPrefix = item + QLatin1String(tag::EVT) + QLatin1Char(' ');

    if (line->text.startsWith(plainPrefix)) {
        event.msg = line->text.mid(plainPrefix.size()).trimmed();
    } else if (line->text.startsWith(timedPrefix)) {
        // "HH:MM: message"
        const QString rest = line->text.mid(timedPrefix.size());
        const int hourEnd = rest.indexOf(QLatin1Char(':'));
        const int minuteEnd = hourEnd < 0 ? -1 : rest.indexOf(QLatin1Char(':'), hourEnd + 1);
        if (minuteEnd < 0) {
            setError(error, ParseError::StructuralError, markerOffset,
                     QStringLiteral("event '%1' lacks a time or message").arg(line->text));
            return std::nullopt;
        }

        bool hourOk = false;
        bool minuteOk = false;
        const int hour = rest.left(hourEnd).trimmed().toInt(&hourOk);
        const int minute = rest.mid(hourEnd + 1, minuteEnd - hourEnd - 1).trimmed().toInt(&minuteOk);
        const QTime time(hour, minute, 0);
        if (!hourOk || !minuteOk || !time.isValid()) {
            setError(error, ParseError::StructuralError, markerOffset,
                     QStringLiteral("event '%1' has an invalid time").arg(line->text));
            return std::nullopt;
        }
        event.time = time;
        event.msg = rest.mid(minuteEnd + 1).trimmed();
    } else {
        setError(error, ParseError::StructuralError, markerOffset,
                 QStringLiteral("'%1' is not an event line").arg(line->text));
        return std::nullopt;
    }

    const auto date = lookupDate(text, line->start, error);
    if (!date) {
        return std::nullopt;
    }
    event.date = *date;

    auto notes = unitBody(text, *line, markerOffset, error);
    if (!notes) {
        return std::nullopt;
    }
    event.notes = std::move(*notes);
    return event;
}

std::optional<data::Task> LogParser::parseTaskAt(const QString &text, int markerOffset, bool markedDone,
                                                 ParseError *error) const
{
    const auto line = isolateLine(text, markerOffset, error);
    if (!line) {
        return std::nullopt;
    }

    data::Task task;
    if (const auto msg = messageAfterSeparator(line->text)) {
        task.msg = *msg;
    } else if (!line->text.trimmed().endsWith(QLatin1Char(':'))) {
        setError(error, ParseError::StructuralError, markerOffset,
                 QStringLiteral("task '%1' has no ': ' separator").arg(line->text));
        return std::nullopt;
    }

    const auto date = lookupDate(text, line->start, error);
    if (!date) {
        return std::nullopt;
    }
    task.date = *date;

    const auto children = unitBody(text, *line, markerOffset, error);
    if (!children) {
        return std::nullopt;
    }

    for (const QString &child : *children) {
        const bool todo = child.contains(QLatin1String(tag::TODO));
        const bool done = child.contains(QLatin1String(tag::DONE));
        if (todo && done) {
            qCWarning(lcParser).noquote() << "Found TODO and DONE in" << child
                                          << "- a task can either be done or todo, dropping the line";
            continue;
        }
        if (todo || done) {
            data::Subtask subtask;
            subtask.msg = messageAfterSeparator(child).value_or(child);
            subtask.isDone = done;
            task.subtasks.push_back(std::move(subtask));
            continue;
        }
        task.notes << child;
    }

    const bool allSubtasksDone = std::none_of(task.subtasks.cbegin(), task.subtasks.cend(),
                                              [](const data::Subtask &subtask) { return !subtask.isDone; });
    task.isDone = markedDone && allSubtasksDone;
    return task;
}

QString LogParser::stripItemPrefix(const QString &line)
{
    int pos = 0;
    while (pos < line.size() && line.at(pos).isSpace()) {
        ++pos;
    }
    if (line.midRef(pos).startsWith(QLatin1String(tag::ITEM))) {
        pos += static_cast<int>(qstrlen(tag::ITEM));
    }
    return line.mid(pos);
}

} // namespace core
} // namespace mdlog
