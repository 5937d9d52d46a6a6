#pragma once

#include <QString>
#include <array>

#include "mdlog/core/LineEnding.hpp"

namespace mdlog {
namespace core {

namespace tag {
constexpr auto ITEM = "- ";
constexpr auto SUB = "  ";
constexpr auto DAY = "## ";
constexpr auto WEEK = "# Week ";
constexpr auto TODO = "TODO";
constexpr auto DONE = "DONE";
constexpr auto EVT = "EVT";
constexpr auto EVT_PLAIN = "EVT: ";
constexpr auto MSG_SEPARATOR = ": ";
} // namespace tag

// The searched marker strings for one line-ending convention. Every marker is
// prefixed with the line ending, so a match always sits at the start of a line.
struct MarkerSet
{
    static MarkerSet forLineEnding(LineEnding lineEnding);

    LineEnding lineEnding = LineEnding::Unix;
    QString lineEnd;
    QString taskTodo;
    QString taskDone;
    QString event;
    QString dayHeading;
    QString weekHeading;
    // top-level item, empty line, next day, next week
    std::array<QString, 4> unitEnds;
};

} // namespace core
} // namespace mdlog
