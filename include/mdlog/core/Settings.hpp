#pragma once

#include <QString>
#include <optional>

#include "mdlog/core/LineEnding.hpp"

namespace mdlog {
namespace core {

struct Settings
{
    std::optional<LineEnding> lineEnding; // detect from the log when unset
    QString rosterFile = QStringLiteral("birthdays.yml");
    double callProbability = 0.1;

    // Reads from / writes to the application's QSettings store.
    static Settings load();
    void save() const;
};

} // namespace core
} // namespace mdlog
