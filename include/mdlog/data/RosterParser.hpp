#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "mdlog/data/Person.hpp"

namespace mdlog {
namespace data {

struct RosterError
{
    int line = 0; // 1-based, 0 if the failure is not tied to a line
    QString message;

    QString errorString() const;
};

/**
 * Reads the birthday roster:
 *
 *     Alex: 19.01.2001
 *     Bob Smith: 20.12.?
 *
 *     # Presents
 *     Alex:
 *     - Salad
 *
 * People come back in file order.
 */
class RosterParser
{
public:
    static std::optional<std::vector<Person>> parse(const QString &text, RosterError *error = nullptr);
    static std::optional<std::vector<Person>> loadFile(const QString &filePath, RosterError *error = nullptr);

private:
    static std::optional<Birthday> parseBirthday(const QString &value);
    static int quotedPrefixLength(const QString &line);
    static QString unquote(const QString &value);
};

} // namespace data
} // namespace mdlog
