#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <optional>

namespace mdlog {
namespace data {

struct Birthday
{
    int day = 0;
    int month = 0;
    std::optional<int> year; // unset for "dd.mm.?" entries

    bool fallsOn(const QDate &date) const
    {
        return date.isValid() && date.month() == month && date.day() == day;
    }

    // Age reached on the given date, or nullopt if the birth year is unknown.
    std::optional<int> ageOn(const QDate &date) const
    {
        if (!year || !date.isValid()) {
            return std::nullopt;
        }
        int age = date.year() - *year;
        if (date.month() < month || (date.month() == month && date.day() < day)) {
            --age;
        }
        return age;
    }
};

struct Person
{
    QString name;
    Birthday birthday;
    QStringList presents;
};

inline bool operator==(const Birthday &lhs, const Birthday &rhs)
{
    return lhs.day == rhs.day && lhs.month == rhs.month && lhs.year == rhs.year;
}

inline bool operator==(const Person &lhs, const Person &rhs)
{
    return lhs.name == rhs.name && lhs.birthday == rhs.birthday && lhs.presents == rhs.presents;
}

} // namespace data
} // namespace mdlog
