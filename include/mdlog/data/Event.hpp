#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <QTime>
#include <optional>

namespace mdlog {
namespace data {

struct Event
{
    QString msg;
    QStringList notes;
    QDate date;
    std::optional<QTime> time; // absent for "- EVT: ..." lines
};

inline bool operator==(const Event &lhs, const Event &rhs)
{
    return lhs.msg == rhs.msg && lhs.notes == rhs.notes && lhs.date == rhs.date && lhs.time == rhs.time;
}

inline bool operator!=(const Event &lhs, const Event &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace mdlog
