#pragma once

#include <QDate>

namespace mdlog {
namespace data {

inline bool inDateRange(const QDate &date, const QDate &from, const QDate &to)
{
    if (from.isValid() && date < from) {
        return false;
    }
    if (to.isValid() && date > to) {
        return false;
    }
    return true;
}

} // namespace data
} // namespace mdlog
