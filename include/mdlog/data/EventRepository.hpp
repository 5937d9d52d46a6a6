#pragma once

#include <QDate>
#include <vector>

#include "mdlog/core/ParseError.hpp"
#include "mdlog/data/Event.hpp"

namespace mdlog {
namespace data {

class EventRepository
{
public:
    virtual ~EventRepository() = default;

    // Events dated within [from, to]; an invalid bound leaves that side open.
    // An unloaded source yields no records and no error; check isLoaded() on the provider.
    virtual std::vector<Event> fetchEvents(const QDate &from, const QDate &to,
                                           core::ParseError *error = nullptr) const = 0;
};

} // namespace data
} // namespace mdlog
