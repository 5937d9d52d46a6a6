#include "mdlog/data/FileEventRepository.hpp"

#include "mdlog/core/LogParser.hpp"
#include "mdlog/data/DateRange.hpp"

namespace mdlog {
namespace data {

FileEventRepository::FileEventRepository(std::shared_ptr<FileLogStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Event> FileEventRepository::fetchEvents(const QDate &from, const QDate &to, core::ParseError *error) const
{
    std::vector<Event> result;
    if (error) {
        *error = core::ParseError();
    }
    if (!m_storage || !m_storage->isLoaded()) {
        return result;
    }

    const core::LogParser parser(m_storage->lineEnding());
    for (auto &event : parser.parseEvents(m_storage->text(), error)) {
        if (inDateRange(event.date, from, to)) {
            result.push_back(std::move(event));
        }
    }
    return result;
}

} // namespace data
} // namespace mdlog
