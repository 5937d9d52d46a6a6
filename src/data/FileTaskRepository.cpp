#include "mdlog/data/FileTaskRepository.hpp"

#include "mdlog/core/LogParser.hpp"
#include "mdlog/data/DateRange.hpp"

namespace mdlog {
namespace data {

FileTaskRepository::FileTaskRepository(std::shared_ptr<FileLogStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Task> FileTaskRepository::fetchTasks(const QDate &from, const QDate &to, core::ParseError *error) const
{
    std::vector<Task> result;
    if (error) {
        *error = core::ParseError();
    }
    if (!m_storage || !m_storage->isLoaded()) {
        return result;
    }

    const core::LogParser parser(m_storage->lineEnding());
    for (auto &task : parser.parseTasks(m_storage->text(), error)) {
        if (inDateRange(task.date, from, to)) {
            result.push_back(std::move(task));
        }
    }
    return result;
}

} // namespace data
} // namespace mdlog
