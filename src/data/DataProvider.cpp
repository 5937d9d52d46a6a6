#include "mdlog/data/DataProvider.hpp"

#include "mdlog/data/EventRepository.hpp"
#include "mdlog/data/FileEventRepository.hpp"
#include "mdlog/data/FileLogStorage.hpp"
#include "mdlog/data/FileTaskRepository.hpp"
#include "mdlog/data/TaskRepository.hpp"

namespace mdlog {
namespace data {

DataProvider::DataProvider(const QString &logFilePath, std::optional<core::LineEnding> lineEnding)
{
    m_logStorage = std::make_shared<FileLogStorage>(logFilePath, lineEnding);
    m_taskRepository = std::make_unique<FileTaskRepository>(m_logStorage);
    m_eventRepository = std::make_unique<FileEventRepository>(m_logStorage);
}

DataProvider::~DataProvider() = default;

bool DataProvider::isLoaded() const
{
    return m_logStorage->isLoaded();
}

QString DataProvider::errorString() const
{
    return m_logStorage->errorString();
}

TaskRepository &DataProvider::taskRepository()
{
    return *m_taskRepository;
}

EventRepository &DataProvider::eventRepository()
{
    return *m_eventRepository;
}

} // namespace data
} // namespace mdlog
