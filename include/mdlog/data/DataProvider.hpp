#pragma once

#include <QString>
#include <memory>
#include <optional>

#include "mdlog/core/LineEnding.hpp"

namespace mdlog {
namespace data {

class TaskRepository;
class EventRepository;
class FileLogStorage;

class DataProvider
{
public:
    explicit DataProvider(const QString &logFilePath, std::optional<core::LineEnding> lineEnding = std::nullopt);
    ~DataProvider();

    bool isLoaded() const;
    QString errorString() const;

    TaskRepository &taskRepository();
    EventRepository &eventRepository();

private:
    std::shared_ptr<FileLogStorage> m_logStorage;
    std::unique_ptr<TaskRepository> m_taskRepository;
    std::unique_ptr<EventRepository> m_eventRepository;
};

} // namespace data
} // namespace mdlog
