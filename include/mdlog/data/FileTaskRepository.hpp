#pragma once

#include "mdlog/data/FileLogStorage.hpp"
#include "mdlog/data/TaskRepository.hpp"

#include <memory>

namespace mdlog {
namespace data {

class FileTaskRepository : public TaskRepository
{
public:
    explicit FileTaskRepository(std::shared_ptr<FileLogStorage> storage);
    ~FileTaskRepository() override = default;

    std::vector<Task> fetchTasks(const QDate &from, const QDate &to,
                                 core::ParseError *error = nullptr) const override;

private:
    std::shared_ptr<FileLogStorage> m_storage;
};

} // namespace data
} // namespace mdlog
