#pragma once

#include "mdlog/data/EventRepository.hpp"
#include "mdlog/data/FileLogStorage.hpp"

#include <memory>

namespace mdlog {
namespace data {

class FileEventRepository : public EventRepository
{
public:
    explicit FileEventRepository(std::shared_ptr<FileLogStorage> storage);
    ~FileEventRepository() override = default;

    std::vector<Event> fetchEvents(const QDate &from, const QDate &to,
                                   core::ParseError *error = nullptr) const override;

private:
    std::shared_ptr<FileLogStorage> m_storage;
};

} // namespace data
} // namespace mdlog
