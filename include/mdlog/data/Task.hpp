#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <vector>

namespace mdlog {
namespace data {

struct Subtask
{
    QString msg;
    bool isDone = false;
};

struct Task
{
    QString msg;
    std::vector<Subtask> subtasks;
    QStringList notes;
    QDate date;
    // Only true if the task was marked DONE and all subtasks are done.
    bool isDone = false;
};

inline bool operator==(const Subtask &lhs, const Subtask &rhs)
{
    return lhs.msg == rhs.msg && lhs.isDone == rhs.isDone;
}

inline bool operator!=(const Subtask &lhs, const Subtask &rhs)
{
    return !(lhs == rhs);
}

inline bool operator==(const Task &lhs, const Task &rhs)
{
    return lhs.msg == rhs.msg && lhs.subtasks == rhs.subtasks && lhs.notes == rhs.notes
        && lhs.date == rhs.date && lhs.isDone == rhs.isDone;
}

inline bool operator!=(const Task &lhs, const Task &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace mdlog
