#include <QFile>
#include <QTemporaryDir>
#include <QtTest/QtTest>

#include "mdlog/data/DataProvider.hpp"
#include "mdlog/data/EventRepository.hpp"
#include "mdlog/data/FileLogStorage.hpp"
#include "mdlog/data/TaskRepository.hpp"

using namespace mdlog;

namespace {

const QString WEEK_LOG = QStringLiteral("# Week 43, 21.10.2019 - 27.10.2019\n"
                                        "\n"
                                        "## Mon, 21.10.2019\n"
                                        "- TODO: buy milk\n"
                                        "- EVT 08:30: dentist\n"
                                        "\n"
                                        "## Tue, 22.10.2019\n"
                                        "- DONE: file taxes\n"
                                        "  - DONE: gather receipts\n"
                                        "\n"
                                        "## Wed, 23.10.2019\n"
                                        "- EVT: team lunch\n"
                                        "  - bring cake\n"
                                        "- TODO: water plants\n"
                                        "\n");

bool writeFile(const QString &path, const QString &content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(content.toUtf8()) >= 0;
}

} // namespace

class TaskRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void fetchesAllTasks();
    void filtersByDate();
    void fetchesEvents();
    void detectsWindowsLineEndings();
    void propagatesParseErrors();
    void reportsMissingFile();

private:
    QTemporaryDir m_dir;
};

void TaskRepositoryTest::fetchesAllTasks()
{
    const QString path = m_dir.filePath(QStringLiteral("all.md"));
    QVERIFY(writeFile(path, WEEK_LOG));

    data::DataProvider provider(path);
    QVERIFY(provider.isLoaded());

    core::ParseError error;
    const auto tasks = provider.taskRepository().fetchTasks({}, {}, &error);
    QCOMPARE(error.kind, core::ParseError::NoError);
    QCOMPARE(tasks.size(), static_cast<size_t>(3));
    QCOMPARE(tasks.at(0).msg, QStringLiteral("buy milk"));
    QVERIFY(tasks.at(1).isDone);
    QCOMPARE(tasks.at(2).date, QDate(2019, 10, 23));
}

void TaskRepositoryTest::filtersByDate()
{
    const QString path = m_dir.filePath(QStringLiteral("range.md"));
    QVERIFY(writeFile(path, WEEK_LOG));

    data::DataProvider provider(path);
    const auto fromTuesday = provider.taskRepository().fetchTasks(QDate(2019, 10, 22), {});
    QCOMPARE(fromTuesday.size(), static_cast<size_t>(2));
    QCOMPARE(fromTuesday.front().msg, QStringLiteral("file taxes"));

    const auto mondayOnly = provider.taskRepository().fetchTasks(QDate(2019, 10, 21), QDate(2019, 10, 21));
    QCOMPARE(mondayOnly.size(), static_cast<size_t>(1));
    QCOMPARE(mondayOnly.front().msg, QStringLiteral("buy milk"));
}

void TaskRepositoryTest::fetchesEvents()
{
    const QString path = m_dir.filePath(QStringLiteral("events.md"));
    QVERIFY(writeFile(path, WEEK_LOG));

    data::DataProvider provider(path);
    const auto events = provider.eventRepository().fetchEvents({}, QDate(2019, 10, 23));
    QCOMPARE(events.size(), static_cast<size_t>(2));
    QCOMPARE(events.at(0).msg, QStringLiteral("dentist"));
    QVERIFY(events.at(0).time.has_value());
    QCOMPARE(*events.at(0).time, QTime(8, 30));
    QCOMPARE(events.at(1).notes, QStringList{QStringLiteral("bring cake")});
}

void TaskRepositoryTest::detectsWindowsLineEndings()
{
    QString log = WEEK_LOG;
    log.replace(QLatin1Char('\n'), QLatin1String("\r\n"));
    const QString path = m_dir.filePath(QStringLiteral("crlf.md"));
    QVERIFY(writeFile(path, log));

    const auto storage = std::make_shared<data::FileLogStorage>(path);
    QVERIFY(storage->isLoaded());
    QCOMPARE(storage->lineEnding(), core::LineEnding::Windows);

    data::DataProvider provider(path);
    const auto tasks = provider.taskRepository().fetchTasks({}, {});
    QCOMPARE(tasks.size(), static_cast<size_t>(3));
    QCOMPARE(tasks.at(1).subtasks.front().msg, QStringLiteral("gather receipts"));
}

void TaskRepositoryTest::propagatesParseErrors()
{
    const QString path = m_dir.filePath(QStringLiteral("broken.md"));
    QVERIFY(writeFile(path, QStringLiteral("\n## Mon, 31.11.2019\n- TODO: impossible day\n\n")));

    data::DataProvider provider(path);
    core::ParseError error;
    QVERIFY(provider.taskRepository().fetchTasks({}, {}, &error).empty());
    QCOMPARE(error.kind, core::ParseError::DateResolutionError);
}

void TaskRepositoryTest::reportsMissingFile()
{
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("cannot open")));
    data::DataProvider provider(m_dir.filePath(QStringLiteral("missing.md")));
    QVERIFY(!provider.isLoaded());
    QVERIFY(!provider.errorString().isEmpty());
    QVERIFY(provider.taskRepository().fetchTasks({}, {}).empty());

    core::ParseError error;
    error.kind = core::ParseError::StructuralError;
    error.offset = 7;
    QVERIFY(provider.eventRepository().fetchEvents({}, {}, &error).empty());
    QCOMPARE(error.kind, core::ParseError::NoError);
    QCOMPARE(error.offset, -1);
}

QTEST_GUILESS_MAIN(TaskRepositoryTest)
#include "TaskRepositoryTest.moc"
