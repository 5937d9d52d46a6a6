#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <cstdio>
#include <optional>
#include <utility>

#include "version.h"

#include "mdlog/core/LineEnding.hpp"
#include "mdlog/core/Logging.hpp"
#include "mdlog/core/ParseError.hpp"
#include "mdlog/core/Settings.hpp"
#include "mdlog/core/TemplateGenerator.hpp"
#include "mdlog/data/DataProvider.hpp"
#include "mdlog/data/EventRepository.hpp"
#include "mdlog/data/RosterParser.hpp"
#include "mdlog/data/TaskRepository.hpp"

namespace {

constexpr auto DATE_FORMAT = "dd.MM.yyyy";
constexpr auto TIME_FORMAT = "hh:mm";

enum ExitCode
{
    ExitSuccess = 0,
    ExitParseError = 1,
    ExitUsageError = 2,
};

struct Options
{
    QCommandLineOption open{QStringLiteral("open"), QStringLiteral("Only list tasks that are not done.")};
    QCommandLineOption from{QStringLiteral("from"), QStringLiteral("First day to list (dd.MM.yyyy)."),
                            QStringLiteral("date")};
    QCommandLineOption to{QStringLiteral("to"), QStringLiteral("Last day to list (dd.MM.yyyy)."),
                          QStringLiteral("date")};
    QCommandLineOption lineEnding{QStringLiteral("line-ending"), QStringLiteral("lf, crlf or auto."),
                                  QStringLiteral("ending")};
    QCommandLineOption year{QStringLiteral("year"), QStringLiteral("Year to generate for, defaults to the current one."),
                            QStringLiteral("year")};
    QCommandLineOption birthdays{{QStringLiteral("b"), QStringLiteral("generate-birthdays")},
                                 QStringLiteral("Add a task for every birthday in the roster.")};
    QCommandLineOption calls{{QStringLiteral("c"), QStringLiteral("generate-calls")},
                             QStringLiteral("Randomly add a task to call someone from the roster.")};
    QCommandLineOption birthdayFile{QStringLiteral("birthday-file"), QStringLiteral("The roster to source birthdays from."),
                                    QStringLiteral("file")};
};

bool readDateOption(const QCommandLineParser &parser, const QCommandLineOption &option, QDate &date)
{
    if (!parser.isSet(option)) {
        return true;
    }
    const QString value = parser.value(option);
    date = QDate::fromString(value, QLatin1String(DATE_FORMAT));
    if (!date.isValid()) {
        qCCritical(lcCli).noquote() << "Invalid date" << value << "- expected dd.MM.yyyy";
        return false;
    }
    return true;
}

bool readLineEnding(const QCommandLineParser &parser, const Options &options,
                    std::optional<mdlog::core::LineEnding> &lineEnding)
{
    if (!parser.isSet(options.lineEnding)) {
        return true;
    }
    const QString value = parser.value(options.lineEnding);
    if (value == QLatin1String("auto")) {
        lineEnding.reset();
        return true;
    }
    lineEnding = mdlog::core::lineEndingFromName(value);
    if (!lineEnding) {
        qCCritical(lcCli).noquote() << "Unknown line ending" << value;
        return false;
    }
    return true;
}

int listTasks(const QCommandLineParser &parser, const Options &options, const QString &logFile,
              std::optional<mdlog::core::LineEnding> lineEnding)
{
    QDate from;
    QDate to;
    if (!readDateOption(parser, options.from, from) || !readDateOption(parser, options.to, to)) {
        return ExitUsageError;
    }

    mdlog::data::DataProvider provider(logFile, lineEnding);
    if (!provider.isLoaded()) {
        qCCritical(lcCli).noquote() << provider.errorString();
        return ExitUsageError;
    }

    mdlog::core::ParseError error;
    const auto tasks = provider.taskRepository().fetchTasks(from, to, &error);
    if (error.kind != mdlog::core::ParseError::NoError) {
        qCCritical(lcCli).noquote() << logFile << error.errorString();
        return ExitParseError;
    }

    QTextStream out(stdout);
    const bool onlyOpen = parser.isSet(options.open);
    for (const auto &task : tasks) {
        if (onlyOpen && task.isDone) {
            continue;
        }
        out << (task.isDone ? "[x] " : "[ ] ") << task.date.toString(QLatin1String(DATE_FORMAT)) << ' ' << task.msg
            << '\n';
        for (const auto &subtask : task.subtasks) {
            out << "    " << (subtask.isDone ? "[x] " : "[ ] ") << subtask.msg << '\n';
        }
        for (const QString &note : task.notes) {
            out << "    " << note << '\n';
        }
    }
    return ExitSuccess;
}

int listEvents(const QCommandLineParser &parser, const Options &options, const QString &logFile,
               std::optional<mdlog::core::LineEnding> lineEnding)
{
    QDate from;
    QDate to;
    if (!readDateOption(parser, options.from, from) || !readDateOption(parser, options.to, to)) {
        return ExitUsageError;
    }

    mdlog::data::DataProvider provider(logFile, lineEnding);
    if (!provider.isLoaded()) {
        qCCritical(lcCli).noquote() << provider.errorString();
        return ExitUsageError;
    }

    mdlog::core::ParseError error;
    const auto events = provider.eventRepository().fetchEvents(from, to, &error);
    if (error.kind != mdlog::core::ParseError::NoError) {
        qCCritical(lcCli).noquote() << logFile << error.errorString();
        return ExitParseError;
    }

    QTextStream out(stdout);
    for (const auto &event : events) {
        out << event.date.toString(QLatin1String(DATE_FORMAT));
        if (event.time) {
            out << ' ' << event.time->toString(QLatin1String(TIME_FORMAT));
        }
        out << ' ' << event.msg << '\n';
        for (const QString &note : event.notes) {
            out << "    " << note << '\n';
        }
    }
    return ExitSuccess;
}

int generate(const QCommandLineParser &parser, const Options &options, const QStringList &arguments,
             const mdlog::core::Settings &settings, std::optional<mdlog::core::LineEnding> lineEnding)
{
    if (arguments.isEmpty() || arguments.size() > 2) {
        qCCritical(lcCli) << "generate expects <week> [count]";
        return ExitUsageError;
    }

    bool weekOk = false;
    bool countOk = true;
    const int week = arguments.at(0).toInt(&weekOk);
    const int count = arguments.size() > 1 ? arguments.at(1).toInt(&countOk) : 1;
    if (!weekOk || !countOk) {
        qCCritical(lcCli) << "week and count must be numbers";
        return ExitUsageError;
    }

    int year = QDate::currentDate().year();
    if (parser.isSet(options.year)) {
        bool yearOk = false;
        year = parser.value(options.year).toInt(&yearOk);
        if (!yearOk) {
            qCCritical(lcCli).noquote() << "Invalid year" << parser.value(options.year);
            return ExitUsageError;
        }
    } else {
        qCInfo(lcCli) << "No year provided, defaulting to" << year;
    }

    mdlog::core::TemplateGenerator generator(lineEnding.value_or(mdlog::core::LineEnding::Unix));
    generator.setBirthdaysEnabled(parser.isSet(options.birthdays));
    generator.setCallsEnabled(parser.isSet(options.calls));
    generator.setCallProbability(settings.callProbability);

    if (parser.isSet(options.birthdays) || parser.isSet(options.calls)) {
        const QString rosterFile =
            parser.isSet(options.birthdayFile) ? parser.value(options.birthdayFile) : settings.rosterFile;
        mdlog::data::RosterError rosterError;
        auto people = mdlog::data::RosterParser::loadFile(rosterFile, &rosterError);
        if (!people) {
            qCCritical(lcCli).noquote() << "Failed to parse birthday file" << rosterFile << "-"
                                        << rosterError.errorString();
            return ExitParseError;
        }
        generator.setPeople(std::move(*people));
    }

    QString errorString;
    const QString templates = generator.generate(year, week, count, &errorString);
    if (templates.isEmpty()) {
        qCCritical(lcCli).noquote() << errorString;
        return ExitUsageError;
    }

    QTextStream out(stdout);
    out << templates;
    out.flush();
    qCInfo(lcCli) << "Done";
    return ExitSuccess;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("mdlog"));
    QCoreApplication::setApplicationName(QStringLiteral("mdlog"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kMdlogVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Extracts tasks and events from a markdown log and "
                                                    "generates week templates."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("tasks, events or generate"));
    parser.addPositionalArgument(QStringLiteral("arguments"),
                                 QStringLiteral("<log> for tasks/events, <week> [count] for generate"),
                                 QStringLiteral("[arguments...]"));

    const Options options;
    parser.addOptions({options.open, options.from, options.to, options.lineEnding, options.year,
                       options.birthdays, options.calls, options.birthdayFile});
    parser.process(app);

    QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        parser.showHelp(ExitUsageError);
    }
    const QString command = arguments.takeFirst();

    const auto settings = mdlog::core::Settings::load();
    std::optional<mdlog::core::LineEnding> lineEnding = settings.lineEnding;
    if (!readLineEnding(parser, options, lineEnding)) {
        return ExitUsageError;
    }

    if (command == QLatin1String("generate")) {
        return generate(parser, options, arguments, settings, lineEnding);
    }

    if (command != QLatin1String("tasks") && command != QLatin1String("events")) {
        qCCritical(lcCli).noquote() << "Unknown command" << command;
        return ExitUsageError;
    }
    if (arguments.size() != 1) {
        qCCritical(lcCli).noquote() << command << "expects exactly one log file";
        return ExitUsageError;
    }
    if (command == QLatin1String("tasks")) {
        return listTasks(parser, options, arguments.first(), lineEnding);
    }
    return listEvents(parser, options, arguments.first(), lineEnding);
}
