#include "mdlog/data/RosterParser.hpp"

#include "mdlog/core/Logging.hpp"

#include <QDate>
#include <QFile>
#include <QHash>
#include <QStringList>
#include <QTextStream>

namespace mdlog {
namespace data {

namespace {
constexpr auto PRESENTS_HEADING = "# Presents";
constexpr auto UNKNOWN_YEAR = "?";

void setError(RosterError *error, int line, const QString &message)
{
    if (error) {
        error->line = line;
        error->message = message;
    }
}
} // namespace

QString RosterError::errorString() const
{
    if (line <= 0) {
        return message;
    }
    return QStringLiteral("line %1: %2").arg(line).arg(message);
}

std::optional<std::vector<Person>> RosterParser::loadFile(const QString &filePath, RosterError *error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        setError(error, 0, QStringLiteral("cannot open %1: %2").arg(filePath, file.errorString()));
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    return parse(stream.readAll(), error);
}

std::optional<std::vector<Person>> RosterParser::parse(const QString &text, RosterError *error)
{
    enum class Section {
        Birthdays,
        Presents
    };

    std::vector<Person> people;
    QHash<QString, std::size_t> indexByName;
    Section currentSection = Section::Birthdays;
    std::optional<std::size_t> currentPerson;
    QString unknownPerson;

    const QStringList lines = text.split(QLatin1Char('\n'));
    for (int i = 0; i < lines.size(); ++i) {
        const int lineNumber = i + 1;
        const QString line = lines.at(i).trimmed();
        if (line.isEmpty()) {
            continue;
        }

        if (line.contains(QLatin1String(PRESENTS_HEADING))) {
            currentSection = Section::Presents;
            continue;
        }

        if (currentSection == Section::Birthdays) {
            if (line.startsWith(QLatin1Char('#'))) {
                continue;
            }
            const int colonIndex = line.indexOf(QLatin1Char(':'), quotedPrefixLength(line));
            if (colonIndex <= 0) {
                setError(error, lineNumber, QStringLiteral("expected '<name>: <dd.mm.yyyy>', got '%1'").arg(line));
                return std::nullopt;
            }

            Person person;
            person.name = unquote(line.left(colonIndex));
            const auto birthday = parseBirthday(unquote(line.mid(colonIndex + 1)));
            if (!birthday) {
                setError(error, lineNumber, QStringLiteral("failed to parse the birthday of %1").arg(person.name));
                return std::nullopt;
            }
            if (indexByName.contains(person.name)) {
                setError(error, lineNumber, QStringLiteral("%1 is listed twice").arg(person.name));
                return std::nullopt;
            }
            person.birthday = *birthday;
            indexByName.insert(person.name, people.size());
            people.push_back(std::move(person));
            continue;
        }

        if (line.startsWith(QLatin1Char('-'))) {
            const QString present = unquote(line.mid(1));
            if (currentPerson) {
                people[*currentPerson].presents << present;
            } else if (unknownPerson.isEmpty()) {
                setError(error, lineNumber, QStringLiteral("present '%1' does not belong to anyone").arg(present));
                return std::nullopt;
            }
            continue;
        }

        if (!line.endsWith(QLatin1Char(':'))) {
            setError(error, lineNumber, QStringLiteral("expected '<name>:', got '%1'").arg(line));
            return std::nullopt;
        }
        const QString name = unquote(line.left(line.size() - 1));
        const auto it = indexByName.constFind(name);
        if (it == indexByName.constEnd()) {
            qCWarning(lcRoster).noquote() << "Ignoring presents for" << name << "who has no birthday entry";
            currentPerson.reset();
            unknownPerson = name;
            continue;
        }
        currentPerson = it.value();
        unknownPerson.clear();
    }

    qCDebug(lcRoster) << "Loaded" << people.size() << "people";
    return people;
}

std::optional<Birthday> RosterParser::parseBirthday(const QString &value)
{
    const QStringList parts = value.split(QLatin1Char('.'));
    if (parts.size() != 3) {
        return std::nullopt;
    }

    bool dayOk = false;
    bool monthOk = false;
    Birthday birthday;
    birthday.day = parts.at(0).trimmed().toInt(&dayOk);
    birthday.month = parts.at(1).trimmed().toInt(&monthOk);
    if (!dayOk || !monthOk) {
        return std::nullopt;
    }

    const QString year = parts.at(2).trimmed();
    if (year == QLatin1String(UNKNOWN_YEAR)) {
        // 2000 is a leap year, so 29.02 passes
        if (!QDate(2000, birthday.month, birthday.day).isValid()) {
            return std::nullopt;
        }
        return birthday;
    }

    bool yearOk = false;
    const int knownYear = year.toInt(&yearOk);
    if (!yearOk || !QDate(knownYear, birthday.month, birthday.day).isValid()) {
        return std::nullopt;
    }
    birthday.year = knownYear;
    return birthday;
}

int RosterParser::quotedPrefixLength(const QString &line)
{
    if (line.isEmpty() || (line.front() != QLatin1Char('"') && line.front() != QLatin1Char('\''))) {
        return 0;
    }
    const int closing = line.indexOf(line.front(), 1);
    return closing < 0 ? 0 : closing + 1;
}

QString RosterParser::unquote(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.size() >= 2) {
        const QChar first = trimmed.front();
        if ((first == QLatin1Char('"') || first == QLatin1Char('\'')) && trimmed.back() == first) {
            return trimmed.mid(1, trimmed.size() - 2);
        }
    }
    return trimmed;
}

} // namespace data
} // namespace mdlog
