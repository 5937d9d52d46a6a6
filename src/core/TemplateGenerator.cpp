#include "mdlog/core/TemplateGenerator.hpp"

#include "mdlog/core/Logging.hpp"
#include "mdlog/core/MarkerSet.hpp"

#include <QLocale>
#include <QtGlobal>
#include <utility>

namespace mdlog {
namespace core {

namespace {
constexpr auto DATE_FORMAT = "dd.MM.yyyy";
constexpr int MAX_WEEK_COUNT = 520;

void setErrorString(QString *errorString, const QString &message)
{
    if (errorString) {
        *errorString = message;
    }
}
} // namespace

TemplateGenerator::TemplateGenerator(LineEnding lineEnding)
    : m_lineEnd(lineEndingString(lineEnding))
    , m_random(QRandomGenerator::securelySeeded())
{
}

void TemplateGenerator::setPeople(std::vector<data::Person> people)
{
    m_people = std::move(people);
}

void TemplateGenerator::setBirthdaysEnabled(bool enabled)
{
    m_birthdays = enabled;
}

void TemplateGenerator::setCallsEnabled(bool enabled)
{
    m_calls = enabled;
}

void TemplateGenerator::setCallProbability(double probability)
{
    m_callProbability = qBound(0.0, probability, 1.0);
}

void TemplateGenerator::setSeed(quint32 seed)
{
    m_random.seed(seed);
}

QDate TemplateGenerator::mondayOfIsoWeek(int year, int week)
{
    if (week < 1 || week > isoWeeksInYear(year)) {
        return {};
    }
    // 4 January always lies in ISO week 1.
    const QDate january4(year, 1, 4);
    const QDate firstMonday = january4.addDays(1 - january4.dayOfWeek());
    return firstMonday.addDays(7 * (week - 1));
}

int TemplateGenerator::isoWeeksInYear(int year)
{
    // 28 December always lies in the last ISO week of its year.
    return QDate(year, 12, 28).weekNumber();
}

QString TemplateGenerator::generate(int year, int firstWeek, int weekCount, QString *errorString)
{
    if (weekCount < 1 || weekCount > MAX_WEEK_COUNT) {
        setErrorString(errorString,
                       QStringLiteral("week count %1 is out of range, expected 1..%2").arg(weekCount).arg(MAX_WEEK_COUNT));
        return {};
    }
    const QDate firstDay = mondayOfIsoWeek(year, firstWeek);
    if (!firstDay.isValid()) {
        setErrorString(errorString, QStringLiteral("week %1 does not exist in %2, expected 1..%3")
                                        .arg(firstWeek)
                                        .arg(year)
                                        .arg(isoWeeksInYear(year)));
        return {};
    }
    const QDate lastDay = firstDay.addDays(7 * weekCount - 1);
    qCInfo(lcGenerator).noquote() << "Generating templates for" << weekCount << "weeks starting with week"
                                  << firstWeek << "of year" << year;

    QString out;
    for (QDate day = firstDay; day <= lastDay; day = day.addDays(1)) {
        if (day.dayOfWeek() == Qt::Monday) {
            const QDate sunday = day.addDays(6);
            out += QStringLiteral("%1%2, %3 - %4")
                       .arg(QLatin1String(tag::WEEK))
                       .arg(day.weekNumber())
                       .arg(day.toString(QLatin1String(DATE_FORMAT)))
                       .arg(sunday.toString(QLatin1String(DATE_FORMAT)));
            out += m_lineEnd + m_lineEnd;
        }
        appendDay(out, day);
    }
    return out;
}

void TemplateGenerator::appendDay(QString &out, const QDate &day)
{
    const QString dayName = QLocale::c().dayName(day.dayOfWeek(), QLocale::ShortFormat);
    out += QLatin1String(tag::DAY) + dayName + QStringLiteral(", ") + day.toString(QLatin1String(DATE_FORMAT))
        + m_lineEnd;

    const QString item = QLatin1String(tag::ITEM) + QLatin1String(tag::TODO) + QLatin1String(tag::MSG_SEPARATOR);

    if (m_birthdays) {
        for (const data::Person &person : m_people) {
            if (!person.birthday.fallsOn(day)) {
                continue;
            }
            const auto age = person.birthday.ageOn(day);
            if (age) {
                out += item + QStringLiteral("Congratulate %1 (Age %2)").arg(person.name).arg(*age) + m_lineEnd;
            } else {
                out += item + QStringLiteral("Congratulate %1").arg(person.name) + m_lineEnd;
            }
        }
    }

    if (m_calls && !m_people.empty() && m_random.generateDouble() < m_callProbability) {
        const auto index = m_random.bounded(static_cast<quint32>(m_people.size()));
        out += item + QStringLiteral("Call %1").arg(m_people[index].name) + m_lineEnd;
    }

    out += m_lineEnd;
}

} // namespace core
} // namespace mdlog
