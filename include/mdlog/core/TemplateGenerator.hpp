#pragma once

#include <QDate>
#include <QRandomGenerator>
#include <QString>
#include <vector>

#include "mdlog/core/LineEnding.hpp"
#include "mdlog/data/Person.hpp"

namespace mdlog {
namespace core {

class TemplateGenerator
{
public:
    explicit TemplateGenerator(LineEnding lineEnding = LineEnding::Unix);

    void setPeople(std::vector<data::Person> people);
    void setBirthdaysEnabled(bool enabled);
    void setCallsEnabled(bool enabled);
    void setCallProbability(double probability);
    void setSeed(quint32 seed);

    // Empty string and errorString set if the week range is invalid.
    QString generate(int year, int firstWeek, int weekCount, QString *errorString = nullptr);

    static QDate mondayOfIsoWeek(int year, int week);
    static int isoWeeksInYear(int year);

private:
    void appendDay(QString &out, const QDate &day);

    QString m_lineEnd;
    std::vector<data::Person> m_people;
    bool m_birthdays = false;
    bool m_calls = false;
    double m_callProbability = 0.1;
    QRandomGenerator m_random;
};

} // namespace core
} // namespace mdlog
