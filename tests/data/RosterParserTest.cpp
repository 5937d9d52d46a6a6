#include <QFile>
#include <QTemporaryDir>
#include <QtTest/QtTest>

#include "mdlog/data/RosterParser.hpp"

using namespace mdlog::data;

class RosterParserTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesBirthdaysAndPresents();
    void acceptsQuotedNames();
    void ignoresPresentsOfUnknownPeople();
    void rejectsMalformedRoster_data();
    void rejectsMalformedRoster();
    void loadsFile();
    void reportsMissingFile();
};

void RosterParserTest::parsesBirthdaysAndPresents()
{
    const QString roster = QStringLiteral("\n"
                                          "Alex: 19.01.2001\n"
                                          "Bob Smith: 20.12.?\n"
                                          "John Johnson: 21.12.1947\n"
                                          "\n"
                                          "### Presents\n"
                                          "Alex:\n"
                                          "- Salad\n"
                                          "- Moar Salad\n"
                                          "\n"
                                          "Bob Smith:\n"
                                          "- Bazooka\n");

    RosterError error;
    const auto people = RosterParser::parse(roster, &error);
    QVERIFY2(people.has_value(), qPrintable(error.errorString()));
    QCOMPARE(people->size(), static_cast<size_t>(3));

    const Person &alex = people->at(0);
    QCOMPARE(alex.name, QStringLiteral("Alex"));
    QCOMPARE(alex.birthday.day, 19);
    QCOMPARE(alex.birthday.month, 1);
    QVERIFY(alex.birthday.year.has_value());
    QCOMPARE(*alex.birthday.year, 2001);
    QCOMPARE(alex.presents, QStringList({QStringLiteral("Salad"), QStringLiteral("Moar Salad")}));

    const Person &bob = people->at(1);
    QCOMPARE(bob.name, QStringLiteral("Bob Smith"));
    QCOMPARE(bob.birthday.day, 20);
    QCOMPARE(bob.birthday.month, 12);
    QVERIFY(!bob.birthday.year.has_value());
    QCOMPARE(bob.presents, QStringList{QStringLiteral("Bazooka")});

    const Person &john = people->at(2);
    QCOMPARE(john.name, QStringLiteral("John Johnson"));
    QVERIFY(john.presents.isEmpty());
    QCOMPARE(john.birthday.ageOn(QDate(2019, 12, 20)).value_or(-1), 71);
    QCOMPARE(john.birthday.ageOn(QDate(2019, 12, 21)).value_or(-1), 72);
}

void RosterParserTest::acceptsQuotedNames()
{
    const auto people = RosterParser::parse(QStringLiteral("\"Dr. No\": '01.02.1962'\r\n"));
    QVERIFY(people.has_value());
    QCOMPARE(people->size(), static_cast<size_t>(1));
    QCOMPARE(people->front().name, QStringLiteral("Dr. No"));
    QCOMPARE(people->front().birthday.month, 2);

    const auto colonInName = RosterParser::parse(QStringLiteral("\"Dr: No\": 01.02.1962\n"
                                                                "'Mrs: X': 03.04.?\n"
                                                                "\n"
                                                                "# Presents\n"
                                                                "\"Dr: No\":\n"
                                                                "- Cat\n"));
    QVERIFY(colonInName.has_value());
    QCOMPARE(colonInName->size(), static_cast<size_t>(2));
    QCOMPARE(colonInName->at(0).name, QStringLiteral("Dr: No"));
    QCOMPARE(colonInName->at(0).birthday.year.value_or(-1), 1962);
    QCOMPARE(colonInName->at(0).presents, QStringList{QStringLiteral("Cat")});
    QCOMPARE(colonInName->at(1).name, QStringLiteral("Mrs: X"));
    QVERIFY(!colonInName->at(1).birthday.year.has_value());
}

void RosterParserTest::ignoresPresentsOfUnknownPeople()
{
    const QString roster = QStringLiteral("Alex: 19.01.2001\n"
                                          "# Presents\n"
                                          "Zoe:\n"
                                          "- Kite\n"
                                          "Alex:\n"
                                          "- Book\n");

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Zoe")));
    const auto people = RosterParser::parse(roster);
    QVERIFY(people.has_value());
    QCOMPARE(people->size(), static_cast<size_t>(1));
    QCOMPARE(people->front().presents, QStringList{QStringLiteral("Book")});
}

void RosterParserTest::rejectsMalformedRoster_data()
{
    QTest::addColumn<QString>("roster");
    QTest::addColumn<int>("line");

    QTest::newRow("missing colon") << QStringLiteral("Alex 19.01.2001\n") << 1;
    QTest::newRow("invalid date") << QStringLiteral("Alex: 19.01.2001\nBob: 31.02.1990\n") << 2;
    QTest::newRow("not a date") << QStringLiteral("Alex: soon\n") << 1;
    QTest::newRow("invalid day without year") << QStringLiteral("Alex: 32.01.?\n") << 1;
    QTest::newRow("duplicate") << QStringLiteral("Alex: 19.01.2001\n\nAlex: 20.01.2001\n") << 3;
    QTest::newRow("orphan present") << QStringLiteral("Alex: 19.01.2001\n# Presents\n- Kite\n") << 3;
    QTest::newRow("bad presents owner") << QStringLiteral("Alex: 19.01.2001\n# Presents\nAlex likes\n") << 3;
}

void RosterParserTest::rejectsMalformedRoster()
{
    QFETCH(QString, roster);
    QFETCH(int, line);

    RosterError error;
    QVERIFY(!RosterParser::parse(roster, &error).has_value());
    QCOMPARE(error.line, line);
    QVERIFY(!error.message.isEmpty());
}

void RosterParserTest::loadsFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("birthdays.yml"));

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(QStringLiteral("Jürgen: 05.06.1970\n").toUtf8());
    file.close();

    RosterError error;
    const auto people = RosterParser::loadFile(path, &error);
    QVERIFY2(people.has_value(), qPrintable(error.errorString()));
    QCOMPARE(people->front().name, QStringLiteral("Jürgen"));
}

void RosterParserTest::reportsMissingFile()
{
    RosterError error;
    QVERIFY(!RosterParser::loadFile(QStringLiteral("/nonexistent/birthdays.yml"), &error).has_value());
    QCOMPARE(error.line, 0);
    QVERIFY(!error.errorString().isEmpty());
}

QTEST_GUILESS_MAIN(RosterParserTest)
#include "RosterParserTest.moc"
