#include <QtTest>
#include "core/Logging.hpp"

using boost::log::trivial::severity_level;

class TestLogging : public QObject {
    Q_OBJECT
private slots:
    void testParseLevels_data();
    void testParseLevels();
    void testInitDoesNotThrow();
};

void TestLogging::testParseLevels_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<int>("expected");

    QTest::newRow("debug") << "DEBUG" << int(severity_level::debug);
    QTest::newRow("info lower") << "info" << int(severity_level::info);
    QTest::newRow("warn") << "WARN" << int(severity_level::warning);
    QTest::newRow("warning") << "WARNING" << int(severity_level::warning);
    QTest::newRow("error") << "ERROR" << int(severity_level::error);
    QTest::newRow("critical") << "CRITICAL" << int(severity_level::fatal);
    QTest::newRow("fatal") << " fatal " << int(severity_level::fatal);
    QTest::newRow("unknown") << "LOUD" << int(severity_level::warning);
    QTest::newRow("empty") << "" << int(severity_level::warning);
}

void TestLogging::testParseLevels()
{
    QFETCH(QString, name);
    QFETCH(int, expected);
    QCOMPARE(int(cctl::parseLogLevel(name)), expected);
}

void TestLogging::testInitDoesNotThrow()
{
    cctl::initLogging("DEBUG");
    BOOST_LOG_TRIVIAL(debug) << "[TestLogging] debug visible";
    cctl::initLogging("bogus");
    BOOST_LOG_TRIVIAL(info) << "[TestLogging] info filtered";
}

QTEST_MAIN(TestLogging)
#include "test_logging.moc"
