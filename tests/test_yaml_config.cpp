#include <QtTest>
#include <QFile>
#include <QTemporaryDir>
#include "core/Constants.hpp"
#include "core/YamlConfig.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private:
    static QString writeConfig(const QTemporaryDir& dir, const QByteArray& yaml) {
        const QString path = dir.path() + "/config.yaml";
        QFile file(path);
        if (file.open(QIODevice::WriteOnly))
            file.write(yaml);
        return path;
    }

private slots:
    void testLoadDefaults();
    void testLoadFromFile();
    void testLoadBrokenKeepsDefaults();
    void testPartialFileKeepsDefaults();
    void testNegativeWaitDisablesRetry();
    void testDataDirFallback();
};

void TestYamlConfig::testLoadDefaults()
{
    cctl::YamlConfig config;
    QCOMPARE(config.retryWait(), cctl::DEFAULT_RETRY_WAIT);
    QCOMPARE(config.wait(), cctl::DEFAULT_WAIT);
    QCOMPARE(config.lightIcon(), false);
    QCOMPARE(config.logLevel(), QString("WARN"));
    QCOMPARE(config.durationResolution(), cctl::DEFAULT_DURATION_RESOLUTION);
}

void TestYamlConfig::testLoadFromFile()
{
    cctl::YamlConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/test_config.yaml"));

    QCOMPARE(config.retryWait(), 2.5);
    QCOMPARE(config.wait(), cctl::NO_WAIT);
    QCOMPARE(config.lightIcon(), true);
    QCOMPARE(config.logLevel(), QString("DEBUG"));
    QCOMPARE(config.durationResolution(), 2);
}

void TestYamlConfig::testLoadBrokenKeepsDefaults()
{
    cctl::YamlConfig config;
    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/broken_config.yaml"));
    QCOMPARE(config.retryWait(), cctl::DEFAULT_RETRY_WAIT);

    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/does_not_exist.yaml"));
    QCOMPARE(config.wait(), cctl::DEFAULT_WAIT);
}

void TestYamlConfig::testPartialFileKeepsDefaults()
{
    QTemporaryDir dir;
    const QString path = writeConfig(dir, "discovery:\n  retry_wait: 7\nlogging:\n  level: INFO\n");

    cctl::YamlConfig config;
    QVERIFY(config.load(path));
    QCOMPARE(config.retryWait(), 7.0);
    QCOMPARE(config.logLevel(), QString("INFO"));
    QCOMPARE(config.wait(), cctl::DEFAULT_WAIT);
    QCOMPARE(config.lightIcon(), false);
}

void TestYamlConfig::testNegativeWaitDisablesRetry()
{
    QTemporaryDir dir;
    const QString path = writeConfig(dir, "discovery:\n  wait: -5\n");

    cctl::YamlConfig config;
    QVERIFY(config.load(path));
    QCOMPARE(config.wait(), cctl::NO_WAIT);
}

void TestYamlConfig::testDataDirFallback()
{
    cctl::YamlConfig defaults;
    QVERIFY(!defaults.dataDir().isEmpty());

    QTemporaryDir dir;
    const QString path = writeConfig(dir, "session:\n  data_dir: /var/tmp/cctl\n");
    cctl::YamlConfig config;
    QVERIFY(config.load(path));
    QCOMPARE(config.dataDir(), QString("/var/tmp/cctl"));
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
