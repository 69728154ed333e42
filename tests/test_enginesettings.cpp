#include <QtTest>
#include <QFile>
#include <QSettings>
#include <QTemporaryDir>

#include "utils/enginesettings.h"

class TestEngineSettings : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir tempDir_;

    QString writeIni(const QByteArray &content)
    {
        const QString path = tempDir_.filePath(QString("settings_%1.ini").arg(++counter_));
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write(content);
        }
        return path;
    }

    int counter_ = 0;

private slots:
    // ========== defaults ==========

    void testMissingFileGivesDefaults()
    {
        QSettings ini(tempDir_.filePath("missing.ini"), QSettings::IniFormat);
        EngineSettings settings = EngineSettings::load(ini);

        QCOMPARE(settings.connectTimeoutMs, EngineSettings::DefaultConnectTimeoutMs);
        QCOMPARE(settings.idleTimeoutMs, EngineSettings::DefaultIdleTimeoutMs);
        QCOMPARE(settings.bufferSize, EngineSettings::DefaultBufferSize);
        QVERIFY(settings.passiveAddress.isNull());
        QCOMPARE(settings.passivePortMin, quint16(0));
        QCOMPARE(settings.passivePortMax, quint16(0));
        QCOMPARE(settings.uniqueDefaultFileName, QString("ftp.dat"));
        QCOMPARE(settings.uniqueMaxAttempts, EngineSettings::DefaultUniqueMaxAttempts);
        QVERIFY(settings.messages.isEmpty());
    }

    // ========== parsing ==========

    void testValuesAreRead()
    {
        QSettings ini(writeIni("[transfer]\n"
                               "connectTimeoutMs=1500\n"
                               "idleTimeoutMs=60000\n"
                               "bufferSize=65536\n"
                               "[passive]\n"
                               "address=127.0.0.1\n"
                               "portMin=50000\n"
                               "portMax=50100\n"
                               "[stou]\n"
                               "defaultFileName=upload.bin\n"
                               "maxAttempts=5\n"),
                      QSettings::IniFormat);
        EngineSettings settings = EngineSettings::load(ini);

        QCOMPARE(settings.connectTimeoutMs, 1500);
        QCOMPARE(settings.idleTimeoutMs, 60000);
        QCOMPARE(settings.bufferSize, 65536);
        QCOMPARE(settings.passiveAddress, QHostAddress(QHostAddress::LocalHost));
        QCOMPARE(settings.passivePortMin, quint16(50000));
        QCOMPARE(settings.passivePortMax, quint16(50100));
        QCOMPARE(settings.uniqueDefaultFileName, QString("upload.bin"));
        QCOMPARE(settings.uniqueMaxAttempts, 5);
    }

    void testMessagesGroup()
    {
        QSettings ini(writeIni("[messages]\n"
                               "226=All done.\n"
                               "550.STOU.permission=\"Nope, {file} is read-only.\"\n"
                               "425=Sorry, no data connection\n"),
                      QSettings::IniFormat);
        EngineSettings settings = EngineSettings::load(ini);

        QCOMPARE(settings.messages.value("226"), QString("All done."));
        QCOMPARE(settings.messages.value("550.STOU.permission"), QString("Nope, {file} is read-only."));
        QCOMPARE(settings.messages.value("425"), QString("Sorry, no data connection"));
    }

    // ========== fallbacks ==========

    void testInvalidNumbersFallBack()
    {
        QSettings ini(writeIni("[transfer]\n"
                               "connectTimeoutMs=-5\n"
                               "idleTimeoutMs=soon\n"
                               "bufferSize=0\n"
                               "[stou]\n"
                               "maxAttempts=-1\n"),
                      QSettings::IniFormat);
        EngineSettings settings = EngineSettings::load(ini);

        QCOMPARE(settings.connectTimeoutMs, EngineSettings::DefaultConnectTimeoutMs);
        QCOMPARE(settings.idleTimeoutMs, EngineSettings::DefaultIdleTimeoutMs);
        QCOMPARE(settings.bufferSize, EngineSettings::DefaultBufferSize);
        QCOMPARE(settings.uniqueMaxAttempts, EngineSettings::DefaultUniqueMaxAttempts);
    }

    void testInvalidPassiveSettingsFallBack()
    {
        QSettings ini(writeIni("[passive]\n"
                               "address=not-an-address\n"
                               "portMin=70000\n"
                               "portMax=10\n"),
                      QSettings::IniFormat);
        EngineSettings settings = EngineSettings::load(ini);

        QVERIFY(settings.passiveAddress.isNull());
        QCOMPARE(settings.passivePortMin, quint16(0));
        QCOMPARE(settings.passivePortMax, quint16(10));
    }

    void testPortMaxBelowMinIsRaised()
    {
        QSettings ini(writeIni("[passive]\nportMin=6000\nportMax=5000\n"), QSettings::IniFormat);
        EngineSettings settings = EngineSettings::load(ini);

        QCOMPARE(settings.passivePortMin, quint16(6000));
        QCOMPARE(settings.passivePortMax, quint16(6000));
    }

    void testDefaultFileNameWithSlashIsRejected()
    {
        QSettings ini(writeIni("[stou]\ndefaultFileName=sub/ftp.dat\n"), QSettings::IniFormat);
        EngineSettings settings = EngineSettings::load(ini);

        QCOMPARE(settings.uniqueDefaultFileName, QString("ftp.dat"));
    }

    // ========== round trip ==========

    void testSaveThenLoad()
    {
        EngineSettings original;
        original.connectTimeoutMs = 2500;
        original.idleTimeoutMs = 9000;
        original.bufferSize = 1024;
        original.passiveAddress = QHostAddress("10.1.2.3");
        original.passivePortMin = 40000;
        original.passivePortMax = 40010;
        original.uniqueDefaultFileName = "incoming.dat";
        original.uniqueMaxAttempts = 7;
        original.messages.insert("226.LIST", "Listing sent, {bytes} bytes.");

        const QString path = tempDir_.filePath("roundtrip.ini");
        {
            QSettings ini(path, QSettings::IniFormat);
            original.save(ini);
            ini.sync();
            QCOMPARE(ini.status(), QSettings::NoError);
        }

        QSettings ini(path, QSettings::IniFormat);
        EngineSettings loaded = EngineSettings::load(ini);

        QCOMPARE(loaded.connectTimeoutMs, 2500);
        QCOMPARE(loaded.idleTimeoutMs, 9000);
        QCOMPARE(loaded.bufferSize, 1024);
        QCOMPARE(loaded.passiveAddress, QHostAddress("10.1.2.3"));
        QCOMPARE(loaded.passivePortMin, quint16(40000));
        QCOMPARE(loaded.passivePortMax, quint16(40010));
        QCOMPARE(loaded.uniqueDefaultFileName, QString("incoming.dat"));
        QCOMPARE(loaded.uniqueMaxAttempts, 7);
        QCOMPARE(loaded.messages.value("226.LIST"), QString("Listing sent, {bytes} bytes."));
    }
};

QTEST_MAIN(TestEngineSettings)
#include "test_enginesettings.moc"
