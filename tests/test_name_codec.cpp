#include "../qfatimage.h"
#include <QDebug>
#include <QtEndian>
#include <QtTest/QtTest>

class TestNameCodec : public QObject
{
    Q_OBJECT
private slots:
    // Short names
    void testFitsShortName();
    void testPackShortName();
    void testGenerateShortName();
    void testGenerateShortNameTails();
    void testGenerateShortNameExhausted();
    void testShortNameToString();
    void testDeletedMarkerEscaped();

    // Long names
    void testValidLongNames();
    void testChecksum();
    void testLongNameEntries();

    // Timestamps
    void testEncodeDateTime();
    void testEncodeDateTimeClamped();

private:
    QSet<QByteArray> usedTails(const QByteArray &base, const QByteArray &ext, int count);
};

QSet<QByteArray> TestNameCodec::usedTails(const QByteArray &base, const QByteArray &ext, int count)
{
    QSet<QByteArray> used;
    for (int i = 1; i <= count; i++) {
        QByteArray tail = "~" + QByteArray::number(i);
        used.insert((base.left(8 - tail.size()) + tail).leftJustified(8, ' ') + ext.leftJustified(3, ' '));
    }
    return used;
}

void TestNameCodec::testFitsShortName()
{
    quint8 caseFlags = 0xFF;

    QVERIFY(QFATNameCodec::fitsShortName("README", caseFlags));
    QCOMPARE(caseFlags, quint8(0x00));

    QVERIFY(QFATNameCodec::fitsShortName("hello.txt", caseFlags));
    QCOMPARE(caseFlags, quint8(0x18));

    QVERIFY(QFATNameCodec::fitsShortName("BOOT.cfg", caseFlags));
    QCOMPARE(caseFlags, quint8(0x10));

    QVERIFY(!QFATNameCodec::fitsShortName("Hello.txt", caseFlags));
    QVERIFY(!QFATNameCodec::fitsShortName("toolongname.txt", caseFlags));
    QVERIFY(!QFATNameCodec::fitsShortName("file.text", caseFlags));
    QVERIFY(!QFATNameCodec::fitsShortName("a.b.c", caseFlags));
    QVERIFY(!QFATNameCodec::fitsShortName("my file.txt", caseFlags));
    QVERIFY(!QFATNameCodec::fitsShortName(".hidden", caseFlags));
    QVERIFY(!QFATNameCodec::fitsShortName("trailing.", caseFlags));

    QVERIFY(QFATNameCodec::isPlainShortName("KERNEL.BIN"));
    QVERIFY(!QFATNameCodec::isPlainShortName("kernel.bin"));

    qDebug() << "8.3 detection and case flags are correct";
}

void TestNameCodec::testPackShortName()
{
    QCOMPARE(QFATNameCodec::packShortName("hello.txt"), QByteArray("HELLO   TXT"));
    QCOMPARE(QFATNameCodec::packShortName("README"), QByteArray("README     "));
    QCOMPARE(QFATNameCodec::packShortName("A.B"), QByteArray("A       B  "));
}

void TestNameCodec::testGenerateShortName()
{
    QFATImageError error;
    QByteArray alias;

    QVERIFY(QFATNameCodec::generateShortName("this is a long name.txt", QSet<QByteArray>(), alias, error));
    QCOMPARE(error, QFATImageError::None);
    QCOMPARE(alias, QByteArray("THISIS~1TXT"));

    QVERIFY(QFATNameCodec::generateShortName(".hidden", QSet<QByteArray>(), alias, error));
    QCOMPARE(alias, QByteArray("HIDDEN~1   "));

    QVERIFY(QFATNameCodec::generateShortName("archive.tar.gz", QSet<QByteArray>(), alias, error));
    QCOMPARE(alias, QByteArray("ARCHIV~1GZ "));

    // Characters outside the short-name set turn into underscores
    QVERIFY(QFATNameCodec::generateShortName(QString::fromUtf8("caf\xC3\xA9.txt"), QSet<QByteArray>(), alias, error));
    QCOMPARE(alias, QByteArray("CAF_~1  TXT"));

    QVERIFY(QFATNameCodec::generateShortName("a+b.txt", QSet<QByteArray>(), alias, error));
    QCOMPARE(alias, QByteArray("A_B~1   TXT"));

    qDebug() << "Generated aliases follow the basis-name rules";
}

void TestNameCodec::testGenerateShortNameTails()
{
    QFATImageError error;
    QByteArray alias;

    QSet<QByteArray> used = usedTails("THISISAL", "TXT", 1);
    QVERIFY(QFATNameCodec::generateShortName("this is a long name.txt", used, alias, error));
    QCOMPARE(alias, QByteArray("THISIS~2TXT"));

    // Two-digit tails take one more character from the basis
    used = usedTails("THISISAL", "TXT", 9);
    QVERIFY(QFATNameCodec::generateShortName("this is a long name.txt", used, alias, error));
    QCOMPARE(alias, QByteArray("THISI~10TXT"));
}

void TestNameCodec::testGenerateShortNameExhausted()
{
    QFATImageError error;
    QByteArray alias;

    QSet<QByteArray> used = usedTails("THISISAL", "TXT", 99);
    QVERIFY(!QFATNameCodec::generateShortName("this is a long name.txt", used, alias, error));
    QCOMPARE(error, QFATImageError::NameSpaceExhausted);

    qDebug() << "Alias generation stops after ~99";
}

void TestNameCodec::testShortNameToString()
{
    QByteArray entry(32, 0);
    quint8 *raw = reinterpret_cast<quint8 *>(entry.data());

    QFATNameCodec::writeShortEntry(raw, "HELLO   TXT", 0x20, 0x18, 3, 10, QDateTime());
    QCOMPARE(QFATNameCodec::shortNameToString(raw), QString("hello.txt"));

    QFATNameCodec::writeShortEntry(raw, "HELLO   TXT", 0x20, 0x10, 3, 10, QDateTime());
    QCOMPARE(QFATNameCodec::shortNameToString(raw), QString("HELLO.txt"));

    QFATNameCodec::writeShortEntry(raw, "README     ", 0x20, 0x00, 3, 10, QDateTime());
    QCOMPARE(QFATNameCodec::shortNameToString(raw), QString("README"));
}

void TestNameCodec::testDeletedMarkerEscaped()
{
    QByteArray entry(32, 0);
    quint8 *raw = reinterpret_cast<quint8 *>(entry.data());

    QByteArray name("\xE5" "BC     TXT", 11);
    QFATNameCodec::writeShortEntry(raw, name, 0x20, 0, 5, 1, QDateTime());

    QCOMPARE(raw[0], quint8(0x05));
    QCOMPARE(QFATNameCodec::shortNameToString(raw), QString(QChar(0xE5)) + "BC.TXT");
}

void TestNameCodec::testValidLongNames()
{
    QVERIFY(QFATNameCodec::isValidLongName("this is a long name.txt"));
    QVERIFY(QFATNameCodec::isValidLongName(QString::fromUtf8("\xE6\x97\xA5\xE6\x9C\xAC.txt")));
    QVERIFY(QFATNameCodec::isValidLongName(QString(255, 'a')));

    QVERIFY(!QFATNameCodec::isValidLongName(QString()));
    QVERIFY(!QFATNameCodec::isValidLongName("."));
    QVERIFY(!QFATNameCodec::isValidLongName(".."));
    QVERIFY(!QFATNameCodec::isValidLongName("a:b"));
    QVERIFY(!QFATNameCodec::isValidLongName("what?"));
    QVERIFY(!QFATNameCodec::isValidLongName("tab\tname"));
    QVERIFY(!QFATNameCodec::isValidLongName(QString(256, 'a')));
    QVERIFY(!QFATNameCodec::isValidLongName("foo."));
    QVERIFY(!QFATNameCodec::isValidLongName("bar "));
    QVERIFY(QFATNameCodec::isValidLongName(" leading space.txt"));
    QVERIFY(QFATNameCodec::isValidLongName(".hidden"));
}

void TestNameCodec::testChecksum()
{
    QCOMPARE(QFATNameCodec::calculateLFNChecksum("THISIS~1TXT"), quint8(0x43));
    QCOMPARE(QFATNameCodec::calculateLFNChecksum("HELLO   TXT"), quint8(0xF1));
    QCOMPARE(QFATNameCodec::calculateLFNChecksum("README     "), quint8(0x96));
}

void TestNameCodec::testLongNameEntries()
{
    const QString name = "this is a long name.txt";
    QCOMPARE(QFATNameCodec::calculateLFNEntriesNeeded(name), 2);
    QCOMPARE(QFATNameCodec::calculateLFNEntriesNeeded(QString(13, 'x')), 1);
    QCOMPARE(QFATNameCodec::calculateLFNEntriesNeeded(QString(14, 'x')), 2);

    QByteArray first(32, 0);
    QByteArray last(32, 0);
    quint8 *firstRaw = reinterpret_cast<quint8 *>(first.data());
    quint8 *lastRaw = reinterpret_cast<quint8 *>(last.data());

    QFATNameCodec::writeLFNEntry(firstRaw, name, 1, 0x43, false);
    QFATNameCodec::writeLFNEntry(lastRaw, name, 2, 0x43, true);

    QCOMPARE(firstRaw[0], quint8(0x01));
    QCOMPARE(lastRaw[0], quint8(0x42));
    QCOMPARE(firstRaw[0x0B], quint8(0x0F));
    QCOMPARE(firstRaw[0x0D], quint8(0x43));
    QCOMPARE(qFromLittleEndian<quint16>(firstRaw + 0x1A), quint16(0));

    QCOMPARE(QFATNameCodec::readLongFileName(firstRaw), QString("this is a lon"));
    QCOMPARE(QFATNameCodec::readLongFileName(lastRaw), QString("g name.txt"));

    // Ten characters, then the terminator, then padding
    QCOMPARE(qFromLittleEndian<quint16>(lastRaw + 0x0E + 4 * 2), quint16('t'));
    QCOMPARE(qFromLittleEndian<quint16>(lastRaw + 0x0E + 5 * 2), quint16(0x0000));
    QCOMPARE(qFromLittleEndian<quint16>(lastRaw + 0x1C), quint16(0xFFFF));
    QCOMPARE(qFromLittleEndian<quint16>(lastRaw + 0x1E), quint16(0xFFFF));

    qDebug() << "LFN entries carry terminator and padding";
}

void TestNameCodec::testEncodeDateTime()
{
    quint16 date, time;
    quint8 tenths;

    QDateTime stamp(QDate(2024, 3, 15), QTime(13, 45, 31, 250));
    QFATNameCodec::encodeFATDateTime(stamp, date, time, tenths);

    QCOMPARE(date, quint16(15 | (3 << 5) | (44 << 9)));
    QCOMPARE(time, quint16(15 | (45 << 5) | (13 << 11)));
    QCOMPARE(tenths, quint8(125));

    QCOMPARE(QFATNameCodec::parseDateTime(date, time), QDateTime(QDate(2024, 3, 15), QTime(13, 45, 30)));

    QFATNameCodec::encodeFATDateTime(QDateTime(), date, time, tenths);
    QCOMPARE(date, quint16(0));
    QCOMPARE(time, quint16(0));
    QVERIFY(!QFATNameCodec::parseDateTime(0, 0).isValid());
}

void TestNameCodec::testEncodeDateTimeClamped()
{
    quint16 date, time;
    quint8 tenths;

    QFATNameCodec::encodeFATDateTime(QDateTime(QDate(1975, 6, 1), QTime(12, 0)), date, time, tenths);
    QCOMPARE(date, quint16(1 | (1 << 5)));
    QCOMPARE(time, quint16(0));

    QFATNameCodec::encodeFATDateTime(QDateTime(QDate(2150, 6, 1), QTime(12, 0)), date, time, tenths);
    QCOMPARE(date, quint16(31 | (12 << 5) | (127 << 9)));
    QCOMPARE(time, quint16(29 | (59 << 5) | (23 << 11)));
}

QTEST_MAIN(TestNameCodec)
#include "test_name_codec.moc"
