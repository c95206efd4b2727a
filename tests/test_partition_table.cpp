#include "../qfatimage.h"
#include <QBuffer>
#include <QDebug>
#include <QtEndian>
#include <QtTest/QtTest>

class TestPartitionTable : public QObject
{
    Q_OBJECT
private slots:
    void testCrc32();

    // Layout
    void testLayoutNone();
    void testLayoutMbr();
    void testLayoutMbrOverflow();
    void testLayoutGpt();

    // MBR
    void testMbrSector();
    void testMbrBootCode();

    // GPT
    void testGuidByteOrder();
    void testDerivedGuids();
    void testGptBootable();
    void testGptNotBootable();

private:
    QByteArray writeTable(QFATPartitionTable scheme, quint64 partitionSectors, bool bootable, QFATPartitionLayout &layout);
};

QByteArray TestPartitionTable::writeTable(QFATPartitionTable scheme, quint64 partitionSectors, bool bootable,
                                          QFATPartitionLayout &layout)
{
    QFATPartitionTableWriter writer;
    QFATImageError error;
    if (!writer.layout(scheme, partitionSectors, layout, error)) {
        return QByteArray();
    }

    QFATImageSpec spec;
    spec.partitionTable = scheme;
    spec.bootable = bootable;

    QByteArray disk(static_cast<int>(layout.totalBytes()), 0);
    QBuffer buffer(&disk);
    buffer.open(QIODevice::ReadWrite);
    if (!writer.write(&buffer, layout, spec, 0xCAFEF00D, error)) {
        qDebug() << "Write failed:" << writer.errorString();
        return QByteArray();
    }
    return disk;
}

void TestPartitionTable::testCrc32()
{
    QCOMPARE(qfatCrc32(QByteArray("123456789")), quint32(0xCBF43926));
    QCOMPARE(qfatCrc32(QByteArray()), quint32(0));

    // Chained updates equal one pass
    quint32 partial = qfatCrc32("12345", 5);
    QCOMPARE(qfatCrc32("6789", 4, partial), quint32(0xCBF43926));
}

void TestPartitionTable::testLayoutNone()
{
    QFATPartitionTableWriter writer;
    QFATPartitionLayout layout;
    QFATImageError error;

    QVERIFY(writer.layout(QFATPartitionTable::None, 66581, layout, error));
    QCOMPARE(layout.partitionStartLba, quint64(0));
    QCOMPARE(layout.totalSectors, quint64(66581));
    QCOMPARE(layout.totalBytes(), quint64(66581) * 512);

    QVERIFY(!writer.layout(QFATPartitionTable::None, 0, layout, error));
    QCOMPARE(error, QFATImageError::InvalidConfiguration);
}

void TestPartitionTable::testLayoutMbr()
{
    QFATPartitionTableWriter writer;
    QFATPartitionLayout layout;
    QFATImageError error;

    QVERIFY(writer.layout(QFATPartitionTable::MBR, 66581, layout, error));
    QCOMPARE(layout.partitionStartLba, quint64(2048));
    QCOMPARE(layout.partitionOffset(), quint64(2048) * 512);
    QCOMPARE(layout.totalSectors, quint64(2048 + 66581));
}

void TestPartitionTable::testLayoutMbrOverflow()
{
    QFATPartitionTableWriter writer;
    QFATPartitionLayout layout;
    QFATImageError error;

    QVERIFY(!writer.layout(QFATPartitionTable::MBR, Q_UINT64_C(0xFFFFFFFF), layout, error));
    QCOMPARE(error, QFATImageError::PartitionOverflow);
    QCOMPARE(writer.lastError(), QFATImageError::PartitionOverflow);
}

void TestPartitionTable::testLayoutGpt()
{
    QFATPartitionTableWriter writer;
    QFATPartitionLayout layout;
    QFATImageError error;

    QVERIFY(writer.layout(QFATPartitionTable::GPT, 131072, layout, error));
    QCOMPARE(layout.primaryEntriesLba, quint64(2));
    QCOMPARE(layout.firstUsableLba, quint64(34));
    QCOMPARE(layout.partitionStartLba, quint64(2048));
    QCOMPARE(layout.lastUsableLba, quint64(2048 + 131072 - 1));
    QCOMPARE(layout.backupEntriesLba, quint64(2048 + 131072));
    QCOMPARE(layout.backupHeaderLba, quint64(2048 + 131072 + 32));
    QCOMPARE(layout.totalSectors, quint64(2048 + 131072 + 33));
}

void TestPartitionTable::testMbrSector()
{
    QFATPartitionTableWriter writer;
    QFATPartitionLayout layout;
    QFATImageError error;
    QVERIFY(writer.layout(QFATPartitionTable::MBR, 66581, layout, error));

    QByteArray sector = QFATPartitionTableWriter::mbrSector(layout, true, QByteArray(), 0xDEADBEEF);
    QCOMPARE(sector.size(), 512);
    const char *raw = sector.constData();

    QCOMPARE(sector.left(440), QByteArray(440, 0));
    QCOMPARE(qFromLittleEndian<quint32>(raw + 0x1B8), quint32(0xDEADBEEF));

    const char *entry = raw + 0x1BE;
    QCOMPARE(quint8(entry[0]), quint8(0x80));
    QCOMPARE(QByteArray(entry + 1, 3), QByteArray("\xFE\xFF\xFF"));
    QCOMPARE(quint8(entry[4]), quint8(0x0C));
    QCOMPARE(QByteArray(entry + 5, 3), QByteArray("\xFE\xFF\xFF"));
    QCOMPARE(qFromLittleEndian<quint32>(entry + 8), quint32(2048));
    QCOMPARE(qFromLittleEndian<quint32>(entry + 12), quint32(66581));

    // Remaining three entries stay empty
    QCOMPARE(sector.mid(0x1CE, 48), QByteArray(48, 0));
    QCOMPARE(quint8(raw[0x1FE]), quint8(0x55));
    QCOMPARE(quint8(raw[0x1FF]), quint8(0xAA));

    QByteArray inactive = QFATPartitionTableWriter::mbrSector(layout, false, QByteArray(), 0);
    QCOMPARE(quint8(inactive[0x1BE]), quint8(0x00));

    qDebug() << "MBR entry describes the FAT32 partition";
}

void TestPartitionTable::testMbrBootCode()
{
    QFATPartitionLayout layout;
    layout.scheme = QFATPartitionTable::MBR;
    layout.partitionStartLba = 2048;
    layout.partitionSectors = 66581;
    layout.totalSectors = 2048 + 66581;

    QByteArray code("\xFA\x31\xC0\xEB\xFE");
    QByteArray sector = QFATPartitionTableWriter::mbrSector(layout, true, code, 1);
    QCOMPARE(sector.left(code.size()), code);
    QCOMPARE(quint8(sector[code.size()]), quint8(0));
    QCOMPARE(quint8(sector[0x1C2]), quint8(0x0C));

    // Oversized boot code is refused when written
    QFATImageSpec spec;
    spec.partitionTable = QFATPartitionTable::MBR;
    spec.bootCode = QByteArray(441, '\x90');

    QByteArray disk(4096, 0);
    QBuffer buffer(&disk);
    buffer.open(QIODevice::ReadWrite);
    QFATPartitionTableWriter writer;
    QFATImageError error;
    QVERIFY(!writer.write(&buffer, layout, spec, 1, error));
    QCOMPARE(error, QFATImageError::InvalidConfiguration);
}

void TestPartitionTable::testGuidByteOrder()
{
    QUuid efi = QFATPartitionTableWriter::partitionTypeGuid(true);
    QCOMPARE(efi, QUuid("{c12a7328-f81f-11d2-ba4b-00a0c93ec93b}"));

    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::ReadWrite);
    QDataStream stream(&buffer);
    stream.setByteOrder(QDataStream::LittleEndian);
    QFATPartitionTableWriter::writeGuid(stream, efi);

    QCOMPARE(bytes, QByteArray::fromHex("28732ac11ff8d211ba4b00a0c93ec93b"));

    buffer.seek(0);
    QCOMPARE(QFATPartitionTableWriter::readGuid(stream), efi);

    QCOMPARE(QFATPartitionTableWriter::partitionTypeGuid(false), QUuid("{ebd0a0a2-b9e5-4433-87c0-68b6b72699c7}"));
}

void TestPartitionTable::testDerivedGuids()
{
    QUuid disk = QFATPartitionTableWriter::diskGuid(0x1234);
    QUuid partition = QFATPartitionTableWriter::partitionGuid(0x1234);

    QVERIFY(!disk.isNull());
    QCOMPARE(disk.version(), QUuid::Sha1);
    QCOMPARE(disk, QFATPartitionTableWriter::diskGuid(0x1234));
    QVERIFY(disk != partition);
    QVERIFY(disk != QFATPartitionTableWriter::diskGuid(0x1235));
}

void TestPartitionTable::testGptBootable()
{
    QFATPartitionLayout layout;
    QByteArray disk = writeTable(QFATPartitionTable::GPT, 131072, true, layout);
    QCOMPARE(quint64(disk.size()), quint64(2048 + 131072 + 33) * 512);

    // Protective MBR
    const char *mbr = disk.constData();
    QCOMPARE(quint8(mbr[0x1BE + 4]), quint8(0xEE));
    QCOMPARE(qFromLittleEndian<quint32>(mbr + 0x1BE + 8), quint32(1));
    QCOMPARE(qFromLittleEndian<quint32>(mbr + 0x1BE + 12), quint32(2048 + 131072 + 32));
    QCOMPARE(quint8(mbr[0x1CE + 4]), quint8(0));
    QCOMPARE(quint8(mbr[0x1FE]), quint8(0x55));

    // Primary header
    const char *header = disk.constData() + 512;
    QCOMPARE(QByteArray(header, 8), QByteArray("EFI PART"));
    QCOMPARE(qFromLittleEndian<quint32>(header + 0x08), quint32(0x00010000));
    QCOMPARE(qFromLittleEndian<quint32>(header + 0x0C), quint32(92));
    QByteArray zeroed(header, 92);
    qToLittleEndian<quint32>(0, zeroed.data() + 0x10);
    QCOMPARE(qfatCrc32(zeroed), qFromLittleEndian<quint32>(header + 0x10));
    QCOMPARE(qFromLittleEndian<quint64>(header + 0x18), quint64(1));
    QCOMPARE(qFromLittleEndian<quint64>(header + 0x20), layout.backupHeaderLba);
    QCOMPARE(qFromLittleEndian<quint64>(header + 0x28), quint64(34));
    QCOMPARE(qFromLittleEndian<quint64>(header + 0x30), layout.lastUsableLba);
    QCOMPARE(qFromLittleEndian<quint64>(header + 0x48), quint64(2));
    QCOMPARE(qFromLittleEndian<quint32>(header + 0x50), quint32(128));
    QCOMPARE(qFromLittleEndian<quint32>(header + 0x54), quint32(128));

    QByteArray entries = disk.mid(2 * 512, 128 * 128);
    QCOMPARE(qfatCrc32(entries), qFromLittleEndian<quint32>(header + 0x58));

    // The single entry
    QBuffer entryBuffer(&entries);
    entryBuffer.open(QIODevice::ReadOnly);
    QDataStream in(&entryBuffer);
    in.setByteOrder(QDataStream::LittleEndian);
    QCOMPARE(QFATPartitionTableWriter::readGuid(in), QFATPartitionTableWriter::partitionTypeGuid(true));
    QCOMPARE(QFATPartitionTableWriter::readGuid(in), QFATPartitionTableWriter::partitionGuid(0xCAFEF00D));
    quint64 firstLba, lastLba, attributes;
    in >> firstLba >> lastLba >> attributes;
    QCOMPARE(firstLba, quint64(2048));
    QCOMPARE(lastLba, quint64(2048 + 131072 - 1));
    QVERIFY(attributes & (Q_UINT64_C(1) << 2));
    QCOMPARE(entries.mid(128, 128), QByteArray(128, 0));

    // Backup header mirrors the primary with swapped locations
    const char *backup = disk.constData() + layout.backupHeaderLba * 512;
    QCOMPARE(QByteArray(backup, 8), QByteArray("EFI PART"));
    QCOMPARE(qFromLittleEndian<quint64>(backup + 0x18), layout.backupHeaderLba);
    QCOMPARE(qFromLittleEndian<quint64>(backup + 0x20), quint64(1));
    QCOMPARE(qFromLittleEndian<quint64>(backup + 0x48), layout.backupEntriesLba);
    QCOMPARE(qFromLittleEndian<quint32>(backup + 0x58), qFromLittleEndian<quint32>(header + 0x58));
    QCOMPARE(disk.mid(static_cast<int>(layout.backupEntriesLba * 512), 128 * 128), entries);
    QCOMPARE(QByteArray(backup + 0x38, 16), QByteArray(header + 0x38, 16));

    qDebug() << "GPT headers and entry arrays verify";
}

void TestPartitionTable::testGptNotBootable()
{
    QFATPartitionLayout layout;
    QByteArray disk = writeTable(QFATPartitionTable::GPT, 66581, false, layout);
    QVERIFY(!disk.isEmpty());

    QByteArray entries = disk.mid(2 * 512, 128 * 128);
    QBuffer entryBuffer(&entries);
    entryBuffer.open(QIODevice::ReadOnly);
    QDataStream in(&entryBuffer);
    in.setByteOrder(QDataStream::LittleEndian);
    QCOMPARE(QFATPartitionTableWriter::readGuid(in), QFATPartitionTableWriter::partitionTypeGuid(false));
    QFATPartitionTableWriter::readGuid(in);
    quint64 firstLba, lastLba, attributes;
    in >> firstLba >> lastLba >> attributes;
    QCOMPARE(attributes, quint64(0));

    // UTF-16LE partition name
    QCOMPARE(entries.mid(0x38, 10), QByteArray("B\0a\0s\0i\0c\0", 10));
}

QTEST_MAIN(TestPartitionTable)
#include "test_partition_table.moc"
