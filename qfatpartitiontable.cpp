#include <limits>

#include <QBuffer>
#include <QDebug>

#include "internal_constants.h"
#include "qfatimage.h"

// ============================================================================
// QFATPartitionTableWriter
// ============================================================================

QFATPartitionTableWriter::QFATPartitionTableWriter()
{
}

static quint64 alignUp(quint64 lba, quint64 alignment)
{
    return (lba + alignment - 1) / alignment * alignment;
}

bool QFATPartitionTableWriter::layout(QFATPartitionTable scheme, quint64 partitionSectors, QFATPartitionLayout &layout,
                                      QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();

    layout = QFATPartitionLayout();
    layout.scheme = scheme;
    layout.partitionSectors = partitionSectors;

    if (partitionSectors == 0) {
        return fail(QFATImageError::InvalidConfiguration, "partition has no sectors", error);
    }

    switch (scheme) {
    case QFATPartitionTable::None:
        layout.partitionStartLba = 0;
        layout.totalSectors = partitionSectors;
        break;

    case QFATPartitionTable::MBR:
        layout.partitionStartLba = PARTITION_ALIGNMENT_SECTORS;
        layout.totalSectors = layout.partitionStartLba + partitionSectors;
        if (layout.totalSectors > MBR_MAX_LBA) {
            return fail(QFATImageError::PartitionOverflow,
                        QString("partition ends at LBA %1, MBR addresses at most %2").arg(layout.totalSectors).arg(MBR_MAX_LBA), error);
        }
        break;

    case QFATPartitionTable::GPT: {
        layout.primaryEntriesLba = GPT_ENTRIES_LBA;
        layout.firstUsableLba = GPT_ENTRIES_LBA + GPT_ENTRY_ARRAY_SECTORS;
        layout.partitionStartLba = alignUp(layout.firstUsableLba, PARTITION_ALIGNMENT_SECTORS);
        layout.lastUsableLba = layout.partitionStartLba + partitionSectors - 1;
        layout.backupEntriesLba = layout.lastUsableLba + 1;
        layout.backupHeaderLba = layout.backupEntriesLba + GPT_ENTRY_ARRAY_SECTORS;
        layout.totalSectors = layout.backupHeaderLba + 1;

        const quint64 maxSectors = static_cast<quint64>(std::numeric_limits<qint64>::max()) / SECTOR_SIZE;
        if (layout.totalSectors > maxSectors) {
            return fail(QFATImageError::PartitionOverflow, QString("disk of %1 sectors is not addressable").arg(layout.totalSectors),
                        error);
        }
        break;
    }
    }

    qDebug() << "[QFATPartitionTableWriter] Start LBA:" << layout.partitionStartLba << "Sectors:" << partitionSectors
             << "Disk sectors:" << layout.totalSectors;
    return true;
}

QByteArray QFATPartitionTableWriter::mbrSector(const QFATPartitionLayout &layout, bool bootable, const QByteArray &bootCode,
                                               quint32 diskSignature)
{
    QByteArray sector(SECTOR_SIZE, 0);
    QByteArray code = bootCode.left(MBR_BOOT_CODE_LENGTH);
    sector.replace(0, code.size(), code);

    QBuffer buffer(&sector);
    buffer.open(QIODevice::WriteOnly);
    QDataStream out(&buffer);
    out.setByteOrder(QDataStream::LittleEndian);

    out.device()->seek(MBR_DISK_SIGNATURE_OFFSET);
    out << diskSignature;
    out << quint16(0);

    // Single partition entry; CHS fields carry the LBA-only sentinel
    out.device()->seek(MBR_PARTITION_TABLE_OFFSET);
    out << quint8(bootable ? MBR_STATUS_ACTIVE : MBR_STATUS_INACTIVE);
    out << quint8(0xFE) << quint8(0xFF) << quint8(0xFF);
    out << quint8(MBR_TYPE_FAT32_LBA);
    out << quint8(0xFE) << quint8(0xFF) << quint8(0xFF);
    out << static_cast<quint32>(layout.partitionStartLba);
    out << static_cast<quint32>(layout.partitionSectors);

    out.device()->seek(BOOT_SIGNATURE_OFFSET);
    out << quint8(BOOT_SIGNATURE_BYTE_1) << quint8(BOOT_SIGNATURE_BYTE_2);

    return sector;
}

QByteArray QFATPartitionTableWriter::protectiveMbrSector(const QFATPartitionLayout &layout)
{
    QByteArray sector(SECTOR_SIZE, 0);
    QBuffer buffer(&sector);
    buffer.open(QIODevice::WriteOnly);
    QDataStream out(&buffer);
    out.setByteOrder(QDataStream::LittleEndian);

    // One 0xEE entry covering the whole disk after LBA 0
    out.device()->seek(MBR_PARTITION_TABLE_OFFSET);
    out << quint8(MBR_STATUS_INACTIVE);
    out << quint8(0x00) << quint8(0x02) << quint8(0x00);
    out << quint8(MBR_TYPE_GPT_PROTECTIVE);
    out << quint8(0xFE) << quint8(0xFF) << quint8(0xFF);
    out << quint32(GPT_HEADER_LBA);
    out << static_cast<quint32>(qMin<quint64>(layout.totalSectors - 1, MBR_MAX_LBA));

    out.device()->seek(BOOT_SIGNATURE_OFFSET);
    out << quint8(BOOT_SIGNATURE_BYTE_1) << quint8(BOOT_SIGNATURE_BYTE_2);

    return sector;
}

QByteArray QFATPartitionTableWriter::gptEntryArray(const QFATPartitionLayout &layout, bool bootable, const QUuid &uniqueGuid)
{
    QByteArray entries(GPT_ENTRY_COUNT * GPT_ENTRY_SIZE, 0);
    QBuffer buffer(&entries);
    buffer.open(QIODevice::WriteOnly);
    QDataStream out(&buffer);
    out.setByteOrder(QDataStream::LittleEndian);

    writeGuid(out, partitionTypeGuid(bootable));
    writeGuid(out, uniqueGuid);
    out << quint64(layout.partitionStartLba);
    out << quint64(layout.partitionStartLba + layout.partitionSectors - 1);
    out << quint64(bootable ? GPT_ATTRIBUTE_LEGACY_BIOS_BOOTABLE : 0);

    // UTF-16LE name, zero padded
    QString name = bootable ? QStringLiteral("EFI System Partition") : QStringLiteral("Basic Data Partition");
    out.device()->seek(GPT_ENTRY_NAME_OFFSET);
    for (int i = 0; i < name.length() && i < GPT_ENTRY_NAME_LENGTH; i++) {
        out << quint16(name[i].unicode());
    }

    return entries;
}

QByteArray QFATPartitionTableWriter::gptHeader(const QFATPartitionLayout &layout, const QUuid &diskGuid, quint32 entryArrayCrc,
                                               bool backup)
{
    QByteArray sector(SECTOR_SIZE, 0);
    QBuffer buffer(&sector);
    buffer.open(QIODevice::WriteOnly);
    QDataStream out(&buffer);
    out.setByteOrder(QDataStream::LittleEndian);

    out.writeRawData(GPT_SIGNATURE, 8);
    out << quint32(GPT_REVISION);
    out << quint32(GPT_HEADER_SIZE);
    out << quint32(0); // header CRC, filled in below
    out << quint32(0);
    out << quint64(backup ? layout.backupHeaderLba : GPT_HEADER_LBA);
    out << quint64(backup ? GPT_HEADER_LBA : layout.backupHeaderLba);
    out << quint64(layout.firstUsableLba);
    out << quint64(layout.lastUsableLba);
    writeGuid(out, diskGuid);
    out << quint64(backup ? layout.backupEntriesLba : layout.primaryEntriesLba);
    out << quint32(GPT_ENTRY_COUNT);
    out << quint32(GPT_ENTRY_SIZE);
    out << entryArrayCrc;

    // The CRC covers the header with its own field zeroed
    quint32 crc = qfatCrc32(sector.constData(), GPT_HEADER_SIZE);
    out.device()->seek(GPT_HEADER_CRC_OFFSET);
    out << crc;

    return sector;
}

QUuid QFATPartitionTableWriter::diskGuid(quint32 seed)
{
    return QUuid::createUuidV5(QUuid(GPT_GUID_NAMESPACE), QByteArray("qfatimage:disk:") + QByteArray::number(seed, 16));
}

QUuid QFATPartitionTableWriter::partitionGuid(quint32 seed)
{
    return QUuid::createUuidV5(QUuid(GPT_GUID_NAMESPACE), QByteArray("qfatimage:partition:") + QByteArray::number(seed, 16));
}

QUuid QFATPartitionTableWriter::partitionTypeGuid(bool bootable)
{
    return QUuid(bootable ? GPT_TYPE_EFI_SYSTEM : GPT_TYPE_BASIC_DATA);
}

void QFATPartitionTableWriter::writeGuid(QDataStream &out, const QUuid &uuid)
{
    // First three fields little-endian, the last eight bytes as stored
    out << quint32(uuid.data1) << quint16(uuid.data2) << quint16(uuid.data3);
    out.writeRawData(reinterpret_cast<const char *>(uuid.data4), 8);
}

QUuid QFATPartitionTableWriter::readGuid(QDataStream &in)
{
    quint32 data1;
    quint16 data2, data3;
    uchar data4[8];
    in >> data1 >> data2 >> data3;
    in.readRawData(reinterpret_cast<char *>(data4), 8);
    return QUuid(data1, data2, data3, data4[0], data4[1], data4[2], data4[3], data4[4], data4[5], data4[6], data4[7]);
}

bool QFATPartitionTableWriter::write(QIODevice *device, const QFATPartitionLayout &layout, const QFATImageSpec &spec,
                                     quint32 diskSignature, QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();

    if (layout.scheme == QFATPartitionTable::None) {
        return true;
    }
    if (!device || !device->isOpen() || !device->isWritable()) {
        return fail(QFATImageError::OutputWriteError, "output device is not writable", error);
    }

    QDataStream stream(device);
    stream.setByteOrder(QDataStream::LittleEndian);

    auto writeAt = [&](quint64 lba, const QByteArray &bytes) -> bool {
        if (!stream.device()->seek(static_cast<qint64>(lba * SECTOR_SIZE))) {
            return false;
        }
        return stream.writeRawData(bytes.constData(), bytes.size()) == bytes.size();
    };

    if (layout.scheme == QFATPartitionTable::MBR) {
        if (spec.bootCode.size() > MBR_BOOT_CODE_LENGTH) {
            return fail(QFATImageError::InvalidConfiguration, QString("boot code is %1 bytes, at most %2 fit").arg(spec.bootCode.size()).arg(MBR_BOOT_CODE_LENGTH),
                        error);
        }
        if (!writeAt(0, mbrSector(layout, spec.bootable, spec.bootCode, diskSignature))) {
            return fail(QFATImageError::OutputWriteError, "failed to write the MBR", error);
        }
        qInfo() << "[QFATPartitionTableWriter] MBR written, partition at LBA" << layout.partitionStartLba;
        return true;
    }

    QByteArray entries = gptEntryArray(layout, spec.bootable, partitionGuid(diskSignature));
    quint32 entriesCrc = qfatCrc32(entries);
    QUuid disk = diskGuid(diskSignature);

    if (!writeAt(0, protectiveMbrSector(layout))) {
        return fail(QFATImageError::OutputWriteError, "failed to write the protective MBR", error);
    }
    if (!writeAt(GPT_HEADER_LBA, gptHeader(layout, disk, entriesCrc, false)) || !writeAt(layout.primaryEntriesLba, entries)) {
        return fail(QFATImageError::OutputWriteError, "failed to write the primary GPT", error);
    }
    if (!writeAt(layout.backupEntriesLba, entries) || !writeAt(layout.backupHeaderLba, gptHeader(layout, disk, entriesCrc, true))) {
        return fail(QFATImageError::OutputWriteError, "failed to write the backup GPT", error);
    }

    qInfo() << "[QFATPartitionTableWriter] GPT written, disk" << disk.toString() << "partition at LBA" << layout.partitionStartLba;
    return true;
}
