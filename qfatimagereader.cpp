#include <cstring>

#include <QBuffer>
#include <QDebug>
#include <QFile>
#include <QtEndian>

#include "internal_constants.h"
#include "qfatimage.h"

// ============================================================================
// QFATImageReader
// ============================================================================

QFATImageReader::QFATImageReader(QSharedPointer<QIODevice> device)
    : m_device(device)
    , m_partitionTable(QFATPartitionTable::None)
    , m_partitionOffset(0)
    , m_volumeId(0)
    , m_mounted(false)
{
    m_stream.setDevice(m_device.data());
    // Set byte order to Little Endian so that the data is read correctly
    m_stream.setByteOrder(QDataStream::LittleEndian);
}

QScopedPointer<QFATImageReader> QFATImageReader::open(const QString &imagePath)
{
    QSharedPointer<QFile> file(new QFile(imagePath));
    if (!file->open(QIODevice::ReadOnly)) {
        qWarning() << "Failed to open image:" << imagePath;
        return QScopedPointer<QFATImageReader>();
    }

    return QScopedPointer<QFATImageReader>(new QFATImageReader(file));
}

QByteArray QFATImageReader::readSectors(quint64 lba, quint32 count)
{
    QByteArray data;
    if (!m_device || !m_device->isOpen() || !m_stream.device()->seek(static_cast<qint64>(lba * SECTOR_SIZE))) {
        return data;
    }

    data.resize(static_cast<int>(count) * SECTOR_SIZE);
    qint64 bytesRead = m_stream.readRawData(data.data(), data.size());
    if (bytesRead != data.size()) {
        return QByteArray();
    }
    return data;
}

bool QFATImageReader::mount(QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();
    m_mounted = false;

    if (!m_device || !m_device->isOpen()) {
        return fail(QFATImageError::InvalidImage, "device not open", error);
    }
    if (!locatePartition(error) || !readBootSector(error)) {
        return false;
    }

    m_mounted = true;
    qDebug() << "[QFATImageReader] Mounted volume" << m_volumeLabel << "at offset" << m_partitionOffset << "clusters"
             << m_geometry.totalClusters;
    return true;
}

bool QFATImageReader::locatePartition(QFATImageError &error)
{
    QByteArray sector = readSectors(0, 1);
    if (sector.size() != SECTOR_SIZE) {
        return fail(QFATImageError::InvalidImage, "image is shorter than one sector", error);
    }

    const quint8 *raw = reinterpret_cast<const quint8 *>(sector.constData());
    if (raw[BOOT_SIGNATURE_OFFSET] != BOOT_SIGNATURE_BYTE_1 || raw[BOOT_SIGNATURE_OFFSET + 1] != BOOT_SIGNATURE_BYTE_2) {
        return fail(QFATImageError::InvalidImage, "sector 0 has no boot signature", error);
    }

    // A bare volume starts with its own boot sector
    if ((raw[BPB_JUMP_OFFSET] == 0xEB || raw[BPB_JUMP_OFFSET] == 0xE9) && memcmp(raw + BS_FS_TYPE_OFFSET, "FAT32   ", BS_FS_TYPE_LENGTH) == 0) {
        m_partitionTable = QFATPartitionTable::None;
        m_partitionOffset = 0;
        return true;
    }

    const quint8 *entry = raw + MBR_PARTITION_TABLE_OFFSET;
    quint8 type = entry[MBR_ENTRY_TYPE_OFFSET];
    quint32 startLba = qFromLittleEndian<quint32>(entry + MBR_ENTRY_LBA_START_OFFSET);

    if (type == MBR_TYPE_GPT_PROTECTIVE) {
        QByteArray header = readSectors(GPT_HEADER_LBA, 1);
        if (header.size() != SECTOR_SIZE || !header.startsWith(GPT_SIGNATURE)) {
            return fail(QFATImageError::InvalidImage, "protective MBR without a GPT header", error);
        }

        quint64 entriesLba = qFromLittleEndian<quint64>(header.constData() + GPT_HEADER_ENTRIES_LBA_OFFSET);
        QByteArray entries = readSectors(entriesLba, 1);
        if (entries.size() != SECTOR_SIZE) {
            return fail(QFATImageError::InvalidImage, "GPT entry array is unreadable", error);
        }

        QBuffer buffer(&entries);
        buffer.open(QIODevice::ReadOnly);
        QDataStream in(&buffer);
        in.setByteOrder(QDataStream::LittleEndian);
        QUuid typeGuid = QFATPartitionTableWriter::readGuid(in);
        if (typeGuid.isNull()) {
            return fail(QFATImageError::InvalidImage, "GPT has no partition", error);
        }
        QFATPartitionTableWriter::readGuid(in);
        quint64 firstLba;
        in >> firstLba;

        m_partitionTable = QFATPartitionTable::GPT;
        m_partitionOffset = firstLba * SECTOR_SIZE;
        return true;
    }

    if (type == MBR_TYPE_FAT32_LBA || type == MBR_TYPE_FAT32_CHS || type == MBR_TYPE_EFI_SYSTEM) {
        m_partitionTable = QFATPartitionTable::MBR;
        m_partitionOffset = static_cast<quint64>(startLba) * SECTOR_SIZE;
        return true;
    }

    return fail(QFATImageError::InvalidImage, QString("unsupported partition type 0x%1").arg(static_cast<uint>(type), 2, 16, QChar('0')), error);
}

bool QFATImageReader::readBootSector(QFATImageError &error)
{
    QByteArray boot = readSectors(m_partitionOffset / SECTOR_SIZE, 1);
    if (boot.size() != SECTOR_SIZE) {
        return fail(QFATImageError::InvalidImage, "boot sector is unreadable", error);
    }
    const quint8 *raw = reinterpret_cast<const quint8 *>(boot.constData());
    if (raw[BOOT_SIGNATURE_OFFSET] != BOOT_SIGNATURE_BYTE_1 || raw[BOOT_SIGNATURE_OFFSET + 1] != BOOT_SIGNATURE_BYTE_2) {
        return fail(QFATImageError::InvalidImage, "boot sector has no signature", error);
    }

    QBuffer buffer(&boot);
    buffer.open(QIODevice::ReadOnly);
    QDataStream in(&buffer);
    in.setByteOrder(QDataStream::LittleEndian);

    QFATClusterGeometry geometry;
    in.device()->seek(BPB_BYTES_PER_SECTOR_OFFSET);
    in >> geometry.bytesPerSector >> geometry.sectorsPerCluster >> geometry.reservedSectors >> geometry.numFats;
    in.device()->seek(BPB_TOTAL_SECTORS_32_OFFSET);
    in >> geometry.totalSectors >> geometry.fatSizeSectors;
    in.device()->seek(BPB_ROOT_DIRECTORY_CLUSTER_OFFSET);
    in >> geometry.rootDirFirstCluster;

    if (geometry.bytesPerSector != SECTOR_SIZE || geometry.sectorsPerCluster == 0
        || (geometry.sectorsPerCluster & (geometry.sectorsPerCluster - 1)) != 0 || geometry.numFats == 0 || geometry.fatSizeSectors == 0
        || geometry.rootDirFirstCluster < FAT32_ROOT_CLUSTER || memcmp(raw + BS_FS_TYPE_OFFSET, "FAT32   ", BS_FS_TYPE_LENGTH) != 0) {
        return fail(QFATImageError::InvalidImage, "boot sector does not describe a FAT32 volume", error);
    }
    if (geometry.totalSectors <= geometry.dataStartSector()) {
        return fail(QFATImageError::InvalidImage, "volume has no data area", error);
    }
    geometry.totalClusters = (geometry.totalSectors - geometry.dataStartSector()) / geometry.sectorsPerCluster;

    m_geometry = geometry;
    m_volumeId = qFromLittleEndian<quint32>(raw + BS_VOLUME_ID_OFFSET);
    m_volumeLabel = QString::fromLatin1(boot.constData() + BS_VOLUME_LABEL_OFFSET, BS_VOLUME_LABEL_LENGTH).trimmed();
    return true;
}

quint32 QFATImageReader::readFatEntry(quint32 cluster)
{
    quint64 fatOffset = m_partitionOffset + static_cast<quint64>(m_geometry.reservedSectors) * m_geometry.bytesPerSector
        + static_cast<quint64>(cluster) * 4; // 4 bytes per cluster

    m_stream.device()->seek(static_cast<qint64>(fatOffset));
    quint32 value = 0;
    m_stream >> value;

    // Mask off high 4 bits (only use 28 bits for FAT32)
    return value & FAT32_ENTRY_MASK;
}

QList<quint32> QFATImageReader::clusterChain(quint32 startCluster)
{
    QList<quint32> chain;

    quint32 currentCluster = startCluster;
    quint32 limit = m_geometry.totalClusters + 2;

    while (currentCluster >= FAT32_ROOT_CLUSTER && currentCluster < limit && static_cast<quint32>(chain.size()) < m_geometry.totalClusters) {
        chain.append(currentCluster);
        currentCluster = readFatEntry(currentCluster);
    }

    return chain;
}

quint32 QFATImageReader::countFreeClusters()
{
    const quint32 chunkSectors = 256;
    const quint64 fatLba = m_partitionOffset / SECTOR_SIZE + m_geometry.reservedSectors;
    quint32 freeClusters = 0;
    quint64 index = 0;
    quint64 lastIndex = static_cast<quint64>(m_geometry.totalClusters) + 1;

    for (quint32 sector = 0; sector < m_geometry.fatSizeSectors && index <= lastIndex; sector += chunkSectors) {
        quint32 count = qMin(chunkSectors, m_geometry.fatSizeSectors - sector);
        QByteArray chunk = readSectors(fatLba + sector, count);
        const uchar *raw = reinterpret_cast<const uchar *>(chunk.constData());

        for (int i = 0; i + 4 <= chunk.size() && index <= lastIndex; i += 4, index++) {
            if (index >= FAT32_ROOT_CLUSTER && (qFromLittleEndian<quint32>(raw + i) & FAT32_ENTRY_MASK) == 0) {
                freeClusters++;
            }
        }
    }

    return freeClusters;
}

quint32 QFATImageReader::fsInfoFreeCount()
{
    QByteArray sector = readSectors(m_partitionOffset / SECTOR_SIZE + FAT32_FSINFO_SECTOR, 1);
    if (sector.size() != SECTOR_SIZE) {
        return FAT32_NO_FREE_HINT;
    }
    return qFromLittleEndian<quint32>(sector.constData() + FSI_FREE_COUNT_OFFSET);
}

bool QFATImageReader::fatCopiesMatch()
{
    const quint32 chunkSectors = 256;
    const quint64 fatLba = m_partitionOffset / SECTOR_SIZE + m_geometry.reservedSectors;

    for (quint8 copy = 1; copy < m_geometry.numFats; copy++) {
        for (quint32 sector = 0; sector < m_geometry.fatSizeSectors; sector += chunkSectors) {
            quint32 count = qMin(chunkSectors, m_geometry.fatSizeSectors - sector);
            QByteArray primary = readSectors(fatLba + sector, count);
            QByteArray mirror = readSectors(fatLba + static_cast<quint64>(copy) * m_geometry.fatSizeSectors + sector, count);
            if (primary.isEmpty() || primary != mirror) {
                return false;
            }
        }
    }
    return true;
}

bool QFATImageReader::verifyGpt(QFATImageError &error)
{
    error = QFATImageError::None;
    if (m_partitionTable != QFATPartitionTable::GPT) {
        return true;
    }

    // Checks one header and its entry array, returns the alternate header LBA
    auto checkHeader = [&](quint64 lba, quint64 &alternate, const QString &which) -> bool {
        QByteArray header = readSectors(lba, 1);
        if (header.size() != SECTOR_SIZE || !header.startsWith(GPT_SIGNATURE)) {
            return fail(QFATImageError::InvalidImage, QString("%1 GPT header missing").arg(which), error);
        }

        quint32 headerSize = qFromLittleEndian<quint32>(header.constData() + GPT_HEADER_CRC_OFFSET - 4);
        quint32 storedCrc = qFromLittleEndian<quint32>(header.constData() + GPT_HEADER_CRC_OFFSET);
        if (headerSize != GPT_HEADER_SIZE) {
            return fail(QFATImageError::InvalidImage, QString("%1 GPT header size is %2").arg(which).arg(headerSize), error);
        }

        QByteArray zeroed = header.left(GPT_HEADER_SIZE);
        qToLittleEndian<quint32>(0, zeroed.data() + GPT_HEADER_CRC_OFFSET);
        if (qfatCrc32(zeroed) != storedCrc) {
            return fail(QFATImageError::InvalidImage, QString("%1 GPT header CRC mismatch").arg(which), error);
        }

        quint64 myLba = qFromLittleEndian<quint64>(header.constData() + GPT_HEADER_MY_LBA_OFFSET);
        if (myLba != lba) {
            return fail(QFATImageError::InvalidImage, QString("%1 GPT header claims LBA %2").arg(which).arg(myLba), error);
        }
        alternate = qFromLittleEndian<quint64>(header.constData() + GPT_HEADER_ALTERNATE_LBA_OFFSET);

        quint64 entriesLba = qFromLittleEndian<quint64>(header.constData() + GPT_HEADER_ENTRIES_LBA_OFFSET);
        quint32 entryCount = qFromLittleEndian<quint32>(header.constData() + GPT_HEADER_ENTRY_COUNT_OFFSET);
        quint32 entrySize = qFromLittleEndian<quint32>(header.constData() + GPT_HEADER_ENTRY_SIZE_OFFSET);
        quint32 entriesCrc = qFromLittleEndian<quint32>(header.constData() + GPT_HEADER_ENTRIES_CRC_OFFSET);
        if (entryCount != GPT_ENTRY_COUNT || entrySize != GPT_ENTRY_SIZE) {
            return fail(QFATImageError::InvalidImage, QString("%1 GPT entry array has an unexpected shape").arg(which), error);
        }

        QByteArray entries = readSectors(entriesLba, GPT_ENTRY_ARRAY_SECTORS);
        if (entries.isEmpty() || qfatCrc32(entries) != entriesCrc) {
            return fail(QFATImageError::InvalidImage, QString("%1 GPT entry array CRC mismatch").arg(which), error);
        }
        return true;
    };

    quint64 backupLba = 0;
    quint64 primaryLba = 0;
    if (!checkHeader(GPT_HEADER_LBA, backupLba, "primary") || !checkHeader(backupLba, primaryLba, "backup")) {
        return false;
    }
    if (primaryLba != GPT_HEADER_LBA) {
        return fail(QFATImageError::InvalidImage, "backup GPT header does not point back to LBA 1", error);
    }
    return true;
}

QFATFileInfo QFATImageReader::parseDirectoryEntry(const quint8 *entry, const QString &longName)
{
    QFATFileInfo info;

    info.name = QFATNameCodec::shortNameToString(entry);
    info.longName = longName.isEmpty() ? info.name : longName;

    info.attributes = entry[ENTRY_ATTRIBUTE_OFFSET];
    info.isDirectory = (info.attributes & ENTRY_ATTRIBUTE_DIRECTORY) != 0;
    info.size = qFromLittleEndian<quint32>(entry + ENTRY_SIZE_OFFSET);

    quint16 clusterLow = qFromLittleEndian<quint16>(entry + ENTRY_CLUSTER_OFFSET);
    quint16 clusterHigh = qFromLittleEndian<quint16>(entry + ENTRY_HIGH_ORDER_CLUSTER_ADDRESS_OFFSET);
    info.cluster = (static_cast<quint32>(clusterHigh) << 16) | clusterLow;

    quint16 modifiedTime = qFromLittleEndian<quint16>(entry + ENTRY_WRITTEN_DATE_TIME_OFFSET);
    quint16 modifiedDate = qFromLittleEndian<quint16>(entry + ENTRY_WRITTEN_DATE_TIME_OFFSET + 2);
    info.modified = QFATNameCodec::parseDateTime(modifiedDate, modifiedTime);

    return info;
}

QList<QFATFileInfo> QFATImageReader::readDirectoryEntries(const QByteArray &buffer, bool &foundEnd)
{
    QList<QFATFileInfo> files;
    foundEnd = false;

    int numEntries = buffer.size() / ENTRY_SIZE;
    QString currentLongName;
    quint8 currentChecksum = 0;

    for (int i = 0; i < numEntries; i++) {
        const quint8 *entry = reinterpret_cast<const quint8 *>(buffer.constData() + i * ENTRY_SIZE);

        if (entry[ENTRY_NAME_OFFSET] == ENTRY_END_OF_DIRECTORY) {
            foundEnd = true;
            break;
        }

        if (entry[ENTRY_NAME_OFFSET] == ENTRY_DELETED) {
            currentLongName.clear();
            continue;
        }

        if (entry[ENTRY_ATTRIBUTE_OFFSET] == ENTRY_ATTRIBUTE_LONG_FILE_NAME) {
            QString part = QFATNameCodec::readLongFileName(entry);

            // Long filename entries appear before the short entry in reverse order
            if (entry[ENTRY_NAME_OFFSET] & ENTRY_LFN_SEQUENCE_LAST_MASK) {
                currentLongName = part;
                currentChecksum = entry[ENTRY_LFN_CHECKSUM_OFFSET];
            } else {
                currentLongName = part + currentLongName;
            }
            continue;
        }

        // Skip . and .. entries and the volume label
        if (entry[ENTRY_NAME_OFFSET] == ENTRY_CURRENT_DIRECTORY || (entry[ENTRY_ATTRIBUTE_OFFSET] & ENTRY_ATTRIBUTE_VOLUME_LABEL) != 0) {
            currentLongName.clear();
            continue;
        }

        // A long name belongs to this entry only if the checksum matches its alias
        QByteArray alias(reinterpret_cast<const char *>(entry), ENTRY_NAME_LENGTH);
        if (!currentLongName.isEmpty() && QFATNameCodec::calculateLFNChecksum(alias) != currentChecksum) {
            qWarning() << "[QFATImageReader] Orphaned long name" << currentLongName;
            currentLongName.clear();
        }

        files.append(parseDirectoryEntry(entry, currentLongName));
        currentLongName.clear();
    }

    return files;
}

QList<QFATFileInfo> QFATImageReader::listRootDirectory()
{
    if (!m_mounted) {
        qWarning() << "Image not mounted";
        return QList<QFATFileInfo>();
    }
    return listDirectory(m_geometry.rootDirFirstCluster);
}

QList<QFATFileInfo> QFATImageReader::listDirectory(quint32 cluster)
{
    if (!m_mounted || cluster < FAT32_ROOT_CLUSTER) {
        return QList<QFATFileInfo>();
    }

    // Whole directory at once so long names may cross cluster boundaries
    QByteArray data;
    for (quint32 c : clusterChain(cluster)) {
        quint64 lba = (m_partitionOffset + m_geometry.clusterOffset(c)) / SECTOR_SIZE;
        QByteArray clusterData = readSectors(lba, m_geometry.sectorsPerCluster);
        if (clusterData.isEmpty()) {
            qWarning() << "Failed to read cluster" << c;
            break;
        }
        data.append(clusterData);
    }

    bool foundEnd = false;
    return readDirectoryEntries(data, foundEnd);
}

QStringList QFATImageReader::splitPath(const QString &path)
{
    QString normalized = path;
    // Normalize path separators
    normalized.replace('\\', '/');
    return normalized.split('/', Qt::SkipEmptyParts);
}

QFATFileInfo QFATImageReader::findInDirectory(const QList<QFATFileInfo> &entries, const QString &name)
{
    QString upperName = name.toUpper();

    for (const QFATFileInfo &entry : entries) {
        // Match by exact name (short or long)
        if (entry.longName.toUpper() == upperName || entry.name.toUpper() == upperName) {
            return entry;
        }
    }

    return QFATFileInfo();
}

QFATFileInfo QFATImageReader::fileInfo(const QString &path, QFATImageError &error)
{
    error = QFATImageError::None;

    if (!m_mounted) {
        fail(QFATImageError::InvalidImage, "image not mounted", error);
        return QFATFileInfo();
    }

    QStringList parts = splitPath(path);
    if (parts.isEmpty()) {
        QFATFileInfo root;
        root.name = "/";
        root.longName = "/";
        root.isDirectory = true;
        root.attributes = ENTRY_ATTRIBUTE_DIRECTORY;
        root.cluster = m_geometry.rootDirFirstCluster;
        return root;
    }

    // Start from root directory
    QList<QFATFileInfo> currentDir = listRootDirectory();

    for (int i = 0; i < parts.size(); i++) {
        QFATFileInfo found = findInDirectory(currentDir, parts[i]);
        if (found.name.isEmpty()) {
            fail(QFATImageError::FileNotFound, QString("%1 not found").arg(path), error);
            return QFATFileInfo();
        }

        // If this is the last component, return it
        if (i == parts.size() - 1) {
            return found;
        }

        if (!found.isDirectory) {
            fail(QFATImageError::FileNotFound, QString("%1 is not a directory").arg(parts[i]), error);
            return QFATFileInfo();
        }
        currentDir = listDirectory(found.cluster);
    }

    fail(QFATImageError::FileNotFound, QString("%1 not found").arg(path), error);
    return QFATFileInfo();
}

QList<QFATFileInfo> QFATImageReader::listDirectory(const QString &path, QFATImageError &error)
{
    QFATFileInfo dirInfo = fileInfo(path, error);
    if (error != QFATImageError::None) {
        return QList<QFATFileInfo>();
    }
    if (!dirInfo.isDirectory) {
        fail(QFATImageError::FileNotFound, QString("%1 is not a directory").arg(path), error);
        return QList<QFATFileInfo>();
    }
    return listDirectory(dirInfo.cluster);
}

QByteArray QFATImageReader::readClusterChain(quint32 startCluster, quint32 fileSize)
{
    QByteArray data;

    if (startCluster < FAT32_ROOT_CLUSTER || fileSize == 0) {
        return data;
    }

    quint32 clusterSize = m_geometry.clusterSize();
    quint32 bytesRead = 0;

    for (quint32 cluster : clusterChain(startCluster)) {
        quint64 lba = (m_partitionOffset + m_geometry.clusterOffset(cluster)) / SECTOR_SIZE;
        QByteArray clusterData = readSectors(lba, m_geometry.sectorsPerCluster);
        if (clusterData.isEmpty()) {
            qWarning() << "Failed to read cluster" << cluster;
            break;
        }

        quint32 bytesToRead = qMin(clusterSize, fileSize - bytesRead);
        data.append(clusterData.constData(), static_cast<int>(bytesToRead));
        bytesRead += bytesToRead;

        if (bytesRead >= fileSize) {
            break;
        }
    }

    return data;
}

QByteArray QFATImageReader::readFile(const QString &path, QFATImageError &error)
{
    QFATFileInfo info = fileInfo(path, error);
    if (error != QFATImageError::None) {
        return QByteArray();
    }
    if (info.isDirectory) {
        fail(QFATImageError::FileNotFound, QString("%1 is a directory").arg(path), error);
        return QByteArray();
    }

    // Empty file
    if (info.size == 0) {
        return QByteArray();
    }

    QByteArray data = readClusterChain(info.cluster, info.size);
    if (static_cast<quint32>(data.size()) != info.size) {
        fail(QFATImageError::InvalidImage, QString("%1: chain holds %2 of %3 bytes").arg(path).arg(data.size()).arg(info.size), error);
        return QByteArray();
    }
    return data;
}

bool QFATImageReader::verifyDirectory(const QFATTreeEntry &dir, quint32 cluster, const QString &path, QFATImageError &error)
{
    QList<QFATFileInfo> entries = listDirectory(cluster);
    if (entries.size() != dir.children.size()) {
        return fail(QFATImageError::InvalidImage,
                    QString("%1 holds %2 entries, expected %3").arg(path).arg(entries.size()).arg(dir.children.size()), error);
    }

    for (const QFATTreeEntry &child : dir.children) {
        QString childPath = path + child.name;

        QFATFileInfo found;
        for (const QFATFileInfo &entry : entries) {
            if (entry.longName == child.name) {
                found = entry;
                break;
            }
        }

        if (found.name.isEmpty()) {
            return fail(QFATImageError::InvalidImage, QString("%1 is missing").arg(childPath), error);
        }
        if (found.isDirectory != child.isDirectory) {
            return fail(QFATImageError::InvalidImage, QString("%1 has the wrong kind").arg(childPath), error);
        }

        if (child.isDirectory) {
            if (!verifyDirectory(child, found.cluster, childPath + "/", error)) {
                return false;
            }
            continue;
        }

        if (found.size != child.size) {
            return fail(QFATImageError::InvalidImage, QString("%1 is %2 bytes, expected %3").arg(childPath).arg(found.size).arg(child.size),
                        error);
        }
        if (child.size == 0) {
            continue;
        }

        QScopedPointer<QIODevice> source;
        if (!child.sourcePath.isEmpty()) {
            source.reset(new QFile(child.sourcePath));
        } else {
            QBuffer *buffer = new QBuffer();
            buffer->setData(child.data);
            source.reset(buffer);
        }
        if (!source->open(QIODevice::ReadOnly)) {
            return fail(QFATImageError::SourceReadError, QString("cannot reopen source of %1").arg(childPath), error);
        }

        // Compare one cluster at a time
        quint64 remaining = child.size;
        for (quint32 c : clusterChain(found.cluster)) {
            if (remaining == 0) {
                break;
            }
            quint64 lba = (m_partitionOffset + m_geometry.clusterOffset(c)) / SECTOR_SIZE;
            QByteArray stored = readSectors(lba, m_geometry.sectorsPerCluster);
            int length = static_cast<int>(qMin<quint64>(m_geometry.clusterSize(), remaining));
            QByteArray expected = source->read(length);
            if (stored.size() < length || expected.size() != length || stored.left(length) != expected) {
                return fail(QFATImageError::InvalidImage, QString("%1 differs from its source at byte %2").arg(childPath).arg(child.size - remaining),
                            error);
            }
            remaining -= length;
        }
        if (remaining != 0) {
            return fail(QFATImageError::InvalidImage, QString("%1 chain is %2 bytes short").arg(childPath).arg(remaining), error);
        }
    }

    return true;
}

bool QFATImageReader::verifyAgainst(const QFATTreeEntry &root, QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();

    if (!m_mounted) {
        return fail(QFATImageError::InvalidImage, "image not mounted", error);
    }
    if (!verifyGpt(error)) {
        return false;
    }
    if (!fatCopiesMatch()) {
        return fail(QFATImageError::InvalidImage, "FAT copies differ", error);
    }

    quint32 freeClusters = countFreeClusters();
    if (fsInfoFreeCount() != freeClusters) {
        return fail(QFATImageError::InvalidImage,
                    QString("FSInfo reports %1 free clusters, FAT has %2").arg(fsInfoFreeCount()).arg(freeClusters), error);
    }

    if (!verifyDirectory(root, m_geometry.rootDirFirstCluster, "/", error)) {
        return false;
    }

    qInfo() << "[QFATImageReader] Image matches" << root.fileCount() << "files and" << root.directoryCount() - 1 << "directories";
    return true;
}
