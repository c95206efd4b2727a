#include <cstring>

#include <QBuffer>
#include <QDebug>
#include <QFile>

#include "internal_constants.h"
#include "qfatimage.h"

// ============================================================================
// QFATClusterAllocator
// ============================================================================

QFATClusterAllocator::QFATClusterAllocator(quint32 totalClusters)
    : m_totalClusters(totalClusters)
    , m_cursor(FAT32_ROOT_CLUSTER)
{
    // Entry 0 carries the media byte, entry 1 the end-of-chain marker
    m_table.append(0x0FFFFF00 | FAT32_MEDIA_DESCRIPTOR);
    m_table.append(FAT32_END_OF_CHAIN);
}

bool QFATClusterAllocator::allocate(quint32 &cluster)
{
    if (allocatedCount() >= m_totalClusters) {
        return false;
    }

    cluster = m_cursor++;
    m_table.append(FAT32_END_OF_CHAIN);
    return true;
}

bool QFATClusterAllocator::extend(quint32 lastCluster, quint32 &next)
{
    if (lastCluster < FAT32_ROOT_CLUSTER || lastCluster >= m_cursor) {
        return false;
    }
    if (!allocate(next)) {
        return false;
    }

    m_table[lastCluster] = next;
    return true;
}

bool QFATClusterAllocator::allocateChain(quint32 count, quint32 &firstCluster)
{
    firstCluster = 0;
    if (count == 0) {
        return true;
    }
    if (count > freeCount()) {
        return false;
    }

    quint32 last = 0;
    if (!allocate(firstCluster)) {
        return false;
    }
    last = firstCluster;

    for (quint32 i = 1; i < count; i++) {
        quint32 next;
        if (!extend(last, next)) {
            return false;
        }
        last = next;
    }
    return true;
}

quint32 QFATClusterAllocator::entry(quint32 cluster) const
{
    if (cluster >= static_cast<quint32>(m_table.size())) {
        return 0;
    }
    return m_table[cluster];
}

QList<quint32> QFATClusterAllocator::chain(quint32 firstCluster) const
{
    QList<quint32> clusters;

    quint32 current = firstCluster;
    while (current >= FAT32_ROOT_CLUSTER && current < m_cursor && static_cast<quint32>(clusters.size()) < m_totalClusters) {
        clusters.append(current);
        quint32 next = m_table[current];
        if (next >= FAT32_END_OF_CHAIN_MIN) {
            break;
        }
        current = next;
    }

    return clusters;
}

quint32 QFATClusterAllocator::nextFree() const
{
    if (allocatedCount() >= m_totalClusters) {
        return FAT32_NO_FREE_HINT;
    }
    return m_cursor;
}

QByteArray QFATClusterAllocator::serialize(quint32 fatSizeSectors, quint16 bytesPerSector) const
{
    QByteArray bytes(static_cast<int>(fatSizeSectors) * bytesPerSector, 0);
    QDataStream out(&bytes, QIODevice::WriteOnly);
    out.setByteOrder(QDataStream::LittleEndian);

    int count = qMin(m_table.size(), bytes.size() / 4);
    for (int i = 0; i < count; i++) {
        out << m_table[i];
    }

    return bytes;
}

// ============================================================================
// QFAT32Builder
// ============================================================================

static QByteArray formatVolumeLabel(const QString &label)
{
    QByteArray field = label.toUpper().toLatin1().left(BS_VOLUME_LABEL_LENGTH);
    if (field.trimmed().isEmpty()) {
        field = "NO NAME";
    }
    return field.leftJustified(BS_VOLUME_LABEL_LENGTH, ' ');
}

QFAT32Builder::QFAT32Builder(const QFATClusterGeometry &geometry, const QString &volumeLabel, quint32 volumeId)
    : m_geometry(geometry)
    , m_allocator(geometry.totalClusters)
    , m_label(formatVolumeLabel(volumeLabel))
    , m_volumeId(volumeId)
    , m_built(false)
{
}

bool QFAT32Builder::build(const QFATTreeEntry &root, QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();

    m_allocator = QFATClusterAllocator(m_geometry.totalClusters);
    m_directories.clear();
    m_files.clear();
    m_built = false;

    if (!m_geometry.isValid()) {
        return fail(QFATImageError::InvalidConfiguration, "cluster geometry is not a valid FAT32 layout", error);
    }

    quint32 rootCluster;
    if (!m_allocator.allocate(rootCluster) || rootCluster != m_geometry.rootDirFirstCluster) {
        return fail(QFATImageError::InsufficientSize, "no cluster left for the root directory", error);
    }

    if (!buildDirectory(root, rootCluster, 0, true, error)) {
        // A failed build leaves nothing behind
        m_allocator = QFATClusterAllocator(m_geometry.totalClusters);
        m_directories.clear();
        m_files.clear();
        return false;
    }

    m_built = true;
    qInfo() << "[QFAT32Builder] Laid out" << m_directories.size() << "directories and" << m_files.size() << "files in"
             << m_allocator.allocatedCount() << "of" << m_geometry.totalClusters << "clusters";
    return true;
}

bool QFAT32Builder::buildDirectory(const QFATTreeEntry &dir, quint32 firstCluster, quint32 parentCluster, bool isRoot,
                                   QFATImageError &error)
{
    DirectoryImage image;
    image.firstCluster = firstCluster;
    image.lastCluster = firstCluster;
    image.clusterCount = 1;

    QByteArray header;
    if (!isRoot) {
        QByteArray dotEntries(2 * ENTRY_SIZE, 0);
        quint8 *raw = reinterpret_cast<quint8 *>(dotEntries.data());
        QFATNameCodec::writeShortEntry(raw, QByteArray(".").leftJustified(ENTRY_NAME_LENGTH, ' '), ENTRY_ATTRIBUTE_DIRECTORY, 0,
                                       firstCluster, 0, dir.modified);
        // A parent that is the root is recorded as cluster 0
        QFATNameCodec::writeShortEntry(raw + ENTRY_SIZE, QByteArray("..").leftJustified(ENTRY_NAME_LENGTH, ' '),
                                       ENTRY_ATTRIBUTE_DIRECTORY, 0, parentCluster, 0, dir.modified);
        header = dotEntries;
    } else if (m_label != formatVolumeLabel(QString())) {
        QByteArray labelEntry(ENTRY_SIZE, 0);
        QFATNameCodec::writeShortEntry(reinterpret_cast<quint8 *>(labelEntry.data()), m_label, ENTRY_ATTRIBUTE_VOLUME_LABEL, 0, 0, 0,
                                       dir.modified);
        header = labelEntry;
    }

    if (!header.isEmpty() && !appendEntries(image, header, error)) {
        return false;
    }

    // Names that are already valid 8.3 keep their alias; generated aliases must avoid them
    QSet<QByteArray> usedNames;
    for (const QFATTreeEntry &child : dir.children) {
        quint8 caseFlags;
        if (QFATNameCodec::fitsShortName(child.name, caseFlags)) {
            usedNames.insert(QFATNameCodec::packShortName(child.name));
        }
    }

    QSet<QByteArray> assigned;
    for (const QFATTreeEntry &child : dir.children) {
        QByteArray shortName;
        quint8 caseFlags = 0;
        bool needsLongName = false;

        if (QFATNameCodec::fitsShortName(child.name, caseFlags) && !assigned.contains(QFATNameCodec::packShortName(child.name))) {
            shortName = QFATNameCodec::packShortName(child.name);
        } else {
            caseFlags = 0;
            if (!QFATNameCodec::generateShortName(child.name, usedNames, shortName, error)) {
                return fail(error, QString("no short alias left for %1").arg(child.name), error);
            }
            usedNames.insert(shortName);
            needsLongName = true;
        }
        assigned.insert(shortName);

        quint32 childCluster = 0;
        if (child.isDirectory) {
            if (!m_allocator.allocate(childCluster)) {
                return fail(QFATImageError::InsufficientSize, QString("no cluster left for directory %1").arg(child.name), error);
            }
            if (!buildDirectory(child, childCluster, isRoot ? 0 : firstCluster, false, error)) {
                return false;
            }
        } else if (child.size > 0) {
            quint64 count = (child.size + m_geometry.clusterSize() - 1) / m_geometry.clusterSize();
            if (count > m_allocator.freeCount() || !m_allocator.allocateChain(static_cast<quint32>(count), childCluster)) {
                return fail(QFATImageError::InsufficientSize,
                            QString("%1 needs %2 clusters, %3 free").arg(child.name).arg(count).arg(m_allocator.freeCount()), error);
            }
            FilePlacement placement;
            placement.entry = &child;
            placement.firstCluster = childCluster;
            m_files.append(placement);
        }

        int lfnCount = needsLongName ? QFATNameCodec::calculateLFNEntriesNeeded(child.name) : 0;
        QByteArray entries((lfnCount + 1) * ENTRY_SIZE, 0);
        quint8 *raw = reinterpret_cast<quint8 *>(entries.data());

        if (needsLongName) {
            quint8 checksum = QFATNameCodec::calculateLFNChecksum(shortName);
            // Highest sequence number comes first
            for (int i = 0; i < lfnCount; i++) {
                int sequence = lfnCount - i;
                QFATNameCodec::writeLFNEntry(raw + i * ENTRY_SIZE, child.name, sequence, checksum, i == 0);
            }
        }

        quint8 attributes = child.isDirectory ? ENTRY_ATTRIBUTE_DIRECTORY : ENTRY_ATTRIBUTE_ARCHIVE;
        quint32 size = child.isDirectory ? 0 : static_cast<quint32>(child.size);
        QFATNameCodec::writeShortEntry(raw + lfnCount * ENTRY_SIZE, shortName, attributes, caseFlags, childCluster, size, child.modified);

        if (!appendEntries(image, entries, error)) {
            return false;
        }

        qDebug() << "[QFAT32Builder] Entry" << child.name << "->" << shortName << "cluster" << childCluster;
    }

    m_directories.append(image);
    return true;
}

bool QFAT32Builder::appendEntries(DirectoryImage &dir, const QByteArray &entries, QFATImageError &error)
{
    dir.entries.append(entries);
    if (dir.entries.size() > DIRECTORY_MAX_ENTRIES * ENTRY_SIZE) {
        qWarning() << "[QFAT32Builder] Directory at cluster" << dir.firstCluster << "exceeds" << DIRECTORY_MAX_ENTRIES << "entries";
        return fail(QFATImageError::InvalidConfiguration,
                    QString("directory needs %1 entries, FAT allows %2").arg(dir.entries.size() / ENTRY_SIZE).arg(DIRECTORY_MAX_ENTRIES),
                    error);
    }

    quint32 clusterSize = m_geometry.clusterSize();
    quint32 needed = qMax<quint32>(1, (dir.entries.size() + clusterSize - 1) / clusterSize);

    while (dir.clusterCount < needed) {
        quint32 next;
        if (!m_allocator.extend(dir.lastCluster, next)) {
            return fail(QFATImageError::InsufficientSize, "no cluster left to grow a directory", error);
        }
        dir.lastCluster = next;
        dir.clusterCount++;
    }
    return true;
}

QByteArray QFAT32Builder::bootSector(quint32 hiddenSectors) const
{
    QByteArray sector(SECTOR_SIZE, 0);
    QBuffer buffer(&sector);
    buffer.open(QIODevice::WriteOnly);
    QDataStream out(&buffer);
    out.setByteOrder(QDataStream::LittleEndian);

    // Jump over the BPB
    out << quint8(0xEB) << quint8(0x58) << quint8(0x90);
    out.writeRawData("MSWIN4.1", BPB_OEM_NAME_LENGTH);

    out.device()->seek(BPB_BYTES_PER_SECTOR_OFFSET);
    out << m_geometry.bytesPerSector;
    out << m_geometry.sectorsPerCluster;
    out << m_geometry.reservedSectors;
    out << m_geometry.numFats;
    out << quint16(0); // root entry count, unused on FAT32
    out << quint16(0); // 16-bit total sectors
    out << quint8(FAT32_MEDIA_DESCRIPTOR);
    out << quint16(0); // 16-bit FAT size
    out << quint16(BPB_SECTORS_PER_TRACK);
    out << quint16(BPB_NUMBER_OF_HEADS);
    out << hiddenSectors;
    out << m_geometry.totalSectors;

    out.device()->seek(BPB_SECTORS_PER_FAT32_OFFSET);
    out << m_geometry.fatSizeSectors;
    out << quint16(0); // ext flags: FAT mirrored to all copies
    out << quint16(0); // version 0.0
    out << m_geometry.rootDirFirstCluster;
    out << quint16(FAT32_FSINFO_SECTOR);
    out << quint16(FAT32_BACKUP_BOOT_SECTOR);

    out.device()->seek(BS_DRIVE_NUMBER_OFFSET);
    out << quint8(BS_DRIVE_NUMBER_HARD_DISK);
    out << quint8(0);
    out << quint8(BS_EXTENDED_BOOT_SIGNATURE);
    out << m_volumeId;
    out.writeRawData(m_label.constData(), BS_VOLUME_LABEL_LENGTH);
    out.writeRawData("FAT32   ", BS_FS_TYPE_LENGTH);

    out.device()->seek(BOOT_SIGNATURE_OFFSET);
    out << quint8(BOOT_SIGNATURE_BYTE_1) << quint8(BOOT_SIGNATURE_BYTE_2);

    return sector;
}

QByteArray QFAT32Builder::fsInfoSector() const
{
    QByteArray sector(SECTOR_SIZE, 0);
    QBuffer buffer(&sector);
    buffer.open(QIODevice::WriteOnly);
    QDataStream out(&buffer);
    out.setByteOrder(QDataStream::LittleEndian);

    out.device()->seek(FSI_LEAD_SIGNATURE_OFFSET);
    out << quint32(FSI_LEAD_SIGNATURE);
    out.device()->seek(FSI_STRUCT_SIGNATURE_OFFSET);
    out << quint32(FSI_STRUCT_SIGNATURE);
    out << m_allocator.freeCount();
    out << m_allocator.nextFree();
    out.device()->seek(FSI_TRAIL_SIGNATURE_OFFSET);
    out << quint32(FSI_TRAIL_SIGNATURE);

    return sector;
}

bool QFAT32Builder::writeTo(QIODevice *device, quint64 partitionOffset, quint32 hiddenSectors, QFATImageError &error)
{
    error = QFATImageError::None;

    if (!m_built) {
        return fail(QFATImageError::InvalidConfiguration, "volume has not been built", error);
    }
    if (!device || !device->isOpen() || !device->isWritable()) {
        return fail(QFATImageError::OutputWriteError, "output device is not writable", error);
    }

    QDataStream stream(device);
    stream.setByteOrder(QDataStream::LittleEndian);
    const quint16 bps = m_geometry.bytesPerSector;

    auto writeAt = [&](quint64 offset, const QByteArray &bytes) -> bool {
        if (!stream.device()->seek(static_cast<qint64>(partitionOffset + offset))) {
            return false;
        }
        return stream.writeRawData(bytes.constData(), bytes.size()) == bytes.size();
    };

    // Boot sector and FSInfo, each with its backup
    QByteArray boot = bootSector(hiddenSectors);
    QByteArray fsInfo = fsInfoSector();
    if (!writeAt(0, boot) || !writeAt(static_cast<quint64>(FAT32_BACKUP_BOOT_SECTOR) * bps, boot)
        || !writeAt(static_cast<quint64>(FAT32_FSINFO_SECTOR) * bps, fsInfo)
        || !writeAt(static_cast<quint64>(FAT32_BACKUP_BOOT_SECTOR + FAT32_FSINFO_SECTOR) * bps, fsInfo)) {
        return fail(QFATImageError::OutputWriteError, "failed to write the boot region", error);
    }

    // Only the used prefix of the FAT; the rest of the region is already zero
    quint64 usedEntries = static_cast<quint64>(m_allocator.allocatedCount()) + 2;
    quint32 usedSectors = static_cast<quint32>((usedEntries * 4 + bps - 1) / bps);
    QByteArray table = m_allocator.serialize(usedSectors, bps);
    for (quint8 i = 0; i < m_geometry.numFats; i++) {
        quint64 fatOffset = (static_cast<quint64>(m_geometry.reservedSectors) + static_cast<quint64>(i) * m_geometry.fatSizeSectors) * bps;
        if (!writeAt(fatOffset, table)) {
            return fail(QFATImageError::OutputWriteError, QString("failed to write FAT copy %1").arg(i), error);
        }
    }

    const quint32 clusterSize = m_geometry.clusterSize();
    for (const DirectoryImage &dir : m_directories) {
        QList<quint32> clusters = m_allocator.chain(dir.firstCluster);
        for (int i = 0; i < clusters.size(); i++) {
            QByteArray chunk = dir.entries.mid(i * clusterSize, clusterSize);
            chunk.append(QByteArray(clusterSize - chunk.size(), 0));
            if (!writeAt(m_geometry.clusterOffset(clusters[i]), chunk)) {
                return fail(QFATImageError::OutputWriteError, QString("failed to write directory cluster %1").arg(clusters[i]), error);
            }
        }
    }

    for (const FilePlacement &placement : m_files) {
        const QFATTreeEntry *file = placement.entry;
        QScopedPointer<QIODevice> source;

        if (!file->sourcePath.isEmpty()) {
            source.reset(new QFile(file->sourcePath));
        } else {
            QBuffer *buffer = new QBuffer();
            buffer->setData(file->data);
            source.reset(buffer);
        }

        if (!source->open(QIODevice::ReadOnly)) {
            qWarning() << "[QFAT32Builder] Cannot open source for" << file->name;
            return fail(QFATImageError::SourceReadError, QString("cannot open %1").arg(file->sourcePath.isEmpty() ? file->name : file->sourcePath),
                        error);
        }

        if (!writeClusters(stream, partitionOffset, placement.firstCluster, source.data(), file->size, error)) {
            if (error == QFATImageError::SourceReadError) {
                m_errorDetail = QString("%1: %2").arg(file->name, m_errorDetail);
            }
            return false;
        }
    }

    qInfo() << "[QFAT32Builder] Wrote volume at offset" << partitionOffset << "(" << m_geometry.totalBytes() << "bytes)";
    return true;
}

bool QFAT32Builder::writeClusters(QDataStream &stream, quint64 partitionOffset, quint32 firstCluster, QIODevice *source,
                                  quint64 length, QFATImageError &error)
{
    const quint32 clusterSize = m_geometry.clusterSize();
    QByteArray buffer(static_cast<int>(clusterSize), 0);
    quint64 remaining = length;
    quint32 cluster = firstCluster;

    // File chains are streamed one cluster at a time
    while (remaining > 0) {
        if (cluster < FAT32_ROOT_CLUSTER || cluster >= FAT32_END_OF_CHAIN_MIN) {
            return fail(QFATImageError::InvalidConfiguration, "cluster chain shorter than the file", error);
        }

        qint64 toRead = static_cast<qint64>(qMin<quint64>(clusterSize, remaining));
        qint64 got = source->read(buffer.data(), toRead);
        if (got != toRead) {
            return fail(QFATImageError::SourceReadError, QString("expected %1 bytes, read %2").arg(length).arg(length - remaining + qMax<qint64>(got, 0)),
                        error);
        }
        if (toRead < clusterSize) {
            memset(buffer.data() + toRead, 0, clusterSize - toRead);
        }

        if (!stream.device()->seek(static_cast<qint64>(partitionOffset + m_geometry.clusterOffset(cluster)))
            || stream.writeRawData(buffer.constData(), buffer.size()) != buffer.size()) {
            return fail(QFATImageError::OutputWriteError, QString("failed to write data cluster %1").arg(cluster), error);
        }

        remaining -= toRead;
        cluster = m_allocator.entry(cluster);
    }

    // The source changed size since it was collected
    if (!source->atEnd()) {
        return fail(QFATImageError::SourceReadError, QString("source is longer than %1 bytes").arg(length), error);
    }
    return true;
}
