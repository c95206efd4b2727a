#include <QByteArray>
#include <QDebug>
#include <QString>

#include "internal_constants.h"
#include "qfatimage.h"

// ============================================================================
// Errors
// ============================================================================

QString qfatImageErrorString(QFATImageError error)
{
    switch (error) {
    case QFATImageError::None:
        return "No error";
    case QFATImageError::SourceReadError:
        return "Source read error";
    case QFATImageError::FileTooLarge:
        return "File too large for FAT32";
    case QFATImageError::GeometryConvergenceError:
        return "Geometry did not converge";
    case QFATImageError::VolumeTooSmall:
        return "Volume too small for FAT32";
    case QFATImageError::VolumeTooLarge:
        return "Volume too large for FAT32";
    case QFATImageError::InsufficientSize:
        return "Insufficient size";
    case QFATImageError::NameSpaceExhausted:
        return "Short name space exhausted";
    case QFATImageError::PartitionOverflow:
        return "Partition overflow";
    case QFATImageError::OutputWriteError:
        return "Output write error";
    case QFATImageError::InvalidConfiguration:
        return "Invalid configuration";
    case QFATImageError::InvalidImage:
        return "Invalid image";
    case QFATImageError::FileNotFound:
        return "File not found";
    default:
        return "Unknown error";
    }
}

QFATErrorState::QFATErrorState()
    : m_lastError(QFATImageError::None)
{
}

QString QFATErrorState::errorString() const
{
    if (m_errorDetail.isEmpty()) {
        return qfatImageErrorString(m_lastError);
    }
    return qfatImageErrorString(m_lastError) + ": " + m_errorDetail;
}

bool QFATErrorState::fail(QFATImageError kind, const QString &detail, QFATImageError &error)
{
    error = kind;
    m_lastError = kind;
    m_errorDetail = detail;
    return false;
}

void QFATErrorState::clearError()
{
    m_lastError = QFATImageError::None;
    m_errorDetail.clear();
}

void QFATErrorState::adoptError(const QFATErrorState &other)
{
    m_lastError = other.m_lastError;
    m_errorDetail = other.m_errorDetail;
}

// ============================================================================
// CRC-32
// ============================================================================

static const quint32 *crc32Table()
{
    static quint32 table[256];
    static bool haveTable = false;

    if (!haveTable) {
        for (quint32 i = 0; i < 256; i++) {
            quint32 rem = i;
            for (int j = 0; j < 8; j++) {
                if (rem & 1) {
                    rem = (rem >> 1) ^ 0xEDB88320;
                } else {
                    rem >>= 1;
                }
            }
            table[i] = rem;
        }
        haveTable = true;
    }
    return table;
}

quint32 qfatCrc32(const char *data, qint64 length, quint32 crc)
{
    const quint32 *table = crc32Table();

    crc = ~crc;
    for (qint64 i = 0; i < length; i++) {
        crc = (crc >> 8) ^ table[(crc ^ static_cast<quint8>(data[i])) & MASK_8_BITS];
    }
    return ~crc;
}

quint32 qfatCrc32(const QByteArray &data)
{
    return qfatCrc32(data.constData(), data.size());
}

// ============================================================================
// QFATTreeEntry
// ============================================================================

QFATTreeEntry QFATTreeEntry::directory(const QString &name, const QDateTime &modified)
{
    QFATTreeEntry entry;
    entry.name = name;
    entry.isDirectory = true;
    entry.modified = modified;
    return entry;
}

QFATTreeEntry QFATTreeEntry::file(const QString &name, const QByteArray &data, const QDateTime &modified)
{
    QFATTreeEntry entry;
    entry.name = name;
    entry.size = static_cast<quint64>(data.size());
    entry.modified = modified;
    entry.data = data;
    return entry;
}

QFATTreeEntry QFATTreeEntry::hostFile(const QString &name, const QString &sourcePath, quint64 size, const QDateTime &modified)
{
    QFATTreeEntry entry;
    entry.name = name;
    entry.size = size;
    entry.modified = modified;
    entry.sourcePath = sourcePath;
    return entry;
}

quint64 QFATTreeEntry::totalFileBytes() const
{
    if (!isDirectory) {
        return size;
    }

    quint64 total = 0;
    for (const QFATTreeEntry &child : children) {
        total += child.totalFileBytes();
    }
    return total;
}

int QFATTreeEntry::fileCount() const
{
    if (!isDirectory) {
        return 1;
    }

    int count = 0;
    for (const QFATTreeEntry &child : children) {
        count += child.fileCount();
    }
    return count;
}

int QFATTreeEntry::directoryCount() const
{
    if (!isDirectory) {
        return 0;
    }

    int count = 1;
    for (const QFATTreeEntry &child : children) {
        count += child.directoryCount();
    }
    return count;
}

// ============================================================================
// QFATClusterGeometry
// ============================================================================

quint64 QFATClusterGeometry::clusterOffset(quint32 cluster) const
{
    // Cluster 2 is the first data cluster
    quint64 dataAreaOffset = static_cast<quint64>(dataStartSector()) * bytesPerSector;
    return dataAreaOffset + static_cast<quint64>(cluster - FAT32_ROOT_CLUSTER) * clusterSize();
}

bool QFATClusterGeometry::isValid() const
{
    if (bytesPerSector != SECTOR_SIZE || sectorsPerCluster == 0 || fatSizeSectors == 0) {
        return false;
    }
    if (totalClusters < FAT32_MIN_CLUSTERS || totalClusters > FAT32_MAX_CLUSTERS) {
        return false;
    }
    // Every cluster plus the two reserved entries must have a FAT slot
    quint64 fatEntries = static_cast<quint64>(fatSizeSectors) * FAT32_ENTRIES_PER_SECTOR;
    if (fatEntries < static_cast<quint64>(totalClusters) + 2) {
        return false;
    }
    quint64 used = static_cast<quint64>(dataStartSector()) + static_cast<quint64>(totalClusters) * sectorsPerCluster;
    return used <= totalSectors;
}
