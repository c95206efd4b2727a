#include <QDebug>

#include "internal_constants.h"
#include "qfatimage.h"

// ============================================================================
// QFATGeometryPlanner
// ============================================================================

QFATGeometryPlanner::QFATGeometryPlanner()
{
}

quint8 QFATGeometryPlanner::sectorsPerClusterFor(quint64 totalSectors)
{
    // Cluster size by volume size, for 512-byte sectors
    if (totalSectors <= 532480) {
        return 1; // up to 260 MiB
    }
    if (totalSectors <= 16777216) {
        return 8; // up to 8 GiB
    }
    if (totalSectors <= 33554432) {
        return 16; // up to 16 GiB
    }
    if (totalSectors <= 67108864) {
        return 32; // up to 32 GiB
    }
    if (totalSectors <= 0x80000000ULL) {
        return 64; // up to 1 TiB
    }
    return 128;
}

quint32 QFATGeometryPlanner::fatSectorsNeeded(quint32 totalSectors, quint8 sectorsPerCluster, quint32 fatSize)
{
    quint64 dataSectors = static_cast<quint64>(totalSectors) - FAT32_RESERVED_SECTORS - static_cast<quint64>(FAT32_NUMBER_OF_FATS) * fatSize;
    quint64 clusters = dataSectors / sectorsPerCluster;
    // Two reserved entries precede the first data cluster
    quint64 fatBytes = (clusters + 2) * 4;
    return static_cast<quint32>((fatBytes + SECTOR_SIZE - 1) / SECTOR_SIZE);
}

bool QFATGeometryPlanner::planForSize(quint64 totalBytes, QFATClusterGeometry &geometry, QFATImageError &error,
                                      quint8 sectorsPerCluster)
{
    error = QFATImageError::None;
    clearError();

    quint64 sectors = (totalBytes + SECTOR_SIZE - 1) / SECTOR_SIZE;
    if (sectors > FAT32_MAX_SECTORS) {
        return fail(QFATImageError::VolumeTooLarge, QString("%1 sectors exceed the 32-bit sector count").arg(sectors), error);
    }

    quint32 totalSectors = static_cast<quint32>(sectors);
    quint8 spc = sectorsPerCluster ? sectorsPerCluster : sectorsPerClusterFor(totalSectors);
    const quint64 reserved = FAT32_RESERVED_SECTORS;
    const quint64 fats = FAT32_NUMBER_OF_FATS;

    if (totalSectors <= reserved + fats) {
        return fail(QFATImageError::VolumeTooSmall, QString("%1 bytes cannot hold a FAT32 volume").arg(totalBytes), error);
    }

    // Smallest FAT size with (clusters + 2) * 4 <= fatSize * 512, ignoring integer rounding
    quint64 fatSize = (totalSectors - reserved + 2ULL * spc + (128ULL * spc + fats) - 1) / (128ULL * spc + fats);
    if (fatSize == 0) {
        fatSize = 1;
    }

    bool converged = false;
    for (int iteration = 0; iteration < GEOMETRY_MAX_ITERATIONS; iteration++) {
        if (totalSectors <= reserved + fats * fatSize) {
            return fail(QFATImageError::VolumeTooSmall, QString("%1 bytes leave no data area").arg(totalBytes), error);
        }

        quint32 needed = fatSectorsNeeded(totalSectors, spc, static_cast<quint32>(fatSize));
        if (needed > fatSize) {
            fatSize++;
            continue;
        }
        if (fatSize > 1 && fatSectorsNeeded(totalSectors, spc, static_cast<quint32>(fatSize - 1)) <= fatSize - 1) {
            fatSize--;
            continue;
        }
        converged = true;
        break;
    }

    if (!converged) {
        qWarning() << "[QFATGeometryPlanner] FAT size did not settle for" << totalSectors << "sectors";
        return fail(QFATImageError::GeometryConvergenceError,
                    QString("FAT size for %1 sectors did not settle within %2 steps").arg(totalSectors).arg(GEOMETRY_MAX_ITERATIONS),
                    error);
    }

    quint64 clusters = (totalSectors - reserved - fats * fatSize) / spc;
    if (clusters < FAT32_MIN_CLUSTERS) {
        return fail(QFATImageError::VolumeTooSmall,
                    QString("%1 bytes give %2 clusters, FAT32 needs at least %3").arg(totalBytes).arg(clusters).arg(FAT32_MIN_CLUSTERS),
                    error);
    }
    if (clusters > FAT32_MAX_CLUSTERS) {
        return fail(QFATImageError::VolumeTooLarge,
                    QString("%1 bytes give %2 clusters, FAT32 allows at most %3").arg(totalBytes).arg(clusters).arg(FAT32_MAX_CLUSTERS),
                    error);
    }

    geometry = QFATClusterGeometry();
    geometry.sectorsPerCluster = spc;
    geometry.fatSizeSectors = static_cast<quint32>(fatSize);
    geometry.totalClusters = static_cast<quint32>(clusters);
    geometry.totalSectors = totalSectors;

    qDebug() << "[QFATGeometryPlanner] Sectors:" << totalSectors << "Sectors/cluster:" << spc << "FAT sectors:" << fatSize
             << "Clusters:" << clusters;
    return true;
}

bool QFATGeometryPlanner::planForClusters(quint32 clusterCount, quint8 sectorsPerCluster, QFATClusterGeometry &geometry,
                                          QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();

    if (sectorsPerCluster == 0) {
        return fail(QFATImageError::InvalidConfiguration, "sectors per cluster must not be zero", error);
    }

    quint64 fatSize = (static_cast<quint64>(clusterCount) + 2 + FAT32_ENTRIES_PER_SECTOR - 1) / FAT32_ENTRIES_PER_SECTOR;
    quint64 totalSectors = FAT32_RESERVED_SECTORS + FAT32_NUMBER_OF_FATS * fatSize + static_cast<quint64>(clusterCount) * sectorsPerCluster;
    if (totalSectors > FAT32_MAX_SECTORS) {
        return fail(QFATImageError::VolumeTooLarge,
                    QString("%1 clusters of %2 sectors exceed the 32-bit sector count").arg(clusterCount).arg(sectorsPerCluster), error);
    }

    // Same path as an explicit size so both agree on the layout
    return planForSize(totalSectors * SECTOR_SIZE, geometry, error, sectorsPerCluster);
}

// ============================================================================
// QFATSizeEstimator
// ============================================================================

QFATSizeEstimator::QFATSizeEstimator()
{
}

quint32 QFATSizeEstimator::directorySlots(const QFATTreeEntry &dir, bool isRoot)
{
    // Root holds the volume label, every other directory holds . and ..
    quint32 slots = isRoot ? 1 : 2;

    for (const QFATTreeEntry &child : dir.children) {
        slots += 1;
        if (!QFATNameCodec::isPlainShortName(child.name)) {
            slots += QFATNameCodec::calculateLFNEntriesNeeded(child.name);
        }
    }
    return slots;
}

quint64 QFATSizeEstimator::requiredClustersIn(const QFATTreeEntry &dir, quint32 clusterSize, bool isRoot)
{
    quint64 entryBytes = static_cast<quint64>(directorySlots(dir, isRoot)) * ENTRY_SIZE;
    quint64 clusters = qMax<quint64>(1, (entryBytes + clusterSize - 1) / clusterSize);

    for (const QFATTreeEntry &child : dir.children) {
        if (child.isDirectory) {
            clusters += requiredClustersIn(child, clusterSize, false);
        } else {
            clusters += (child.size + clusterSize - 1) / clusterSize;
        }
    }
    return clusters;
}

quint64 QFATSizeEstimator::requiredClusters(const QFATTreeEntry &root, quint32 clusterSize)
{
    // One spare cluster so the root can grow
    return requiredClustersIn(root, clusterSize, true) + 1;
}

bool QFATSizeEstimator::estimate(const QFATTreeEntry &root, QFATClusterGeometry &geometry, QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();

    quint64 contentSectors = FAT32_RESERVED_SECTORS + (root.totalFileBytes() + SECTOR_SIZE - 1) / SECTOR_SIZE;
    quint8 spc = QFATGeometryPlanner::sectorsPerClusterFor(contentSectors);

    // Cluster size depends on the volume size and the volume size on the cluster size
    for (int iteration = 0; iteration < GEOMETRY_MAX_ITERATIONS; iteration++) {
        quint64 clusters = qMax<quint64>(requiredClusters(root, spc * SECTOR_SIZE), FAT32_MIN_CLUSTERS);
        if (clusters > FAT32_MAX_CLUSTERS) {
            return fail(QFATImageError::VolumeTooLarge, QString("content needs %1 clusters").arg(clusters), error);
        }

        QFATClusterGeometry candidate;
        if (!m_planner.planForClusters(static_cast<quint32>(clusters), spc, candidate, error)) {
            adoptError(m_planner);
            return false;
        }

        quint8 next = QFATGeometryPlanner::sectorsPerClusterFor(candidate.totalSectors);
        qDebug() << "[QFATSizeEstimator] Step" << iteration << "sectors/cluster" << spc << "->" << next << "total sectors"
                 << candidate.totalSectors;

        if (next == spc) {
            geometry = candidate;
            qInfo() << "[QFATSizeEstimator] Minimum volume:" << geometry.totalBytes() << "bytes," << geometry.totalClusters
                    << "clusters of" << geometry.clusterSize() << "bytes";
            return true;
        }

        if (next < spc) {
            // A smaller cluster size that would push the volume back over the boundary oscillates; keep the larger one
            quint64 probeClusters = qMax<quint64>(requiredClusters(root, next * SECTOR_SIZE), FAT32_MIN_CLUSTERS);
            QFATClusterGeometry probe;
            if (probeClusters <= FAT32_MAX_CLUSTERS && m_planner.planForClusters(static_cast<quint32>(probeClusters), next, probe, error)
                && QFATGeometryPlanner::sectorsPerClusterFor(probe.totalSectors) > next) {
                geometry = candidate;
                qInfo() << "[QFATSizeEstimator] Minimum volume:" << geometry.totalBytes() << "bytes at cluster boundary";
                return true;
            }
            error = QFATImageError::None;
        }

        spc = next;
    }

    qWarning() << "[QFATSizeEstimator] Estimate did not converge";
    return fail(QFATImageError::GeometryConvergenceError,
                QString("cluster size did not settle within %1 steps").arg(GEOMETRY_MAX_ITERATIONS), error);
}

bool QFATSizeEstimator::validate(const QFATTreeEntry &root, quint64 requestedSize, QFATClusterGeometry &geometry,
                                 QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();

    QFATClusterGeometry minimum;
    if (!estimate(root, minimum, error)) {
        return false;
    }

    quint64 available = (requestedSize + SECTOR_SIZE - 1) / SECTOR_SIZE * SECTOR_SIZE;
    QString shortfall = QString("required %1 bytes, available %2 bytes").arg(minimum.totalBytes()).arg(available);

    if (!m_planner.planForSize(available, geometry, error)) {
        if (error != QFATImageError::VolumeTooSmall) {
            adoptError(m_planner);
            return false;
        }
        qWarning() << "[QFATSizeEstimator] Requested size" << requestedSize << "is below the minimum" << minimum.totalBytes();
        return fail(QFATImageError::InsufficientSize, shortfall, error);
    }

    // Near a table boundary the content may only fit with larger clusters than the table picks
    for (quint8 spc = geometry.sectorsPerCluster; spc != 0 && spc <= 128; spc *= 2) {
        QFATClusterGeometry candidate;
        if (!m_planner.planForSize(available, candidate, error, spc)) {
            break;
        }

        quint64 needed = requiredClusters(root, candidate.clusterSize());
        qDebug() << "[QFATSizeEstimator] Sectors/cluster" << spc << "needs" << needed << "clusters, volume has"
                 << candidate.totalClusters;
        if (needed <= candidate.totalClusters) {
            geometry = candidate;
            error = QFATImageError::None;
            return true;
        }
    }

    qWarning() << "[QFATSizeEstimator] Content does not fit" << available << "bytes at any cluster size";
    return fail(QFATImageError::InsufficientSize, shortfall, error);
}
