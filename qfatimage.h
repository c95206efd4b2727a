#ifndef QFATIMAGE_H
#define QFATIMAGE_H

#include <QByteArray>
#include <QDataStream>
#include <QDateTime>
#include <QIODevice>
#include <QList>
#include <QScopedPointer>
#include <QSet>
#include <QSharedPointer>
#include <QString>
#include <QUuid>
#include <QVector>

// Error codes for image construction and inspection
enum class QFATImageError {
    None,
    SourceReadError,
    FileTooLarge,
    GeometryConvergenceError,
    VolumeTooSmall,
    VolumeTooLarge,
    InsufficientSize,
    NameSpaceExhausted,
    PartitionOverflow,
    OutputWriteError,
    InvalidConfiguration,
    InvalidImage,
    FileNotFound
};

QString qfatImageErrorString(QFATImageError error);

enum class QFATPartitionTable {
    None,
    MBR,
    GPT
};

enum class QFATFilesystem {
    FAT32
};

// CRC-32 (IEEE 802.3, reflected, as used by GPT)
quint32 qfatCrc32(const char *data, qint64 length, quint32 crc = 0);
quint32 qfatCrc32(const QByteArray &data);

// One node of the input tree. File bytes come from `data` when `sourcePath` is empty.
struct QFATTreeEntry {
    QString name;
    bool isDirectory;
    quint64 size;
    QDateTime modified;
    QList<QFATTreeEntry> children;
    QString sourcePath;
    QByteArray data;

    QFATTreeEntry()
        : isDirectory(false)
        , size(0)
    {
    }

    static QFATTreeEntry directory(const QString &name, const QDateTime &modified = QDateTime());
    static QFATTreeEntry file(const QString &name, const QByteArray &data, const QDateTime &modified = QDateTime());
    static QFATTreeEntry hostFile(const QString &name, const QString &sourcePath, quint64 size, const QDateTime &modified);

    quint64 totalFileBytes() const;
    int fileCount() const;
    int directoryCount() const;
};

// Image configuration, created once and passed through every stage
struct QFATImageSpec {
    QString inputDir;
    QString outputPath;
    QFATPartitionTable partitionTable;
    QFATFilesystem filesystem;
    quint64 requestedSize; // 0 = estimate
    bool bootable;
    QString volumeLabel;
    quint32 volumeId; // 0 = derive from the input tree
    QByteArray bootCode;
    bool verify;

    QFATImageSpec()
        : partitionTable(QFATPartitionTable::None)
        , filesystem(QFATFilesystem::FAT32)
        , requestedSize(0)
        , bootable(false)
        , volumeLabel(QStringLiteral("NO NAME"))
        , volumeId(0)
        , verify(false)
    {
    }
};

struct QFATClusterGeometry {
    quint16 bytesPerSector;
    quint8 sectorsPerCluster;
    quint16 reservedSectors;
    quint8 numFats;
    quint32 fatSizeSectors;
    quint32 rootDirFirstCluster;
    quint32 totalClusters;
    quint32 totalSectors;

    QFATClusterGeometry()
        : bytesPerSector(512)
        , sectorsPerCluster(0)
        , reservedSectors(32)
        , numFats(2)
        , fatSizeSectors(0)
        , rootDirFirstCluster(2)
        , totalClusters(0)
        , totalSectors(0)
    {
    }

    quint32 clusterSize() const { return static_cast<quint32>(sectorsPerCluster) * bytesPerSector; }
    quint32 dataStartSector() const { return reservedSectors + numFats * fatSizeSectors; }
    quint64 totalBytes() const { return static_cast<quint64>(totalSectors) * bytesPerSector; }
    // Byte offset of a data cluster relative to the start of the volume
    quint64 clusterOffset(quint32 cluster) const;
    bool isValid() const;
};

// Shared last-error bookkeeping
class QFATErrorState
{
public:
    QFATErrorState();

    QFATImageError lastError() const { return m_lastError; }
    QString errorDetail() const { return m_errorDetail; }
    QString errorString() const;

protected:
    bool fail(QFATImageError kind, const QString &detail, QFATImageError &error);
    void clearError();
    void adoptError(const QFATErrorState &other);

    QFATImageError m_lastError;
    QString m_errorDetail;
};

// Turns a host directory into an ordered, validated tree
class QFATTreeCollector : public QFATErrorState
{
public:
    QFATTreeCollector();

    bool collect(const QString &rootPath, QFATTreeEntry &root, QFATImageError &error);
    // Sorts children and checks names of a tree built in memory
    bool normalize(QFATTreeEntry &root, QFATImageError &error);

    static bool lessThan(const QFATTreeEntry &a, const QFATTreeEntry &b);

private:
    bool collectDirectory(const QString &path, QFATTreeEntry &dir, QFATImageError &error);
    bool checkSiblings(const QFATTreeEntry &dir, const QString &path, QFATImageError &error);
    bool checkName(const QString &name, const QString &path, QFATImageError &error);

    int m_skippedLinks;
};

class QFATGeometryPlanner : public QFATErrorState
{
public:
    QFATGeometryPlanner();

    static quint8 sectorsPerClusterFor(quint64 totalSectors);

    // sectorsPerCluster == 0 picks the cluster size from the standard table
    bool planForSize(quint64 totalBytes, QFATClusterGeometry &geometry, QFATImageError &error, quint8 sectorsPerCluster = 0);
    bool planForClusters(quint32 clusterCount, quint8 sectorsPerCluster, QFATClusterGeometry &geometry, QFATImageError &error);

private:
    static quint32 fatSectorsNeeded(quint32 totalSectors, quint8 sectorsPerCluster, quint32 fatSize);
};

class QFATSizeEstimator : public QFATErrorState
{
public:
    QFATSizeEstimator();

    static quint32 directorySlots(const QFATTreeEntry &dir, bool isRoot);
    static quint64 requiredClusters(const QFATTreeEntry &root, quint32 clusterSize);

    bool estimate(const QFATTreeEntry &root, QFATClusterGeometry &geometry, QFATImageError &error);
    bool validate(const QFATTreeEntry &root, quint64 requestedSize, QFATClusterGeometry &geometry, QFATImageError &error);

private:
    static quint64 requiredClustersIn(const QFATTreeEntry &dir, quint32 clusterSize, bool isRoot);

    QFATGeometryPlanner m_planner;
};

// 8.3 aliases, VFAT long names and directory entry encoding
class QFATNameCodec
{
public:
    static bool isValidLongName(const QString &name);
    // Valid 8.3 name with each part in a single case; caseFlags carries the NT lower-case bits
    static bool fitsShortName(const QString &name, quint8 &caseFlags);
    static bool isPlainShortName(const QString &name);
    static QByteArray packShortName(const QString &name);
    static bool generateShortName(const QString &longName, const QSet<QByteArray> &usedNames, QByteArray &shortName, QFATImageError &error);
    static QString shortNameToString(const quint8 *entry);

    static quint8 calculateLFNChecksum(const QByteArray &shortName);
    static int calculateLFNEntriesNeeded(const QString &longName);
    static void writeLFNEntry(quint8 *entry, const QString &longName, int sequence, quint8 checksum, bool isLast);
    static QString readLongFileName(const quint8 *entry);

    static void writeShortEntry(quint8 *entry, const QByteArray &shortName, quint8 attributes, quint8 caseFlags,
                                quint32 cluster, quint32 size, const QDateTime &modified);

    static void encodeFATDateTime(const QDateTime &dt, quint16 &date, quint16 &time, quint8 &tenths);
    static QDateTime parseDateTime(quint16 date, quint16 time);
};

// Single logical FAT; the mirror copy is produced at serialization time
class QFATClusterAllocator
{
public:
    explicit QFATClusterAllocator(quint32 totalClusters);

    bool allocate(quint32 &cluster);
    bool extend(quint32 lastCluster, quint32 &next);
    bool allocateChain(quint32 count, quint32 &firstCluster);

    quint32 entry(quint32 cluster) const;
    QList<quint32> chain(quint32 firstCluster) const;

    quint32 totalClusters() const { return m_totalClusters; }
    quint32 allocatedCount() const { return m_cursor - 2; }
    quint32 freeCount() const { return m_totalClusters - allocatedCount(); }
    // 0xFFFFFFFF when the volume is full
    quint32 nextFree() const;

    QByteArray serialize(quint32 fatSizeSectors, quint16 bytesPerSector) const;

private:
    QVector<quint32> m_table;
    quint32 m_totalClusters;
    quint32 m_cursor;
};

class QFAT32Builder : public QFATErrorState
{
public:
    QFAT32Builder(const QFATClusterGeometry &geometry, const QString &volumeLabel, quint32 volumeId);

    // Lays out the whole volume in memory. The tree must outlive writeTo().
    bool build(const QFATTreeEntry &root, QFATImageError &error);
    bool writeTo(QIODevice *device, quint64 partitionOffset, quint32 hiddenSectors, QFATImageError &error);

    QByteArray bootSector(quint32 hiddenSectors) const;
    QByteArray fsInfoSector() const;

    const QFATClusterGeometry &geometry() const { return m_geometry; }
    const QFATClusterAllocator &allocator() const { return m_allocator; }
    QByteArray volumeLabelField() const { return m_label; }

private:
    struct DirectoryImage {
        quint32 firstCluster;
        quint32 lastCluster;
        quint32 clusterCount;
        QByteArray entries;
    };

    struct FilePlacement {
        const QFATTreeEntry *entry;
        quint32 firstCluster;
    };

    bool buildDirectory(const QFATTreeEntry &dir, quint32 firstCluster, quint32 parentCluster, bool isRoot, QFATImageError &error);
    bool appendEntries(DirectoryImage &dir, const QByteArray &entries, QFATImageError &error);
    bool writeClusters(QDataStream &stream, quint64 partitionOffset, quint32 firstCluster, QIODevice *source,
                       quint64 length, QFATImageError &error);

    QFATClusterGeometry m_geometry;
    QFATClusterAllocator m_allocator;
    QByteArray m_label;
    quint32 m_volumeId;
    QList<DirectoryImage> m_directories;
    QList<FilePlacement> m_files;
    bool m_built;
};

struct QFATPartitionLayout {
    QFATPartitionTable scheme;
    quint64 partitionStartLba;
    quint64 partitionSectors;
    quint64 totalSectors;
    quint64 primaryEntriesLba;
    quint64 backupEntriesLba;
    quint64 backupHeaderLba;
    quint64 firstUsableLba;
    quint64 lastUsableLba;

    QFATPartitionLayout()
        : scheme(QFATPartitionTable::None)
        , partitionStartLba(0)
        , partitionSectors(0)
        , totalSectors(0)
        , primaryEntriesLba(0)
        , backupEntriesLba(0)
        , backupHeaderLba(0)
        , firstUsableLba(0)
        , lastUsableLba(0)
    {
    }

    quint64 partitionOffset() const { return partitionStartLba * 512; }
    quint64 totalBytes() const { return totalSectors * 512; }
};

class QFATPartitionTableWriter : public QFATErrorState
{
public:
    QFATPartitionTableWriter();

    bool layout(QFATPartitionTable scheme, quint64 partitionSectors, QFATPartitionLayout &layout, QFATImageError &error);
    bool write(QIODevice *device, const QFATPartitionLayout &layout, const QFATImageSpec &spec, quint32 diskSignature, QFATImageError &error);

    static QByteArray mbrSector(const QFATPartitionLayout &layout, bool bootable, const QByteArray &bootCode, quint32 diskSignature);
    static QByteArray protectiveMbrSector(const QFATPartitionLayout &layout);
    static QByteArray gptEntryArray(const QFATPartitionLayout &layout, bool bootable, const QUuid &uniqueGuid);
    static QByteArray gptHeader(const QFATPartitionLayout &layout, const QUuid &diskGuid, quint32 entryArrayCrc, bool backup);

    static QUuid diskGuid(quint32 seed);
    static QUuid partitionGuid(quint32 seed);
    static QUuid partitionTypeGuid(bool bootable);
    static void writeGuid(QDataStream &out, const QUuid &uuid);
    static QUuid readGuid(QDataStream &in);
};

class QFATImageAssembler : public QFATErrorState
{
public:
    enum class Stage {
        CollectTree,
        PlanGeometry,
        EstimateSize,
        ValidateRequestedSize,
        BuildFilesystemRegion,
        LayoutPartitionTable,
        AllocateFinalBuffer,
        WriteRegionsAtOffsets,
        Done
    };

    QFATImageAssembler();
    ~QFATImageAssembler();

    // Collects spec.inputDir and writes spec.outputPath atomically
    bool assemble(const QFATImageSpec &spec, QFATImageError &error);
    // Writes the image into an open device; the device is grown to the image size
    bool assemble(const QFATTreeEntry &root, const QFATImageSpec &spec, QIODevice *device, QFATImageError &error);
    // Everything up to and including the partition layout, without touching any output
    bool prepare(const QFATTreeEntry &root, const QFATImageSpec &spec, QFATImageError &error);

    Stage stage() const { return m_stage; }
    const QFATClusterGeometry &geometry() const { return m_geometry; }
    const QFATPartitionLayout &layout() const { return m_layout; }
    quint32 volumeId() const { return m_volumeId; }

    static QString stageName(Stage stage);
    static quint32 deriveVolumeId(const QFATTreeEntry &root);
    static bool checkSpec(const QFATImageSpec &spec, QString &detail);

private:
    bool writeImage(QIODevice *device, const QFATImageSpec &spec, QFATImageError &error);
    bool allocateBuffer(QIODevice *device, quint64 length, QFATImageError &error);
    bool stageFailed(const QFATErrorState &component, QFATImageError &error);

    Stage m_stage;
    QFATTreeEntry m_tree;
    QFATClusterGeometry m_geometry;
    QFATPartitionLayout m_layout;
    quint32 m_volumeId;
    QScopedPointer<QFAT32Builder> m_builder;
};

struct QFATFileInfo {
    QString name;
    QString longName;
    bool isDirectory;
    quint32 size;
    QDateTime modified;
    quint8 attributes;
    quint32 cluster;

    QFATFileInfo()
        : isDirectory(false)
        , size(0)
        , attributes(0)
        , cluster(0)
    {
    }
};

// Read-only view of a built image (None, MBR or GPT wrapped)
class QFATImageReader : public QFATErrorState
{
public:
    QFATImageReader(QSharedPointer<QIODevice> device);

    static QScopedPointer<QFATImageReader> open(const QString &imagePath);

    bool mount(QFATImageError &error);

    QFATPartitionTable partitionTable() const { return m_partitionTable; }
    quint64 partitionOffset() const { return m_partitionOffset; }
    const QFATClusterGeometry &geometry() const { return m_geometry; }
    QString volumeLabel() const { return m_volumeLabel; }
    quint32 volumeId() const { return m_volumeId; }

    QList<QFATFileInfo> listRootDirectory();
    QList<QFATFileInfo> listDirectory(quint32 cluster);
    QList<QFATFileInfo> listDirectory(const QString &path, QFATImageError &error);
    QFATFileInfo fileInfo(const QString &path, QFATImageError &error);
    QByteArray readFile(const QString &path, QFATImageError &error);

    quint32 readFatEntry(quint32 cluster);
    QList<quint32> clusterChain(quint32 startCluster);
    quint32 countFreeClusters();
    quint32 fsInfoFreeCount();
    bool fatCopiesMatch();
    bool verifyGpt(QFATImageError &error);

    // Compares names, kinds, sizes and contents with the tree the image was built from
    bool verifyAgainst(const QFATTreeEntry &root, QFATImageError &error);

private:
    bool locatePartition(QFATImageError &error);
    bool readBootSector(QFATImageError &error);
    QByteArray readSectors(quint64 lba, quint32 count);
    QList<QFATFileInfo> readDirectoryEntries(const QByteArray &buffer, bool &foundEnd);
    QFATFileInfo parseDirectoryEntry(const quint8 *entry, const QString &longName);
    QByteArray readClusterChain(quint32 startCluster, quint32 fileSize);
    QFATFileInfo findInDirectory(const QList<QFATFileInfo> &entries, const QString &name);
    QStringList splitPath(const QString &path);
    bool verifyDirectory(const QFATTreeEntry &dir, quint32 cluster, const QString &path, QFATImageError &error);

    QSharedPointer<QIODevice> m_device;
    QDataStream m_stream;
    QFATPartitionTable m_partitionTable;
    quint64 m_partitionOffset;
    QFATClusterGeometry m_geometry;
    QString m_volumeLabel;
    quint32 m_volumeId;
    bool m_mounted;
};

#endif // QFATIMAGE_H
