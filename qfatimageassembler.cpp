#include <limits>

#include <QBuffer>
#include <QDebug>
#include <QFile>
#include <QSaveFile>

#include "internal_constants.h"
#include "qfatimage.h"

// ============================================================================
// QFATImageAssembler
// ============================================================================

QFATImageAssembler::QFATImageAssembler()
    : m_stage(Stage::CollectTree)
    , m_volumeId(0)
{
}

QFATImageAssembler::~QFATImageAssembler()
{
}

QString QFATImageAssembler::stageName(Stage stage)
{
    switch (stage) {
    case Stage::CollectTree:
        return "CollectTree";
    case Stage::PlanGeometry:
        return "PlanGeometry";
    case Stage::EstimateSize:
        return "EstimateSize";
    case Stage::ValidateRequestedSize:
        return "ValidateRequestedSize";
    case Stage::BuildFilesystemRegion:
        return "BuildFilesystemRegion";
    case Stage::LayoutPartitionTable:
        return "LayoutPartitionTable";
    case Stage::AllocateFinalBuffer:
        return "AllocateFinalBuffer";
    case Stage::WriteRegionsAtOffsets:
        return "WriteRegionsAtOffsets";
    case Stage::Done:
        return "Done";
    default:
        return "Unknown";
    }
}

static quint32 treeChecksum(const QFATTreeEntry &entry, quint32 crc)
{
    QByteArray record = entry.name.toUtf8();
    record.append(entry.isDirectory ? 'D' : 'F');
    record.append(QByteArray::number(entry.size));
    record.append(QByteArray::number(entry.modified.isValid() ? entry.modified.toMSecsSinceEpoch() : 0));
    crc = qfatCrc32(record.constData(), record.size(), crc);

    for (const QFATTreeEntry &child : entry.children) {
        crc = treeChecksum(child, crc);
    }
    return crc;
}

quint32 QFATImageAssembler::deriveVolumeId(const QFATTreeEntry &root)
{
    // Same tree, same id; 0 is reserved for "derive"
    quint32 id = treeChecksum(root, 0);
    return id ? id : 1;
}

bool QFATImageAssembler::checkSpec(const QFATImageSpec &spec, QString &detail)
{
    if (spec.filesystem != QFATFilesystem::FAT32) {
        detail = "only FAT32 is supported";
        return false;
    }
    if (spec.bootCode.size() > MBR_BOOT_CODE_LENGTH) {
        detail = QString("boot code is %1 bytes, at most %2 fit").arg(spec.bootCode.size()).arg(MBR_BOOT_CODE_LENGTH);
        return false;
    }
    if (!spec.bootCode.isEmpty() && spec.partitionTable != QFATPartitionTable::MBR) {
        detail = "boot code needs an MBR partition table";
        return false;
    }
    if (spec.volumeLabel.length() > BS_VOLUME_LABEL_LENGTH) {
        detail = QString("volume label %1 is longer than %2 characters").arg(spec.volumeLabel).arg(BS_VOLUME_LABEL_LENGTH);
        return false;
    }
    for (const QChar &ch : spec.volumeLabel) {
        if (ch.unicode() < 0x20 || ch.unicode() >= 0x7F || QByteArray("\"*+,./:;<=>?[\\]|").contains(static_cast<char>(ch.unicode()))) {
            detail = QString("volume label %1 contains an invalid character").arg(spec.volumeLabel);
            return false;
        }
    }
    return true;
}

bool QFATImageAssembler::stageFailed(const QFATErrorState &component, QFATImageError &error)
{
    adoptError(component);
    error = component.lastError();
    qWarning() << "[QFATImageAssembler] Stage" << stageName(m_stage) << "failed:" << component.errorString();
    return false;
}

bool QFATImageAssembler::prepare(const QFATTreeEntry &root, const QFATImageSpec &spec, QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();
    m_builder.reset();
    m_geometry = QFATClusterGeometry();
    m_layout = QFATPartitionLayout();

    m_stage = Stage::CollectTree;
    m_tree = root;
    QFATTreeCollector collector;
    if (!collector.normalize(m_tree, error)) {
        return stageFailed(collector, error);
    }

    m_stage = Stage::PlanGeometry;
    QString detail;
    if (!checkSpec(spec, detail)) {
        qWarning() << "[QFATImageAssembler] Invalid configuration:" << detail;
        return fail(QFATImageError::InvalidConfiguration, detail, error);
    }
    m_volumeId = spec.volumeId ? spec.volumeId : deriveVolumeId(m_tree);

    QFATSizeEstimator estimator;
    if (spec.requestedSize == 0) {
        m_stage = Stage::EstimateSize;
        if (!estimator.estimate(m_tree, m_geometry, error)) {
            return stageFailed(estimator, error);
        }
    } else {
        m_stage = Stage::ValidateRequestedSize;
        if (!estimator.validate(m_tree, spec.requestedSize, m_geometry, error)) {
            return stageFailed(estimator, error);
        }
    }

    m_stage = Stage::BuildFilesystemRegion;
    m_builder.reset(new QFAT32Builder(m_geometry, spec.volumeLabel, m_volumeId));
    if (!m_builder->build(m_tree, error)) {
        stageFailed(*m_builder, error);
        m_builder.reset();
        return false;
    }

    m_stage = Stage::LayoutPartitionTable;
    QFATPartitionTableWriter writer;
    if (!writer.layout(spec.partitionTable, m_geometry.totalSectors, m_layout, error)) {
        return stageFailed(writer, error);
    }

    qInfo() << "[QFATImageAssembler] Image:" << m_layout.totalBytes() << "bytes, volume" << m_geometry.totalBytes() << "bytes at offset"
            << m_layout.partitionOffset() << "volume id" << QString::number(m_volumeId, 16);
    return true;
}

bool QFATImageAssembler::allocateBuffer(QIODevice *device, quint64 length, QFATImageError &error)
{
    // The whole image is zero before any structure lands in it
    if (QFileDevice *file = qobject_cast<QFileDevice *>(device)) {
        if (!file->resize(0) || !file->resize(static_cast<qint64>(length))) {
            return fail(QFATImageError::OutputWriteError, QString("cannot size %1 to %2 bytes: %3").arg(file->fileName()).arg(length).arg(file->errorString()),
                        error);
        }
        return true;
    }

    if (QBuffer *buffer = qobject_cast<QBuffer *>(device)) {
        if (length > static_cast<quint64>(std::numeric_limits<int>::max())) {
            return fail(QFATImageError::OutputWriteError, QString("%1 bytes do not fit an in-memory buffer").arg(length), error);
        }
        buffer->buffer().fill(0, static_cast<int>(length));
        return true;
    }

    return fail(QFATImageError::OutputWriteError, "output device cannot be resized", error);
}

bool QFATImageAssembler::writeImage(QIODevice *device, const QFATImageSpec &spec, QFATImageError &error)
{
    if (!m_builder) {
        return fail(QFATImageError::InvalidConfiguration, "nothing prepared to write", error);
    }

    m_stage = Stage::AllocateFinalBuffer;
    if (!allocateBuffer(device, m_layout.totalBytes(), error)) {
        qWarning() << "[QFATImageAssembler] Stage" << stageName(m_stage) << "failed:" << errorString();
        return false;
    }

    m_stage = Stage::WriteRegionsAtOffsets;
    QFATPartitionTableWriter writer;
    if (!writer.write(device, m_layout, spec, m_volumeId, error)) {
        return stageFailed(writer, error);
    }
    // Hidden sectors tell the volume where its partition starts
    if (!m_builder->writeTo(device, m_layout.partitionOffset(), static_cast<quint32>(m_layout.partitionStartLba), error)) {
        return stageFailed(*m_builder, error);
    }

    return true;
}

bool QFATImageAssembler::assemble(const QFATTreeEntry &root, const QFATImageSpec &spec, QIODevice *device, QFATImageError &error)
{
    if (!prepare(root, spec, error)) {
        return false;
    }

    if (!device || !device->isOpen() || !device->isWritable()) {
        return fail(QFATImageError::OutputWriteError, "output device is not writable", error);
    }
    if (!writeImage(device, spec, error)) {
        return false;
    }

    m_stage = Stage::Done;
    return true;
}

bool QFATImageAssembler::assemble(const QFATImageSpec &spec, QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();

    m_stage = Stage::CollectTree;
    if (spec.inputDir.isEmpty() || spec.outputPath.isEmpty()) {
        return fail(QFATImageError::InvalidConfiguration, "input directory and output path are required", error);
    }

    QFATTreeCollector collector;
    QFATTreeEntry root;
    if (!collector.collect(spec.inputDir, root, error)) {
        return stageFailed(collector, error);
    }

    if (!prepare(root, spec, error)) {
        return false;
    }

    // Nothing appears at the output path until every byte is in place
    QSaveFile file(spec.outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(QFATImageError::OutputWriteError, QString("cannot open %1: %2").arg(spec.outputPath, file.errorString()), error);
    }
    if (!writeImage(&file, spec, error)) {
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        return fail(QFATImageError::OutputWriteError, QString("cannot commit %1: %2").arg(spec.outputPath, file.errorString()), error);
    }

    if (spec.verify) {
        QScopedPointer<QFATImageReader> reader = QFATImageReader::open(spec.outputPath);
        if (!reader) {
            QFile::remove(spec.outputPath);
            return fail(QFATImageError::InvalidImage, QString("cannot reopen %1").arg(spec.outputPath), error);
        }
        if (!reader->mount(error) || !reader->verifyAgainst(m_tree, error)) {
            stageFailed(*reader, error);
            reader.reset();
            QFile::remove(spec.outputPath);
            return false;
        }
        qInfo() << "[QFATImageAssembler] Verified" << spec.outputPath;
    }

    m_stage = Stage::Done;
    qInfo() << "[QFATImageAssembler] Wrote" << spec.outputPath << "(" << m_layout.totalBytes() << "bytes)";
    return true;
}
