// Example: inspecting an image built by mkfatimage
// Prints the partition layout, the volume and the whole directory tree

#include <QCoreApplication>
#include <QDebug>
#include "qfatimage.h"

static void listTree(QFATImageReader &reader, quint32 cluster, const QString &indent)
{
    QList<QFATFileInfo> files = reader.listDirectory(cluster);
    for (const QFATFileInfo &file : files) {
        qDebug().noquote() << indent + (file.isDirectory ? "[DIR] " : "[FILE] ") + file.longName << "(" << file.name << ")"
                           << "Size:" << file.size << "bytes";
        if (file.isDirectory) {
            listTree(reader, file.cluster, indent + "  ");
        }
    }
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    if (argc < 2) {
        qDebug() << "Usage: inspect_image <image>";
        return 1;
    }

    QScopedPointer<QFATImageReader> reader = QFATImageReader::open(QString::fromLocal8Bit(argv[1]));
    if (reader.isNull()) {
        qDebug() << "ERROR: Failed to open image";
        return 1;
    }

    QFATImageError error;
    if (!reader->mount(error)) {
        qDebug() << "ERROR:" << reader->errorString();
        return 1;
    }

    qDebug() << "=== Image ===";
    switch (reader->partitionTable()) {
    case QFATPartitionTable::None:
        qDebug() << "Partition table: none";
        break;
    case QFATPartitionTable::MBR:
        qDebug() << "Partition table: MBR";
        break;
    case QFATPartitionTable::GPT:
        qDebug() << "Partition table: GPT, headers" << (reader->verifyGpt(error) ? "valid" : "INVALID");
        break;
    }
    qDebug() << "Partition offset:" << reader->partitionOffset() << "bytes";

    const QFATClusterGeometry &geometry = reader->geometry();
    qDebug() << "\n=== Volume ===";
    qDebug() << "Label:" << reader->volumeLabel() << "ID:" << QString::number(reader->volumeId(), 16);
    qDebug() << "Sectors:" << geometry.totalSectors << "Cluster size:" << geometry.clusterSize() << "bytes";
    qDebug() << "Clusters:" << geometry.totalClusters << "Free:" << reader->countFreeClusters() << "FSInfo free:" << reader->fsInfoFreeCount();
    qDebug() << "FAT copies match:" << reader->fatCopiesMatch();

    qDebug() << "\n=== Files ===";
    listTree(*reader, geometry.rootDirFirstCluster, QString());

    return 0;
}
