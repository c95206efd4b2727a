// mkfatimage: build a FAT32 disk image from a host directory

#include <limits>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QLoggingCategory>

#include "qfatimage.h"

// Accepts plain byte counts and K/M/G suffixes (powers of 1024)
static bool parseSize(const QString &text, quint64 &size)
{
    QString value = text.trimmed().toUpper();
    if (value.endsWith('B')) {
        value.chop(1);
    }

    quint64 multiplier = 1;
    if (value.endsWith('K')) {
        multiplier = 1024ULL;
    } else if (value.endsWith('M')) {
        multiplier = 1024ULL * 1024;
    } else if (value.endsWith('G')) {
        multiplier = 1024ULL * 1024 * 1024;
    }
    if (multiplier != 1) {
        value.chop(1);
    }

    bool ok = false;
    quint64 number = value.toULongLong(&ok);
    if (!ok || number == 0 || number > std::numeric_limits<quint64>::max() / multiplier) {
        return false;
    }

    size = number * multiplier;
    return true;
}

static bool parsePartitionTable(const QString &text, QFATPartitionTable &table)
{
    QString value = text.toLower();
    if (value == "none") {
        table = QFATPartitionTable::None;
    } else if (value == "mbr") {
        table = QFATPartitionTable::MBR;
    } else if (value == "gpt") {
        table = QFATPartitionTable::GPT;
    } else {
        return false;
    }
    return true;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("mkfatimage");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Convert a directory tree into a FAT32 disk image");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption inputOption({"i", "input-dir"}, "Directory root to convert to an image.", "dir");
    QCommandLineOption outputOption({"o", "output-path"}, "Output image path.", "path");
    QCommandLineOption partitionOption({"p", "partition-table"}, "Partition table: gpt, mbr or none. Image size is extended to fit it.",
                                       "table", "none");
    QCommandLineOption filesystemOption({"f", "filesystem"}, "Filesystem for the image: fat32.", "fs", "fat32");
    QCommandLineOption sizeOption({"s", "size"}, "Partition size in bytes (K, M, G suffixes allowed). Estimated when omitted.", "size");
    QCommandLineOption bootableOption({"b", "bootable"}, "Mark the partition bootable.");
    QCommandLineOption labelOption({"l", "label"}, "Volume label, at most 11 characters.", "label", "NO NAME");
    QCommandLineOption bootCodeOption("boot-code", "File with up to 440 bytes of MBR boot code.", "file");
    QCommandLineOption verifyOption("verify", "Read the image back and compare it with the input.");
    QCommandLineOption verboseOption({"v", "verbose"}, "Print layout details.");

    parser.addOptions({inputOption, outputOption, partitionOption, filesystemOption, sizeOption, bootableOption, labelOption,
                       bootCodeOption, verifyOption, verboseOption});
    parser.process(app);

    if (!parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    if (!parser.isSet(inputOption) || !parser.isSet(outputOption)) {
        qCritical().noquote() << "mkfatimage: --input-dir and --output-path are required";
        parser.showHelp(1);
    }

    QFATImageSpec spec;
    spec.inputDir = parser.value(inputOption);
    spec.outputPath = parser.value(outputOption);
    spec.bootable = parser.isSet(bootableOption);
    spec.volumeLabel = parser.value(labelOption);
    spec.verify = parser.isSet(verifyOption);

    if (!parsePartitionTable(parser.value(partitionOption), spec.partitionTable)) {
        qCritical().noquote() << "mkfatimage: unknown partition table" << parser.value(partitionOption);
        return 1;
    }

    if (parser.value(filesystemOption).toLower() != "fat32") {
        qCritical().noquote() << "mkfatimage: unsupported filesystem" << parser.value(filesystemOption);
        return 1;
    }
    spec.filesystem = QFATFilesystem::FAT32;

    if (parser.isSet(sizeOption) && !parseSize(parser.value(sizeOption), spec.requestedSize)) {
        qCritical().noquote() << "mkfatimage: invalid size" << parser.value(sizeOption);
        return 1;
    }

    if (parser.isSet(bootCodeOption)) {
        QFile bootCode(parser.value(bootCodeOption));
        if (!bootCode.open(QIODevice::ReadOnly)) {
            qCritical().noquote() << "mkfatimage: cannot read boot code" << bootCode.fileName() << ":" << bootCode.errorString();
            return 1;
        }
        spec.bootCode = bootCode.readAll();
    }

    QFATImageAssembler assembler;
    QFATImageError error;
    if (!assembler.assemble(spec, error)) {
        qCritical().noquote() << "mkfatimage:" << QFATImageAssembler::stageName(assembler.stage()) << "failed:" << assembler.errorString();
        return 1;
    }

    qInfo().noquote() << "mkfatimage: wrote" << spec.outputPath << "(" << assembler.layout().totalBytes() << "bytes,"
                      << assembler.geometry().totalClusters << "clusters of" << assembler.geometry().clusterSize() << "bytes)";
    return 0;
}
