#include <algorithm>

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSet>

#include "internal_constants.h"
#include "qfatimage.h"

// ============================================================================
// QFATTreeCollector
// ============================================================================

QFATTreeCollector::QFATTreeCollector()
    : m_skippedLinks(0)
{
}

bool QFATTreeCollector::lessThan(const QFATTreeEntry &a, const QFATTreeEntry &b)
{
    // Plain UTF-16 code unit order, case-sensitive, independent of locale
    return a.name < b.name;
}

bool QFATTreeCollector::collect(const QString &rootPath, QFATTreeEntry &root, QFATImageError &error)
{
    error = QFATImageError::None;
    clearError();
    m_skippedLinks = 0;

    QFileInfo rootInfo(rootPath);
    if (!rootInfo.exists() || !rootInfo.isDir()) {
        qWarning() << "[QFATTreeCollector] Input is not a directory:" << rootPath;
        return fail(QFATImageError::SourceReadError, QString("input directory %1 does not exist").arg(rootPath), error);
    }

    root = QFATTreeEntry::directory(QString(), rootInfo.lastModified());
    if (!collectDirectory(rootInfo.absoluteFilePath(), root, error)) {
        root = QFATTreeEntry();
        return false;
    }

    qInfo() << "[QFATTreeCollector] Collected" << root.fileCount() << "files," << root.directoryCount() - 1
            << "directories," << root.totalFileBytes() << "bytes";
    if (m_skippedLinks > 0) {
        qInfo() << "[QFATTreeCollector] Skipped" << m_skippedLinks << "directory links";
    }
    return true;
}

bool QFATTreeCollector::collectDirectory(const QString &path, QFATTreeEntry &dir, QFATImageError &error)
{
    QDir hostDir(path);
    if (!hostDir.isReadable()) {
        qWarning() << "[QFATTreeCollector] Cannot read directory:" << path;
        return fail(QFATImageError::SourceReadError, QString("cannot read directory %1").arg(path), error);
    }

    const QFileInfoList infos = hostDir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
                                                      QDir::NoSort);

    for (const QFileInfo &info : infos) {
        QString name = info.fileName();
        if (!checkName(name, info.filePath(), error)) {
            return false;
        }

        if (info.isSymLink() && info.isDir()) {
            // Following directory links could loop forever
            qWarning() << "[QFATTreeCollector] Skipping directory link:" << info.filePath();
            m_skippedLinks++;
            continue;
        }

        if (info.isDir()) {
            QFATTreeEntry child = QFATTreeEntry::directory(name, info.lastModified());
            if (!collectDirectory(info.filePath(), child, error)) {
                return false;
            }
            dir.children.append(child);
        } else if (info.isFile()) {
            if (!info.isReadable()) {
                qWarning() << "[QFATTreeCollector] Cannot read file:" << info.filePath();
                return fail(QFATImageError::SourceReadError, QString("cannot read file %1").arg(info.filePath()), error);
            }
            quint64 size = static_cast<quint64>(info.size());
            if (size > FAT32_MAX_FILE_SIZE) {
                qWarning() << "[QFATTreeCollector] File too large:" << info.filePath() << size;
                return fail(QFATImageError::FileTooLarge, QString("%1 is %2 bytes").arg(info.filePath()).arg(size), error);
            }
            dir.children.append(QFATTreeEntry::hostFile(name, info.filePath(), size, info.lastModified()));
        } else {
            // Dangling links, sockets, fifos
            qWarning() << "[QFATTreeCollector] Skipping special entry:" << info.filePath();
        }
    }

    std::sort(dir.children.begin(), dir.children.end(), lessThan);
    return checkSiblings(dir, path, error);
}

bool QFATTreeCollector::normalize(QFATTreeEntry &root, QFATImageError &error)
{
    error = QFATImageError::None;

    for (QFATTreeEntry &child : root.children) {
        if (!checkName(child.name, child.name, error)) {
            return false;
        }
        if (child.isDirectory) {
            if (!normalize(child, error)) {
                return false;
            }
        } else if (child.size > FAT32_MAX_FILE_SIZE) {
            return fail(QFATImageError::FileTooLarge, QString("%1 is %2 bytes").arg(child.name).arg(child.size), error);
        }
    }

    std::sort(root.children.begin(), root.children.end(), lessThan);
    return checkSiblings(root, root.name, error);
}

bool QFATTreeCollector::checkSiblings(const QFATTreeEntry &dir, const QString &path, QFATImageError &error)
{
    // FAT compares names case-insensitively
    QSet<QString> seen;
    for (const QFATTreeEntry &child : dir.children) {
        QString key = child.name.toUpper();
        if (seen.contains(key)) {
            qWarning() << "[QFATTreeCollector] Names differ only by case:" << child.name << "in" << path;
            return fail(QFATImageError::SourceReadError,
                        QString("%1 collides with a sibling in %2 when compared without case").arg(child.name, path), error);
        }
        seen.insert(key);
    }
    return true;
}

bool QFATTreeCollector::checkName(const QString &name, const QString &path, QFATImageError &error)
{
    if (name.length() > ENTRY_LFN_MAX_NAME_LENGTH) {
        qWarning() << "[QFATTreeCollector] Name too long:" << path;
        return fail(QFATImageError::SourceReadError, QString("name of %1 exceeds %2 characters").arg(path).arg(ENTRY_LFN_MAX_NAME_LENGTH),
                    error);
    }
    if (!QFATNameCodec::isValidLongName(name)) {
        qWarning() << "[QFATTreeCollector] Name not representable on FAT:" << path;
        return fail(QFATImageError::SourceReadError, QString("name of %1 cannot be stored on FAT").arg(path), error);
    }
    return true;
}
