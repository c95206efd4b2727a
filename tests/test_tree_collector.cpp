#include "../qfatimage.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QtTest/QtTest>

class TestTreeCollector : public QObject
{
    Q_OBJECT
private slots:
    // Host directories
    void testCollectTree();
    void testCollectMissingDirectory();
    void testCollectCaseCollision();
    void testSkipDirectoryLink();

    // In-memory trees
    void testNormalizeSorts();
    void testNormalizeRejectsInvalidName();
    void testTreeTotals();

private:
    void writeFile(const QString &path, const QByteArray &data);
};

void TestTreeCollector::writeFile(const QString &path, const QByteArray &data)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QCOMPARE(file.write(data), qint64(data.size()));
}

void TestTreeCollector::testCollectTree()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QVERIFY(QDir(dir.path()).mkpath("docs/nested"));
    writeFile(dir.filePath("zeta.txt"), "zeta");
    writeFile(dir.filePath("Alpha.txt"), "alpha!");
    writeFile(dir.filePath("docs/readme.md"), "# readme");
    writeFile(dir.filePath("docs/nested/empty.bin"), QByteArray());

    QFATTreeCollector collector;
    QFATTreeEntry root;
    QFATImageError error;
    QVERIFY(collector.collect(dir.path(), root, error));
    QCOMPARE(error, QFATImageError::None);

    QVERIFY(root.isDirectory);
    QCOMPARE(root.children.size(), 3);

    // Code unit order: upper case sorts before lower case
    QCOMPARE(root.children[0].name, QString("Alpha.txt"));
    QCOMPARE(root.children[1].name, QString("docs"));
    QCOMPARE(root.children[2].name, QString("zeta.txt"));

    QCOMPARE(root.children[0].size, quint64(6));
    QVERIFY(!root.children[0].isDirectory);
    QVERIFY(!root.children[0].sourcePath.isEmpty());

    const QFATTreeEntry &docs = root.children[1];
    QVERIFY(docs.isDirectory);
    QCOMPARE(docs.children.size(), 2);
    QCOMPARE(docs.children[0].name, QString("nested"));
    QCOMPARE(docs.children[1].name, QString("readme.md"));
    QCOMPARE(docs.children[0].children.size(), 1);
    QCOMPARE(docs.children[0].children[0].size, quint64(0));

    qDebug() << "Collected tree is ordered and complete";
}

void TestTreeCollector::testCollectMissingDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QFATTreeCollector collector;
    QFATTreeEntry root;
    QFATImageError error;
    QVERIFY(!collector.collect(dir.filePath("does-not-exist"), root, error));
    QCOMPARE(error, QFATImageError::SourceReadError);
    QCOMPARE(collector.lastError(), QFATImageError::SourceReadError);
}

void TestTreeCollector::testCollectCaseCollision()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    writeFile(dir.filePath("Readme.txt"), "a");
    writeFile(dir.filePath("README.TXT"), "b");
    if (QDir(dir.path()).entryList(QDir::Files).size() < 2) {
        QSKIP("Host filesystem is case-insensitive");
    }

    QFATTreeCollector collector;
    QFATTreeEntry root;
    QFATImageError error;
    QVERIFY(!collector.collect(dir.path(), root, error));
    QCOMPARE(error, QFATImageError::SourceReadError);
    QVERIFY(collector.errorDetail().contains("README.TXT") || collector.errorDetail().contains("Readme.txt"));

    qDebug() << "Names that collide without case are rejected";
}

void TestTreeCollector::testSkipDirectoryLink()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QVERIFY(QDir(dir.path()).mkpath("real"));
    writeFile(dir.filePath("real/file.txt"), "data");
    if (!QFile::link(dir.filePath("real"), dir.filePath("loop"))) {
        QSKIP("Symbolic links are not available");
    }

    QFATTreeCollector collector;
    QFATTreeEntry root;
    QFATImageError error;
    QVERIFY(collector.collect(dir.path(), root, error));

    QCOMPARE(root.children.size(), 1);
    QCOMPARE(root.children[0].name, QString("real"));
    QCOMPARE(root.fileCount(), 1);
}

void TestTreeCollector::testNormalizeSorts()
{
    QFATTreeEntry root = QFATTreeEntry::directory(QString());
    QFATTreeEntry sub = QFATTreeEntry::directory("sub");
    sub.children.append(QFATTreeEntry::file("b.txt", "b"));
    sub.children.append(QFATTreeEntry::file("a.txt", "a"));
    root.children.append(QFATTreeEntry::file("c.txt", "c"));
    root.children.append(sub);

    QFATTreeCollector collector;
    QFATImageError error;
    QVERIFY(collector.normalize(root, error));

    QCOMPARE(root.children[0].name, QString("c.txt"));
    QCOMPARE(root.children[1].name, QString("sub"));
    QCOMPARE(root.children[1].children[0].name, QString("a.txt"));
    QCOMPARE(root.children[1].children[1].name, QString("b.txt"));
}

void TestTreeCollector::testNormalizeRejectsInvalidName()
{
    QFATTreeEntry root = QFATTreeEntry::directory(QString());
    root.children.append(QFATTreeEntry::file("bad:name.txt", "x"));

    QFATTreeCollector collector;
    QFATImageError error;
    QVERIFY(!collector.normalize(root, error));
    QCOMPARE(error, QFATImageError::SourceReadError);

    QFATTreeEntry trailing = QFATTreeEntry::directory(QString());
    QFATTreeEntry sub = QFATTreeEntry::directory("notes");
    sub.children.append(QFATTreeEntry::file("draft.", "x"));
    trailing.children.append(sub);
    QVERIFY(!collector.normalize(trailing, error));
    QCOMPARE(error, QFATImageError::SourceReadError);
    QVERIFY(collector.errorDetail().contains("draft."));

    QFATTreeEntry spaced = QFATTreeEntry::directory(QString());
    spaced.children.append(QFATTreeEntry::directory("folder "));
    QVERIFY(!collector.normalize(spaced, error));
    QCOMPARE(error, QFATImageError::SourceReadError);

    QFATTreeEntry huge = QFATTreeEntry::directory(QString());
    QFATTreeEntry big = QFATTreeEntry::file("big.bin", QByteArray());
    big.size = Q_UINT64_C(0x100000000);
    huge.children.append(big);
    QVERIFY(!collector.normalize(huge, error));
    QCOMPARE(error, QFATImageError::FileTooLarge);
}

void TestTreeCollector::testTreeTotals()
{
    QFATTreeEntry root = QFATTreeEntry::directory(QString());
    QFATTreeEntry sub = QFATTreeEntry::directory("sub");
    sub.children.append(QFATTreeEntry::file("one", QByteArray(100, 'x')));
    root.children.append(sub);
    root.children.append(QFATTreeEntry::file("two", QByteArray(23, 'y')));

    QCOMPARE(root.totalFileBytes(), quint64(123));
    QCOMPARE(root.fileCount(), 2);
    QCOMPARE(root.directoryCount(), 2);
}

QTEST_MAIN(TestTreeCollector)
#include "test_tree_collector.moc"
