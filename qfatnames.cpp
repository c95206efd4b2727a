#include <cstring>

#include <QByteArray>
#include <QDebug>
#include <QString>
#include <QtEndian>

#include "internal_constants.h"
#include "qfatimage.h"

// ============================================================================
// QFATNameCodec
// ============================================================================

// Characters allowed in a short name besides A-Z and 0-9
static const char SHORT_NAME_SPECIALS[] = "$%'-_@~`!(){}^#&";
// Characters a long name may not contain besides control characters
static const char LONG_NAME_FORBIDDEN[] = "\"*/:<>?\\|";

static bool isShortChar(QChar ch)
{
    ushort code = ch.unicode();
    if (code >= 0x80) {
        return false;
    }
    if ((code >= 'A' && code <= 'Z') || (code >= 'a' && code <= 'z') || (code >= '0' && code <= '9')) {
        return true;
    }
    return qstrchr(SHORT_NAME_SPECIALS, static_cast<char>(code)) != nullptr;
}

bool QFATNameCodec::isValidLongName(const QString &name)
{
    if (name.isEmpty() || name.length() > ENTRY_LFN_MAX_NAME_LENGTH) {
        return false;
    }
    // Readers strip trailing dots and spaces on lookup
    if (name.endsWith('.') || name.endsWith(' ')) {
        return false;
    }
    for (const QChar &ch : name) {
        if (ch.unicode() < 0x20) {
            return false;
        }
        if (ch.unicode() < 0x80 && qstrchr(LONG_NAME_FORBIDDEN, static_cast<char>(ch.unicode())) != nullptr) {
            return false;
        }
    }
    return true;
}

bool QFATNameCodec::fitsShortName(const QString &name, quint8 &caseFlags)
{
    caseFlags = 0;

    int dotPos = name.indexOf('.');
    if (dotPos != name.lastIndexOf('.')) {
        return false;
    }

    QString base = (dotPos >= 0) ? name.left(dotPos) : name;
    QString ext = (dotPos >= 0) ? name.mid(dotPos + 1) : QString();

    if (base.isEmpty() || base.length() > ENTRY_BASE_LENGTH || ext.length() > ENTRY_EXTENSION_LENGTH) {
        return false;
    }
    if (dotPos >= 0 && ext.isEmpty()) {
        return false;
    }

    // Each part may be all upper or all lower case, never mixed
    auto partCase = [](const QString &part, bool &lower, bool &upper) -> bool {
        lower = false;
        upper = false;
        for (const QChar &ch : part) {
            if (!isShortChar(ch)) {
                return false;
            }
            if (ch.unicode() >= 'a' && ch.unicode() <= 'z') {
                lower = true;
            } else if (ch.unicode() >= 'A' && ch.unicode() <= 'Z') {
                upper = true;
            }
        }
        return !(lower && upper);
    };

    bool baseLower, baseUpper, extLower, extUpper;
    if (!partCase(base, baseLower, baseUpper) || !partCase(ext, extLower, extUpper)) {
        return false;
    }

    if (baseLower) {
        caseFlags |= ENTRY_CASE_LOWER_BASE;
    }
    if (extLower) {
        caseFlags |= ENTRY_CASE_LOWER_EXTENSION;
    }
    return true;
}

bool QFATNameCodec::isPlainShortName(const QString &name)
{
    quint8 caseFlags = 0;
    return fitsShortName(name, caseFlags) && caseFlags == 0;
}

QByteArray QFATNameCodec::packShortName(const QString &name)
{
    QByteArray packed(ENTRY_NAME_LENGTH, ' ');
    QString upper = name.toUpper();
    int dotPos = upper.indexOf('.');

    QString base = (dotPos >= 0) ? upper.left(dotPos) : upper;
    for (int i = 0; i < base.length() && i < ENTRY_BASE_LENGTH; i++) {
        packed[i] = base[i].toLatin1();
    }

    if (dotPos >= 0) {
        QString ext = upper.mid(dotPos + 1);
        for (int i = 0; i < ext.length() && i < ENTRY_EXTENSION_LENGTH; i++) {
            packed[ENTRY_BASE_LENGTH + i] = ext[i].toLatin1();
        }
    }

    return packed;
}

bool QFATNameCodec::generateShortName(const QString &longName, const QSet<QByteArray> &usedNames, QByteArray &shortName,
                                      QFATImageError &error)
{
    error = QFATImageError::None;

    // Leading periods and all spaces are dropped from the basis name
    QString upper = longName.toUpper();
    int start = 0;
    while (start < upper.length() && upper[start] == '.') {
        start++;
    }

    QString stripped;
    for (int i = start; i < upper.length(); i++) {
        if (upper[i] != ' ') {
            stripped.append(upper[i]);
        }
    }

    int dotPos = stripped.lastIndexOf('.');
    QString base = (dotPos >= 0) ? stripped.left(dotPos) : stripped;
    QString ext = (dotPos >= 0) ? stripped.mid(dotPos + 1) : QString();
    base.remove('.');

    // Anything outside the short-name character set becomes '_'
    auto toBasis = [](const QString &part, int limit) -> QByteArray {
        QByteArray result;
        for (const QChar &ch : part) {
            if (result.size() >= limit) {
                break;
            }
            if (ch.isLowSurrogate()) {
                continue;
            }
            result.append(isShortChar(ch) ? ch.toLatin1() : '_');
        }
        return result;
    };

    QByteArray baseBytes = toBasis(base, ENTRY_BASE_LENGTH);
    QByteArray extBytes = toBasis(ext, ENTRY_EXTENSION_LENGTH);
    if (baseBytes.isEmpty()) {
        baseBytes = "_";
    }

    for (int tailNum = 1; tailNum <= ENTRY_ALIAS_MAX_TAIL; tailNum++) {
        QByteArray tail = "~" + QByteArray::number(tailNum);
        QByteArray candidate = baseBytes.left(ENTRY_BASE_LENGTH - tail.size()) + tail;
        candidate = candidate.leftJustified(ENTRY_BASE_LENGTH, ' ') + extBytes.leftJustified(ENTRY_EXTENSION_LENGTH, ' ');

        if (!usedNames.contains(candidate)) {
            shortName = candidate;
            return true;
        }
    }

    qWarning() << "[generateShortName] No numeric tail left for" << longName;
    error = QFATImageError::NameSpaceExhausted;
    return false;
}

QString QFATNameCodec::shortNameToString(const quint8 *entry)
{
    quint8 caseFlags = entry[ENTRY_CASE_OFFSET];

    // Read 8.3 filename (remove trailing spaces)
    QString base;
    int nameEnd = ENTRY_BASE_LENGTH - 1;
    while (nameEnd >= 0 && entry[nameEnd] == ' ')
        nameEnd--;
    for (int i = 0; i <= nameEnd; i++) {
        quint8 ch = (i == 0 && entry[i] == ENTRY_KANJI_E5) ? ENTRY_DELETED : entry[i];
        base.append(QChar(ch));
    }

    QString ext;
    int extEnd = ENTRY_NAME_LENGTH - 1;
    while (extEnd >= ENTRY_BASE_LENGTH && entry[extEnd] == ' ')
        extEnd--;
    for (int i = ENTRY_BASE_LENGTH; i <= extEnd; i++) {
        ext.append(QChar(entry[i]));
    }

    if (caseFlags & ENTRY_CASE_LOWER_BASE) {
        base = base.toLower();
    }
    if (caseFlags & ENTRY_CASE_LOWER_EXTENSION) {
        ext = ext.toLower();
    }

    if (ext.isEmpty()) {
        return base;
    }
    return base + '.' + ext;
}

// Calculate LFN checksum for an 11-byte space-padded short name
quint8 QFATNameCodec::calculateLFNChecksum(const QByteArray &shortName)
{
    quint8 checksum = 0;
    for (int i = 0; i < ENTRY_NAME_LENGTH; i++) {
        quint8 ch = (i < shortName.size()) ? static_cast<quint8>(shortName[i]) : ' ';
        checksum = ((checksum & 1) << 7) + (checksum >> 1) + ch;
    }
    return checksum;
}

// Calculate how many LFN entries are needed for a long name
int QFATNameCodec::calculateLFNEntriesNeeded(const QString &longName)
{
    // Each LFN entry holds 13 characters
    return (longName.length() + 12) / 13;
}

// Write a single LFN entry
void QFATNameCodec::writeLFNEntry(quint8 *entry, const QString &longName, int sequence, quint8 checksum, bool isLast)
{
    memset(entry, 0, ENTRY_SIZE);

    // Set sequence number (1-based, with 0x40 flag for last entry)
    entry[ENTRY_NAME_OFFSET] = static_cast<quint8>(sequence);
    if (isLast) {
        entry[ENTRY_NAME_OFFSET] |= ENTRY_LFN_SEQUENCE_LAST_MASK;
    }

    entry[ENTRY_ATTRIBUTE_OFFSET] = ENTRY_ATTRIBUTE_LONG_FILE_NAME;
    entry[ENTRY_LFN_CHECKSUM_OFFSET] = checksum;

    int startPos = (sequence - ENTRY_LFN_SEQUENCE_START) * ENTRY_LFN_CHARS;
    int length = longName.length();

    // A name that ends inside the entry is terminated by 0x0000, then padded with 0xFFFF
    auto charAt = [&](int index) -> quint16 {
        if (index < length) {
            return longName[index].unicode();
        }
        return (index == length) ? 0x0000 : 0xFFFF;
    };

    // Part 1: 5 characters at offset 0x01
    for (int i = 0; i < ENTRY_LFN_PART1_LENGTH / 2; i++) {
        qToLittleEndian<quint16>(charAt(startPos + i), entry + ENTRY_LFN_PART1_OFFSET + i * 2);
    }

    // Part 2: 6 characters at offset 0x0E
    for (int i = 0; i < ENTRY_LFN_PART2_LENGTH / 2; i++) {
        qToLittleEndian<quint16>(charAt(startPos + 5 + i), entry + ENTRY_LFN_PART2_OFFSET + i * 2);
    }

    // Part 3: 2 characters at offset 0x1C
    for (int i = 0; i < ENTRY_LFN_PART3_LENGTH / 2; i++) {
        qToLittleEndian<quint16>(charAt(startPos + 11 + i), entry + ENTRY_LFN_PART3_OFFSET + i * 2);
    }
}

QString QFATNameCodec::readLongFileName(const quint8 *entry)
{
    quint16 chars[ENTRY_LFN_CHARS];
    int pos = 0;

    for (int i = 0; i < ENTRY_LFN_PART1_LENGTH / 2; i++) {
        chars[pos++] = qFromLittleEndian<quint16>(entry + ENTRY_LFN_PART1_OFFSET + i * 2);
    }
    for (int i = 0; i < ENTRY_LFN_PART2_LENGTH / 2; i++) {
        chars[pos++] = qFromLittleEndian<quint16>(entry + ENTRY_LFN_PART2_OFFSET + i * 2);
    }
    for (int i = 0; i < ENTRY_LFN_PART3_LENGTH / 2; i++) {
        chars[pos++] = qFromLittleEndian<quint16>(entry + ENTRY_LFN_PART3_OFFSET + i * 2);
    }

    // Stop at null terminator or 0xFFFF
    QString name;
    for (int i = 0; i < ENTRY_LFN_CHARS; i++) {
        if (chars[i] == 0x0000 || chars[i] == 0xFFFF)
            break;
        name.append(QChar(chars[i]));
    }

    return name;
}

void QFATNameCodec::writeShortEntry(quint8 *entry, const QByteArray &shortName, quint8 attributes, quint8 caseFlags,
                                    quint32 cluster, quint32 size, const QDateTime &modified)
{
    memset(entry, 0, ENTRY_SIZE);

    for (int i = 0; i < ENTRY_NAME_LENGTH; i++) {
        entry[ENTRY_NAME_OFFSET + i] = (i < shortName.size()) ? static_cast<quint8>(shortName[i]) : ' ';
    }
    // 0xE5 would mark the entry deleted
    if (entry[ENTRY_NAME_OFFSET] == ENTRY_DELETED) {
        entry[ENTRY_NAME_OFFSET] = ENTRY_KANJI_E5;
    }

    entry[ENTRY_ATTRIBUTE_OFFSET] = attributes;
    entry[ENTRY_CASE_OFFSET] = caseFlags;

    quint16 date, time;
    quint8 tenths;
    encodeFATDateTime(modified, date, time, tenths);

    entry[ENTRY_CREATION_TENTHS_OFFSET] = tenths;
    qToLittleEndian<quint16>(time, entry + ENTRY_CREATION_DATE_TIME_OFFSET);
    qToLittleEndian<quint16>(date, entry + ENTRY_CREATION_DATE_TIME_OFFSET + 2);
    qToLittleEndian<quint16>(date, entry + ENTRY_ACCESSED_DATE_OFFSET);
    qToLittleEndian<quint16>(time, entry + ENTRY_WRITTEN_DATE_TIME_OFFSET);
    qToLittleEndian<quint16>(date, entry + ENTRY_WRITTEN_DATE_TIME_OFFSET + 2);

    // FAT32 splits the first cluster into high and low words
    qToLittleEndian<quint16>(static_cast<quint16>((cluster >> 16) & 0xFFFF), entry + ENTRY_HIGH_ORDER_CLUSTER_ADDRESS_OFFSET);
    qToLittleEndian<quint16>(static_cast<quint16>(cluster & 0xFFFF), entry + ENTRY_CLUSTER_OFFSET);

    qToLittleEndian<quint32>(size, entry + ENTRY_SIZE_OFFSET);
}

void QFATNameCodec::encodeFATDateTime(const QDateTime &dt, quint16 &date, quint16 &time, quint8 &tenths)
{
    // FAT date format: bits 0-4: day (1-31), bits 5-8: month (1-12), bits 9-15: year-1980
    // FAT time format: bits 0-4: seconds/2 (0-29), bits 5-10: minute (0-59), bits 11-15: hour (0-23)
    if (!dt.isValid()) {
        date = 0;
        time = 0;
        tenths = 0;
        return;
    }

    QDateTime local = dt.toLocalTime();
    QDate d = local.date();
    QTime t = local.time();

    if (d.year() < ENTRY_DATE_TIME_START_OF_YEAR) {
        d = QDate(ENTRY_DATE_TIME_START_OF_YEAR, 1, 1);
        t = QTime(0, 0, 0);
    } else if (d.year() > ENTRY_DATE_TIME_END_OF_YEAR) {
        d = QDate(ENTRY_DATE_TIME_END_OF_YEAR, 12, 31);
        t = QTime(23, 59, 58);
    }

    int year = d.year() - ENTRY_DATE_TIME_START_OF_YEAR;

    date = (d.day() & MASK_5_BITS) | ((d.month() & MASK_4_BITS) << 5) | ((year & MASK_7_BITS) << 9);
    time = ((t.second() / 2) & MASK_5_BITS) | ((t.minute() & MASK_6_BITS) << 5) | ((t.hour() & MASK_5_BITS) << 11);
    tenths = static_cast<quint8>((t.second() % 2) * 100 + t.msec() / 10);
}

QDateTime QFATNameCodec::parseDateTime(quint16 date, quint16 time)
{
    if (date == 0) {
        return QDateTime();
    }

    int year = ENTRY_DATE_TIME_START_OF_YEAR + ((date >> 9) & MASK_7_BITS);
    int month = (date >> 5) & MASK_4_BITS;
    int day = date & MASK_5_BITS;
    int hour = (time >> 11) & MASK_5_BITS;
    int minute = (time >> 5) & MASK_6_BITS;
    int second = (time & MASK_5_BITS) * 2;
    return QDateTime(QDate(year, month, day), QTime(hour, minute, second));
}
