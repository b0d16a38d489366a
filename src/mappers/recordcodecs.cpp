#include "recordcodecs.h"

#include <QCryptographicHash>
#include <QRegularExpression>
#include <cmath>

const QString RecordCodecs::UNKNOWN_IDENTITY = QStringLiteral("Unknown");

// Largest plausible seconds value (year ~2318); beyond this the column holds nanoseconds
static const qint64 MAX_VENDOR_SECONDS = 10000000000LL;

// ========== Time ==========

QDateTime RecordCodecs::vendorEpoch()
{
    return QDateTime::fromSecsSinceEpoch(VENDOR_EPOCH_OFFSET, Qt::UTC);
}

QDateTime RecordCodecs::fromVendorSeconds(double seconds)
{
    qint64 msecs = static_cast<qint64>(std::llround(seconds * 1000.0));
    return QDateTime::fromMSecsSinceEpoch(VENDOR_EPOCH_OFFSET * 1000 + msecs, Qt::UTC);
}

QDateTime RecordCodecs::fromVendorTimestamp(qint64 raw)
{
    if (raw > MAX_VENDOR_SECONDS || raw < -MAX_VENDOR_SECONDS) {
        qint64 msecs = raw / 1000000;
        return QDateTime::fromMSecsSinceEpoch(VENDOR_EPOCH_OFFSET * 1000 + msecs, Qt::UTC);
    }
    return fromVendorSeconds(static_cast<double>(raw));
}

double RecordCodecs::toVendorSeconds(const QDateTime &dateTime)
{
    return static_cast<double>(dateTime.toMSecsSinceEpoch() - VENDOR_EPOCH_OFFSET * 1000) / 1000.0;
}

// ========== Labels ==========

QString RecordCodecs::phoneLabel(int code)
{
    switch (code) {
    case 1: return "mobile";
    case 2: return "home";
    case 3: return "work";
    case 4: return "main";
    case 5: return "home fax";
    case 6: return "work fax";
    case 7: return "pager";
    default: return "other";
    }
}

QString RecordCodecs::emailLabel(int code)
{
    switch (code) {
    case 1: return "home";
    case 2: return "work";
    default: return "other";
    }
}

// ========== Identity ==========

bool RecordCodecs::isEmailHandle(const QString &handle)
{
    return handle.contains('@');
}

QString RecordCodecs::normalizePhone(const QString &handle)
{
    QString value = handle.trimmed();
    if (value.isEmpty()) {
        return UNKNOWN_IDENTITY;
    }

    if (isEmailHandle(value)) {
        return value.toLower();
    }

    if (value.startsWith("+1")) {
        value.remove(0, 2);
    } else if (value.startsWith('+')) {
        value.remove(0, 1);
    }

    static const QRegularExpression nonDigits("[^0-9]");
    value.remove(nonDigits);

    // Trunk prefix written without a plus ("1 (941) 518-0701")
    if (value.length() == 11 && value.startsWith('1')) {
        value.remove(0, 1);
    }

    if (value.length() == 10) {
        return QString("(%1) %2-%3").arg(value.left(3), value.mid(3, 3), value.mid(6));
    }

    return value.isEmpty() ? UNKNOWN_IDENTITY : value;
}

QString RecordCodecs::groupConversationKey(const QStringList &participants)
{
    QStringList normalized;
    for (const QString &participant : participants) {
        QString identity = normalizePhone(participant);
        if (!normalized.contains(identity)) {
            normalized << identity;
        }
    }
    normalized.sort();
    return "group:" + normalized.join(',');
}

// ========== Content ==========

QString RecordCodecs::normalizeContent(const QString &text)
{
    return text.simplified();
}

QString RecordCodecs::messageSignature(const QString &identity, const QString &content)
{
    QByteArray data = identity.trimmed().toUtf8();
    data.append('\x1f');
    data.append(normalizeContent(content).toUtf8());
    return QString::fromLatin1(QCryptographicHash::hash(data, QCryptographicHash::Sha1).toHex());
}

QString RecordCodecs::preview(const QString &text, int maxLength)
{
    QString line = normalizeContent(text);
    if (line.length() <= maxLength) {
        return line;
    }
    return line.left(maxLength - 3) + "...";
}
