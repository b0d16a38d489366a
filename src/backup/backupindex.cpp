#include "backupindex.h"
#include "sqlitedatabase.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFileInfo>
#include <QMap>
#include <QDebug>

using PhoneSync::ErrorCode;

BackupIndex::BackupIndex(const QString &backupRoot, QObject *parent)
    : QObject(parent)
    , m_backupRoot(backupRoot)
{
}

BackupIndex::~BackupIndex()
{
    close();
}

// ========== Lifecycle ==========

bool BackupIndex::open()
{
    close();
    m_lastError = ErrorCode::None;
    m_errorString.clear();
    m_manifest = BackupManifest();
    m_entries.clear();

    if (m_backupRoot.isEmpty()) {
        return fail(ErrorCode::ManifestUnavailable, "No backup location configured");
    }

    QString manifestPath = QDir(m_backupRoot).filePath(manifestFileName());
    if (!QFileInfo::exists(manifestPath)) {
        return fail(ErrorCode::ManifestUnavailable,
                    QString("%1 not found in backup: %2").arg(manifestFileName(), m_backupRoot));
    }

    m_db.reset(new SqliteDatabase());
    if (!m_db->open(manifestPath, SqliteDatabase::OpenMode::ReadOnly)) {
        QString error = m_db->errorString();
        m_db.reset();
        return fail(ErrorCode::ManifestUnavailable, error);
    }

    if (!readPreferences()) {
        return false;
    }

    if (m_manifest.encrypted) {
        return fail(ErrorCode::BackupEncrypted,
                    QString("Backup of %1 is encrypted, encrypted backups are not supported")
                        .arg(m_manifest.deviceName));
    }

    if (!readEntries()) {
        return false;
    }

    qDebug() << "[BackupIndex] Opened" << m_backupRoot << "device" << m_manifest.deviceName
             << "iOS" << m_manifest.osVersion << "entries" << m_entries.size();
    emit logMessage(QString("Opened backup of %1 (%2 files)")
        .arg(m_manifest.deviceName).arg(m_entries.size()));
    return true;
}

void BackupIndex::close()
{
    if (m_db) {
        m_db->close();
        m_db.reset();
        qDebug() << "[BackupIndex] Closed" << m_backupRoot;
    }
}

bool BackupIndex::isOpen() const
{
    return m_db && m_db->isOpen();
}

bool BackupIndex::fail(ErrorCode code, const QString &message)
{
    m_lastError = code;
    m_errorString = message;
    close();
    qWarning() << "[BackupIndex]" << message;
    emit errorOccurred(message);
    return false;
}

bool BackupIndex::readPreferences()
{
    // Older containers carry no metadata table, defaults apply
    QMap<QString, QString> values;
    if (m_db->hasTable("Preferences")) {
        SqliteStatement stmt = m_db->prepare("SELECT key, value FROM Preferences");
        while (stmt.step()) {
            values.insert(stmt.columnText(0), stmt.columnText(1));
        }
        if (stmt.hasError()) {
            return fail(ErrorCode::ManifestUnavailable, stmt.errorString());
        }
    }

    m_manifest.version = values.value("Version");
    if (m_manifest.version.isEmpty()) {
        m_manifest.version = "0.0";
    }

    m_manifest.deviceName = values.value("Device Name");
    if (m_manifest.deviceName.isEmpty()) {
        m_manifest.deviceName = "Unknown iPhone";
    }

    m_manifest.deviceId = values.value("Unique Identifier");

    m_manifest.osVersion = values.value("Product Version");
    if (m_manifest.osVersion.isEmpty()) {
        m_manifest.osVersion = "Unknown";
    }

    QString date = values.value("Date");
    bool numeric = false;
    qint64 unixSeconds = date.toLongLong(&numeric);
    if (numeric) {
        m_manifest.date = QDateTime::fromSecsSinceEpoch(unixSeconds, Qt::UTC);
    } else {
        m_manifest.date = QDateTime::fromString(date, Qt::ISODate);
    }
    if (!m_manifest.date.isValid()) {
        m_manifest.date = QDateTime::currentDateTimeUtc();
    }

    QString encrypted = values.value("IsEncrypted").trimmed();
    m_manifest.encrypted = encrypted == "1" || encrypted.compare("true", Qt::CaseInsensitive) == 0;

    return true;
}

bool BackupIndex::readEntries()
{
    if (!m_db->hasTable("Files")) {
        return fail(ErrorCode::ManifestUnavailable,
                    QString("%1 has no Files table").arg(manifestFileName()));
    }

    bool hasDomain = m_db->hasColumn("Files", "domain");
    SqliteStatement stmt = m_db->prepare(hasDomain
        ? "SELECT fileID, domain, relativePath FROM Files"
        : "SELECT fileID, '', relativePath FROM Files");

    while (stmt.step()) {
        Entry entry;
        entry.fileId = stmt.columnText(0).toLower();
        entry.domain = stmt.columnText(1);
        entry.relativePath = stmt.columnText(2);
        if (entry.fileId.isEmpty() || entry.relativePath.isEmpty()) {
            continue;
        }
        m_entries.append(entry);
    }

    if (stmt.hasError()) {
        return fail(ErrorCode::ManifestUnavailable, stmt.errorString());
    }
    return true;
}

// ========== Resolution ==========

QString BackupIndex::resolve(const QString &suffix) const
{
    if (suffix.isEmpty()) {
        return QString();
    }

    const Entry *best = nullptr;
    for (const Entry &entry : m_entries) {
        if (!entry.relativePath.endsWith(suffix, Qt::CaseInsensitive)) {
            continue;
        }
        if (!best
            || entry.relativePath.size() < best->relativePath.size()
            || (entry.relativePath.size() == best->relativePath.size()
                && entry.relativePath < best->relativePath)) {
            best = &entry;
        }
    }

    if (!best) {
        qDebug() << "[BackupIndex] No entry ends with" << suffix;
        return QString();
    }

    QString path = existingBlob(best->fileId);
    if (path.isEmpty()) {
        qWarning() << "[BackupIndex] Entry" << best->relativePath
                   << "listed but blob" << best->fileId << "is missing";
    }
    return path;
}

QString BackupIndex::resolveDomainPath(const QString &domain, const QString &relativePath) const
{
    QString fileId;

    if (isOpen() && m_db->hasColumn("Files", "domain")) {
        SqliteStatement stmt = m_db->prepare(
            "SELECT fileID FROM Files WHERE domain = ?1 AND relativePath = ?2");
        stmt.bind(1, domain);
        stmt.bind(2, relativePath);
        if (stmt.step()) {
            fileId = stmt.columnText(0).toLower();
        }
    }

    if (fileId.isEmpty()) {
        fileId = fileIdFor(domain, relativePath);
    }

    return existingBlob(fileId);
}

QString BackupIndex::blobPath(const QString &fileId) const
{
    if (fileId.size() < 2) {
        return QString();
    }
    QString id = fileId.toLower();
    return QDir(m_backupRoot).filePath(id.left(2) + "/" + id);
}

QString BackupIndex::existingBlob(const QString &fileId) const
{
    QString path = blobPath(fileId);
    if (path.isEmpty() || !QFileInfo(path).isFile()) {
        return QString();
    }
    return path;
}

QString BackupIndex::fileIdFor(const QString &domain, const QString &relativePath)
{
    QByteArray key = (domain + "-" + relativePath).toUtf8();
    return QString::fromLatin1(QCryptographicHash::hash(key, QCryptographicHash::Sha1).toHex());
}
