#ifndef BACKUPINDEX_H
#define BACKUPINDEX_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QList>
#include <memory>
#include "../sync/synctypes.h"

class SqliteDatabase;

/**
 * @brief Device metadata read from the backup index
 */
struct BackupManifest
{
    QString version;        ///< Backup format version ("0.0" if absent)
    QDateTime date;         ///< When the backup was taken
    QString deviceName;     ///< "Unknown iPhone" if absent
    QString deviceId;       ///< Unique Identifier, empty if absent
    QString osVersion;      ///< Product Version, "Unknown" if absent
    bool encrypted = false;
};

/**
 * @brief Read-only view of a device backup container
 *
 * A container is a directory holding Manifest.db plus content-addressed
 * blobs. Each logical file (domain + relative path) is stored at
 * <root>/<first two hex chars of fileID>/<fileID>, where the fileID is
 * the SHA-1 of "<domain>-<relativePath>".
 *
 * The index handle stays open from open() until close() or destruction.
 */
class BackupIndex : public QObject
{
    Q_OBJECT

public:
    struct Entry {
        QString fileId;
        QString domain;
        QString relativePath;
    };

    explicit BackupIndex(const QString &backupRoot, QObject *parent = nullptr);
    ~BackupIndex();

    QString backupRoot() const { return m_backupRoot; }

    // ========== Lifecycle ==========

    /**
     * @brief Open the index and read manifest metadata and file entries
     *
     * Fails with ManifestUnavailable if Manifest.db is missing or not a
     * readable database, and with BackupEncrypted if the container is
     * encrypted.
     */
    bool open();

    /**
     * @brief Release the index handle
     */
    void close();

    bool isOpen() const;

    PhoneSync::ErrorCode lastError() const { return m_lastError; }
    QString errorString() const { return m_errorString; }

    // ========== Metadata ==========

    BackupManifest manifest() const { return m_manifest; }

    int entryCount() const { return m_entries.size(); }

    // ========== Resolution ==========

    /**
     * @brief Resolve a logical path suffix to a blob on disk
     *
     * Matching is case-insensitive. When several paths end with the
     * suffix, the shortest wins, then the lexicographically smallest.
     *
     * @return Absolute blob path, or empty if no entry matches or the
     *         blob is missing from the container
     */
    QString resolve(const QString &suffix) const;

    /**
     * @brief Resolve an exact domain and relative path
     * @return Absolute blob path, or empty if not present
     */
    QString resolveDomainPath(const QString &domain, const QString &relativePath) const;

    /**
     * @brief Location a blob with the given fileID would have
     */
    QString blobPath(const QString &fileId) const;

    /**
     * @brief Compute the fileID for a domain-qualified path
     */
    static QString fileIdFor(const QString &domain, const QString &relativePath);

    /**
     * @brief Name of the index database inside a container
     */
    static QString manifestFileName() { return QStringLiteral("Manifest.db"); }

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    bool fail(PhoneSync::ErrorCode code, const QString &message);
    bool readPreferences();
    bool readEntries();
    QString existingBlob(const QString &fileId) const;

    QString m_backupRoot;
    std::unique_ptr<SqliteDatabase> m_db;
    BackupManifest m_manifest;
    QList<Entry> m_entries;

    PhoneSync::ErrorCode m_lastError = PhoneSync::ErrorCode::None;
    QString m_errorString;
};

#endif // BACKUPINDEX_H
