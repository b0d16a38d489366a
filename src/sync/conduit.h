#ifndef CONDUIT_H
#define CONDUIT_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>
#include "synctypes.h"
#include "../backup/sqlitedatabase.h"

class BackupIndex;

namespace PhoneSync {

class Reconciler;

/**
 * @brief Context passed to conduits during an ingestion run
 *
 * Contains everything a conduit needs to perform its import.
 */
class SyncContext
{
public:
    BackupIndex *index = nullptr;       ///< Open backup index (may be null with a source override)
    Reconciler *reconciler = nullptr;   ///< Writes records into the store
};

/**
 * @brief Abstract base class for record extractors
 *
 * A conduit handles one record category. It knows how to:
 *   - Locate its embedded database inside a backup
 *   - Read and decode rows into normalized records
 *   - Hand the resulting stream to the Reconciler
 *
 * A missing database is not an error: the run succeeds with zero records
 * and a SourceNotPresent warning.
 *
 * Conduits:
 *   - ContactConduit: AddressBook.sqlitedb -> ContactRecord
 *   - MessageConduit: sms.db -> MessageRecord
 *   - CallHistoryConduit: CallHistory.storedata -> CallRecord
 */
class Conduit : public QObject
{
    Q_OBJECT

public:
    explicit Conduit(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~Conduit() = default;

    // ========== Conduit Identity ==========

    /**
     * @brief Record category this conduit extracts
     */
    virtual Category category() const = 0;

    /**
     * @brief Unique identifier ("contacts", "messages", "calls")
     */
    QString conduitId() const { return categoryId(category()); }

    /**
     * @brief Human-readable name for display
     */
    virtual QString displayName() const = 0;

    /**
     * @brief Domain holding the source database inside the backup
     */
    virtual QString sourceDomain() const = 0;

    /**
     * @brief Relative path of the source database within its domain
     *
     * Its file name doubles as the suffix for the fallback lookup.
     */
    virtual QString sourceRelativePath() const = 0;

    /**
     * @brief File name of the source database ("sms.db", ...)
     */
    QString sourceFileName() const;

    /**
     * @brief Description of what this conduit does
     */
    virtual QString description() const { return QString(); }

    // ========== Dependency Ordering ==========

    /**
     * @brief Conduit IDs that this conduit must run AFTER
     *
     * Messages and calls run after contacts so they can be linked.
     */
    virtual QStringList runAfter() const { return {}; }

    // ========== Source Override ==========

    /**
     * @brief Read the source database from a plain file instead of the backup
     *
     * Used for databases copied off a device by other means.
     */
    void setSourcePath(const QString &path) { m_sourcePath = path; }
    QString sourcePath() const { return m_sourcePath; }
    bool hasSourceOverride() const { return !m_sourcePath.isEmpty(); }

    // ========== Core Sync Operation ==========

    /**
     * @brief Extract this category and reconcile it into the store
     *
     * @param context Sync context with index and reconciler
     * @return Result with counters and any warnings
     */
    virtual SyncResult sync(SyncContext *context);

    /**
     * @brief Check if conduit can sync with the given context
     */
    virtual bool canSync(const SyncContext *context) const;

    /**
     * @brief Set external cancel check callback
     *
     * Consulted between records. Returns true if cancellation requested.
     */
    void setCancelCheck(std::function<bool()> callback) { m_cancelCheck = callback; }

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

protected:
    /**
     * @brief Stream records and reconcile them
     *
     * Implementations call extract() and hand the stream to the reconciler,
     * filling result.import.
     */
    virtual void runImport(SyncContext *context, SyncResult &result) = 0;

    /**
     * @brief Tables the source database must contain
     */
    virtual QStringList requiredTables() const = 0;

    /**
     * @brief Find the source database file
     * @return Path, or empty if the backup does not contain it
     */
    QString locateSource(const SyncContext *context) const;

    /**
     * @brief Locate and open the source database read-only
     *
     * Adds a SourceNotPresent warning when absent. An unreadable file or
     * one missing the expected tables counts as one decode error.
     *
     * @return Open database, or nullptr if there is nothing to read
     */
    std::unique_ptr<SqliteDatabase> openSource(const SyncContext *context, SyncResult &result);

    /**
     * @brief Check if cancellation was requested
     */
    bool isCancelled() const { return m_cancelCheck && m_cancelCheck(); }

    std::function<bool()> m_cancelCheck;  ///< External cancellation check
    QString m_sourcePath;                 ///< Optional file override
};

} // namespace PhoneSync

#endif // CONDUIT_H
