#ifndef SYNCCOORDINATOR_H
#define SYNCCOORDINATOR_H

#include <QObject>
#include <QString>
#include <QList>
#include <QMap>
#include <QMutex>
#include <atomic>
#include <functional>
#include "synctypes.h"
#include "syncstate.h"
#include "conduit.h"
#include "../backup/backupindex.h"
#include "../profile.h"

namespace PhoneSync {

class RecordStore;
class Reconciler;

/**
 * @brief Lifecycle of one record category
 *
 * Idle -> Running -> CooldownWait -> Idle. CooldownWait ends on its own
 * once the category's cooldown has elapsed since its last completed run.
 */
enum class CategoryState {
    Idle,
    Running,
    CooldownWait
};

QString categoryStateName(CategoryState state);

/**
 * @brief Main ingestion orchestrator
 *
 * The SyncCoordinator coordinates:
 *   - Conduit registration and execution
 *   - The record store and its reconciler
 *   - Per-category mutual exclusion and cooldowns
 *   - Run history (SyncState)
 *   - Progress reporting
 *
 * At most one run per category is active at any time. startSync() may be
 * called from several threads; a call for a category that is already
 * running returns AlreadyRunning, a call inside the cooldown returns
 * CooldownActive. Neither is retried.
 *
 * Usage:
 * @code
 * SyncCoordinator coordinator;
 *
 * SqliteRecordStore *store = new SqliteRecordStore(profile.storeDatabasePath());
 * store->open();
 * coordinator.setStore(store);
 *
 * coordinator.registerConduit(new ContactConduit());
 * coordinator.registerConduit(new MessageConduit());
 * coordinator.registerConduit(new CallHistoryConduit());
 *
 * coordinator.applyProfile(profile);
 * coordinator.setBackupPath("/path/to/backup");
 *
 * coordinator.syncAll();
 * @endcode
 */
class SyncCoordinator : public QObject
{
    Q_OBJECT

public:
    explicit SyncCoordinator(QObject *parent = nullptr);
    ~SyncCoordinator();

    // ========== Store ==========

    /**
     * @brief Set the record store
     *
     * The coordinator takes ownership of the store and creates the
     * reconciler that writes into it. Rejected while any category is
     * running, in which case the caller keeps ownership.
     */
    bool setStore(RecordStore *store);
    RecordStore *store() const { return m_store; }
    Reconciler *reconciler() const { return m_reconciler; }

    // ========== Conduit Management ==========

    /**
     * @brief Register the conduit for a category
     *
     * The coordinator takes ownership of the conduit. A conduit already
     * registered for the same category is replaced. Rejected while any
     * category is running, in which case the caller keeps ownership.
     */
    bool registerConduit(Conduit *conduit);

    /**
     * @brief Remove and delete the conduit of a category
     * @return false while any category is running or if none is registered
     */
    bool unregisterConduit(Category category);
    Conduit *conduit(Category category) const;
    QList<Category> registeredCategories() const;

    bool isCategoryEnabled(Category category) const;
    void setCategoryEnabled(Category category, bool enabled);

    // ========== Configuration ==========

    /**
     * @brief Backup root directory to ingest
     */
    void setBackupPath(const QString &path);
    QString backupPath() const;

    /**
     * @brief Minimum interval between two runs of a category
     */
    void setCooldownSeconds(Category category, int seconds);
    int cooldownSeconds(Category category) const;

    /**
     * @brief Message dedup window handed to the reconciler
     */
    void setDedupWindowSeconds(int seconds);
    int dedupWindowSeconds() const { return m_dedupWindowSeconds; }

    /**
     * @brief Device the backups are expected to come from
     *
     * A backup from another device still imports, with a warning.
     */
    void setExpectedFingerprint(const DeviceFingerprint &fingerprint);

    /**
     * @brief Clock used for cooldown measurement and run timestamps
     */
    void setClock(std::function<QDateTime()> clock);

    /**
     * @brief Take enable flags, cooldowns, dedup window, state directory,
     *        fingerprint and last backup path from a profile
     */
    void applyProfile(const Profile &profile);

    /**
     * @brief Set the sync state directory and reload run history from it
     * @return false while any category is running
     */
    bool setStateDirectory(const QString &path);

    /**
     * @brief Get the run history for a category
     */
    SyncState *stateForCategory(Category category);

    // ========== State Machine ==========

    CategoryState state(Category category) const;
    bool isRunning(Category category) const { return state(category) == CategoryState::Running; }

    /**
     * @brief Seconds left before the category may run again, 0 if none
     */
    int cooldownRemaining(Category category) const;

    /**
     * @brief Manifest of the last backup opened
     */
    BackupManifest lastManifest() const;

    // ========== Emergency Mode ==========

    static const int MESSAGE_SPIKE_THRESHOLD = 100;     ///< Growth that counts as a spike
    static const int MESSAGE_LIMIT = 10000;             ///< Store size that triggers emergency mode
    static const int EMERGENCY_COOLDOWN_FACTOR = 10;    ///< Cooldown multiplier in emergency mode

    /**
     * @brief Report the number of stored messages
     *
     * Called after every message run. Growth by more than
     * MESSAGE_SPIKE_THRESHOLD since the last report emits
     * messageSpikeDetected(); a count above MESSAGE_LIMIT activates
     * emergency mode.
     */
    void updateMessageCount(int count);
    int lastMessageCount() const;

    /**
     * @brief Multiply every cooldown by EMERGENCY_COOLDOWN_FACTOR
     *
     * Also releases all sync locks. Cooldowns already running are
     * extended as well, since they are measured from the last run.
     */
    void activateEmergencyMode();

    /**
     * @brief Restore the configured cooldowns
     */
    void deactivateEmergencyMode();
    bool isEmergencyMode() const;

    /**
     * @brief Ask every running category to stop
     *
     * Each run leaves Running once it notices the cancellation, keeping
     * what it already committed. Idle categories are unaffected.
     *
     * @return Number of categories that were running
     */
    int releaseAllSyncLocks();

    // ========== Sync Operations ==========

    /**
     * @brief Run one category
     *
     * Opens the backup index (unless the conduit reads an override file),
     * extracts and reconciles, then enters the cooldown.
     */
    SyncResult startSync(Category category);

    /**
     * @brief Run every enabled category in dependency order
     *
     * The backup index is opened once for all categories. A fatal index
     * error aborts the whole run.
     */
    QList<SyncResult> syncAll();

    /**
     * @brief Remove accumulated duplicate messages
     *
     * Runs outside the category state machine.
     */
    CleanupReport emergencyCleanup();

    /**
     * @brief Cancel running syncs
     *
     * Checked between records. Committed records are kept.
     */
    void cancelSync();

    /**
     * @brief Set external cancel check callback
     */
    void setCancelCheck(std::function<bool()> callback);

signals:
    void syncStarted();
    void syncFinished();
    void categoryStarted(PhoneSync::Category category);
    void categoryFinished(PhoneSync::Category category, const PhoneSync::SyncResult &result);
    void progressUpdated(int current, int total, const QString &message);
    void messageSpikeDetected(int previous, int current);
    void emergencyModeActivated();
    void emergencyModeDeactivated();
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    struct Runtime {
        bool running = false;
        QDateTime lastCompleted;
    };

    /**
     * @brief Enter Running, or fill result with the rejection
     */
    bool acquire(Category category, SyncResult &result);

    /**
     * @brief Leave Running and record the run
     */
    void release(Category category, SyncResult &result);

    SyncResult runCategory(Category category, BackupIndex *sharedIndex);
    bool openIndex(BackupIndex *index, SyncResult &result);
    QString checkFingerprint(const BackupManifest &manifest) const;

    SyncState *stateLocked(Category category);
    qint64 cooldownRemainingMsLocked(Category category) const;
    bool anyRunningLocked() const;

    /**
     * @brief Emit a rejection for a call that would pull objects from under a run
     */
    bool rejectWhileRunning(const QString &operation);
    QDateTime now() const;
    bool isCancelled() const;

    Conduit *conduitById(const QString &conduitId) const;
    void connectConduitSignals(Conduit *conduit);

    /**
     * @brief Resolve conduit execution order based on dependencies
     *
     * Uses topological sort so that every conduit runs after the
     * conduits named by its runAfter().
     */
    QStringList resolveConduitOrder(const QStringList &conduitIds);

    /**
     * @brief Check for circular dependencies in conduit ordering
     * @return Empty string if OK, or error message describing the cycle
     */
    QString checkCircularDependencies(const QStringList &conduitIds);

    mutable QMutex m_mutex;

    RecordStore *m_store = nullptr;
    Reconciler *m_reconciler = nullptr;

    QMap<Category, Conduit*> m_conduits;
    QMap<Category, bool> m_enabled;
    QMap<Category, int> m_cooldownSeconds;
    QMap<Category, Runtime> m_runtime;
    QMap<Category, SyncState*> m_states;

    QString m_backupPath;
    QString m_stateDirectory;
    int m_dedupWindowSeconds = 0;
    int m_messageCount = 0;
    bool m_emergencyMode = false;
    DeviceFingerprint m_expectedFingerprint;
    BackupManifest m_lastManifest;
    std::function<QDateTime()> m_clock;

    std::atomic<bool> m_cancelled{false};
    std::function<bool()> m_cancelCheck;
};

} // namespace PhoneSync

#endif // SYNCCOORDINATOR_H
