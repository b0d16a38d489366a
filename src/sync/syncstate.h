#ifndef SYNCSTATE_H
#define SYNCSTATE_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QList>
#include <QJsonObject>
#include "synctypes.h"

namespace PhoneSync {

/**
 * @brief Summary of one completed category run
 */
struct RunRecord {
    QDateTime startTime;
    QDateTime endTime;
    bool success = false;
    ErrorCode errorCode = ErrorCode::None;
    int imported = 0;
    int updated = 0;
    int skipped = 0;
    int errors = 0;
    int warnings = 0;
};

/**
 * @brief Persistent run history for one record category
 *
 * Lets the coordinator measure cooldowns across process restarts and lets
 * a UI show when each category last ran.
 *
 * State is stored in:
 *   <stateBaseDir>/<category>/state.json
 */
class SyncState : public QObject
{
    Q_OBJECT

public:
    /// Number of runs kept in the history
    static const int MAX_HISTORY = 20;

    /**
     * @brief Construct a SyncState for a category
     *
     * The state lives under the application data location until
     * setStateDirectory() is called.
     */
    explicit SyncState(Category category, QObject *parent = nullptr);

    /**
     * @brief Saves pending changes
     */
    ~SyncState();

    Category category() const { return m_category; }

    // ========== Run Tracking ==========

    /**
     * @brief Record a completed run (success or failure)
     */
    void recordRun(const SyncResult &result);

    /**
     * @brief End time of the last completed run, successful or not
     */
    QDateTime lastRunTime() const { return m_lastRunTime; }

    /**
     * @brief End time of the last successful run
     */
    QDateTime lastSyncTime() const { return m_lastSyncTime; }

    /**
     * @brief Most recent run, oldest entries first in history()
     */
    RunRecord lastRun() const { return m_history.isEmpty() ? RunRecord() : m_history.last(); }
    QList<RunRecord> history() const { return m_history; }

    /**
     * @brief Check if this category never completed a run
     */
    bool isFirstSync() const { return !m_lastRunTime.isValid(); }

    // ========== Persistence ==========

    /**
     * @brief Load state from disk
     * @return true if loaded successfully (or if no previous state exists)
     */
    bool load();

    /**
     * @brief Save state to disk
     * @return true if saved successfully
     */
    bool save();

    /**
     * @brief Clear all state (use with caution)
     */
    void clear();

    /**
     * @brief Get the state directory path
     */
    QString statePath() const { return m_stateDir; }

    /**
     * @brief Set the base directory for state storage
     * @param baseDir Base directory (state will be in baseDir/<category>/)
     *
     * Must be called before load() or save().
     */
    void setStateDirectory(const QString &baseDir);

signals:
    void stateChanged();
    void errorOccurred(const QString &error);

private:
    QString stateFile() const;
    bool ensureStateDir();
    static QJsonObject runToJson(const RunRecord &run);
    static RunRecord runFromJson(const QJsonObject &json);

    Category m_category;
    QString m_stateDir;
    QDateTime m_lastRunTime;
    QDateTime m_lastSyncTime;
    QList<RunRecord> m_history;
    bool m_dirty = false;
};

} // namespace PhoneSync

#endif // SYNCSTATE_H
