#ifndef RECONCILER_H
#define RECONCILER_H

#include <QObject>
#include <QString>
#include <QSet>
#include <functional>
#include "synctypes.h"
#include "recordstream.h"
#include "recordstore.h"
#include "outboundsender.h"

namespace PhoneSync {

/**
 * @brief Merges extracted records into the RecordStore
 *
 * For every record the decision is insert, update (contacts only) or skip:
 *   - A source id already in the store is skipped, so repeated syncs of the
 *     same backup import nothing.
 *   - Messages with a new id are also skipped when the conversation holds a
 *     message with the same dedup signature within the dedup window.
 *   - Each message insert and its thread update commit in one transaction.
 *
 * After a message batch, the aggregates of every touched thread are
 * recomputed from the messages themselves.
 *
 * One reconciler serves all categories. Runs for different categories may
 * execute concurrently against the same store; each record is written in
 * its own Transaction.
 */
class Reconciler : public QObject
{
    Q_OBJECT

public:
    /**
     * @param store Target store, not owned
     */
    explicit Reconciler(RecordStore *store, QObject *parent = nullptr);

    RecordStore *store() const { return m_store; }

    // ========== Configuration ==========

    /**
     * @brief Idempotence window for message dedup
     *
     * Two messages with the same signature are duplicates when their
     * timestamps differ by at most this many seconds. Default 0.
     */
    void setDedupWindowSeconds(int seconds) { m_dedupWindowSeconds = qMax(0, seconds); }
    int dedupWindowSeconds() const { return m_dedupWindowSeconds; }

    /**
     * @brief Set external cancel check callback
     *
     * Checked before each record. Records committed before cancellation
     * are kept.
     */
    void setCancelCheck(std::function<bool()> callback) { m_cancelCheck = callback; }

    // ========== Import ==========

    ImportResult importRecords(RecordStream<ContactRecord> &stream);
    ImportResult importRecords(RecordStream<MessageRecord> &stream);
    ImportResult importRecords(RecordStream<CallRecord> &stream);

    // ========== Outbound ==========

    /**
     * @brief Persist the outcome of an external send
     *
     * A successful send is stored as an outbound message using the receipt
     * id when one is given; a failed send is stored with the failed flag.
     *
     * @param messageId Receives the id of the stored message
     * @return false if the message could not be stored or was already recorded
     */
    bool recordOutbound(const OutboundReport &report, QString *messageId = nullptr);

    // ========== Remediation ==========

    /**
     * @brief Remove messages sharing identity and content with an earlier one
     *
     * Groups every stored message by (normalized identity, normalized
     * content), keeps the earliest of each group and deletes the rest,
     * regardless of the dedup window. Rows without a stored signature are
     * signed first. Touched threads are recomputed and emptied threads
     * deleted. Runs as one transaction.
     */
    CleanupReport removeDuplicateMessages();

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);
    void progressUpdated(int current, int total, const QString &message);

private:
    // Invalid: the record lacks an id or timestamp and never reached the store
    enum class Outcome { Inserted, Updated, Skipped, Invalid, Failed };

    Outcome importContact(const ContactRecord &contact, QString *error);
    Outcome importCall(const CallRecord &call, QString *error);

    /**
     * @brief Insert one message and fold it into its thread
     * @param threadKey Receives the conversation key when inserted
     */
    Outcome importMessage(const MessageRecord &message, bool checkDuplicates,
                          QString *threadKey, QString *error);

    /**
     * @brief Fold the outcome of one record into the counters
     */
    void count(Outcome outcome, const QString &error, ImportResult &result);

    /**
     * @brief Recompute aggregates of the given threads
     * @return Number of threads recomputed
     */
    int healThreads(const QSet<QString> &keys, ImportResult *result);

    template<typename T>
    void finishImport(const RecordStream<T> &stream, ImportResult &result, const QString &label);

    bool isCancelled() const { return m_cancelCheck && m_cancelCheck(); }

    RecordStore *m_store;
    int m_dedupWindowSeconds = 0;
    std::function<bool()> m_cancelCheck;
};

} // namespace PhoneSync

#endif // RECONCILER_H
