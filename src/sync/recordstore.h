#ifndef RECORDSTORE_H
#define RECORDSTORE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QDateTime>
#include <QRecursiveMutex>
#include <QMutexLocker>
#include "synctypes.h"

namespace PhoneSync {

/**
 * @brief Minimal view of a stored message used by duplicate remediation
 */
struct MessageSignatureRow {
    QString id;
    QString threadKey;
    QString phoneIdentity;
    QString content;
    QString signature;      ///< Empty for rows stored before signatures existed
    QDateTime timestamp;
};

/**
 * @brief Abstract interface for the persistent record store
 *
 * The store is authoritative for everything imported. Only the Reconciler
 * writes threads and messages; the query methods serve an embedding UI.
 *
 * All methods are safe to call from several threads. Multi-statement
 * writes must be wrapped in a Transaction, which also serializes writers.
 */
class RecordStore : public QObject
{
    Q_OBJECT

public:
    explicit RecordStore(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~RecordStore() = default;

    // ========== Store Identity ==========

    /**
     * @brief Unique identifier for this store type ("sqlite")
     */
    virtual QString backendId() const = 0;

    /**
     * @brief Human-readable name for display
     */
    virtual QString displayName() const = 0;

    /**
     * @brief Check if the store is open and usable
     */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Description of the last failed operation
     */
    QString lastError() const { return m_lastError; }

    // ========== Batch Operations ==========

    /**
     * @brief Begin a transaction
     *
     * Prefer the Transaction scope, which also holds the store mutex.
     */
    virtual bool beginBatch() = 0;

    /**
     * @brief Commit the current transaction
     */
    virtual bool commitBatch() = 0;

    /**
     * @brief Roll back the current transaction
     */
    virtual void rollbackBatch() = 0;

    /**
     * @brief Mutex serializing transactions on this store
     */
    QRecursiveMutex *mutex() const { return &m_mutex; }

    // ========== Contacts ==========

    virtual bool hasContact(const QString &id) = 0;

    /**
     * @brief Content hash stored with a contact
     * @return Hash, or empty string if the contact does not exist
     */
    virtual QString contactContentHash(const QString &id) = 0;

    /**
     * @brief Insert a new contact and index its phone numbers
     */
    virtual bool insertContact(const ContactRecord &contact, const QString &contentHash) = 0;

    /**
     * @brief Replace an existing contact, including its phone and email lists
     */
    virtual bool updateContact(const ContactRecord &contact, const QString &contentHash) = 0;

    /**
     * @brief Load one contact
     * @return Contact, or a record with an empty id if not found
     */
    virtual ContactRecord contact(const QString &id) = 0;

    /**
     * @brief Contacts ordered by display name
     * @param limit Maximum rows, or -1 for all
     */
    virtual QList<ContactRecord> contacts(int limit = -1, int offset = 0) = 0;

    /**
     * @brief Contact owning a normalized phone identity
     * @return Contact id, or empty if none
     */
    virtual QString contactIdForPhone(const QString &identity) = 0;

    virtual int contactCount() = 0;

    /**
     * @brief All contacts as a single vCard 4.0 document
     */
    QString exportContactsVCard();

    // ========== Messages ==========

    virtual bool hasMessage(const QString &id) = 0;

    /**
     * @brief Insert a message and its attachments
     *
     * message.conversationKey names the owning thread, which must exist.
     */
    virtual bool insertMessage(const MessageRecord &message, const QString &signature) = 0;

    /**
     * @brief Look for a duplicate within the idempotence window
     *
     * @return true if the thread holds a message with the same signature
     *         whose timestamp differs by at most windowSeconds
     */
    virtual bool hasDuplicateMessage(const QString &threadKey,
                                     const QString &signature,
                                     const QDateTime &timestamp,
                                     int windowSeconds) = 0;

    /**
     * @brief Load one message
     * @return Message, or a record with an empty id if not found
     */
    virtual MessageRecord message(const QString &id) = 0;

    /**
     * @brief Messages of a thread, oldest first
     */
    virtual QList<MessageRecord> threadMessages(const QString &threadKey,
                                                int limit = -1, int offset = 0) = 0;

    /**
     * @brief Messages whose text contains the query, newest first
     */
    virtual QList<MessageRecord> searchMessages(const QString &query, int limit = 50) = 0;

    /**
     * @brief Number of stored messages, in one thread or overall
     */
    virtual int messageCount(const QString &threadKey = QString()) = 0;

    /**
     * @brief Every stored message as identity, content and time
     */
    virtual QList<MessageSignatureRow> messageSignatures() = 0;

    virtual bool setMessageSignature(const QString &id, const QString &signature) = 0;

    /**
     * @brief Delete messages and their attachments
     * @return Number deleted, or -1 on failure
     */
    virtual int deleteMessages(const QStringList &ids) = 0;

    // ========== Threads ==========

    /**
     * @brief Load one thread
     * @return Thread, invalid if not found
     */
    virtual ConversationThread thread(const QString &key) = 0;

    /**
     * @brief Insert or replace a thread row
     */
    virtual bool saveThread(const ConversationThread &thread) = 0;

    /**
     * @brief Threads by most recent activity
     */
    virtual QList<ConversationThread> threads(int limit = -1, int offset = 0,
                                              bool includeArchived = false) = 0;

    /**
     * @brief Recompute count, unread count and last message from messages
     */
    virtual bool recomputeThread(const QString &key) = 0;

    virtual bool markThreadRead(const QString &key) = 0;
    virtual bool setThreadArchived(const QString &key, bool archived) = 0;

    /**
     * @brief Delete threads that no longer own any message
     * @return Number deleted, or -1 on failure
     */
    virtual int deleteEmptyThreads() = 0;

    virtual int threadCount() = 0;

    // ========== Calls ==========

    virtual bool hasCall(const QString &id) = 0;

    /**
     * @brief Insert a call, linking it to a contact by phone identity
     */
    virtual bool insertCall(const CallRecord &call) = 0;

    /**
     * @brief Calls, most recent first
     */
    virtual QList<CallRecord> calls(int limit = -1, int offset = 0) = 0;

    virtual CallStatistics callStatistics() = 0;

    virtual int callCount() = 0;

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

protected:
    void setLastError(const QString &error);

    mutable QRecursiveMutex m_mutex;
    QString m_lastError;
};

/**
 * @brief Transaction scope on a RecordStore
 *
 * Locks the store mutex and begins a transaction. Rolls back on
 * destruction unless commit() succeeded.
 */
class Transaction
{
public:
    explicit Transaction(RecordStore *store);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    bool isActive() const { return m_active; }
    bool commit();
    void rollback();

private:
    RecordStore *m_store;
    QMutexLocker<QRecursiveMutex> m_locker;
    bool m_active = false;
};

} // namespace PhoneSync

#endif // RECORDSTORE_H
