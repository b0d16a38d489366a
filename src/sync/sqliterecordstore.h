#ifndef SQLITERECORDSTORE_H
#define SQLITERECORDSTORE_H

#include "recordstore.h"
#include "../backup/sqlitedatabase.h"

namespace PhoneSync {

/**
 * @brief RecordStore kept in a SQLite database file
 *
 * Schema:
 *   contacts            - one row per contact, phone/email lists as JSON
 *   contact_phones      - normalized phone identity -> contact id
 *   threads             - conversation aggregates
 *   messages            - imported and recorded messages
 *   message_attachments - attachment names per message
 *   calls               - call log
 *
 * Timestamps are stored as milliseconds since the Unix epoch (UTC).
 */
class SqliteRecordStore : public RecordStore
{
    Q_OBJECT

public:
    /**
     * @param databasePath Database file, or ":memory:" for a private store
     */
    explicit SqliteRecordStore(const QString &databasePath, QObject *parent = nullptr);
    ~SqliteRecordStore() override;

    /**
     * @brief Open the database and create the schema if needed
     */
    bool open();
    void close();

    QString databasePath() const { return m_databasePath; }

    // ========== Store Identity ==========

    QString backendId() const override { return "sqlite"; }
    QString displayName() const override { return "SQLite Store"; }
    bool isAvailable() const override;

    // ========== Batch Operations ==========

    bool beginBatch() override;
    bool commitBatch() override;
    void rollbackBatch() override;

    // ========== Contacts ==========

    bool hasContact(const QString &id) override;
    QString contactContentHash(const QString &id) override;
    bool insertContact(const ContactRecord &contact, const QString &contentHash) override;
    bool updateContact(const ContactRecord &contact, const QString &contentHash) override;
    ContactRecord contact(const QString &id) override;
    QList<ContactRecord> contacts(int limit = -1, int offset = 0) override;
    QString contactIdForPhone(const QString &identity) override;
    int contactCount() override;

    // ========== Messages ==========

    bool hasMessage(const QString &id) override;
    bool insertMessage(const MessageRecord &message, const QString &signature) override;
    bool hasDuplicateMessage(const QString &threadKey, const QString &signature,
                             const QDateTime &timestamp, int windowSeconds) override;
    MessageRecord message(const QString &id) override;
    QList<MessageRecord> threadMessages(const QString &threadKey,
                                        int limit = -1, int offset = 0) override;
    QList<MessageRecord> searchMessages(const QString &query, int limit = 50) override;
    int messageCount(const QString &threadKey = QString()) override;
    QList<MessageSignatureRow> messageSignatures() override;
    bool setMessageSignature(const QString &id, const QString &signature) override;
    int deleteMessages(const QStringList &ids) override;

    // ========== Threads ==========

    ConversationThread thread(const QString &key) override;
    bool saveThread(const ConversationThread &thread) override;
    QList<ConversationThread> threads(int limit = -1, int offset = 0,
                                      bool includeArchived = false) override;
    bool recomputeThread(const QString &key) override;
    bool markThreadRead(const QString &key) override;
    bool setThreadArchived(const QString &key, bool archived) override;
    int deleteEmptyThreads() override;
    int threadCount() override;

    // ========== Calls ==========

    bool hasCall(const QString &id) override;
    bool insertCall(const CallRecord &call) override;
    QList<CallRecord> calls(int limit = -1, int offset = 0) override;
    CallStatistics callStatistics() override;
    int callCount() override;

private:
    bool createSchema();
    bool exists(const QString &sql, const QString &id);
    int count(const QString &sql, const QString &parameter = QString());
    bool run(SqliteStatement &stmt);
    bool writeContact(const ContactRecord &contact, const QString &contentHash, bool replace);
    bool writeContactPhones(const ContactRecord &contact);
    QStringList loadAttachments(const QString &messageId);

    ContactRecord contactFromRow(const SqliteStatement &stmt) const;
    MessageRecord messageFromRow(const SqliteStatement &stmt);
    ConversationThread threadFromRow(const SqliteStatement &stmt) const;
    CallRecord callFromRow(const SqliteStatement &stmt) const;

    QString m_databasePath;
    SqliteDatabase m_db;
    int m_batchDepth = 0;
};

} // namespace PhoneSync

#endif // SQLITERECORDSTORE_H
