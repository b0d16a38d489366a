#include "sqliterecordstore.h"
#include "../mappers/contactmapper.h"
#include "../mappers/recordcodecs.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMimeDatabase>
#include <QDebug>

namespace PhoneSync {

static const char *const SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS contacts (
    id TEXT PRIMARY KEY,
    first_name TEXT,
    last_name TEXT,
    display_name TEXT NOT NULL,
    phone_numbers TEXT,
    email_addresses TEXT,
    organization TEXT,
    notes TEXT,
    content_hash TEXT NOT NULL,
    created_at INTEGER,
    updated_at INTEGER
);
CREATE TABLE IF NOT EXISTS contact_phones (
    contact_id TEXT NOT NULL,
    identity TEXT NOT NULL,
    PRIMARY KEY (contact_id, identity)
);
CREATE INDEX IF NOT EXISTS idx_contact_phones_identity ON contact_phones(identity);
CREATE TABLE IF NOT EXISTS threads (
    thread_key TEXT PRIMARY KEY,
    phone_identity TEXT,
    contact_id TEXT,
    last_message_id TEXT,
    last_activity INTEGER,
    last_message_preview TEXT,
    unread_count INTEGER NOT NULL DEFAULT 0,
    message_count INTEGER NOT NULL DEFAULT 0,
    is_group INTEGER NOT NULL DEFAULT 0,
    group_name TEXT,
    participants TEXT,
    archived INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS messages (
    id TEXT PRIMARY KEY,
    guid TEXT,
    thread_key TEXT NOT NULL REFERENCES threads(thread_key),
    phone_identity TEXT,
    content TEXT NOT NULL,
    channel TEXT NOT NULL,
    direction TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    read_status INTEGER NOT NULL DEFAULT 1,
    delivered_status INTEGER NOT NULL DEFAULT 0,
    failed_status INTEGER NOT NULL DEFAULT 0,
    signature TEXT
);
CREATE INDEX IF NOT EXISTS idx_messages_thread_signature ON messages(thread_key, signature);
CREATE INDEX IF NOT EXISTS idx_messages_thread_time ON messages(thread_key, timestamp);
CREATE TABLE IF NOT EXISTS message_attachments (
    message_id TEXT NOT NULL,
    position INTEGER NOT NULL,
    file_name TEXT NOT NULL,
    mime_type TEXT,
    PRIMARY KEY (message_id, position)
);
CREATE TABLE IF NOT EXISTS calls (
    id TEXT PRIMARY KEY,
    phone_identity TEXT,
    contact_id TEXT,
    timestamp INTEGER NOT NULL,
    duration INTEGER NOT NULL DEFAULT 0,
    direction TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_calls_timestamp ON calls(timestamp);
)SQL";

static const char *const CONTACT_COLUMNS =
    "id, first_name, last_name, phone_numbers, email_addresses, organization, notes";
static const char *const MESSAGE_COLUMNS =
    "id, guid, thread_key, phone_identity, content, channel, direction, timestamp, "
    "read_status, delivered_status, failed_status";
static const char *const THREAD_COLUMNS =
    "thread_key, phone_identity, contact_id, last_message_id, last_activity, "
    "last_message_preview, unread_count, message_count, is_group, group_name, "
    "participants, archived";
static const char *const CALL_COLUMNS =
    "id, phone_identity, contact_id, timestamp, duration, direction";

// ========== Helpers ==========

static void bindTime(SqliteStatement &stmt, int index, const QDateTime &time)
{
    if (time.isValid()) {
        stmt.bind(index, time.toMSecsSinceEpoch());
    } else {
        stmt.bindNull(index);
    }
}

static QDateTime timeColumn(const SqliteStatement &stmt, int column)
{
    if (stmt.isNull(column)) {
        return QDateTime();
    }
    return QDateTime::fromMSecsSinceEpoch(stmt.columnInt64(column), Qt::UTC);
}

static QString labeledValuesToJson(const QList<LabeledValue> &values)
{
    QJsonArray array;
    for (const LabeledValue &value : values) {
        QJsonObject obj;
        obj["label"] = value.label;
        obj["value"] = value.value;
        array.append(obj);
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact));
}

static QList<LabeledValue> labeledValuesFromJson(const QString &json)
{
    QList<LabeledValue> values;
    const QJsonArray array = QJsonDocument::fromJson(json.toUtf8()).array();
    for (const QJsonValue &item : array) {
        QJsonObject obj = item.toObject();
        values.append(LabeledValue{obj["label"].toString(), obj["value"].toString()});
    }
    return values;
}

static QString stringListToJson(const QStringList &list)
{
    return QString::fromUtf8(QJsonDocument(QJsonArray::fromStringList(list)).toJson(QJsonDocument::Compact));
}

static QStringList stringListFromJson(const QString &json)
{
    QStringList list;
    const QJsonArray array = QJsonDocument::fromJson(json.toUtf8()).array();
    for (const QJsonValue &item : array) {
        list << item.toString();
    }
    return list;
}

static QString limitClause(int limit, int offset)
{
    if (limit < 0) {
        return offset > 0 ? QString(" LIMIT -1 OFFSET %1").arg(offset) : QString();
    }
    return QString(" LIMIT %1 OFFSET %2").arg(limit).arg(qMax(0, offset));
}

// ========== Lifecycle ==========

SqliteRecordStore::SqliteRecordStore(const QString &databasePath, QObject *parent)
    : RecordStore(parent)
    , m_databasePath(databasePath)
{
}

SqliteRecordStore::~SqliteRecordStore()
{
    close();
}

bool SqliteRecordStore::open()
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);

    if (!m_db.open(m_databasePath, SqliteDatabase::OpenMode::ReadWrite)) {
        setLastError(m_db.errorString());
        return false;
    }

    if (m_databasePath != ":memory:") {
        m_db.exec("PRAGMA journal_mode=WAL");
    }
    m_db.exec("PRAGMA foreign_keys=OFF");

    if (!createSchema()) {
        m_db.close();
        return false;
    }

    qDebug() << "[SqliteRecordStore] Opened" << m_databasePath;
    emit logMessage(QString("Opened store %1").arg(m_databasePath));
    return true;
}

void SqliteRecordStore::close()
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    if (m_db.isOpen()) {
        if (m_batchDepth > 0) {
            m_db.exec("ROLLBACK");
            m_batchDepth = 0;
        }
        m_db.close();
    }
}

bool SqliteRecordStore::isAvailable() const
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    return m_db.isOpen();
}

bool SqliteRecordStore::createSchema()
{
    if (!m_db.exec(SCHEMA)) {
        setLastError(QString("Failed to create schema: %1").arg(m_db.errorString()));
        return false;
    }
    return true;
}

bool SqliteRecordStore::run(SqliteStatement &stmt)
{
    if (!stmt.exec()) {
        setLastError(stmt.errorString());
        return false;
    }
    return true;
}

bool SqliteRecordStore::exists(const QString &sql, const QString &id)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare(sql);
    stmt.bind(1, id);
    bool found = stmt.step();
    if (stmt.hasError()) {
        setLastError(stmt.errorString());
    }
    return found;
}

int SqliteRecordStore::count(const QString &sql, const QString &parameter)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare(sql);
    if (!parameter.isNull()) {
        stmt.bind(1, parameter);
    }
    if (!stmt.step()) {
        if (stmt.hasError()) {
            setLastError(stmt.errorString());
        }
        return 0;
    }
    return stmt.columnInt(0);
}

// ========== Batch Operations ==========

bool SqliteRecordStore::beginBatch()
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    if (m_batchDepth > 0) {
        m_batchDepth++;
        return true;
    }
    if (!m_db.exec("BEGIN IMMEDIATE")) {
        setLastError(m_db.errorString());
        return false;
    }
    m_batchDepth = 1;
    return true;
}

bool SqliteRecordStore::commitBatch()
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    if (m_batchDepth == 0) {
        setLastError("Commit without an open transaction");
        return false;
    }
    if (--m_batchDepth > 0) {
        return true;
    }
    if (!m_db.exec("COMMIT")) {
        setLastError(m_db.errorString());
        m_db.exec("ROLLBACK");
        return false;
    }
    return true;
}

void SqliteRecordStore::rollbackBatch()
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    if (m_batchDepth == 0) {
        return;
    }
    // A nested rollback aborts the whole transaction
    m_batchDepth = 0;
    m_db.exec("ROLLBACK");
}

// ========== Contacts ==========

bool SqliteRecordStore::hasContact(const QString &id)
{
    return exists("SELECT 1 FROM contacts WHERE id = ?1", id);
}

QString SqliteRecordStore::contactContentHash(const QString &id)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare("SELECT content_hash FROM contacts WHERE id = ?1");
    stmt.bind(1, id);
    if (stmt.step()) {
        return stmt.columnText(0);
    }
    if (stmt.hasError()) {
        setLastError(stmt.errorString());
    }
    return QString();
}

bool SqliteRecordStore::insertContact(const ContactRecord &contact, const QString &contentHash)
{
    return writeContact(contact, contentHash, false);
}

bool SqliteRecordStore::updateContact(const ContactRecord &contact, const QString &contentHash)
{
    return writeContact(contact, contentHash, true);
}

bool SqliteRecordStore::writeContact(const ContactRecord &contact, const QString &contentHash, bool replace)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    qint64 now = QDateTime::currentMSecsSinceEpoch();

    SqliteStatement stmt = m_db.prepare(replace
        ? QString("UPDATE contacts SET first_name = ?2, last_name = ?3, display_name = ?4, "
                  "phone_numbers = ?5, email_addresses = ?6, organization = ?7, notes = ?8, "
                  "content_hash = ?9, updated_at = ?10 WHERE id = ?1")
        : QString("INSERT INTO contacts (id, first_name, last_name, display_name, phone_numbers, "
                  "email_addresses, organization, notes, content_hash, updated_at, created_at) "
                  "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?10)"));
    stmt.bind(1, contact.id);
    stmt.bind(2, contact.firstName);
    stmt.bind(3, contact.lastName);
    stmt.bind(4, contact.displayName());
    stmt.bind(5, labeledValuesToJson(contact.phoneNumbers));
    stmt.bind(6, labeledValuesToJson(contact.emails));
    stmt.bind(7, contact.organization);
    stmt.bind(8, contact.notes);
    stmt.bind(9, contentHash);
    stmt.bind(10, now);

    if (!run(stmt)) {
        return false;
    }
    return writeContactPhones(contact);
}

bool SqliteRecordStore::writeContactPhones(const ContactRecord &contact)
{
    SqliteStatement remove = m_db.prepare("DELETE FROM contact_phones WHERE contact_id = ?1");
    remove.bind(1, contact.id);
    if (!run(remove)) {
        return false;
    }

    SqliteStatement insert = m_db.prepare(
        "INSERT OR IGNORE INTO contact_phones (contact_id, identity) VALUES (?1, ?2)");
    for (const QString &identity : ContactMapper::phoneIdentities(contact)) {
        insert.reset();
        insert.bind(1, contact.id);
        insert.bind(2, identity);
        if (!run(insert)) {
            return false;
        }
    }
    return true;
}

ContactRecord SqliteRecordStore::contactFromRow(const SqliteStatement &stmt) const
{
    ContactRecord contact;
    contact.id = stmt.columnText(0);
    contact.firstName = stmt.columnText(1);
    contact.lastName = stmt.columnText(2);
    contact.phoneNumbers = labeledValuesFromJson(stmt.columnText(3));
    contact.emails = labeledValuesFromJson(stmt.columnText(4));
    contact.organization = stmt.columnText(5);
    contact.notes = stmt.columnText(6);
    return contact;
}

ContactRecord SqliteRecordStore::contact(const QString &id)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare(
        QString("SELECT %1 FROM contacts WHERE id = ?1").arg(CONTACT_COLUMNS));
    stmt.bind(1, id);
    if (stmt.step()) {
        return contactFromRow(stmt);
    }
    return ContactRecord();
}

QList<ContactRecord> SqliteRecordStore::contacts(int limit, int offset)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    QList<ContactRecord> result;
    SqliteStatement stmt = m_db.prepare(
        QString("SELECT %1 FROM contacts ORDER BY display_name COLLATE NOCASE, id")
            .arg(CONTACT_COLUMNS) + limitClause(limit, offset));
    while (stmt.step()) {
        result.append(contactFromRow(stmt));
    }
    if (stmt.hasError()) {
        setLastError(stmt.errorString());
    }
    return result;
}

QString SqliteRecordStore::contactIdForPhone(const QString &identity)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare(
        "SELECT contact_id FROM contact_phones WHERE identity = ?1 ORDER BY contact_id LIMIT 1");
    stmt.bind(1, identity);
    if (stmt.step()) {
        return stmt.columnText(0);
    }
    return QString();
}

int SqliteRecordStore::contactCount()
{
    return count("SELECT COUNT(*) FROM contacts");
}

// ========== Messages ==========

bool SqliteRecordStore::hasMessage(const QString &id)
{
    return exists("SELECT 1 FROM messages WHERE id = ?1", id);
}

bool SqliteRecordStore::insertMessage(const MessageRecord &message, const QString &signature)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);

    SqliteStatement stmt = m_db.prepare(
        "INSERT INTO messages (id, guid, thread_key, phone_identity, content, channel, direction, "
        "timestamp, read_status, delivered_status, failed_status, signature) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)");
    stmt.bind(1, message.id);
    stmt.bind(2, message.guid);
    stmt.bind(3, message.conversationKey);
    stmt.bind(4, message.phoneIdentity);
    stmt.bind(5, message.text.isNull() ? QString("") : message.text);
    stmt.bind(6, channelKindName(message.channel));
    stmt.bind(7, messageDirectionName(message.direction));
    bindTime(stmt, 8, message.timestamp);
    stmt.bind(9, message.isRead);
    stmt.bind(10, message.isDelivered);
    stmt.bind(11, message.isFailed);
    stmt.bind(12, signature);

    if (!run(stmt)) {
        return false;
    }

    if (message.attachments.isEmpty()) {
        return true;
    }

    QMimeDatabase mimeDb;
    SqliteStatement attachment = m_db.prepare(
        "INSERT INTO message_attachments (message_id, position, file_name, mime_type) "
        "VALUES (?1, ?2, ?3, ?4)");
    for (int i = 0; i < message.attachments.size(); ++i) {
        const QString &fileName = message.attachments.at(i);
        attachment.reset();
        attachment.bind(1, message.id);
        attachment.bind(2, i);
        attachment.bind(3, fileName);
        attachment.bind(4, mimeDb.mimeTypeForFile(fileName, QMimeDatabase::MatchExtension).name());
        if (!run(attachment)) {
            return false;
        }
    }
    return true;
}

bool SqliteRecordStore::hasDuplicateMessage(const QString &threadKey, const QString &signature,
                                            const QDateTime &timestamp, int windowSeconds)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);

    qint64 center = timestamp.toMSecsSinceEpoch();
    qint64 window = static_cast<qint64>(qMax(0, windowSeconds)) * 1000;

    SqliteStatement stmt = m_db.prepare(
        "SELECT 1 FROM messages WHERE thread_key = ?1 AND signature = ?2 "
        "AND timestamp BETWEEN ?3 AND ?4 LIMIT 1");
    stmt.bind(1, threadKey);
    stmt.bind(2, signature);
    stmt.bind(3, center - window);
    stmt.bind(4, center + window);

    bool found = stmt.step();
    if (stmt.hasError()) {
        setLastError(stmt.errorString());
    }
    return found;
}

QStringList SqliteRecordStore::loadAttachments(const QString &messageId)
{
    QStringList names;
    SqliteStatement stmt = m_db.prepare(
        "SELECT file_name FROM message_attachments WHERE message_id = ?1 ORDER BY position");
    stmt.bind(1, messageId);
    while (stmt.step()) {
        names << stmt.columnText(0);
    }
    return names;
}

MessageRecord SqliteRecordStore::messageFromRow(const SqliteStatement &stmt)
{
    MessageRecord message;
    message.id = stmt.columnText(0);
    message.guid = stmt.columnText(1);
    message.conversationKey = stmt.columnText(2);
    message.phoneIdentity = stmt.columnText(3);
    message.text = stmt.columnText(4);
    message.channel = channelKindFromName(stmt.columnText(5));
    message.direction = messageDirectionFromName(stmt.columnText(6));
    message.timestamp = timeColumn(stmt, 7);
    message.isRead = stmt.columnInt(8) != 0;
    message.isDelivered = stmt.columnInt(9) != 0;
    message.isFailed = stmt.columnInt(10) != 0;
    message.isGroup = message.conversationKey.startsWith("group:");
    message.attachments = loadAttachments(message.id);
    return message;
}

MessageRecord SqliteRecordStore::message(const QString &id)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare(
        QString("SELECT %1 FROM messages WHERE id = ?1").arg(MESSAGE_COLUMNS));
    stmt.bind(1, id);
    if (stmt.step()) {
        return messageFromRow(stmt);
    }
    return MessageRecord();
}

QList<MessageRecord> SqliteRecordStore::threadMessages(const QString &threadKey, int limit, int offset)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    QList<MessageRecord> result;
    SqliteStatement stmt = m_db.prepare(
        QString("SELECT %1 FROM messages WHERE thread_key = ?1 ORDER BY timestamp ASC, rowid ASC")
            .arg(MESSAGE_COLUMNS) + limitClause(limit, offset));
    stmt.bind(1, threadKey);
    while (stmt.step()) {
        result.append(messageFromRow(stmt));
    }
    if (stmt.hasError()) {
        setLastError(stmt.errorString());
    }
    return result;
}

QList<MessageRecord> SqliteRecordStore::searchMessages(const QString &query, int limit)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    QList<MessageRecord> result;
    if (query.trimmed().isEmpty()) {
        return result;
    }

    QString pattern = query;
    pattern.replace('\\', "\\\\");
    pattern.replace('%', "\\%");
    pattern.replace('_', "\\_");

    SqliteStatement stmt = m_db.prepare(
        QString("SELECT %1 FROM messages WHERE content LIKE ?1 ESCAPE '\\' "
                "ORDER BY timestamp DESC, rowid DESC").arg(MESSAGE_COLUMNS)
        + limitClause(limit, 0));
    stmt.bind(1, "%" + pattern + "%");
    while (stmt.step()) {
        result.append(messageFromRow(stmt));
    }
    if (stmt.hasError()) {
        setLastError(stmt.errorString());
    }
    return result;
}

int SqliteRecordStore::messageCount(const QString &threadKey)
{
    if (threadKey.isEmpty()) {
        return count("SELECT COUNT(*) FROM messages");
    }
    return count("SELECT COUNT(*) FROM messages WHERE thread_key = ?1", threadKey);
}

QList<MessageSignatureRow> SqliteRecordStore::messageSignatures()
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    QList<MessageSignatureRow> rows;
    SqliteStatement stmt = m_db.prepare(
        "SELECT id, thread_key, phone_identity, content, signature, timestamp "
        "FROM messages ORDER BY timestamp ASC, rowid ASC");
    while (stmt.step()) {
        MessageSignatureRow row;
        row.id = stmt.columnText(0);
        row.threadKey = stmt.columnText(1);
        row.phoneIdentity = stmt.columnText(2);
        row.content = stmt.columnText(3);
        row.signature = stmt.columnText(4);
        row.timestamp = timeColumn(stmt, 5);
        rows.append(row);
    }
    if (stmt.hasError()) {
        setLastError(stmt.errorString());
    }
    return rows;
}

bool SqliteRecordStore::setMessageSignature(const QString &id, const QString &signature)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare("UPDATE messages SET signature = ?2 WHERE id = ?1");
    stmt.bind(1, id);
    stmt.bind(2, signature);
    return run(stmt);
}

int SqliteRecordStore::deleteMessages(const QStringList &ids)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement attachments = m_db.prepare("DELETE FROM message_attachments WHERE message_id = ?1");
    SqliteStatement messages = m_db.prepare("DELETE FROM messages WHERE id = ?1");

    int deleted = 0;
    for (const QString &id : ids) {
        attachments.reset();
        attachments.bind(1, id);
        if (!run(attachments)) {
            return -1;
        }
        messages.reset();
        messages.bind(1, id);
        if (!run(messages)) {
            return -1;
        }
        deleted += m_db.changes();
    }
    return deleted;
}

// ========== Threads ==========

ConversationThread SqliteRecordStore::threadFromRow(const SqliteStatement &stmt) const
{
    ConversationThread thread;
    thread.key = stmt.columnText(0);
    thread.phoneIdentity = stmt.columnText(1);
    thread.contactId = stmt.columnText(2);
    thread.lastMessageId = stmt.columnText(3);
    thread.lastActivity = timeColumn(stmt, 4);
    thread.lastMessagePreview = stmt.columnText(5);
    thread.unreadCount = stmt.columnInt(6);
    thread.messageCount = stmt.columnInt(7);
    thread.isGroup = stmt.columnInt(8) != 0;
    thread.groupName = stmt.columnText(9);
    thread.participants = stringListFromJson(stmt.columnText(10));
    thread.archived = stmt.columnInt(11) != 0;
    return thread;
}

ConversationThread SqliteRecordStore::thread(const QString &key)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare(
        QString("SELECT %1 FROM threads WHERE thread_key = ?1").arg(THREAD_COLUMNS));
    stmt.bind(1, key);
    if (stmt.step()) {
        return threadFromRow(stmt);
    }
    return ConversationThread();
}

bool SqliteRecordStore::saveThread(const ConversationThread &thread)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare(
        QString("INSERT OR REPLACE INTO threads (%1) "
                "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)").arg(THREAD_COLUMNS));
    stmt.bind(1, thread.key);
    stmt.bind(2, thread.phoneIdentity);
    stmt.bind(3, thread.contactId);
    stmt.bind(4, thread.lastMessageId);
    bindTime(stmt, 5, thread.lastActivity);
    stmt.bind(6, thread.lastMessagePreview);
    stmt.bind(7, thread.unreadCount);
    stmt.bind(8, thread.messageCount);
    stmt.bind(9, thread.isGroup);
    stmt.bind(10, thread.groupName);
    stmt.bind(11, stringListToJson(thread.participants));
    stmt.bind(12, thread.archived);
    return run(stmt);
}

QList<ConversationThread> SqliteRecordStore::threads(int limit, int offset, bool includeArchived)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    QList<ConversationThread> result;
    SqliteStatement stmt = m_db.prepare(
        QString("SELECT %1 FROM threads %2 ORDER BY last_activity DESC, thread_key ASC")
            .arg(THREAD_COLUMNS, includeArchived ? QString() : QString("WHERE archived = 0"))
        + limitClause(limit, offset));
    while (stmt.step()) {
        result.append(threadFromRow(stmt));
    }
    if (stmt.hasError()) {
        setLastError(stmt.errorString());
    }
    return result;
}

bool SqliteRecordStore::recomputeThread(const QString &key)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);

    SqliteStatement totals = m_db.prepare(
        "SELECT COUNT(*), "
        "COALESCE(SUM(CASE WHEN read_status = 0 AND direction = 'inbound' THEN 1 ELSE 0 END), 0) "
        "FROM messages WHERE thread_key = ?1");
    totals.bind(1, key);
    if (!totals.step()) {
        setLastError(totals.errorString());
        return false;
    }
    int messageCount = totals.columnInt(0);
    int unreadCount = totals.columnInt(1);

    QString lastId;
    QString preview;
    QDateTime lastActivity;

    SqliteStatement latest = m_db.prepare(
        "SELECT id, content, timestamp FROM messages WHERE thread_key = ?1 "
        "ORDER BY timestamp DESC, rowid DESC LIMIT 1");
    latest.bind(1, key);
    if (latest.step()) {
        lastId = latest.columnText(0);
        preview = RecordCodecs::preview(latest.columnText(1));
        lastActivity = timeColumn(latest, 2);
    } else if (latest.hasError()) {
        setLastError(latest.errorString());
        return false;
    }

    SqliteStatement update = m_db.prepare(
        "UPDATE threads SET message_count = ?2, unread_count = ?3, last_message_id = ?4, "
        "last_activity = ?5, last_message_preview = ?6 WHERE thread_key = ?1");
    update.bind(1, key);
    update.bind(2, messageCount);
    update.bind(3, unreadCount);
    update.bind(4, lastId);
    bindTime(update, 5, lastActivity);
    update.bind(6, preview);
    return run(update);
}

bool SqliteRecordStore::markThreadRead(const QString &key)
{
    Transaction transaction(this);
    if (!transaction.isActive()) {
        return false;
    }

    SqliteStatement messages = m_db.prepare(
        "UPDATE messages SET read_status = 1 WHERE thread_key = ?1 AND read_status = 0");
    messages.bind(1, key);
    SqliteStatement thread = m_db.prepare(
        "UPDATE threads SET unread_count = 0 WHERE thread_key = ?1");
    thread.bind(1, key);

    if (!run(messages) || !run(thread)) {
        return false;
    }
    return transaction.commit();
}

bool SqliteRecordStore::setThreadArchived(const QString &key, bool archived)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare("UPDATE threads SET archived = ?2 WHERE thread_key = ?1");
    stmt.bind(1, key);
    stmt.bind(2, archived);
    if (!run(stmt)) {
        return false;
    }
    return m_db.changes() > 0;
}

int SqliteRecordStore::deleteEmptyThreads()
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    SqliteStatement stmt = m_db.prepare(
        "DELETE FROM threads WHERE NOT EXISTS "
        "(SELECT 1 FROM messages WHERE messages.thread_key = threads.thread_key)");
    if (!run(stmt)) {
        return -1;
    }
    return m_db.changes();
}

int SqliteRecordStore::threadCount()
{
    return count("SELECT COUNT(*) FROM threads");
}

// ========== Calls ==========

bool SqliteRecordStore::hasCall(const QString &id)
{
    return exists("SELECT 1 FROM calls WHERE id = ?1", id);
}

bool SqliteRecordStore::insertCall(const CallRecord &call)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);

    QString contactId = call.contactId;
    if (contactId.isEmpty()) {
        contactId = contactIdForPhone(call.phoneIdentity);
    }

    SqliteStatement stmt = m_db.prepare(
        QString("INSERT INTO calls (%1) VALUES (?1, ?2, ?3, ?4, ?5, ?6)").arg(CALL_COLUMNS));
    stmt.bind(1, call.id);
    stmt.bind(2, call.phoneIdentity);
    stmt.bind(3, contactId);
    bindTime(stmt, 4, call.timestamp);
    stmt.bind(5, call.durationSeconds);
    stmt.bind(6, callDirectionName(call.direction));
    return run(stmt);
}

CallRecord SqliteRecordStore::callFromRow(const SqliteStatement &stmt) const
{
    CallRecord call;
    call.id = stmt.columnText(0);
    call.phoneIdentity = stmt.columnText(1);
    call.contactId = stmt.columnText(2);
    call.timestamp = timeColumn(stmt, 3);
    call.durationSeconds = stmt.columnInt(4);
    call.direction = callDirectionFromName(stmt.columnText(5));
    return call;
}

QList<CallRecord> SqliteRecordStore::calls(int limit, int offset)
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    QList<CallRecord> result;
    SqliteStatement stmt = m_db.prepare(
        QString("SELECT %1 FROM calls ORDER BY timestamp DESC, id ASC").arg(CALL_COLUMNS)
        + limitClause(limit, offset));
    while (stmt.step()) {
        result.append(callFromRow(stmt));
    }
    if (stmt.hasError()) {
        setLastError(stmt.errorString());
    }
    return result;
}

CallStatistics SqliteRecordStore::callStatistics()
{
    QMutexLocker<QRecursiveMutex> locker(&m_mutex);
    CallStatistics stats;

    SqliteStatement stmt = m_db.prepare(
        "SELECT COUNT(*), "
        "COALESCE(SUM(CASE WHEN direction = 'incoming' THEN 1 ELSE 0 END), 0), "
        "COALESCE(SUM(CASE WHEN direction = 'outgoing' THEN 1 ELSE 0 END), 0), "
        "COALESCE(SUM(CASE WHEN direction = 'missed' THEN 1 ELSE 0 END), 0), "
        "COALESCE(SUM(duration), 0), "
        "COALESCE(AVG(duration), 0) "
        "FROM calls");
    if (!stmt.step()) {
        if (stmt.hasError()) {
            setLastError(stmt.errorString());
        }
        return stats;
    }

    stats.totalCalls = stmt.columnInt(0);
    stats.incomingCalls = stmt.columnInt(1);
    stats.outgoingCalls = stmt.columnInt(2);
    stats.missedCalls = stmt.columnInt(3);
    stats.totalTalkTime = stmt.columnInt64(4);
    stats.averageCallDuration = qRound(stmt.columnDouble(5));
    return stats;
}

int SqliteRecordStore::callCount()
{
    return count("SELECT COUNT(*) FROM calls");
}

} // namespace PhoneSync
