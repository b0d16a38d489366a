#include "reconciler.h"
#include "../mappers/contactmapper.h"
#include "../mappers/recordcodecs.h"

#include <QHash>
#include <QUuid>
#include <QDebug>

namespace PhoneSync {

static const int PROGRESS_INTERVAL = 100;

Reconciler::Reconciler(RecordStore *store, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
}

void Reconciler::count(Outcome outcome, const QString &error, ImportResult &result)
{
    switch (outcome) {
    case Outcome::Inserted:
        result.imported++;
        break;
    case Outcome::Updated:
        result.updated++;
        break;
    case Outcome::Skipped:
        result.skipped++;
        break;
    case Outcome::Invalid:
        result.addError(QString("%1: %2").arg(errorCodeName(ErrorCode::RecordDecodeError), error));
        emit errorOccurred(error);
        break;
    case Outcome::Failed:
        result.addError(QString("%1: %2").arg(errorCodeName(ErrorCode::StoreError), error));
        emit errorOccurred(error);
        break;
    }
}

template<typename T>
void Reconciler::finishImport(const RecordStream<T> &stream, ImportResult &result, const QString &label)
{
    for (const QString &error : stream.decodeErrors()) {
        result.addError(QString("%1: %2").arg(errorCodeName(ErrorCode::RecordDecodeError), error));
    }
    if (stream.isCancelled()) {
        result.cancelled = true;
    }

    qDebug() << "[Reconciler]" << label << result.summary();
    emit logMessage(QString("%1 - %2").arg(label, result.summary()));
}

// ========== Contacts ==========

ImportResult Reconciler::importRecords(RecordStream<ContactRecord> &stream)
{
    ImportResult result;
    ContactRecord contact;
    int processed = 0;

    while (true) {
        if (isCancelled()) {
            result.cancelled = true;
            break;
        }
        if (!stream.next(contact)) {
            break;
        }

        QString error;
        count(importContact(contact, &error), error, result);

        if (++processed % PROGRESS_INTERVAL == 0) {
            emit progressUpdated(processed, 0, QString("Contacts: %1 processed").arg(processed));
        }
    }

    finishImport(stream, result, "Contacts");
    return result;
}

Reconciler::Outcome Reconciler::importContact(const ContactRecord &contact, QString *error)
{
    if (contact.id.isEmpty()) {
        *error = "Contact without id";
        return Outcome::Invalid;
    }

    Transaction transaction(m_store);
    if (!transaction.isActive()) {
        *error = m_store->lastError();
        return Outcome::Failed;
    }

    QString hash = ContactMapper::contentHash(contact);
    QString storedHash = m_store->contactContentHash(contact.id);

    if (!storedHash.isEmpty() && storedHash == hash) {
        return Outcome::Skipped;
    }

    bool exists = !storedHash.isEmpty() || m_store->hasContact(contact.id);
    bool ok = exists ? m_store->updateContact(contact, hash)
                     : m_store->insertContact(contact, hash);

    if (!ok || !transaction.commit()) {
        *error = QString("Contact %1: %2").arg(contact.id, m_store->lastError());
        return Outcome::Failed;
    }
    return exists ? Outcome::Updated : Outcome::Inserted;
}

// ========== Messages ==========

ImportResult Reconciler::importRecords(RecordStream<MessageRecord> &stream)
{
    ImportResult result;
    QSet<QString> touched;
    MessageRecord message;
    int processed = 0;

    while (true) {
        if (isCancelled()) {
            result.cancelled = true;
            break;
        }
        if (!stream.next(message)) {
            break;
        }

        QString threadKey;
        QString error;
        Outcome outcome = importMessage(message, true, &threadKey, &error);
        count(outcome, error, result);
        if (outcome == Outcome::Inserted) {
            touched.insert(threadKey);
        }

        if (++processed % PROGRESS_INTERVAL == 0) {
            emit progressUpdated(processed, 0, QString("Messages: %1 processed").arg(processed));
        }
    }

    // Self-heal aggregates even when the batch was cancelled part way
    int healed = healThreads(touched, &result);
    qDebug() << "[Reconciler] Recomputed" << healed << "threads";

    finishImport(stream, result, "Messages");
    return result;
}

Reconciler::Outcome Reconciler::importMessage(const MessageRecord &message, bool checkDuplicates,
                                              QString *threadKey, QString *error)
{
    if (message.id.isEmpty()) {
        *error = "Message without id";
        return Outcome::Invalid;
    }

    MessageRecord record = message;
    if (record.phoneIdentity.isEmpty()) {
        record.phoneIdentity = RecordCodecs::UNKNOWN_IDENTITY;
    }
    if (record.conversationKey.isEmpty()) {
        record.conversationKey = record.phoneIdentity;
    }
    if (!record.timestamp.isValid()) {
        *error = QString("Message %1 has no timestamp").arg(record.id);
        return Outcome::Invalid;
    }

    Transaction transaction(m_store);
    if (!transaction.isActive()) {
        *error = m_store->lastError();
        return Outcome::Failed;
    }

    if (m_store->hasMessage(record.id)) {
        return Outcome::Skipped;
    }

    QString signature = RecordCodecs::messageSignature(record.phoneIdentity, record.text);
    if (checkDuplicates && m_store->hasDuplicateMessage(record.conversationKey, signature,
                                                        record.timestamp, m_dedupWindowSeconds)) {
        qDebug() << "[Reconciler] Duplicate of message" << record.id << "in" << record.conversationKey;
        return Outcome::Skipped;
    }

    ConversationThread thread = m_store->thread(record.conversationKey);
    if (!thread.isValid()) {
        thread.key = record.conversationKey;
        thread.isGroup = record.isGroup;
        thread.participants = record.participants;
        thread.groupName = record.groupName;
        if (!record.isGroup) {
            thread.phoneIdentity = record.phoneIdentity;
        }
    }
    if (!thread.isGroup && thread.contactId.isEmpty()) {
        thread.contactId = m_store->contactIdForPhone(thread.phoneIdentity);
    }
    if (thread.isGroup && thread.groupName.isEmpty()) {
        thread.groupName = record.groupName;
    }

    if (!m_store->insertMessage(record, signature)) {
        *error = QString("Message %1: %2").arg(record.id, m_store->lastError());
        return Outcome::Failed;
    }

    if (!thread.lastActivity.isValid() || record.timestamp >= thread.lastActivity) {
        thread.lastMessageId = record.id;
        thread.lastActivity = record.timestamp;
        thread.lastMessagePreview = RecordCodecs::preview(record.text);
    }
    thread.messageCount++;
    if (record.direction == MessageDirection::Inbound && !record.isRead) {
        thread.unreadCount++;
    }

    if (!m_store->saveThread(thread) || !transaction.commit()) {
        *error = QString("Thread %1: %2").arg(thread.key, m_store->lastError());
        return Outcome::Failed;
    }

    *threadKey = thread.key;
    return Outcome::Inserted;
}

int Reconciler::healThreads(const QSet<QString> &keys, ImportResult *result)
{
    int healed = 0;
    for (const QString &key : keys) {
        Transaction transaction(m_store);
        if (transaction.isActive() && m_store->recomputeThread(key) && transaction.commit()) {
            healed++;
            continue;
        }

        QString error = QString("Thread %1: %2").arg(key, m_store->lastError());
        qWarning() << "[Reconciler] Failed to recompute" << error;
        if (result) {
            result->addError(QString("%1: %2").arg(errorCodeName(ErrorCode::StoreError), error));
        }
    }
    return healed;
}

// ========== Calls ==========

ImportResult Reconciler::importRecords(RecordStream<CallRecord> &stream)
{
    ImportResult result;
    CallRecord call;
    int processed = 0;

    while (true) {
        if (isCancelled()) {
            result.cancelled = true;
            break;
        }
        if (!stream.next(call)) {
            break;
        }

        QString error;
        count(importCall(call, &error), error, result);

        if (++processed % PROGRESS_INTERVAL == 0) {
            emit progressUpdated(processed, 0, QString("Calls: %1 processed").arg(processed));
        }
    }

    finishImport(stream, result, "Call history");
    return result;
}

Reconciler::Outcome Reconciler::importCall(const CallRecord &call, QString *error)
{
    if (call.id.isEmpty()) {
        *error = "Call without id";
        return Outcome::Invalid;
    }
    if (!call.timestamp.isValid()) {
        *error = QString("Call %1 has no timestamp").arg(call.id);
        return Outcome::Invalid;
    }

    Transaction transaction(m_store);
    if (!transaction.isActive()) {
        *error = m_store->lastError();
        return Outcome::Failed;
    }

    if (m_store->hasCall(call.id)) {
        return Outcome::Skipped;
    }

    if (!m_store->insertCall(call) || !transaction.commit()) {
        *error = QString("Call %1: %2").arg(call.id, m_store->lastError());
        return Outcome::Failed;
    }
    return Outcome::Inserted;
}

// ========== Outbound ==========

bool Reconciler::recordOutbound(const OutboundReport &report, QString *messageId)
{
    MessageRecord message;
    message.id = report.result.ok && !report.result.receipt.messageId.isEmpty()
        ? report.result.receipt.messageId
        : QString("outbound-%1").arg(QUuid::createUuid().toString(QUuid::WithoutBraces));
    message.phoneIdentity = RecordCodecs::normalizePhone(report.identity);
    message.conversationKey = message.phoneIdentity;
    message.text = report.content;
    message.channel = report.channel;
    message.direction = MessageDirection::Outbound;
    message.timestamp = report.result.receipt.sentAt.isValid()
        ? report.result.receipt.sentAt.toUTC()
        : QDateTime::currentDateTimeUtc();
    message.isRead = true;
    message.isDelivered = report.result.ok && report.result.receipt.delivered;
    message.isFailed = !report.result.ok;

    QString threadKey;
    QString error;
    Outcome outcome = importMessage(message, false, &threadKey, &error);

    if (outcome == Outcome::Skipped) {
        qInfo() << "[Reconciler] Outbound message" << message.id << "already recorded";
        return false;
    }
    if (outcome == Outcome::Failed || outcome == Outcome::Invalid) {
        qWarning() << "[Reconciler]" << error;
        emit errorOccurred(error);
        return false;
    }

    if (messageId) {
        *messageId = message.id;
    }

    emit logMessage(QString("Recorded %1 message to %2")
        .arg(report.result.ok ? "sent" : "failed", message.phoneIdentity));
    return true;
}

// ========== Remediation ==========

CleanupReport Reconciler::removeDuplicateMessages()
{
    CleanupReport report;

    emit logMessage("Scanning store for duplicate messages...");

    Transaction transaction(m_store);
    if (!transaction.isActive()) {
        emit errorOccurred(QString("Cleanup failed: %1").arg(m_store->lastError()));
        return CleanupReport();
    }

    // Rows arrive oldest first, so the first row of a group is the keeper
    const QList<MessageSignatureRow> rows = m_store->messageSignatures();
    QHash<QString, QString> keepers;
    QStringList duplicates;
    QSet<QString> touched;

    for (const MessageSignatureRow &row : rows) {
        QString signature = RecordCodecs::messageSignature(row.phoneIdentity, row.content);
        if (row.signature != signature && !m_store->setMessageSignature(row.id, signature)) {
            emit errorOccurred(QString("Cleanup failed: %1").arg(m_store->lastError()));
            return CleanupReport();
        }

        if (keepers.contains(signature)) {
            duplicates.append(row.id);
            touched.insert(row.threadKey);
        } else {
            keepers.insert(signature, row.id);
        }
    }
    report.groupsExamined = keepers.size();

    if (!duplicates.isEmpty()) {
        int removed = m_store->deleteMessages(duplicates);
        if (removed < 0) {
            emit errorOccurred(QString("Cleanup failed: %1").arg(m_store->lastError()));
            return CleanupReport();
        }
        report.duplicatesRemoved = removed;

        for (const QString &key : touched) {
            if (!m_store->recomputeThread(key)) {
                emit errorOccurred(QString("Cleanup failed: %1").arg(m_store->lastError()));
                return CleanupReport();
            }
            report.threadsRepaired++;
        }
    }

    int emptied = m_store->deleteEmptyThreads();
    if (emptied < 0 || !transaction.commit()) {
        emit errorOccurred(QString("Cleanup failed: %1").arg(m_store->lastError()));
        return CleanupReport();
    }
    report.threadsRemoved = emptied;

    qInfo() << "[Reconciler] Cleanup removed" << report.duplicatesRemoved << "duplicates from"
            << report.groupsExamined << "groups";
    emit logMessage(QString("Cleanup complete - Removed: %1, Threads repaired: %2, Threads removed: %3")
        .arg(report.duplicatesRemoved).arg(report.threadsRepaired).arg(report.threadsRemoved));
    return report;
}

} // namespace PhoneSync
