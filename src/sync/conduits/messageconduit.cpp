#include "messageconduit.h"
#include "../reconciler.h"
#include "../../mappers/messagemapper.h"

#include <QHash>
#include <QDebug>

namespace PhoneSync {

namespace {

/**
 * @brief Side queries run for each message row
 *
 * Owned by the row decoder, so the statements are finalized before the
 * stream closes the database.
 */
struct MessageLookups {
    struct Chat {
        QString identifier;
        QString name;
        QStringList participants;
    };

    SqliteStatement chat;
    SqliteStatement participants;
    SqliteStatement attachments;
    QHash<qint64, Chat> chats;

    bool loadChat(qint64 chatId, Chat *out, QString *error)
    {
        auto it = chats.constFind(chatId);
        if (it != chats.constEnd()) {
            *out = it.value();
            return true;
        }

        Chat info;
        if (chat.isValid()) {
            chat.reset();
            chat.bind(1, chatId);
            if (chat.step()) {
                info.identifier = chat.columnText(0);
                info.name = chat.columnText(1);
            } else if (chat.hasError()) {
                *error = chat.errorString();
                return false;
            }
        }

        if (participants.isValid()) {
            participants.reset();
            participants.bind(1, chatId);
            while (participants.step()) {
                info.participants << participants.columnText(0);
            }
            if (participants.hasError()) {
                *error = participants.errorString();
                return false;
            }
        }

        chats.insert(chatId, info);
        *out = info;
        return true;
    }

    bool loadAttachments(qint64 messageId, QStringList *out, QString *error)
    {
        if (!attachments.isValid()) {
            return true;
        }
        attachments.reset();
        attachments.bind(1, messageId);
        while (attachments.step()) {
            out->append(attachments.columnText(0));
        }
        if (attachments.hasError()) {
            *error = attachments.errorString();
            return false;
        }
        return true;
    }
};

} // namespace

MessageConduit::MessageConduit(QObject *parent)
    : Conduit(parent)
{
}

std::unique_ptr<RecordStream<MessageRecord>> MessageConduit::extract(SyncContext *context,
                                                                     SyncResult &result)
{
    std::unique_ptr<SqliteDatabase> db = openSource(context, result);
    if (!db) {
        return nullptr;
    }

    // ========== Optional schema ==========

    bool hasChats = db->hasTable("chat") && db->hasTable("chat_message_join");
    bool hasChatHandles = hasChats && db->hasTable("chat_handle_join");
    bool hasAttachments = db->hasTable("message_attachment_join") && db->hasTable("attachment");
    bool hasReadFlag = db->hasColumn("message", "is_read");
    bool hasDeliveredFlag = db->hasColumn("message", "is_delivered");

    qDebug() << "[MessageConduit] chats:" << hasChats << "attachments:" << hasAttachments
             << "read flag:" << hasReadFlag << "delivered flag:" << hasDeliveredFlag;

    QString sql = QString(
        "SELECT m.ROWID, m.guid, m.text, m.service, m.is_from_me, m.date, h.id, %1, %2, %3 "
        "FROM message m "
        "LEFT JOIN handle h ON m.handle_id = h.ROWID "
        "WHERE m.text IS NOT NULL "
        "ORDER BY m.date ASC, m.ROWID ASC")
        .arg(hasReadFlag ? "m.is_read" : "NULL",
             hasDeliveredFlag ? "m.is_delivered" : "NULL",
             hasChats ? "(SELECT chat_id FROM chat_message_join "
                        "WHERE message_id = m.ROWID ORDER BY chat_id LIMIT 1)"
                      : "NULL");

    SqliteStatement messages = db->prepare(sql);
    if (!messages.isValid()) {
        QString error = QString("%1: %2").arg(errorCodeName(ErrorCode::RecordDecodeError),
                                              messages.errorString());
        qWarning() << "[MessageConduit]" << error;
        result.import.addError(error);
        emit errorOccurred(error);
        return nullptr;
    }

    std::shared_ptr<MessageLookups> lookups = std::make_shared<MessageLookups>();
    if (hasChats) {
        QString name = db->hasColumn("chat", "display_name") ? "display_name" : "NULL";
        lookups->chat = db->prepare(
            QString("SELECT chat_identifier, %1 FROM chat WHERE ROWID = ?1").arg(name));
    }
    if (hasChatHandles) {
        lookups->participants = db->prepare(
            "SELECT h.id FROM chat_handle_join j "
            "JOIN handle h ON j.handle_id = h.ROWID "
            "WHERE j.chat_id = ?1 ORDER BY h.ROWID");
    }
    if (hasAttachments) {
        lookups->attachments = db->prepare(
            "SELECT a.filename FROM message_attachment_join j "
            "JOIN attachment a ON j.attachment_id = a.ROWID "
            "WHERE j.message_id = ?1 AND a.filename IS NOT NULL "
            "ORDER BY a.ROWID");
    }

    auto decode = [lookups](const SqliteStatement &row, MessageRecord &record, QString *error) {
        MessageMapper::MessageRow message;
        message.rowId = row.columnInt64(0);
        message.guid = row.columnText(1);
        message.text = row.columnText(2);
        message.service = row.columnText(3);
        message.fromMe = row.columnInt(4) != 0;
        message.hasDate = !row.isNull(5);
        message.date = row.columnInt64(5);
        message.handle = row.columnText(6);
        message.hasReadFlag = !row.isNull(7);
        message.isRead = row.columnInt(7) != 0;
        message.hasDeliveredFlag = !row.isNull(8);
        message.isDelivered = row.columnInt(8) != 0;

        QString lookupError;
        if (!row.isNull(9)) {
            MessageLookups::Chat chat;
            if (!lookups->loadChat(row.columnInt64(9), &chat, &lookupError)) {
                *error = QString("Message %1: %2").arg(message.rowId).arg(lookupError);
                return false;
            }
            message.chatIdentifier = chat.identifier;
            message.chatName = chat.name;
            message.chatParticipants = chat.participants;
        }

        if (!lookups->loadAttachments(message.rowId, &message.attachments, &lookupError)) {
            *error = QString("Message %1: %2").arg(message.rowId).arg(lookupError);
            return false;
        }

        return MessageMapper::toRecord(message, &record, error);
    };

    return std::unique_ptr<RecordStream<MessageRecord>>(new SqliteRecordStream<MessageRecord>(
        std::move(db), std::move(messages), decode, m_cancelCheck));
}

void MessageConduit::runImport(SyncContext *context, SyncResult &result)
{
    std::unique_ptr<RecordStream<MessageRecord>> stream = extract(context, result);
    if (!stream) {
        return;
    }

    result.import = context->reconciler->importRecords(*stream);
}

} // namespace PhoneSync
