#include "messagemapper.h"
#include "recordcodecs.h"

using namespace PhoneSync;

bool MessageMapper::toRecord(const MessageRow &row, MessageRecord *record, QString *error)
{
    if (!row.hasDate) {
        if (error) {
            *error = QString("Message %1 has no date").arg(row.rowId);
        }
        return false;
    }

    MessageRecord message;
    message.id = QString::number(row.rowId);
    message.guid = row.guid;
    message.text = row.text;
    message.channel = channelKind(row.service);
    message.direction = row.fromMe ? MessageDirection::Outbound : MessageDirection::Inbound;
    message.timestamp = RecordCodecs::fromVendorTimestamp(row.date);

    // Outgoing messages in a chat often have no handle, fall back to the chat
    QString handle = row.handle.isEmpty() ? row.chatIdentifier : row.handle;
    message.phoneIdentity = RecordCodecs::normalizePhone(handle);

    QStringList participants;
    for (const QString &participant : row.chatParticipants) {
        QString identity = RecordCodecs::normalizePhone(participant);
        if (!participants.contains(identity)) {
            participants << identity;
        }
    }

    if (participants.size() > 1) {
        participants.sort();
        message.isGroup = true;
        message.participants = participants;
        message.groupName = row.chatName;
        message.conversationKey = RecordCodecs::groupConversationKey(row.chatParticipants);
    } else {
        message.conversationKey = message.phoneIdentity;
    }

    if (message.direction == MessageDirection::Outbound) {
        message.isRead = true;
    } else {
        message.isRead = row.hasReadFlag ? row.isRead : true;
    }
    message.isDelivered = row.hasDeliveredFlag && row.isDelivered;

    for (const QString &attachment : row.attachments) {
        if (!attachment.isEmpty()) {
            message.attachments << attachment;
        }
    }

    *record = message;
    return true;
}

ChannelKind MessageMapper::channelKind(const QString &service)
{
    return service == "iMessage" ? ChannelKind::IpMessage : ChannelKind::CarrierSms;
}
