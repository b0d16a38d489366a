#ifndef MESSAGEMAPPER_H
#define MESSAGEMAPPER_H

#include <QString>
#include <QStringList>
#include "../sync/synctypes.h"

/**
 * @brief Mapper for message database rows to MessageRecord
 *
 * Handles channel classification, direction, conversation keys (1:1 or
 * group) and read/delivery flags. The row is filled by MessageConduit from
 * the message, handle and chat tables.
 */
class MessageMapper
{
public:
    struct MessageRow {
        qint64 rowId = 0;
        QString guid;
        QString text;
        QString service;            ///< "iMessage", "SMS", ...
        bool fromMe = false;
        bool hasDate = false;
        qint64 date = 0;            ///< Raw vendor epoch value
        QString handle;             ///< handle.id of the counterpart
        QString chatIdentifier;     ///< chat.chat_identifier, if any
        QString chatName;           ///< chat.display_name, if any
        QStringList chatParticipants;   ///< Raw handle ids of the chat
        bool hasReadFlag = false;
        bool isRead = false;
        bool hasDeliveredFlag = false;
        bool isDelivered = false;
        QStringList attachments;    ///< Attachment file names
    };

    /**
     * @brief Decode a row into a normalized record
     * @param error Set to a description when decoding fails
     * @return false if the row cannot be decoded (no timestamp)
     */
    static bool toRecord(const MessageRow &row, PhoneSync::MessageRecord *record, QString *error);

    /**
     * @brief Classify the service string
     *
     * "iMessage" is the IP channel, anything else is carrier SMS.
     */
    static PhoneSync::ChannelKind channelKind(const QString &service);
};

#endif // MESSAGEMAPPER_H
