#include "synctypes.h"

namespace PhoneSync {

QString categoryId(Category category)
{
    switch (category) {
    case Category::Contacts:
        return "contacts";
    case Category::Messages:
        return "messages";
    case Category::CallHistory:
        return "calls";
    }
    return QString();
}

QString categoryDisplayName(Category category)
{
    switch (category) {
    case Category::Contacts:
        return "Contacts";
    case Category::Messages:
        return "Messages";
    case Category::CallHistory:
        return "Call History";
    }
    return QString();
}

bool categoryFromId(const QString &id, Category *category)
{
    for (Category candidate : allCategories()) {
        if (categoryId(candidate) == id) {
            if (category) {
                *category = candidate;
            }
            return true;
        }
    }
    return false;
}

QList<Category> allCategories()
{
    return {Category::Contacts, Category::Messages, Category::CallHistory};
}

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:                return "None";
    case ErrorCode::ManifestUnavailable: return "ManifestUnavailable";
    case ErrorCode::BackupEncrypted:     return "BackupEncrypted";
    case ErrorCode::SourceNotPresent:    return "SourceNotPresent";
    case ErrorCode::RecordDecodeError:   return "RecordDecodeError";
    case ErrorCode::AlreadyRunning:      return "AlreadyRunning";
    case ErrorCode::CooldownActive:      return "CooldownActive";
    case ErrorCode::NotConfigured:       return "NotConfigured";
    case ErrorCode::StoreError:          return "StoreError";
    case ErrorCode::Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

ErrorCode errorCodeFromName(const QString &name)
{
    static const QList<ErrorCode> codes = {
        ErrorCode::None, ErrorCode::ManifestUnavailable, ErrorCode::BackupEncrypted,
        ErrorCode::SourceNotPresent, ErrorCode::RecordDecodeError, ErrorCode::AlreadyRunning,
        ErrorCode::CooldownActive, ErrorCode::NotConfigured, ErrorCode::StoreError,
        ErrorCode::Cancelled
    };
    for (ErrorCode code : codes) {
        if (errorCodeName(code) == name) {
            return code;
        }
    }
    return ErrorCode::None;
}

// Stored names are persisted in the store, keep them stable.

QString channelKindName(ChannelKind kind)
{
    switch (kind) {
    case ChannelKind::CarrierSms:    return "sms";
    case ChannelKind::IpMessage:     return "imessage";
    case ChannelKind::RichMessaging: return "rcs";
    }
    return "sms";
}

ChannelKind channelKindFromName(const QString &name)
{
    if (name == "imessage") {
        return ChannelKind::IpMessage;
    }
    if (name == "rcs") {
        return ChannelKind::RichMessaging;
    }
    return ChannelKind::CarrierSms;
}

QString messageDirectionName(MessageDirection direction)
{
    return direction == MessageDirection::Outbound ? "outbound" : "inbound";
}

MessageDirection messageDirectionFromName(const QString &name)
{
    return name == "outbound" ? MessageDirection::Outbound : MessageDirection::Inbound;
}

QString callDirectionName(CallDirection direction)
{
    switch (direction) {
    case CallDirection::Outgoing: return "outgoing";
    case CallDirection::Incoming: return "incoming";
    case CallDirection::Missed:   return "missed";
    }
    return "incoming";
}

CallDirection callDirectionFromName(const QString &name)
{
    if (name == "outgoing") {
        return CallDirection::Outgoing;
    }
    if (name == "missed") {
        return CallDirection::Missed;
    }
    return CallDirection::Incoming;
}

QString ContactRecord::displayName() const
{
    QString name = QString("%1 %2").arg(firstName, lastName).trimmed();
    if (!name.isEmpty()) {
        return name;
    }
    if (!organization.isEmpty()) {
        return organization;
    }
    return "Unknown";
}

} // namespace PhoneSync
