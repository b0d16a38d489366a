#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMetaType>

/**
 * @file synctypes.h
 * @brief Common types and enums for backup ingestion and reconciliation
 *
 * Records produced by the extractors, the aggregates maintained by the
 * reconciler and the result structures reported back to callers.
 */

namespace PhoneSync {

/**
 * @brief Record categories handled by the sync layer
 */
enum class Category {
    Contacts,       ///< Address book entries
    Messages,       ///< SMS / iMessage conversation messages
    CallHistory     ///< Call log entries
};

/**
 * @brief Stable identifier for a category ("contacts", "messages", "calls")
 */
QString categoryId(Category category);

/**
 * @brief Human-readable name for a category
 */
QString categoryDisplayName(Category category);

/**
 * @brief Parse a category identifier
 * @return true if @p id named a known category
 */
bool categoryFromId(const QString &id, Category *category);

/**
 * @brief All categories in canonical order
 */
QList<Category> allCategories();

/**
 * @brief Error taxonomy for ingestion runs
 */
enum class ErrorCode {
    None,
    ManifestUnavailable,    ///< Index missing or unreadable (fatal for the run)
    BackupEncrypted,        ///< Encrypted container, unsupported (fatal)
    SourceNotPresent,       ///< Category database absent (warning only)
    RecordDecodeError,      ///< One record could not be decoded (counted)
    AlreadyRunning,         ///< Category already has an active run
    CooldownActive,         ///< Category ran too recently
    NotConfigured,          ///< No conduit, store or backup path set
    StoreError,             ///< Store rejected a read or write
    Cancelled               ///< Run stopped by the cancel check
};

/**
 * @brief Name of an error code, as shown in logs and run reports
 */
QString errorCodeName(ErrorCode code);
ErrorCode errorCodeFromName(const QString &name);

/**
 * @brief Transport a message travelled over
 */
enum class ChannelKind {
    CarrierSms,     ///< Carrier SMS/MMS
    IpMessage,      ///< iMessage
    RichMessaging   ///< RCS
};

QString channelKindName(ChannelKind kind);
ChannelKind channelKindFromName(const QString &name);

enum class MessageDirection {
    Inbound,
    Outbound
};

QString messageDirectionName(MessageDirection direction);
MessageDirection messageDirectionFromName(const QString &name);

enum class CallDirection {
    Outgoing,
    Incoming,
    Missed
};

QString callDirectionName(CallDirection direction);
CallDirection callDirectionFromName(const QString &name);

/**
 * @brief A labelled multi-value attribute (phone number or email)
 */
struct LabeledValue {
    QString label;      ///< Human label ("mobile", "work", ...)
    QString value;      ///< Raw value as stored on the device

    bool operator==(const LabeledValue &other) const {
        return label == other.label && value == other.value;
    }
};

/**
 * @brief Normalized address book entry
 */
struct ContactRecord {
    QString id;                         ///< Source-native id (ABPerson ROWID)
    QString firstName;
    QString lastName;
    QList<LabeledValue> phoneNumbers;
    QList<LabeledValue> emails;
    QString organization;
    QString notes;

    QString displayName() const;
};

/**
 * @brief Normalized conversation message
 */
struct MessageRecord {
    QString id;                 ///< Source-native id (message ROWID)
    QString guid;               ///< Device GUID, informational
    QString conversationKey;    ///< Participant identity or group key
    QString text;
    ChannelKind channel = ChannelKind::CarrierSms;
    MessageDirection direction = MessageDirection::Inbound;
    QDateTime timestamp;        ///< UTC
    QString phoneIdentity;      ///< Normalized counterpart identity
    QStringList attachments;    ///< Attachment file names
    bool isRead = true;
    bool isDelivered = false;
    bool isFailed = false;
    bool isGroup = false;
    QStringList participants;   ///< Group members (normalized), empty for 1:1
    QString groupName;
};

/**
 * @brief Normalized call log entry
 */
struct CallRecord {
    QString id;                 ///< Source-native id (Z_PK)
    QString phoneIdentity;      ///< Normalized number
    QString contactId;          ///< Linked contact, filled in by the store
    QDateTime timestamp;        ///< UTC
    int durationSeconds = 0;
    CallDirection direction = CallDirection::Incoming;
};

/**
 * @brief Derived per-conversation aggregate
 *
 * Only the reconciler creates or mutates threads.
 */
struct ConversationThread {
    QString key;                ///< Conversation key
    QString phoneIdentity;      ///< Counterpart identity (1:1 threads)
    QString contactId;
    QString lastMessageId;
    QDateTime lastActivity;
    QString lastMessagePreview;
    int unreadCount = 0;
    int messageCount = 0;
    bool isGroup = false;
    bool archived = false;
    QStringList participants;
    QString groupName;

    bool isValid() const { return !key.isEmpty(); }
};

/**
 * @brief Per-category import counters
 */
struct ImportResult {
    int imported = 0;       ///< New records written
    int updated = 0;        ///< Existing records changed in place (contacts)
    int skipped = 0;        ///< Already present or duplicate
    int errors = 0;         ///< Records that failed to decode or store
    bool cancelled = false;
    QStringList errorList;  ///< Human readable problems

    int total() const { return imported + updated + skipped + errors; }

    void addError(const QString &message) {
        errors++;
        errorList.append(message);
    }

    QString summary() const {
        return QString("Imported: %1, Updated: %2, Skipped: %3, Errors: %4")
            .arg(imported).arg(updated).arg(skipped).arg(errors);
    }
};

/**
 * @brief Result of one category run
 */
struct SyncResult {
    Category category = Category::Contacts;
    bool success = false;
    ErrorCode errorCode = ErrorCode::None;
    QString errorMessage;
    ImportResult import;
    QStringList warnings;
    QDateTime startTime;
    QDateTime endTime;

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }

    void fail(ErrorCode code, const QString &message) {
        success = false;
        errorCode = code;
        errorMessage = message;
    }
};

/**
 * @brief Outcome of a duplicate remediation pass
 */
struct CleanupReport {
    int groupsExamined = 0;     ///< Distinct (identity, content) groups scanned
    int duplicatesRemoved = 0;  ///< Messages deleted
    int threadsRepaired = 0;    ///< Threads whose aggregates were recomputed
    int threadsRemoved = 0;     ///< Threads left empty and deleted
};

/**
 * @brief Aggregate call log figures
 */
struct CallStatistics {
    int totalCalls = 0;
    int incomingCalls = 0;
    int outgoingCalls = 0;
    int missedCalls = 0;
    qint64 totalTalkTime = 0;       ///< Seconds
    int averageCallDuration = 0;    ///< Seconds, rounded
};

} // namespace PhoneSync

Q_DECLARE_METATYPE(PhoneSync::SyncResult)
Q_DECLARE_METATYPE(PhoneSync::Category)

#endif // SYNCTYPES_H
