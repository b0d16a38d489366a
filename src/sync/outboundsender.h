#ifndef OUTBOUNDSENDER_H
#define OUTBOUNDSENDER_H

#include <QString>
#include <QDateTime>
#include "synctypes.h"

namespace PhoneSync {

/**
 * @brief Confirmation returned by a sender for a transmitted message
 */
struct DeliveryReceipt {
    QString messageId;      ///< Id assigned by the sender, may be empty
    QDateTime sentAt;       ///< UTC, invalid if unknown
    bool delivered = false;
};

enum class SendError {
    None,
    HostUnavailable,        ///< Sending application not running or reachable
    InvalidRecipient,
    Rejected,               ///< Host refused the message
    Unknown
};

/**
 * @brief Result of OutboundSender::send()
 *
 * Holds either a receipt (ok) or an error.
 */
struct SendResult {
    bool ok = false;
    DeliveryReceipt receipt;
    SendError error = SendError::Unknown;
    QString errorMessage;

    static SendResult success(const DeliveryReceipt &receipt) {
        SendResult result;
        result.ok = true;
        result.receipt = receipt;
        result.error = SendError::None;
        return result;
    }

    static SendResult failure(SendError error, const QString &message) {
        SendResult result;
        result.error = error;
        result.errorMessage = message;
        return result;
    }
};

/**
 * @brief Outcome of a send, reported back for recording in the store
 */
struct OutboundReport {
    QString identity;       ///< Recipient phone number or address, raw
    QString content;
    ChannelKind channel = ChannelKind::CarrierSms;
    SendResult result;
};

/**
 * @brief Interface to an external component that transmits messages
 *
 * This library never transmits anything. An embedding application may
 * implement this interface against a host messaging application and hand
 * the outcome to Reconciler::recordOutbound().
 */
class OutboundSender
{
public:
    virtual ~OutboundSender() = default;

    virtual SendResult send(const QString &identity, const QString &content) = 0;
};

} // namespace PhoneSync

#endif // OUTBOUNDSENDER_H
