#ifndef RECORDCODECS_H
#define RECORDCODECS_H

#include <QString>
#include <QStringList>
#include <QDateTime>

/**
 * @brief Shared conversions for records read from device databases
 *
 * Pure functions, safe to call from any thread:
 *   - vendor epoch timestamps (seconds since 2001-01-01T00:00:00Z)
 *   - multi-value label codes for phone numbers and emails
 *   - phone number normalization into a stable identity
 *   - message content normalization and dedup signatures
 */
class RecordCodecs
{
public:
    /// Seconds between the Unix epoch and 2001-01-01T00:00:00Z
    static constexpr qint64 VENDOR_EPOCH_OFFSET = 978307200;

    /// Identity used when a record carries no usable phone or address
    static const QString UNKNOWN_IDENTITY;

    // ========== Time ==========

    /**
     * @brief The vendor epoch, 2001-01-01T00:00:00Z
     */
    static QDateTime vendorEpoch();

    /**
     * @brief Convert vendor epoch seconds to a UTC date/time
     *
     * Fractional seconds are kept to millisecond precision.
     */
    static QDateTime fromVendorSeconds(double seconds);

    /**
     * @brief Convert a raw message database date column
     *
     * Newer message databases store nanoseconds rather than seconds since
     * the vendor epoch. Values too large to be plausible seconds are
     * treated as nanoseconds.
     */
    static QDateTime fromVendorTimestamp(qint64 raw);

    /**
     * @brief Convert a date/time back to vendor epoch seconds
     */
    static double toVendorSeconds(const QDateTime &dateTime);

    // ========== Labels ==========

    /**
     * @brief Map a phone label code to its human label
     *
     * 1 mobile, 2 home, 3 work, 4 main, 5 home fax, 6 work fax,
     * 7 pager, 8 other. Unknown codes map to "other".
     */
    static QString phoneLabel(int code);

    /**
     * @brief Map an email label code to its human label
     *
     * 1 home, 2 work, 3 other. Unknown codes map to "other".
     */
    static QString emailLabel(int code);

    // ========== Identity ==========

    /**
     * @brief Normalize a phone number or message handle
     *
     * Strips a leading "+1" (or bare "+") prefix and all non-digits, then
     * formats 10-digit results as "(AAA) BBB-CCCC". Other lengths stay as
     * bare digits. Email handles are lower-cased instead. Empty or
     * digit-less input yields UNKNOWN_IDENTITY.
     */
    static QString normalizePhone(const QString &handle);

    /**
     * @brief Whether a handle is an email address rather than a number
     */
    static bool isEmailHandle(const QString &handle);

    /**
     * @brief Conversation key for a group of participants
     *
     * "group:" followed by the sorted, de-duplicated normalized identities
     * joined with ",".
     */
    static QString groupConversationKey(const QStringList &participants);

    // ========== Content ==========

    /**
     * @brief Collapse whitespace runs and trim
     */
    static QString normalizeContent(const QString &text);

    /**
     * @brief Stable dedup signature of (identity, content)
     *
     * Lower-case hex SHA-1 of the normalized identity and the normalized
     * content separated by a unit separator.
     */
    static QString messageSignature(const QString &identity, const QString &content);

    /**
     * @brief Short single-line preview of message text
     */
    static QString preview(const QString &text, int maxLength = 100);
};

#endif // RECORDCODECS_H
