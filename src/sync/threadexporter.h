#ifndef THREADEXPORTER_H
#define THREADEXPORTER_H

#include <QString>
#include <QList>
#include <QHash>
#include "synctypes.h"

namespace PhoneSync {

class RecordStore;

/**
 * @brief Serializes conversation threads, the call log and contacts
 *
 * Thread formats:
 *   - Csv: header row, one message per row, RFC 4180 quoting, CRLF endings
 *   - Json: array of message objects
 *   - PlainText: "[timestamp] -> identity: text" for sent messages,
 *     "[timestamp] <- identity: text" for received ones
 *
 * Messages are written oldest first, calls most recent first. Call
 * durations are written as m:ss. Contacts are exported as CSV only.
 */
class ThreadExporter
{
public:
    enum class Format {
        Csv,
        Json,
        PlainText
    };

    static QString formatName(Format format);
    static QString fileExtension(Format format);
    static bool formatFromName(const QString &name, Format *format);

    static QString toCsv(const QList<MessageRecord> &messages);
    static QString toJson(const QList<MessageRecord> &messages);
    static QString toPlainText(const QList<MessageRecord> &messages);

    static QString serialize(const QList<MessageRecord> &messages, Format format);

    // ========== Call log ==========

    /**
     * @param contactNames Display names by contact id; unknown ids print "Unknown"
     */
    static QString callsToCsv(const QList<CallRecord> &calls,
                              const QHash<QString, QString> &contactNames = {});
    static QString callsToJson(const QList<CallRecord> &calls,
                               const QHash<QString, QString> &contactNames = {});

    /**
     * @brief "[timestamp] OUTGOING call to Alice (1:05)" lines
     *
     * Falls back to the phone identity when the call has no contact.
     */
    static QString callsToPlainText(const QList<CallRecord> &calls,
                                    const QHash<QString, QString> &contactNames = {});

    static QString serializeCalls(const QList<CallRecord> &calls, Format format,
                                  const QHash<QString, QString> &contactNames = {});

    /**
     * @brief Duration as minutes and zero-padded seconds ("1:05", "0:00")
     */
    static QString formatDuration(int seconds);

    // ========== Contacts ==========

    /**
     * @brief CSV with one contact per row
     *
     * Phone numbers and emails are written as "label: value" pairs
     * separated by "; " in a single field.
     */
    static QString contactsToCsv(const QList<ContactRecord> &contacts);

    /**
     * @brief Serialize a stored thread
     * @param error Set when the thread does not exist
     * @return Serialized text, empty on error
     */
    static QString exportThread(RecordStore *store, const QString &threadKey,
                                Format format, QString *error = nullptr);

    /**
     * @brief Serialize a stored thread into a UTF-8 file
     */
    static bool exportThreadToFile(RecordStore *store, const QString &threadKey,
                                   Format format, const QString &filePath,
                                   QString *error = nullptr);

    /**
     * @brief Serialize every stored call, most recent first
     * @param error Set when the store is not open
     */
    static QString exportCalls(RecordStore *store, Format format, QString *error = nullptr);
    static bool exportCallsToFile(RecordStore *store, Format format, const QString &filePath,
                                  QString *error = nullptr);

    /**
     * @brief Write every stored contact as CSV into a UTF-8 file
     * @param exported Receives the number of contacts written
     */
    static bool exportContactsToFile(RecordStore *store, const QString &filePath,
                                     int *exported = nullptr, QString *error = nullptr);

private:
    static QString csvField(const QString &value);
    static QString labeledValues(const QList<LabeledValue> &values);
    static QString contactName(const CallRecord &call, const QHash<QString, QString> &contactNames);
    static QHash<QString, QString> contactNames(RecordStore *store, const QList<CallRecord> &calls);

    /**
     * @brief Write content as UTF-8, failing on a short or unflushed write
     */
    static bool writeFile(const QString &filePath, const QString &content, QString *error);
};

} // namespace PhoneSync

#endif // THREADEXPORTER_H
