#include "threadexporter.h"
#include "recordstore.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

namespace PhoneSync {

QString ThreadExporter::formatName(Format format)
{
    switch (format) {
    case Format::Csv:       return "csv";
    case Format::Json:      return "json";
    case Format::PlainText: return "text";
    }
    return "text";
}

QString ThreadExporter::fileExtension(Format format)
{
    switch (format) {
    case Format::Csv:       return "csv";
    case Format::Json:      return "json";
    case Format::PlainText: return "txt";
    }
    return "txt";
}

bool ThreadExporter::formatFromName(const QString &name, Format *format)
{
    QString lower = name.trimmed().toLower();
    if (lower == "csv") {
        *format = Format::Csv;
    } else if (lower == "json") {
        *format = Format::Json;
    } else if (lower == "text" || lower == "txt") {
        *format = Format::PlainText;
    } else {
        return false;
    }
    return true;
}

// ========== CSV ==========

QString ThreadExporter::csvField(const QString &value)
{
    if (!value.contains(',') && !value.contains('"')
        && !value.contains('\n') && !value.contains('\r')) {
        return value;
    }
    QString escaped = value;
    escaped.replace("\"", "\"\"");
    return "\"" + escaped + "\"";
}

QString ThreadExporter::toCsv(const QList<MessageRecord> &messages)
{
    QString csv = "timestamp,direction,identity,channel,text,read,delivered\r\n";

    for (const MessageRecord &message : messages) {
        QStringList fields;
        fields << message.timestamp.toUTC().toString(Qt::ISODate)
               << messageDirectionName(message.direction)
               << csvField(message.phoneIdentity)
               << channelKindName(message.channel)
               << csvField(message.text)
               << (message.isRead ? "1" : "0")
               << (message.isDelivered ? "1" : "0");
        csv += fields.join(',') + "\r\n";
    }
    return csv;
}

// ========== JSON ==========

QString ThreadExporter::toJson(const QList<MessageRecord> &messages)
{
    QJsonArray array;
    for (const MessageRecord &message : messages) {
        QJsonObject obj;
        obj["id"] = message.id;
        obj["timestamp"] = message.timestamp.toUTC().toString(Qt::ISODate);
        obj["direction"] = messageDirectionName(message.direction);
        obj["identity"] = message.phoneIdentity;
        obj["channel"] = channelKindName(message.channel);
        obj["text"] = message.text;
        obj["read"] = message.isRead;
        obj["delivered"] = message.isDelivered;
        obj["failed"] = message.isFailed;
        if (!message.attachments.isEmpty()) {
            obj["attachments"] = QJsonArray::fromStringList(message.attachments);
        }
        array.append(obj);
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Indented));
}

// ========== Plain text ==========

QString ThreadExporter::toPlainText(const QList<MessageRecord> &messages)
{
    QString text;
    for (const MessageRecord &message : messages) {
        QString arrow = message.direction == MessageDirection::Outbound ? "->" : "<-";
        text += QString("[%1] %2 %3: %4\n")
            .arg(message.timestamp.toUTC().toString("yyyy-MM-dd HH:mm:ss"),
                 arrow, message.phoneIdentity, message.text);
    }
    return text;
}

QString ThreadExporter::serialize(const QList<MessageRecord> &messages, Format format)
{
    switch (format) {
    case Format::Csv:       return toCsv(messages);
    case Format::Json:      return toJson(messages);
    case Format::PlainText: return toPlainText(messages);
    }
    return QString();
}

// ========== Store export ==========

QString ThreadExporter::exportThread(RecordStore *store, const QString &threadKey,
                                     Format format, QString *error)
{
    if (!store || !store->isAvailable()) {
        if (error) *error = "Record store is not open";
        return QString();
    }

    if (!store->thread(threadKey).isValid()) {
        if (error) *error = QString("No conversation %1").arg(threadKey);
        return QString();
    }

    QList<MessageRecord> messages = store->threadMessages(threadKey);
    qDebug() << "[ThreadExporter] Exporting" << messages.size() << "messages of" << threadKey
             << "as" << formatName(format);
    return serialize(messages, format);
}

bool ThreadExporter::exportThreadToFile(RecordStore *store, const QString &threadKey,
                                        Format format, const QString &filePath,
                                        QString *error)
{
    QString exportError;
    QString content = exportThread(store, threadKey, format, &exportError);
    if (!exportError.isEmpty()) {
        if (error) *error = exportError;
        return false;
    }

    return writeFile(filePath, content, error);
}

bool ThreadExporter::writeFile(const QString &filePath, const QString &content, QString *error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error) *error = QString("Failed to write %1: %2").arg(filePath, file.errorString());
        qWarning() << "[ThreadExporter]" << file.errorString();
        return false;
    }

    const QByteArray data = content.toUtf8();
    if (file.write(data) != data.size() || !file.flush()) {
        if (error) *error = QString("Failed to write %1: %2").arg(filePath, file.errorString());
        qWarning() << "[ThreadExporter] Short write to" << filePath << file.errorString();
        file.close();
        return false;
    }

    file.close();
    return true;
}

// ========== Call log ==========

QString ThreadExporter::formatDuration(int seconds)
{
    if (seconds <= 0) {
        return "0:00";
    }
    return QString("%1:%2").arg(seconds / 60).arg(seconds % 60, 2, 10, QChar('0'));
}

QString ThreadExporter::contactName(const CallRecord &call,
                                    const QHash<QString, QString> &contactNames)
{
    return contactNames.value(call.contactId);
}

QString ThreadExporter::callsToCsv(const QList<CallRecord> &calls,
                                   const QHash<QString, QString> &contactNames)
{
    QString csv = "timestamp,contact,identity,direction,duration\r\n";

    for (const CallRecord &call : calls) {
        QString name = contactName(call, contactNames);
        QStringList fields;
        fields << call.timestamp.toUTC().toString(Qt::ISODate)
               << csvField(name.isEmpty() ? QString("Unknown") : name)
               << csvField(call.phoneIdentity)
               << callDirectionName(call.direction)
               << formatDuration(call.durationSeconds);
        csv += fields.join(',') + "\r\n";
    }
    return csv;
}

QString ThreadExporter::callsToJson(const QList<CallRecord> &calls,
                                    const QHash<QString, QString> &contactNames)
{
    QJsonArray array;
    for (const CallRecord &call : calls) {
        QJsonObject obj;
        obj["id"] = call.id;
        obj["timestamp"] = call.timestamp.toUTC().toString(Qt::ISODate);
        obj["identity"] = call.phoneIdentity;
        obj["direction"] = callDirectionName(call.direction);
        obj["durationSeconds"] = call.durationSeconds;
        if (!call.contactId.isEmpty()) {
            obj["contactId"] = call.contactId;
            obj["contactName"] = contactName(call, contactNames);
        }
        array.append(obj);
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Indented));
}

QString ThreadExporter::callsToPlainText(const QList<CallRecord> &calls,
                                         const QHash<QString, QString> &contactNames)
{
    QString text;
    for (const CallRecord &call : calls) {
        QString who = contactName(call, contactNames);
        if (who.isEmpty()) {
            who = call.phoneIdentity;
        }
        QString preposition = call.direction == CallDirection::Outgoing ? "to" : "from";
        text += QString("[%1] %2 call %3 %4 (%5)\n")
            .arg(call.timestamp.toUTC().toString("yyyy-MM-dd HH:mm:ss"),
                 callDirectionName(call.direction).toUpper(),
                 preposition, who, formatDuration(call.durationSeconds));
    }
    return text;
}

QString ThreadExporter::serializeCalls(const QList<CallRecord> &calls, Format format,
                                       const QHash<QString, QString> &contactNames)
{
    switch (format) {
    case Format::Csv:       return callsToCsv(calls, contactNames);
    case Format::Json:      return callsToJson(calls, contactNames);
    case Format::PlainText: return callsToPlainText(calls, contactNames);
    }
    return QString();
}

QHash<QString, QString> ThreadExporter::contactNames(RecordStore *store,
                                                     const QList<CallRecord> &calls)
{
    QHash<QString, QString> names;
    for (const CallRecord &call : calls) {
        if (call.contactId.isEmpty() || names.contains(call.contactId)) {
            continue;
        }
        ContactRecord contact = store->contact(call.contactId);
        names.insert(call.contactId, contact.id.isEmpty() ? QString() : contact.displayName());
    }
    return names;
}

QString ThreadExporter::exportCalls(RecordStore *store, Format format, QString *error)
{
    if (!store || !store->isAvailable()) {
        if (error) *error = "Record store is not open";
        return QString();
    }

    QList<CallRecord> calls = store->calls();
    qDebug() << "[ThreadExporter] Exporting" << calls.size() << "calls as" << formatName(format);
    return serializeCalls(calls, format, contactNames(store, calls));
}

bool ThreadExporter::exportCallsToFile(RecordStore *store, Format format,
                                       const QString &filePath, QString *error)
{
    QString exportError;
    QString content = exportCalls(store, format, &exportError);
    if (!exportError.isEmpty()) {
        if (error) *error = exportError;
        return false;
    }
    return writeFile(filePath, content, error);
}

// ========== Contacts ==========

QString ThreadExporter::labeledValues(const QList<LabeledValue> &values)
{
    QStringList parts;
    for (const LabeledValue &value : values) {
        parts << QString("%1: %2").arg(value.label, value.value);
    }
    return parts.join("; ");
}

QString ThreadExporter::contactsToCsv(const QList<ContactRecord> &contacts)
{
    QString csv = "first_name,last_name,display_name,phone_numbers,emails,organization\r\n";

    for (const ContactRecord &contact : contacts) {
        QStringList fields;
        fields << csvField(contact.firstName)
               << csvField(contact.lastName)
               << csvField(contact.displayName())
               << csvField(labeledValues(contact.phoneNumbers))
               << csvField(labeledValues(contact.emails))
               << csvField(contact.organization);
        csv += fields.join(',') + "\r\n";
    }
    return csv;
}

bool ThreadExporter::exportContactsToFile(RecordStore *store, const QString &filePath,
                                          int *exported, QString *error)
{
    if (!store || !store->isAvailable()) {
        if (error) *error = "Record store is not open";
        return false;
    }

    QList<ContactRecord> contacts = store->contacts();
    if (!writeFile(filePath, contactsToCsv(contacts), error)) {
        return false;
    }

    qInfo() << "[ThreadExporter] Exported" << contacts.size() << "contacts to" << filePath;
    if (exported) *exported = contacts.size();
    return true;
}

} // namespace PhoneSync
