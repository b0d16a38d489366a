#include "contactmapper.h"
#include "recordcodecs.h"

#include <QCryptographicHash>

using PhoneSync::ContactRecord;
using PhoneSync::LabeledValue;

// Fold vCard lines to 75 octets as per RFC 6350 section 3.2
static QString foldLine(const QString &line)
{
    const int MAX_LINE_LENGTH = 75;  // octets, excluding CRLF

    QByteArray utf8 = line.toUtf8();
    if (utf8.length() <= MAX_LINE_LENGTH) {
        return line + "\r\n";
    }

    QString result;
    int pos = 0;

    while (pos < utf8.length()) {
        // Continuation lines lose one octet to the leading space
        int chunkSize = pos > 0 ? MAX_LINE_LENGTH - 1 : MAX_LINE_LENGTH;

        // Never split inside a UTF-8 sequence (continuation bytes are 10xxxxxx)
        while (chunkSize > 0 && pos + chunkSize < utf8.length() &&
               (utf8[pos + chunkSize] & 0xC0) == 0x80) {
            chunkSize--;
        }

        QString chunk = QString::fromUtf8(utf8.mid(pos, chunkSize));
        result += (pos == 0 ? chunk : " " + chunk) + "\r\n";
        pos += chunkSize;
    }

    return result;
}

// Escape text values per RFC 6350 section 3.4
static QString escapeText(const QString &value)
{
    QString escaped = value;
    escaped.replace('\\', "\\\\");
    escaped.replace(',', "\\,");
    escaped.replace(';', "\\;");
    escaped.replace("\r\n", "\\n");
    escaped.replace('\n', "\\n");
    return escaped;
}

ContactRecord ContactMapper::toRecord(const PersonRow &person, const QList<MultiValueRow> &values)
{
    ContactRecord contact;
    contact.id = QString::number(person.rowId);
    contact.firstName = person.firstName;
    contact.lastName = person.lastName;
    contact.organization = person.organization;
    contact.notes = person.note;

    for (const MultiValueRow &row : values) {
        if (row.value.trimmed().isEmpty()) {
            continue;
        }

        if (row.property == PROPERTY_PHONE) {
            contact.phoneNumbers.append(LabeledValue{RecordCodecs::phoneLabel(row.labelCode), row.value});
        } else if (row.property == PROPERTY_EMAIL) {
            contact.emails.append(LabeledValue{RecordCodecs::emailLabel(row.labelCode), row.value});
        }
    }

    return contact;
}

QString ContactMapper::contentHash(const ContactRecord &contact)
{
    QStringList parts;
    parts << contact.firstName << contact.lastName << contact.organization << contact.notes;

    for (const LabeledValue &phone : contact.phoneNumbers) {
        parts << "tel" << phone.label << phone.value;
    }
    for (const LabeledValue &email : contact.emails) {
        parts << "email" << email.label << email.value;
    }

    QByteArray data = parts.join(QChar(0x1f)).toUtf8();
    return QString::fromLatin1(QCryptographicHash::hash(data, QCryptographicHash::Sha1).toHex());
}

QStringList ContactMapper::phoneIdentities(const ContactRecord &contact)
{
    QStringList identities;
    for (const LabeledValue &phone : contact.phoneNumbers) {
        QString identity = RecordCodecs::normalizePhone(phone.value);
        if (identity != RecordCodecs::UNKNOWN_IDENTITY && !identities.contains(identity)) {
            identities << identity;
        }
    }
    return identities;
}

QString ContactMapper::phoneType(const QString &label)
{
    if (label == "mobile") return "cell";
    if (label == "home") return "home,voice";
    if (label == "work") return "work,voice";
    if (label == "main") return "pref,voice";
    if (label == "home fax") return "home,fax";
    if (label == "work fax") return "work,fax";
    if (label == "pager") return "pager";
    return "voice";
}

QString ContactMapper::contactToVCard(const ContactRecord &contact)
{
    QString vcard;

    vcard += "BEGIN:VCARD\r\n";
    vcard += "VERSION:4.0\r\n";

    // FN is required
    vcard += foldLine(QString("FN:%1").arg(escapeText(contact.displayName())));

    // Family;Given;Middle;Prefix;Suffix
    vcard += foldLine(QString("N:%1;%2;;;")
        .arg(escapeText(contact.lastName), escapeText(contact.firstName)));

    if (!contact.organization.isEmpty()) {
        vcard += foldLine(QString("ORG:%1").arg(escapeText(contact.organization)));
    }

    for (const LabeledValue &phone : contact.phoneNumbers) {
        vcard += foldLine(QString("TEL;TYPE=%1:%2").arg(phoneType(phone.label), phone.value));
    }

    for (const LabeledValue &email : contact.emails) {
        QString type = email.label == "other" ? QString("internet") : email.label;
        vcard += foldLine(QString("EMAIL;TYPE=%1:%2").arg(type, email.value));
    }

    if (!contact.notes.isEmpty()) {
        vcard += foldLine(QString("NOTE:%1").arg(escapeText(contact.notes)));
    }

    vcard += foldLine(QString("UID:phone-contact-%1").arg(contact.id));

    vcard += "END:VCARD\r\n";

    return vcard;
}
