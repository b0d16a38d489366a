#ifndef CONTACTMAPPER_H
#define CONTACTMAPPER_H

#include <QString>
#include <QStringList>
#include <QList>
#include "../sync/synctypes.h"

/**
 * @brief Mapper for address book rows to ContactRecord
 *
 * The device address book keeps one row per person plus a side table of
 * multi-valued attributes. Each attribute row carries a property
 * discriminator (phone or email) and a label code. This mapper turns those
 * rows into a normalized ContactRecord and serializes records to vCard 4.0.
 */
class ContactMapper
{
public:
    /// Property discriminator for phone numbers in the multi-value table
    static const int PROPERTY_PHONE = 3;
    /// Property discriminator for email addresses in the multi-value table
    static const int PROPERTY_EMAIL = 4;

    /**
     * @brief One person row as read from the address book
     */
    struct PersonRow {
        qint64 rowId = 0;
        QString firstName;
        QString lastName;
        QString organization;
        QString note;
    };

    /**
     * @brief One multi-value attribute row
     */
    struct MultiValueRow {
        int property = 0;
        int labelCode = 0;
        QString value;
    };

    /**
     * @brief Build a ContactRecord from a person and its attributes
     *
     * Attributes with other property values or empty values are ignored.
     */
    static PhoneSync::ContactRecord toRecord(const PersonRow &person,
                                             const QList<MultiValueRow> &values);

    /**
     * @brief Hash over every imported field, used to detect changed contacts
     */
    static QString contentHash(const PhoneSync::ContactRecord &contact);

    /**
     * @brief Normalized identities of all phone numbers of a contact
     */
    static QStringList phoneIdentities(const PhoneSync::ContactRecord &contact);

    /**
     * @brief Convert a contact to vCard 4.0 format
     * @return vCard string (RFC 6350) with CRLF line endings
     */
    static QString contactToVCard(const PhoneSync::ContactRecord &contact);

    /**
     * @brief vCard TYPE parameter for a phone label
     */
    static QString phoneType(const QString &label);
};

#endif // CONTACTMAPPER_H
