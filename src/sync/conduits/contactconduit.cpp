#include "contactconduit.h"
#include "../reconciler.h"
#include "../../mappers/contactmapper.h"

#include <QDebug>

namespace PhoneSync {

ContactConduit::ContactConduit(QObject *parent)
    : Conduit(parent)
{
}

std::unique_ptr<RecordStream<ContactRecord>> ContactConduit::extract(SyncContext *context,
                                                                     SyncResult &result)
{
    std::unique_ptr<SqliteDatabase> db = openSource(context, result);
    if (!db) {
        return nullptr;
    }

    // Older address books lack some person columns
    QString organization = db->hasColumn("ABPerson", "Organization") ? "Organization" : "NULL";
    QString note = db->hasColumn("ABPerson", "Note") ? "Note" : "NULL";

    SqliteStatement persons = db->prepare(QString(
        "SELECT ROWID, First, Last, %1, %2 FROM ABPerson "
        "WHERE First IS NOT NULL OR Last IS NOT NULL "
        "ORDER BY ROWID").arg(organization, note));

    std::shared_ptr<SqliteStatement> values = std::make_shared<SqliteStatement>(db->prepare(QString(
        "SELECT property, label, value FROM ABMultiValue "
        "WHERE record_id = ?1 AND property IN (%1, %2) "
        "ORDER BY ROWID").arg(ContactMapper::PROPERTY_PHONE).arg(ContactMapper::PROPERTY_EMAIL)));

    if (!persons.isValid() || !values->isValid()) {
        QString error = QString("%1: %2").arg(errorCodeName(ErrorCode::RecordDecodeError),
            persons.isValid() ? values->errorString() : persons.errorString());
        qWarning() << "[ContactConduit]" << error;
        result.import.addError(error);
        emit errorOccurred(error);
        return nullptr;
    }

    auto decode = [values](const SqliteStatement &row, ContactRecord &record, QString *error) {
        ContactMapper::PersonRow person;
        person.rowId = row.columnInt64(0);
        person.firstName = row.columnText(1);
        person.lastName = row.columnText(2);
        person.organization = row.columnText(3);
        person.note = row.columnText(4);

        QList<ContactMapper::MultiValueRow> multiValues;
        values->reset();
        values->bind(1, person.rowId);
        while (values->step()) {
            ContactMapper::MultiValueRow value;
            value.property = values->columnInt(0);
            value.labelCode = values->columnInt(1);
            value.value = values->columnText(2);
            multiValues.append(value);
        }
        if (values->hasError()) {
            *error = QString("Contact %1: %2").arg(person.rowId).arg(values->errorString());
            return false;
        }

        record = ContactMapper::toRecord(person, multiValues);
        return true;
    };

    return std::unique_ptr<RecordStream<ContactRecord>>(new SqliteRecordStream<ContactRecord>(
        std::move(db), std::move(persons), decode, m_cancelCheck));
}

void ContactConduit::runImport(SyncContext *context, SyncResult &result)
{
    std::unique_ptr<RecordStream<ContactRecord>> stream = extract(context, result);
    if (!stream) {
        return;
    }

    result.import = context->reconciler->importRecords(*stream);
}

} // namespace PhoneSync
