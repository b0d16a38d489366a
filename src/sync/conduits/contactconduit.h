#ifndef CONTACTCONDUIT_H
#define CONTACTCONDUIT_H

#include "../conduit.h"
#include "../recordstream.h"

namespace PhoneSync {

/**
 * @brief Conduit for the device address book
 *
 * Reads:
 *   - ABPerson (one row per person)
 *   - ABMultiValue (phone numbers, property 3, and emails, property 4)
 *
 * Persons with neither a first nor a last name are not extracted.
 * Uses ContactMapper for label decoding and record conversion.
 */
class ContactConduit : public Conduit
{
    Q_OBJECT

public:
    explicit ContactConduit(QObject *parent = nullptr);

    // ========== Conduit Identity ==========

    Category category() const override { return Category::Contacts; }
    QString displayName() const override { return "Contacts"; }
    QString sourceDomain() const override { return "HomeDomain"; }
    QString sourceRelativePath() const override { return "Library/AddressBook/AddressBook.sqlitedb"; }
    QString description() const override { return "Address book entries with phone numbers and emails"; }

    // ========== Extraction ==========

    /**
     * @brief Open the address book and stream its contacts
     *
     * @return Stream, or nullptr if the database is absent or unreadable
     *         (reported in result)
     */
    std::unique_ptr<RecordStream<ContactRecord>> extract(SyncContext *context, SyncResult &result);

protected:
    QStringList requiredTables() const override { return {"ABPerson", "ABMultiValue"}; }
    void runImport(SyncContext *context, SyncResult &result) override;
};

} // namespace PhoneSync

#endif // CONTACTCONDUIT_H
