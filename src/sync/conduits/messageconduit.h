#ifndef MESSAGECONDUIT_H
#define MESSAGECONDUIT_H

#include "../conduit.h"
#include "../recordstream.h"

namespace PhoneSync {

/**
 * @brief Conduit for the device message database
 *
 * Reads message rows joined to their handle, oldest first. Rows without
 * text are not extracted. When the chat tables are present, messages of a
 * chat with several participants are keyed as group conversations.
 * Attachment names come from message_attachment_join.
 *
 * Runs after contacts so threads can be linked to a contact.
 */
class MessageConduit : public Conduit
{
    Q_OBJECT

public:
    explicit MessageConduit(QObject *parent = nullptr);

    // ========== Conduit Identity ==========

    Category category() const override { return Category::Messages; }
    QString displayName() const override { return "Messages"; }
    QString sourceDomain() const override { return "HomeDomain"; }
    QString sourceRelativePath() const override { return "Library/SMS/sms.db"; }
    QString description() const override { return "SMS and iMessage conversations"; }

    QStringList runAfter() const override { return {"contacts"}; }

    // ========== Extraction ==========

    /**
     * @brief Open the message database and stream its messages
     *
     * @return Stream, or nullptr if the database is absent or unreadable
     *         (reported in result)
     */
    std::unique_ptr<RecordStream<MessageRecord>> extract(SyncContext *context, SyncResult &result);

protected:
    QStringList requiredTables() const override { return {"message", "handle"}; }
    void runImport(SyncContext *context, SyncResult &result) override;
};

} // namespace PhoneSync

#endif // MESSAGECONDUIT_H
