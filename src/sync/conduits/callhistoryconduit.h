#ifndef CALLHISTORYCONDUIT_H
#define CALLHISTORYCONDUIT_H

#include "../conduit.h"
#include "../recordstream.h"

namespace PhoneSync {

/**
 * @brief Conduit for the device call log
 *
 * Reads ZCALLRECORD. Direction is derived from ZORIGINATED and ZANSWERED
 * by CallMapper.
 */
class CallHistoryConduit : public Conduit
{
    Q_OBJECT

public:
    explicit CallHistoryConduit(QObject *parent = nullptr);

    // ========== Conduit Identity ==========

    Category category() const override { return Category::CallHistory; }
    QString displayName() const override { return "Call History"; }
    QString sourceDomain() const override { return "HomeDomain"; }
    QString sourceRelativePath() const override { return "Library/CallHistoryDB/CallHistory.storedata"; }
    QString description() const override { return "Incoming, outgoing and missed calls"; }

    QStringList runAfter() const override { return {"contacts"}; }

    // ========== Extraction ==========

    std::unique_ptr<RecordStream<CallRecord>> extract(SyncContext *context, SyncResult &result);

protected:
    QStringList requiredTables() const override { return {"ZCALLRECORD"}; }
    void runImport(SyncContext *context, SyncResult &result) override;
};

} // namespace PhoneSync

#endif // CALLHISTORYCONDUIT_H
