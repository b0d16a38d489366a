#include "callhistoryconduit.h"
#include "../reconciler.h"
#include "../../mappers/callmapper.h"

#include <QDebug>

namespace PhoneSync {

CallHistoryConduit::CallHistoryConduit(QObject *parent)
    : Conduit(parent)
{
}

std::unique_ptr<RecordStream<CallRecord>> CallHistoryConduit::extract(SyncContext *context,
                                                                      SyncResult &result)
{
    std::unique_ptr<SqliteDatabase> db = openSource(context, result);
    if (!db) {
        return nullptr;
    }

    SqliteStatement calls = db->prepare(
        "SELECT Z_PK, ZADDRESS, ZDATE, ZDURATION, ZORIGINATED, ZANSWERED "
        "FROM ZCALLRECORD ORDER BY ZDATE ASC, Z_PK ASC");
    if (!calls.isValid()) {
        QString error = QString("%1: %2").arg(errorCodeName(ErrorCode::RecordDecodeError),
                                              calls.errorString());
        qWarning() << "[CallHistoryConduit]" << error;
        result.import.addError(error);
        emit errorOccurred(error);
        return nullptr;
    }

    auto decode = [](const SqliteStatement &row, CallRecord &record, QString *error) {
        CallMapper::CallRow call;
        call.rowId = row.columnInt64(0);
        call.address = row.columnText(1);
        call.hasDate = !row.isNull(2);
        call.date = row.columnDouble(2);
        call.duration = row.columnDouble(3);
        call.originated = row.columnInt(4) == 1;
        // A missing answered flag counts as answered
        call.answered = row.isNull(5) || row.columnInt(5) != 0;
        return CallMapper::toRecord(call, &record, error);
    };

    return std::unique_ptr<RecordStream<CallRecord>>(new SqliteRecordStream<CallRecord>(
        std::move(db), std::move(calls), decode, m_cancelCheck));
}

void CallHistoryConduit::runImport(SyncContext *context, SyncResult &result)
{
    std::unique_ptr<RecordStream<CallRecord>> stream = extract(context, result);
    if (!stream) {
        return;
    }

    result.import = context->reconciler->importRecords(*stream);
}

} // namespace PhoneSync
