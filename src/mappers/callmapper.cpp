#include "callmapper.h"
#include "recordcodecs.h"

#include <QtMath>

using namespace PhoneSync;

CallDirection CallMapper::direction(bool originated, bool answered)
{
    if (originated) {
        return CallDirection::Outgoing;
    }
    return answered ? CallDirection::Incoming : CallDirection::Missed;
}

bool CallMapper::toRecord(const CallRow &row, CallRecord *record, QString *error)
{
    if (!row.hasDate) {
        if (error) {
            *error = QString("Call %1 has no date").arg(row.rowId);
        }
        return false;
    }

    CallRecord call;
    call.id = QString::number(row.rowId);
    call.phoneIdentity = RecordCodecs::normalizePhone(row.address);
    call.timestamp = RecordCodecs::fromVendorSeconds(row.date);
    call.durationSeconds = row.duration > 0.0 ? qRound(row.duration) : 0;
    call.direction = direction(row.originated, row.answered);

    *record = call;
    return true;
}
