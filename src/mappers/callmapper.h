#ifndef CALLMAPPER_H
#define CALLMAPPER_H

#include <QString>
#include "../sync/synctypes.h"

/**
 * @brief Mapper for call history rows to CallRecord
 */
class CallMapper
{
public:
    struct CallRow {
        qint64 rowId = 0;
        QString address;
        bool hasDate = false;
        double date = 0.0;          ///< Vendor epoch seconds
        double duration = 0.0;      ///< Seconds, fractional
        bool originated = false;
        bool answered = false;
    };

    /**
     * @brief Derive the call direction from the two flags
     *
     * Originated calls are outgoing whether or not they connected. A call
     * that was not originated is incoming if answered, otherwise missed.
     */
    static PhoneSync::CallDirection direction(bool originated, bool answered);

    /**
     * @brief Decode a row into a normalized record
     * @return false if the row has no timestamp
     */
    static bool toRecord(const CallRow &row, PhoneSync::CallRecord *record, QString *error);
};

#endif // CALLMAPPER_H
