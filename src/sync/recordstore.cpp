#include "recordstore.h"
#include "../mappers/contactmapper.h"

#include <QDebug>

namespace PhoneSync {

QString RecordStore::exportContactsVCard()
{
    QString document;
    const QList<ContactRecord> all = contacts();
    for (const ContactRecord &record : all) {
        document += ContactMapper::contactToVCard(record);
    }
    return document;
}

void RecordStore::setLastError(const QString &error)
{
    m_lastError = error;
    qWarning() << "[RecordStore]" << error;
    emit errorOccurred(error);
}

// ========== Transaction ==========

Transaction::Transaction(RecordStore *store)
    : m_store(store)
    , m_locker(store->mutex())
{
    m_active = m_store->beginBatch();
}

Transaction::~Transaction()
{
    if (m_active) {
        rollback();
    }
}

bool Transaction::commit()
{
    if (!m_active) {
        return false;
    }
    m_active = false;
    if (!m_store->commitBatch()) {
        m_store->rollbackBatch();
        return false;
    }
    return true;
}

void Transaction::rollback()
{
    if (m_active) {
        m_active = false;
        m_store->rollbackBatch();
    }
}

} // namespace PhoneSync
