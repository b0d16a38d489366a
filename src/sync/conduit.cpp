#include "conduit.h"
#include "reconciler.h"
#include "../backup/backupindex.h"

#include <QFileInfo>
#include <QDebug>

namespace PhoneSync {

QString Conduit::sourceFileName() const
{
    return QFileInfo(sourceRelativePath()).fileName();
}

bool Conduit::canSync(const SyncContext *context) const
{
    if (!context || !context->reconciler) {
        return false;
    }
    return hasSourceOverride() || (context->index && context->index->isOpen());
}

SyncResult Conduit::sync(SyncContext *context)
{
    SyncResult result;
    result.category = category();
    result.startTime = QDateTime::currentDateTimeUtc();

    if (!canSync(context)) {
        result.fail(ErrorCode::NotConfigured,
                    QString("%1: no open backup or reconciler").arg(displayName()));
        result.endTime = QDateTime::currentDateTimeUtc();
        emit errorOccurred(result.errorMessage);
        return result;
    }

    emit logMessage(QString("Importing %1...").arg(displayName()));

    runImport(context, result);

    if (result.import.cancelled) {
        result.fail(ErrorCode::Cancelled, QString("%1 import cancelled").arg(displayName()));
        emit logMessage(result.errorMessage);
    } else if (result.errorCode == ErrorCode::None) {
        result.success = true;
    }

    result.endTime = QDateTime::currentDateTimeUtc();

    emit logMessage(QString("%1: %2").arg(displayName(), result.import.summary()));
    for (const QString &warning : result.warnings) {
        emit logMessage(QString("Warning: %1").arg(warning));
    }

    return result;
}

QString Conduit::locateSource(const SyncContext *context) const
{
    if (hasSourceOverride()) {
        return QFileInfo(m_sourcePath).isFile() ? m_sourcePath : QString();
    }

    if (!context || !context->index) {
        return QString();
    }

    QString path = context->index->resolveDomainPath(sourceDomain(), sourceRelativePath());
    if (path.isEmpty()) {
        path = context->index->resolve(sourceFileName());
    }
    return path;
}

std::unique_ptr<SqliteDatabase> Conduit::openSource(const SyncContext *context, SyncResult &result)
{
    QString path = locateSource(context);
    if (path.isEmpty()) {
        QString warning = QString("%1: %2 not found in backup")
            .arg(errorCodeName(ErrorCode::SourceNotPresent), sourceFileName());
        qInfo() << "[Conduit]" << warning;
        result.warnings.append(warning);
        return nullptr;
    }

    std::unique_ptr<SqliteDatabase> db(new SqliteDatabase());
    if (!db->open(path, SqliteDatabase::OpenMode::ReadOnly)) {
        QString error = QString("%1: %2").arg(errorCodeName(ErrorCode::RecordDecodeError), db->errorString());
        qWarning() << "[Conduit]" << error;
        result.import.addError(error);
        emit errorOccurred(error);
        return nullptr;
    }

    for (const QString &table : requiredTables()) {
        if (!db->hasTable(table)) {
            QString error = QString("%1: %2 has no %3 table")
                .arg(errorCodeName(ErrorCode::RecordDecodeError), sourceFileName(), table);
            qWarning() << "[Conduit]" << error;
            result.import.addError(error);
            emit errorOccurred(error);
            return nullptr;
        }
    }

    qDebug() << "[Conduit] Opened" << sourceFileName() << "at" << path;
    return db;
}

} // namespace PhoneSync
