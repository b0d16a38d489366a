#include "syncstate.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QStandardPaths>
#include <QDebug>

namespace PhoneSync {

const int SyncState::MAX_HISTORY;

SyncState::SyncState(Category category, QObject *parent)
    : QObject(parent)
    , m_category(category)
{
    // Default: <AppData>/state/<category>/
    QString baseDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    m_stateDir = QDir(baseDir).filePath("state/" + categoryId(m_category));
}

SyncState::~SyncState()
{
    if (m_dirty) {
        save();
    }
}

void SyncState::setStateDirectory(const QString &baseDir)
{
    m_stateDir = QDir(baseDir).filePath(categoryId(m_category));
}

QString SyncState::stateFile() const
{
    return QDir(m_stateDir).filePath("state.json");
}

bool SyncState::ensureStateDir()
{
    QDir dir(m_stateDir);
    if (!dir.exists() && !dir.mkpath(".")) {
        emit errorOccurred(QString("Failed to create state directory: %1").arg(m_stateDir));
        return false;
    }
    return true;
}

// ========== Run Tracking ==========

void SyncState::recordRun(const SyncResult &result)
{
    RunRecord run;
    run.startTime = result.startTime;
    run.endTime = result.endTime.isValid() ? result.endTime : QDateTime::currentDateTimeUtc();
    run.success = result.success;
    run.errorCode = result.errorCode;
    run.imported = result.import.imported;
    run.updated = result.import.updated;
    run.skipped = result.import.skipped;
    run.errors = result.import.errors;
    run.warnings = result.warnings.size();

    m_lastRunTime = run.endTime;
    if (run.success) {
        m_lastSyncTime = run.endTime;
    }

    m_history.append(run);
    while (m_history.size() > MAX_HISTORY) {
        m_history.removeFirst();
    }

    m_dirty = true;
    emit stateChanged();
}

// ========== Persistence ==========

bool SyncState::load()
{
    QFile file(stateFile());
    if (!file.exists()) {
        // No previous state - this is fine for first sync
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open state file: %1").arg(stateFile()));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        emit errorOccurred(QString("Failed to parse state: %1").arg(parseError.errorString()));
        return false;
    }

    QJsonObject root = doc.object();
    m_lastRunTime = QDateTime::fromString(root["lastRunTime"].toString(), Qt::ISODateWithMs);
    m_lastSyncTime = QDateTime::fromString(root["lastSyncTime"].toString(), Qt::ISODateWithMs);

    m_history.clear();
    const QJsonArray historyArray = root["history"].toArray();
    for (const QJsonValue &val : historyArray) {
        m_history.append(runFromJson(val.toObject()));
    }
    while (m_history.size() > MAX_HISTORY) {
        m_history.removeFirst();
    }

    m_dirty = false;
    qDebug() << "[SyncState] Loaded" << m_history.size() << "runs for" << categoryId(m_category);
    return true;
}

bool SyncState::save()
{
    if (!ensureStateDir()) {
        return false;
    }

    QJsonObject root;
    root["category"] = categoryId(m_category);
    root["appVersion"] = QString(QPHONESYNC_VERSION_STRING);
    root["version"] = 1;
    root["lastRunTime"] = m_lastRunTime.toUTC().toString(Qt::ISODateWithMs);
    root["lastSyncTime"] = m_lastSyncTime.toUTC().toString(Qt::ISODateWithMs);

    QJsonArray historyArray;
    for (const RunRecord &run : m_history) {
        historyArray.append(runToJson(run));
    }
    root["history"] = historyArray;

    QFile file(stateFile());
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to save state: %1").arg(stateFile()));
        return false;
    }

    QJsonDocument doc(root);
    file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    m_dirty = false;
    qDebug() << "[SyncState] Saved" << m_history.size() << "runs for" << categoryId(m_category);
    return true;
}

void SyncState::clear()
{
    m_lastRunTime = QDateTime();
    m_lastSyncTime = QDateTime();
    m_history.clear();
    m_dirty = true;
    emit stateChanged();
}

QJsonObject SyncState::runToJson(const RunRecord &run)
{
    QJsonObject obj;
    obj["startTime"] = run.startTime.toUTC().toString(Qt::ISODateWithMs);
    obj["endTime"] = run.endTime.toUTC().toString(Qt::ISODateWithMs);
    obj["success"] = run.success;
    obj["errorCode"] = errorCodeName(run.errorCode);
    obj["imported"] = run.imported;
    obj["updated"] = run.updated;
    obj["skipped"] = run.skipped;
    obj["errors"] = run.errors;
    obj["warnings"] = run.warnings;
    return obj;
}

RunRecord SyncState::runFromJson(const QJsonObject &json)
{
    RunRecord run;
    run.startTime = QDateTime::fromString(json["startTime"].toString(), Qt::ISODateWithMs);
    run.endTime = QDateTime::fromString(json["endTime"].toString(), Qt::ISODateWithMs);
    run.success = json["success"].toBool();
    run.errorCode = errorCodeFromName(json["errorCode"].toString());
    run.imported = json["imported"].toInt();
    run.updated = json["updated"].toInt();
    run.skipped = json["skipped"].toInt();
    run.errors = json["errors"].toInt();
    run.warnings = json["warnings"].toInt();
    return run;
}

} // namespace PhoneSync
