#include "synccoordinator.h"
#include "recordstore.h"
#include "reconciler.h"

#include <QDebug>
#include <memory>

namespace PhoneSync {

const int SyncCoordinator::MESSAGE_SPIKE_THRESHOLD;
const int SyncCoordinator::MESSAGE_LIMIT;
const int SyncCoordinator::EMERGENCY_COOLDOWN_FACTOR;

QString categoryStateName(CategoryState state)
{
    switch (state) {
    case CategoryState::Idle:         return "Idle";
    case CategoryState::Running:      return "Running";
    case CategoryState::CooldownWait: return "CooldownWait";
    }
    return "Idle";
}

SyncCoordinator::SyncCoordinator(QObject *parent)
    : QObject(parent)
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
{
    for (Category category : allCategories()) {
        m_cooldownSeconds[category] = Profile::defaultCooldownSeconds(category);
    }
}

SyncCoordinator::~SyncCoordinator()
{
    // Clean up owned objects
    qDeleteAll(m_states);
    qDeleteAll(m_conduits);
    delete m_reconciler;
    delete m_store;
}

// ========== Store ==========

bool SyncCoordinator::setStore(RecordStore *store)
{
    QMutexLocker locker(&m_mutex);
    if (anyRunningLocked()) {
        locker.unlock();
        return rejectWhileRunning("Replacing the record store");
    }

    delete m_reconciler;
    m_reconciler = nullptr;
    delete m_store;
    m_store = store;

    if (!m_store) {
        return true;
    }

    m_store->setParent(this);
    m_reconciler = new Reconciler(m_store, this);
    m_reconciler->setDedupWindowSeconds(m_dedupWindowSeconds);
    m_reconciler->setCancelCheck([this] { return isCancelled(); });

    connect(m_store, &RecordStore::logMessage, this, &SyncCoordinator::logMessage);
    connect(m_store, &RecordStore::errorOccurred, this, &SyncCoordinator::errorOccurred);
    connect(m_reconciler, &Reconciler::logMessage, this, &SyncCoordinator::logMessage);
    connect(m_reconciler, &Reconciler::errorOccurred, this, &SyncCoordinator::errorOccurred);
    connect(m_reconciler, &Reconciler::progressUpdated, this, &SyncCoordinator::progressUpdated);
    return true;
}

// ========== Conduit Management ==========

bool SyncCoordinator::registerConduit(Conduit *conduit)
{
    if (!conduit) return false;

    Category category = conduit->category();
    {
        QMutexLocker locker(&m_mutex);
        if (anyRunningLocked()) {
            locker.unlock();
            return rejectWhileRunning(QString("Registering %1").arg(conduit->displayName()));
        }

        // Remove existing conduit for the same category
        delete m_conduits.value(category);

        m_conduits[category] = conduit;
        m_enabled[category] = m_enabled.value(category, true);
        conduit->setParent(this);
        stateLocked(category);
    }

    connectConduitSignals(conduit);

    emit logMessage(QString("Registered conduit: %1").arg(conduit->displayName()));
    return true;
}

bool SyncCoordinator::unregisterConduit(Category category)
{
    QMutexLocker locker(&m_mutex);
    if (anyRunningLocked()) {
        locker.unlock();
        return rejectWhileRunning(QString("Unregistering %1").arg(categoryDisplayName(category)));
    }
    if (!m_conduits.contains(category)) {
        return false;
    }
    delete m_conduits.take(category);
    return true;
}

Conduit *SyncCoordinator::conduit(Category category) const
{
    QMutexLocker locker(&m_mutex);
    return m_conduits.value(category);
}

QList<Category> SyncCoordinator::registeredCategories() const
{
    QMutexLocker locker(&m_mutex);
    return m_conduits.keys();
}

bool SyncCoordinator::isCategoryEnabled(Category category) const
{
    QMutexLocker locker(&m_mutex);
    return m_enabled.value(category, true);
}

void SyncCoordinator::setCategoryEnabled(Category category, bool enabled)
{
    QMutexLocker locker(&m_mutex);
    m_enabled[category] = enabled;
}

Conduit *SyncCoordinator::conduitById(const QString &conduitId) const
{
    QMutexLocker locker(&m_mutex);
    for (Conduit *cond : m_conduits) {
        if (cond->conduitId() == conduitId) {
            return cond;
        }
    }
    return nullptr;
}

void SyncCoordinator::connectConduitSignals(Conduit *conduit)
{
    connect(conduit, &Conduit::logMessage, this, &SyncCoordinator::logMessage);
    connect(conduit, &Conduit::errorOccurred, this, &SyncCoordinator::errorOccurred);
}

// ========== Configuration ==========

void SyncCoordinator::setBackupPath(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    m_backupPath = path;
}

QString SyncCoordinator::backupPath() const
{
    QMutexLocker locker(&m_mutex);
    return m_backupPath;
}

void SyncCoordinator::setCooldownSeconds(Category category, int seconds)
{
    QMutexLocker locker(&m_mutex);
    m_cooldownSeconds[category] = qMax(0, seconds);
}

int SyncCoordinator::cooldownSeconds(Category category) const
{
    QMutexLocker locker(&m_mutex);
    return m_cooldownSeconds.value(category, Profile::defaultCooldownSeconds(category));
}

void SyncCoordinator::setDedupWindowSeconds(int seconds)
{
    QMutexLocker locker(&m_mutex);
    m_dedupWindowSeconds = qMax(0, seconds);
    if (m_reconciler) {
        m_reconciler->setDedupWindowSeconds(m_dedupWindowSeconds);
    }
}

void SyncCoordinator::setExpectedFingerprint(const DeviceFingerprint &fingerprint)
{
    QMutexLocker locker(&m_mutex);
    m_expectedFingerprint = fingerprint;
}

void SyncCoordinator::setClock(std::function<QDateTime()> clock)
{
    QMutexLocker locker(&m_mutex);
    if (clock) {
        m_clock = clock;
    } else {
        m_clock = [] { return QDateTime::currentDateTimeUtc(); };
    }
}

void SyncCoordinator::applyProfile(const Profile &profile)
{
    for (Category category : allCategories()) {
        setCategoryEnabled(category, profile.categoryEnabled(category));
        setCooldownSeconds(category, profile.cooldownSeconds(category));
    }
    setDedupWindowSeconds(profile.dedupWindowSeconds());
    setExpectedFingerprint(profile.deviceFingerprint());

    if (!profile.stateDirectoryPath().isEmpty() && !setStateDirectory(profile.stateDirectoryPath())) {
        qWarning() << "[SyncCoordinator] State directory unchanged, a sync is running";
    }
    if (backupPath().isEmpty() && !profile.lastBackupPath().isEmpty()) {
        setBackupPath(profile.lastBackupPath());
    }

    emit logMessage(QString("Applied profile: %1").arg(profile.name()));
}

bool SyncCoordinator::setStateDirectory(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    if (anyRunningLocked()) {
        locker.unlock();
        return rejectWhileRunning("Changing the state directory");
    }
    m_stateDirectory = path;

    // Reload history from the new location
    qDeleteAll(m_states);
    m_states.clear();
    for (Category category : m_conduits.keys()) {
        stateLocked(category);
    }
    return true;
}

SyncState *SyncCoordinator::stateForCategory(Category category)
{
    QMutexLocker locker(&m_mutex);
    return stateLocked(category);
}

SyncState *SyncCoordinator::stateLocked(Category category)
{
    SyncState *state = m_states.value(category);
    if (!state) {
        state = new SyncState(category);
        if (!m_stateDirectory.isEmpty()) {
            state->setStateDirectory(m_stateDirectory);
        }
        state->load();
        m_states.insert(category, state);
    }
    return state;
}

// ========== State Machine ==========

QDateTime SyncCoordinator::now() const
{
    return m_clock();
}

qint64 SyncCoordinator::cooldownRemainingMsLocked(Category category) const
{
    QDateTime last = m_runtime.value(category).lastCompleted;

    // Persisted history keeps cooldowns across restarts
    SyncState *state = m_states.value(category);
    if (state && state->lastRunTime().isValid()
        && (!last.isValid() || state->lastRunTime() > last)) {
        last = state->lastRunTime();
    }

    if (!last.isValid()) {
        return 0;
    }

    qint64 cooldownMs = static_cast<qint64>(
        m_cooldownSeconds.value(category, Profile::defaultCooldownSeconds(category))) * 1000;
    if (m_emergencyMode) {
        cooldownMs *= EMERGENCY_COOLDOWN_FACTOR;
    }
    qint64 elapsedMs = qMax<qint64>(0, last.msecsTo(now()));
    return qMax<qint64>(0, cooldownMs - elapsedMs);
}

bool SyncCoordinator::anyRunningLocked() const
{
    for (const Runtime &runtime : m_runtime) {
        if (runtime.running) {
            return true;
        }
    }
    return false;
}

bool SyncCoordinator::rejectWhileRunning(const QString &operation)
{
    QString error = QString("%1 is not allowed while a sync is running").arg(operation);
    qWarning() << "[SyncCoordinator]" << error;
    emit errorOccurred(error);
    return false;
}

CategoryState SyncCoordinator::state(Category category) const
{
    QMutexLocker locker(&m_mutex);
    if (m_runtime.value(category).running) {
        return CategoryState::Running;
    }
    return cooldownRemainingMsLocked(category) > 0 ? CategoryState::CooldownWait
                                                   : CategoryState::Idle;
}

int SyncCoordinator::cooldownRemaining(Category category) const
{
    QMutexLocker locker(&m_mutex);
    qint64 remainingMs = cooldownRemainingMsLocked(category);
    return static_cast<int>((remainingMs + 999) / 1000);
}

BackupManifest SyncCoordinator::lastManifest() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastManifest;
}

bool SyncCoordinator::acquire(Category category, SyncResult &result)
{
    QMutexLocker locker(&m_mutex);

    result.category = category;
    result.startTime = now();

    QString name = categoryDisplayName(category);
    Runtime &runtime = m_runtime[category];

    if (!m_conduits.contains(category) || !m_reconciler) {
        result.fail(ErrorCode::NotConfigured, QString("%1: no conduit or store configured").arg(name));
    } else if (!m_enabled.value(category, true)) {
        result.fail(ErrorCode::NotConfigured, QString("%1 is disabled").arg(name));
    } else if (runtime.running) {
        result.fail(ErrorCode::AlreadyRunning, QString("%1 sync is already running").arg(name));
    } else {
        stateLocked(category);
        qint64 remainingMs = cooldownRemainingMsLocked(category);
        if (remainingMs > 0) {
            result.fail(ErrorCode::CooldownActive,
                        QString("%1 synced recently, %2 s of cooldown remaining")
                            .arg(name).arg((remainingMs + 999) / 1000));
        }
    }

    if (result.errorCode != ErrorCode::None) {
        result.endTime = now();
        locker.unlock();
        qInfo() << "[SyncCoordinator]" << result.errorMessage;
        emit logMessage(result.errorMessage);
        return false;
    }

    runtime.running = true;
    return true;
}

void SyncCoordinator::release(Category category, SyncResult &result)
{
    {
        QMutexLocker locker(&m_mutex);

        result.endTime = now();

        Runtime &runtime = m_runtime[category];
        runtime.running = false;
        runtime.lastCompleted = result.endTime;

        SyncState *state = stateLocked(category);
        state->recordRun(result);
        if (!state->save()) {
            result.warnings.append(QString("Failed to save run state in %1").arg(state->statePath()));
        }
    }

    emit categoryFinished(category, result);
    emit logMessage(QString("%1 finished in %2 ms - %3")
        .arg(categoryDisplayName(category))
        .arg(result.durationMs())
        .arg(result.success ? result.import.summary() : result.errorMessage));

    if (category == Category::Messages) {
        RecordStore *store = nullptr;
        {
            QMutexLocker locker(&m_mutex);
            store = m_store;
        }
        if (store && store->isAvailable()) {
            updateMessageCount(store->messageCount());
        }
    }
}

// ========== Sync Operations ==========

SyncResult SyncCoordinator::startSync(Category category)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!anyRunningLocked()) {
            m_cancelled = false;
        }
    }

    SyncResult result;
    if (!acquire(category, result)) {
        return result;
    }

    emit categoryStarted(category);
    emit logMessage(QString("=== %1 ===").arg(categoryDisplayName(category)));

    QDateTime started = result.startTime;
    result = runCategory(category, nullptr);
    result.startTime = started;

    release(category, result);
    return result;
}

bool SyncCoordinator::openIndex(BackupIndex *index, SyncResult &result)
{
    if (index->backupRoot().isEmpty()) {
        result.fail(ErrorCode::NotConfigured, "No backup path set");
        emit errorOccurred(result.errorMessage);
        return false;
    }

    if (!index->open()) {
        result.fail(index->lastError(), index->errorString());
        qWarning() << "[SyncCoordinator]" << errorCodeName(result.errorCode) << result.errorMessage;
        emit errorOccurred(result.errorMessage);
        return false;
    }

    BackupManifest manifest = index->manifest();
    {
        QMutexLocker locker(&m_mutex);
        m_lastManifest = manifest;
    }

    emit logMessage(QString("Backup of %1 (iOS %2) from %3, %4 files")
        .arg(manifest.deviceName, manifest.osVersion,
             manifest.date.toString(Qt::ISODate))
        .arg(index->entryCount()));
    return true;
}

QString SyncCoordinator::checkFingerprint(const BackupManifest &manifest) const
{
    DeviceFingerprint expected;
    {
        QMutexLocker locker(&m_mutex);
        expected = m_expectedFingerprint;
    }

    if (!expected.isValid()) {
        return QString();
    }

    DeviceFingerprint actual;
    actual.uniqueIdentifier = manifest.deviceId;
    actual.deviceName = manifest.deviceName;
    if (expected.matches(actual)) {
        return QString();
    }

    QString warning = QString("Backup is from %1, profile is registered to %2")
        .arg(actual.displayString(), expected.displayString());
    qWarning() << "[SyncCoordinator]" << warning;
    return warning;
}

SyncResult SyncCoordinator::runCategory(Category category, BackupIndex *sharedIndex)
{
    Conduit *cond = nullptr;
    Reconciler *reconciler = nullptr;
    QString backupRoot;
    {
        QMutexLocker locker(&m_mutex);
        cond = m_conduits.value(category);
        reconciler = m_reconciler;
        backupRoot = m_backupPath;
    }

    SyncResult result;
    result.category = category;
    result.startTime = now();

    std::unique_ptr<BackupIndex> ownedIndex;
    BackupIndex *index = sharedIndex;
    QString fingerprintWarning;

    if (!index && !cond->hasSourceOverride()) {
        ownedIndex.reset(new BackupIndex(backupRoot));
        if (!openIndex(ownedIndex.get(), result)) {
            result.endTime = now();
            return result;
        }
        index = ownedIndex.get();
        fingerprintWarning = checkFingerprint(index->manifest());
    }

    SyncContext context;
    context.index = index;
    context.reconciler = reconciler;

    // Pass cancellation check to conduit
    cond->setCancelCheck([this] { return isCancelled(); });
    result = cond->sync(&context);
    cond->setCancelCheck(nullptr);

    if (!fingerprintWarning.isEmpty()) {
        result.warnings.prepend(fingerprintWarning);
    }
    return result;
}

QList<SyncResult> SyncCoordinator::syncAll()
{
    QList<SyncResult> results;

    {
        QMutexLocker locker(&m_mutex);
        if (!anyRunningLocked()) {
            m_cancelled = false;
        }
    }

    emit syncStarted();

    // Get enabled conduits
    QStringList enabledConduits;
    {
        QMutexLocker locker(&m_mutex);
        for (auto it = m_conduits.constBegin(); it != m_conduits.constEnd(); ++it) {
            if (m_enabled.value(it.key(), true)) {
                enabledConduits << it.value()->conduitId();
            }
        }
    }

    // Resolve dependency order
    QString depError = checkCircularDependencies(enabledConduits);
    if (!depError.isEmpty()) {
        emit errorOccurred(depError);
        emit syncFinished();
        return results;
    }

    QStringList orderedConduits = resolveConduitOrder(enabledConduits);
    emit logMessage(QString("Category order: %1").arg(orderedConduits.join(" → ")));

    // One index for the whole run, closed when this function returns
    std::unique_ptr<BackupIndex> index;
    QString fingerprintWarning;

    bool needsIndex = false;
    for (const QString &id : orderedConduits) {
        Conduit *cond = conduitById(id);
        needsIndex = needsIndex || (cond && !cond->hasSourceOverride());
    }

    if (needsIndex) {
        index.reset(new BackupIndex(backupPath()));
        SyncResult failure;
        if (!openIndex(index.get(), failure)) {
            for (const QString &id : orderedConduits) {
                SyncResult result = failure;
                result.category = conduitById(id)->category();
                result.startTime = now();
                result.endTime = result.startTime;
                results.append(result);
            }
            emit syncFinished();
            return results;
        }
        fingerprintWarning = checkFingerprint(index->manifest());
    }

    int conduitIndex = 0;
    for (const QString &id : orderedConduits) {
        if (isCancelled()) {
            emit logMessage("Sync cancelled by user");
            break;
        }

        Category category = conduitById(id)->category();

        emit progressUpdated(conduitIndex, orderedConduits.size(),
            QString("Syncing %1...").arg(categoryDisplayName(category)));

        SyncResult result;
        if (acquire(category, result)) {
            emit categoryStarted(category);
            emit logMessage(QString("=== %1 ===").arg(categoryDisplayName(category)));

            QDateTime started = result.startTime;
            result = runCategory(category, index.get());
            result.startTime = started;
            if (!fingerprintWarning.isEmpty()) {
                result.warnings.prepend(fingerprintWarning);
            }

            release(category, result);
        }

        results.append(result);
        conduitIndex++;
    }

    emit progressUpdated(orderedConduits.size(), orderedConduits.size(), "Sync complete");

    int imported = 0;
    int failed = 0;
    for (const SyncResult &result : results) {
        imported += result.import.imported;
        if (!result.success) {
            failed++;
        }
    }
    emit logMessage(QString("Sync complete. Categories: %1, failed: %2, records imported: %3")
        .arg(results.size()).arg(failed).arg(imported));
    emit syncFinished();

    return results;
}

CleanupReport SyncCoordinator::emergencyCleanup()
{
    Reconciler *reconciler = nullptr;
    {
        QMutexLocker locker(&m_mutex);
        reconciler = m_reconciler;
    }

    if (!reconciler) {
        emit errorOccurred("Emergency cleanup: no store configured");
        return CleanupReport();
    }

    emit logMessage("Emergency duplicate cleanup requested");
    CleanupReport report = reconciler->removeDuplicateMessages();

    // Shrinking is never a spike, but later growth is measured from here
    RecordStore *store = reconciler->store();
    if (store && store->isAvailable()) {
        QMutexLocker locker(&m_mutex);
        m_messageCount = store->messageCount();
    }
    return report;
}

// ========== Emergency Mode ==========

void SyncCoordinator::updateMessageCount(int count)
{
    int previous = 0;
    bool activate = false;
    {
        QMutexLocker locker(&m_mutex);
        previous = m_messageCount;
        m_messageCount = count;
        activate = count > MESSAGE_LIMIT && !m_emergencyMode;
    }

    if (count > previous + MESSAGE_SPIKE_THRESHOLD) {
        qWarning() << "[SyncCoordinator] Message count jumped from" << previous << "to" << count;
        emit logMessage(QString("Message count jumped significantly: %1 → %2 (+%3)")
            .arg(previous).arg(count).arg(count - previous));
        emit messageSpikeDetected(previous, count);
    }

    if (activate) {
        activateEmergencyMode();
    }
}

int SyncCoordinator::lastMessageCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_messageCount;
}

void SyncCoordinator::activateEmergencyMode()
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_emergencyMode) {
            return;
        }
        m_emergencyMode = true;
    }

    qCritical() << "[SyncCoordinator] Emergency mode activated, message count exceeds safe limits";
    emit errorOccurred(QString("Emergency mode activated: cooldowns extended %1x")
        .arg(EMERGENCY_COOLDOWN_FACTOR));

    releaseAllSyncLocks();
    emit emergencyModeActivated();
}

void SyncCoordinator::deactivateEmergencyMode()
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_emergencyMode) {
            return;
        }
        m_emergencyMode = false;
    }

    qInfo() << "[SyncCoordinator] Emergency mode deactivated";
    emit logMessage("Emergency mode deactivated - restoring normal cooldowns");
    emit emergencyModeDeactivated();
}

bool SyncCoordinator::isEmergencyMode() const
{
    QMutexLocker locker(&m_mutex);
    return m_emergencyMode;
}

int SyncCoordinator::releaseAllSyncLocks()
{
    int running = 0;
    {
        QMutexLocker locker(&m_mutex);
        for (const Runtime &runtime : m_runtime) {
            if (runtime.running) {
                running++;
            }
        }
    }

    if (running > 0) {
        m_cancelled = true;
        qWarning() << "[SyncCoordinator] Releasing" << running << "running syncs";
        emit logMessage(QString("Releasing all sync locks (%1 running)").arg(running));
    }
    return running;
}

void SyncCoordinator::cancelSync()
{
    m_cancelled = true;
    emit logMessage("Cancel requested...");
}

void SyncCoordinator::setCancelCheck(std::function<bool()> callback)
{
    QMutexLocker locker(&m_mutex);
    m_cancelCheck = callback;
}

bool SyncCoordinator::isCancelled() const
{
    return m_cancelled || (m_cancelCheck && m_cancelCheck());
}

// ========== Dependency Resolution ==========

QStringList SyncCoordinator::resolveConduitOrder(const QStringList &conduitIds)
{
    // Edge A -> B means "A must run before B"
    QMap<QString, QStringList> mustRunBefore;
    QMap<QString, int> inDegree;

    for (const QString &id : conduitIds) {
        inDegree[id] = 0;
        mustRunBefore[id] = QStringList();
    }

    for (const QString &id : conduitIds) {
        Conduit *cond = conduitById(id);
        if (!cond) continue;

        for (const QString &afterId : cond->runAfter()) {
            if (conduitIds.contains(afterId)) {
                mustRunBefore[afterId].append(id);
                inDegree[id]++;
            }
        }
    }

    // Kahn's algorithm
    QStringList result;
    QStringList queue;

    for (const QString &id : conduitIds) {
        if (inDegree[id] == 0) {
            queue.append(id);
        }
    }

    while (!queue.isEmpty()) {
        // Alphabetical among equals for a deterministic order
        queue.sort();
        QString current = queue.takeFirst();
        result.append(current);

        for (const QString &next : mustRunBefore[current]) {
            inDegree[next]--;
            if (inDegree[next] == 0) {
                queue.append(next);
            }
        }
    }

    if (result.size() != conduitIds.size()) {
        emit logMessage("Warning: Could not resolve all conduit dependencies");
        for (const QString &id : conduitIds) {
            if (!result.contains(id)) {
                result.append(id);
            }
        }
    }

    return result;
}

QString SyncCoordinator::checkCircularDependencies(const QStringList &conduitIds)
{
    QMap<QString, QStringList> edges;  // conduit -> conduits that must run after it

    for (const QString &id : conduitIds) {
        edges[id] = QStringList();
    }

    for (const QString &id : conduitIds) {
        Conduit *cond = conduitById(id);
        if (!cond) continue;

        for (const QString &afterId : cond->runAfter()) {
            if (conduitIds.contains(afterId)) {
                edges[afterId].append(id);
            }
        }
    }

    // 0 = unvisited, 1 = on the current path, 2 = done
    QMap<QString, int> state;
    for (const QString &id : conduitIds) {
        state[id] = 0;
    }

    std::function<QString(const QString&, QStringList&)> dfs;
    dfs = [&](const QString &node, QStringList &path) -> QString {
        if (state[node] == 1) {
            int cycleStart = path.indexOf(node);
            QStringList cycle = path.mid(cycleStart);
            cycle.append(node);
            return QString("Circular dependency detected: %1").arg(cycle.join(" → "));
        }
        if (state[node] == 2) {
            return QString();
        }

        state[node] = 1;
        path.append(node);

        for (const QString &next : edges[node]) {
            QString error = dfs(next, path);
            if (!error.isEmpty()) {
                return error;
            }
        }

        path.removeLast();
        state[node] = 2;
        return QString();
    };

    for (const QString &id : conduitIds) {
        if (state[id] == 0) {
            QStringList path;
            QString error = dfs(id, path);
            if (!error.isEmpty()) {
                return error;
            }
        }
    }

    return QString();
}

} // namespace PhoneSync
