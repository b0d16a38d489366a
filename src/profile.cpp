#include "profile.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QLoggingCategory>

using namespace PhoneSync;

Profile::Profile(const QString &profileFolderPath)
    : m_profileFolderPath(profileFolderPath)
{
    for (Category category : allCategories()) {
        m_categoryEnabled[category] = true;
        m_cooldownSeconds[category] = defaultCooldownSeconds(category);
    }

    // Try to load existing settings if path is set
    if (!m_profileFolderPath.isEmpty()) {
        load();
    }
}

void Profile::setProfileFolderPath(const QString &path)
{
    m_profileFolderPath = path;
}

QString Profile::name() const
{
    if (!m_name.isEmpty()) {
        return m_name;
    }
    // Default to folder name
    if (!m_profileFolderPath.isEmpty()) {
        return QFileInfo(m_profileFolderPath).fileName();
    }
    return QString();
}

void Profile::setName(const QString &name)
{
    m_name = name;
}

bool Profile::isValid() const
{
    if (m_profileFolderPath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_profileFolderPath);
    return info.exists() && info.isDir() && info.isWritable();
}

bool Profile::exists() const
{
    return QFile::exists(configFilePath());
}

// ========== Sync Settings ==========

bool Profile::categoryEnabled(Category category) const
{
    return m_categoryEnabled.value(category, true);
}

void Profile::setCategoryEnabled(Category category, bool enabled)
{
    m_categoryEnabled[category] = enabled;
}

QList<Category> Profile::enabledCategories() const
{
    QList<Category> enabled;
    for (Category category : allCategories()) {
        if (categoryEnabled(category)) {
            enabled << category;
        }
    }
    return enabled;
}

int Profile::cooldownSeconds(Category category) const
{
    return m_cooldownSeconds.value(category, defaultCooldownSeconds(category));
}

void Profile::setCooldownSeconds(Category category, int seconds)
{
    m_cooldownSeconds[category] = qMax(0, seconds);
}

int Profile::defaultCooldownSeconds(Category category)
{
    switch (category) {
    case Category::Messages:    return 60;
    case Category::CallHistory: return 120;
    case Category::Contacts:    return 300;
    }
    return 60;
}

// ========== Logging ==========

void Profile::applyLoggingRules() const
{
    QLoggingCategory::setFilterRules(m_debugLogging ? "default.debug=true"
                                                    : "default.debug=false");
}

// ========== Persistence ==========

bool Profile::load()
{
    QString configPath = configFilePath();
    if (!QFile::exists(configPath)) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    // Profile identity
    m_name = settings.value("profile/name", QString()).toString();

    // Device settings
    m_deviceFingerprint.uniqueIdentifier = settings.value("device/uniqueIdentifier", QString()).toString();
    m_deviceFingerprint.deviceName = settings.value("device/name", QString()).toString();
    m_lastBackupPath = settings.value("backup/lastPath", QString()).toString();

    // Sync settings
    m_dedupWindowSeconds = qMax(0, settings.value("sync/dedupWindowSeconds", DEFAULT_DEDUP_WINDOW).toInt());

    for (Category category : allCategories()) {
        QString id = categoryId(category);
        m_categoryEnabled[category] = settings.value(
            QString("categories/%1/enabled").arg(id), true).toBool();
        m_cooldownSeconds[category] = qMax(0, settings.value(
            QString("categories/%1/cooldownSeconds").arg(id),
            defaultCooldownSeconds(category)).toInt());
    }

    m_debugLogging = settings.value("logging/debug", false).toBool();

    return true;
}

bool Profile::save()
{
    if (m_profileFolderPath.isEmpty()) {
        return false;
    }

    // Ensure directory exists
    QDir dir(m_profileFolderPath);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    QSettings settings(configFilePath(), QSettings::IniFormat);

    // Profile identity
    if (!m_name.isEmpty()) {
        settings.setValue("profile/name", m_name);
    }

    // Device settings
    if (!m_deviceFingerprint.uniqueIdentifier.isEmpty()) {
        settings.setValue("device/uniqueIdentifier", m_deviceFingerprint.uniqueIdentifier);
    }
    if (!m_deviceFingerprint.deviceName.isEmpty()) {
        settings.setValue("device/name", m_deviceFingerprint.deviceName);
    }
    if (!m_lastBackupPath.isEmpty()) {
        settings.setValue("backup/lastPath", m_lastBackupPath);
    }

    // Sync settings
    settings.setValue("sync/dedupWindowSeconds", m_dedupWindowSeconds);

    for (Category category : allCategories()) {
        QString id = categoryId(category);
        settings.setValue(QString("categories/%1/enabled").arg(id), categoryEnabled(category));
        settings.setValue(QString("categories/%1/cooldownSeconds").arg(id), cooldownSeconds(category));
    }

    settings.setValue("logging/debug", m_debugLogging);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool Profile::initialize()
{
    if (m_profileFolderPath.isEmpty()) {
        return false;
    }

    QDir dir(m_profileFolderPath);

    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    dir.mkpath(".state");

    // Save default settings
    return save();
}

QString Profile::configFilePath() const
{
    if (m_profileFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_profileFolderPath).filePath(".qphonesync.conf");
}

QString Profile::stateDirectoryPath() const
{
    if (m_profileFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_profileFolderPath).filePath(".state");
}

QString Profile::storeDatabasePath() const
{
    if (m_profileFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_profileFolderPath).filePath("qphonesync.db");
}
