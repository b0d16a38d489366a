#ifndef PROFILE_H
#define PROFILE_H

#include <QString>
#include <QStringList>
#include <QMap>
#include "sync/synctypes.h"

/**
 * @brief Device fingerprint for identifying a specific phone
 *
 * Taken from the backup manifest: the device's unique identifier and its
 * display name. Lets the coordinator notice a backup made by a different
 * phone than the one the profile was registered with.
 */
struct DeviceFingerprint
{
    QString uniqueIdentifier;
    QString deviceName;

    bool isValid() const { return !uniqueIdentifier.isEmpty() || !deviceName.isEmpty(); }
    bool isEmpty() const { return uniqueIdentifier.isEmpty() && deviceName.isEmpty(); }

    // Match another fingerprint (identifier takes priority if both are set)
    bool matches(const DeviceFingerprint &other) const {
        if (!uniqueIdentifier.isEmpty() && !other.uniqueIdentifier.isEmpty()) {
            return uniqueIdentifier.compare(other.uniqueIdentifier, Qt::CaseInsensitive) == 0;
        }
        // Fall back to name match if no identifier
        return !deviceName.isEmpty() && deviceName == other.deviceName;
    }

    QString displayString() const {
        if (isEmpty()) return QString();
        if (deviceName.isEmpty()) return QString("ID: %1").arg(uniqueIdentifier);
        if (uniqueIdentifier.isEmpty()) return deviceName;
        return QString("%1 (ID: %2)").arg(deviceName, uniqueIdentifier);
    }
};

/**
 * @brief Profile represents a sync profile with its settings
 *
 * Profile settings are stored in the profile folder itself as
 * .qphonesync.conf, next to the record store, so the whole folder can be
 * moved and the settings travel with it.
 *
 * Each profile corresponds to:
 *   - A specific phone (identified by fingerprint)
 *   - A record store database (qphonesync.db)
 *   - Per-category run state under .state/
 */
class Profile
{
public:
    /**
     * @brief Create a profile for the given folder
     */
    explicit Profile(const QString &profileFolderPath = QString());

    // Profile location
    QString profileFolderPath() const { return m_profileFolderPath; }
    void setProfileFolderPath(const QString &path);

    // Profile identity
    QString name() const;
    void setName(const QString &name);

    // Check if profile is valid (folder exists and is writable)
    bool isValid() const;

    // Check if profile config file exists
    bool exists() const;

    // ========== Device Settings ==========

    DeviceFingerprint deviceFingerprint() const { return m_deviceFingerprint; }
    void setDeviceFingerprint(const DeviceFingerprint &fingerprint) { m_deviceFingerprint = fingerprint; }
    bool hasRegisteredDevice() const { return m_deviceFingerprint.isValid(); }

    // Backup root used by the last run
    QString lastBackupPath() const { return m_lastBackupPath; }
    void setLastBackupPath(const QString &path) { m_lastBackupPath = path; }

    // ========== Sync Settings ==========

    bool categoryEnabled(PhoneSync::Category category) const;
    void setCategoryEnabled(PhoneSync::Category category, bool enabled);
    QList<PhoneSync::Category> enabledCategories() const;

    /**
     * @brief Minimum seconds between two runs of a category
     */
    int cooldownSeconds(PhoneSync::Category category) const;
    void setCooldownSeconds(PhoneSync::Category category, int seconds);
    static int defaultCooldownSeconds(PhoneSync::Category category);

    /**
     * @brief Message dedup window in seconds
     */
    int dedupWindowSeconds() const { return m_dedupWindowSeconds; }
    void setDedupWindowSeconds(int seconds) { m_dedupWindowSeconds = qMax(0, seconds); }

    // ========== Logging ==========

    bool debugLogging() const { return m_debugLogging; }
    void setDebugLogging(bool enabled) { m_debugLogging = enabled; }

    /**
     * @brief Enable or silence qDebug() output according to debugLogging()
     */
    void applyLoggingRules() const;

    // ========== Persistence ==========

    // Load settings from .qphonesync.conf in the profile folder
    bool load();

    // Save settings to .qphonesync.conf in the profile folder
    bool save();

    // Initialize a new profile (create directories and default config)
    bool initialize();

    // Get the path to the profile config file
    QString configFilePath() const;

    // Get the path to the state directory
    QString stateDirectoryPath() const;

    // Get the path to the record store database
    QString storeDatabasePath() const;

private:
    QString m_profileFolderPath;
    QString m_name;

    // Device settings
    DeviceFingerprint m_deviceFingerprint;
    QString m_lastBackupPath;

    // Sync settings
    QMap<PhoneSync::Category, bool> m_categoryEnabled;
    QMap<PhoneSync::Category, int> m_cooldownSeconds;
    int m_dedupWindowSeconds = DEFAULT_DEDUP_WINDOW;

    bool m_debugLogging = false;

    static const int DEFAULT_DEDUP_WINDOW = 0;
};

#endif // PROFILE_H
