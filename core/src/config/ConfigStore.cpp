// QSettings mapping of Config.
#include "rdpvisor/ConfigStore.hpp"

#include <QLoggingCategory>
#include <QSettings>
#include <QString>

#include <algorithm>

Q_LOGGING_CATEGORY(rvConfig, "rdpvisor.config")

namespace rdpvisor {

static std::string readString(QSettings &s, const char *key,
                              const std::string &def) {
    const QString v = s.value(QLatin1String(key), QString::fromStdString(def))
                          .toString()
                          .trimmed();
    return v.isEmpty() ? def : v.toStdString();
}

static int readNonNegative(QSettings &s, const char *key, int def) {
    bool ok = false;
    const int v = s.value(QLatin1String(key), def).toInt(&ok);
    if (!ok)
        return def;
    if (v < 0) {
        qCWarning(rvConfig) << "negative value clamped" << "key=" << key
                            << "value=" << v;
        return 0;
    }
    return v;
}

Config loadConfig(QSettings &s) {
    Config cfg;
    cfg.connectToAll = s.value("Connection/connectToAll", cfg.connectToAll).toBool();
    cfg.alwaysConfirm = s.value("Connection/alwaysConfirm", cfg.alwaysConfirm).toBool();

    VaultConfig &v = cfg.vault;
    v.useWindowsVault = s.value("Vault/useWindowsVault", v.useWindowsVault).toBool();
    v.ttlSeconds = readNonNegative(s, "Vault/ttlSeconds", v.ttlSeconds);
    v.adaptiveTtl = s.value("Vault/adaptiveTtl", v.adaptiveTtl).toBool();
    v.removeOnExit = s.value("Vault/removeOnExit", v.removeOnExit).toBool();

    ClientConfig &c = cfg.client;
    c.useAdmin = s.value("Client/useAdmin", c.useAdmin).toBool();
    c.useRestrictedAdmin =
        s.value("Client/useRestrictedAdmin", c.useRestrictedAdmin).toBool();
    c.usePublic = s.value("Client/usePublic", c.usePublic).toBool();
    c.useRemoteGuard = s.value("Client/useRemoteGuard", c.useRemoteGuard).toBool();
    c.useFullscreen = s.value("Client/useFullscreen", c.useFullscreen).toBool();
    c.useSpan = s.value("Client/useSpan", c.useSpan).toBool();
    c.useMultimon = s.value("Client/useMultimon", c.useMultimon).toBool();
    c.width = readNonNegative(s, "Client/width", c.width);
    c.height = readNonNegative(s, "Client/height", c.height);
    c.replaceTitle = s.value("Client/replaceTitle", c.replaceTitle).toBool();
    c.confirmCertificate =
        s.value("Client/confirmCertificate", c.confirmCertificate).toBool();

    PickerConfig &p = cfg.picker;
    p.customGroup = readString(s, "Picker/customGroup", p.customGroup);
    p.includeSelected = s.value("Picker/includeSelected", p.includeSelected).toBool();

    AutomationConfig &a = cfg.automation;
    a.progressClass = readString(s, "Automation/progressClass", a.progressClass);
    a.trustImageId = readString(s, "Automation/trustImageId", a.trustImageId);
    a.trustConfirmId = readString(s, "Automation/trustConfirmId", a.trustConfirmId);
    a.connectionFailedId =
        readString(s, "Automation/connectionFailedId", a.connectionFailedId);
    a.certificateConfirmId =
        readString(s, "Automation/certificateConfirmId", a.certificateConfirmId);

    SupervisorTimings &t = cfg.timings;
    t.hangEscalations =
        std::max(1, readNonNegative(s, "Automation/hangEscalations", t.hangEscalations));
    t.monitorCapMs = std::max(
        t.monitorBaseMs, readNonNegative(s, "Automation/monitorCapMs", t.monitorCapMs));
    return cfg;
}

void saveConfig(QSettings &s, const Config &cfg) {
    s.setValue("Connection/connectToAll", cfg.connectToAll);
    s.setValue("Connection/alwaysConfirm", cfg.alwaysConfirm);

    s.setValue("Vault/useWindowsVault", cfg.vault.useWindowsVault);
    s.setValue("Vault/ttlSeconds", std::max(0, cfg.vault.ttlSeconds));
    s.setValue("Vault/adaptiveTtl", cfg.vault.adaptiveTtl);
    s.setValue("Vault/removeOnExit", cfg.vault.removeOnExit);

    const ClientConfig &c = cfg.client;
    s.setValue("Client/useAdmin", c.useAdmin);
    s.setValue("Client/useRestrictedAdmin", c.useRestrictedAdmin);
    s.setValue("Client/usePublic", c.usePublic);
    s.setValue("Client/useRemoteGuard", c.useRemoteGuard);
    s.setValue("Client/useFullscreen", c.useFullscreen);
    s.setValue("Client/useSpan", c.useSpan);
    s.setValue("Client/useMultimon", c.useMultimon);
    s.setValue("Client/width", std::max(0, c.width));
    s.setValue("Client/height", std::max(0, c.height));
    s.setValue("Client/replaceTitle", c.replaceTitle);
    s.setValue("Client/confirmCertificate", c.confirmCertificate);

    s.setValue("Picker/customGroup", QString::fromStdString(cfg.picker.customGroup));
    s.setValue("Picker/includeSelected", cfg.picker.includeSelected);

    const AutomationConfig &a = cfg.automation;
    s.setValue("Automation/progressClass", QString::fromStdString(a.progressClass));
    s.setValue("Automation/trustImageId", QString::fromStdString(a.trustImageId));
    s.setValue("Automation/trustConfirmId", QString::fromStdString(a.trustConfirmId));
    s.setValue("Automation/connectionFailedId",
               QString::fromStdString(a.connectionFailedId));
    s.setValue("Automation/certificateConfirmId",
               QString::fromStdString(a.certificateConfirmId));
    s.setValue("Automation/hangEscalations", cfg.timings.hangEscalations);
    s.setValue("Automation/monitorCapMs", cfg.timings.monitorCapMs);
    s.sync();
}

Config loadDefaultConfig() {
    QSettings s("RdpVisor", "RdpVisor");
    return loadConfig(s);
}

} // namespace rdpvisor
