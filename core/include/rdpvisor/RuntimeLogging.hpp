// Environment switches for diagnostics and for logging credential metadata.
#pragma once

#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <string>

namespace rdpvisor {

// Trimmed, lower-cased value of an environment variable; empty when unset.
inline QString envValue(const char *name) {
    if (!name)
        return {};
    return qEnvironmentVariable(name).trimmed().toLower();
}

inline bool envFlagEnabled(const char *name) {
    static const QStringList truthy = {QStringLiteral("1"), QStringLiteral("true"),
                                       QStringLiteral("yes"), QStringLiteral("on")};
    return truthy.contains(envValue(name));
}

inline bool isDevEnvironment() {
    static const QStringList dev = {QStringLiteral("dev"), QStringLiteral("development"),
                                    QStringLiteral("local"), QStringLiteral("debug")};
    return dev.contains(envValue("RDPVISOR_ENV"));
}

// Usernames and target hosts of credentials are only logged in dev builds
// that opt in explicitly. Secrets are never logged.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("RDPVISOR_LOG_SENSITIVE");
}

// Value to put in a log line for a username or target host.
inline std::string redactedUser(const std::string &user) {
    if (user.empty() || sensitiveLoggingEnabled())
        return user;
    return "<redacted>";
}

} // namespace rdpvisor
