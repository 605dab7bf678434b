// JSON settings blob stored next to each database entry.
#include "rdpvisor/EntryProvider.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QString>

Q_LOGGING_CATEGORY(rvEntryCfg, "rdpvisor.config")

namespace rdpvisor {

static void readBool(const QJsonObject &o, const char *key, bool &out) {
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isBool())
        out = v.toBool();
}

static void readStrings(const QJsonObject &o, const char *key,
                        std::vector<std::string> &out) {
    const QJsonValue v = o.value(QLatin1String(key));
    if (!v.isArray())
        return;
    for (const QJsonValue &item : v.toArray()) {
        const QString s = item.toString().trimmed();
        if (!s.isEmpty())
            out.push_back(s.toStdString());
    }
}

bool parseEntrySettings(const std::string &blob, EntrySettings &out,
                        std::string &err) {
    out = EntrySettings{};
    const QByteArray raw = QByteArray::fromStdString(blob).trimmed();
    if (raw.isEmpty())
        return true;

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &perr);
    if (perr.error != QJsonParseError::NoError) {
        err = "Invalid settings JSON: " + perr.errorString().toStdString();
        return false;
    }
    if (!doc.isObject()) {
        err = "Settings JSON is not an object";
        return false;
    }

    const QJsonObject o = doc.object();
    EntrySettings s;
    readBool(o, "Ignore", s.ignore);
    readBool(o, "UseCredpicker", s.useCredPicker);
    readBool(o, "ForceLocalUser", s.forceLocalUser);
    readBool(o, "IncludeDefaultParameters", s.includeDefaultParameters);
    readBool(o, "CpRecurseGroups", s.recurseGroups);
    readStrings(o, "CpGroupUUIDs", s.includeGroups);
    readStrings(o, "CpExcludedGroupUUIDs", s.excludeGroups);
    readStrings(o, "CpRegExPatterns", s.regexPatterns);
    readStrings(o, "MstscParameters", s.extraParameters);

    const QJsonValue rdp = o.value(QStringLiteral("RdpFile"));
    if (rdp.isString())
        s.connectionDescriptor = rdp.toString().toStdString();
    else if (!rdp.isNull() && !rdp.isUndefined()) {
        err = "RdpFile must be a string";
        return false;
    }

    out = std::move(s);
    return true;
}

EntrySettings loadEntrySettings(const EntryProvider &provider,
                                const std::string &entryId) {
    EntrySettings s;
    std::string err;
    if (!parseEntrySettings(provider.settingsBlob(entryId), s, err)) {
        qCWarning(rvEntryCfg) << "entry settings ignored"
                              << "entry=" << entryId.c_str()
                              << "detail=" << err.c_str();
    }
    return s;
}

} // namespace rdpvisor
