#include "TestSupport.hpp"
#include "rdpvisor/ConfigStore.hpp"
#include "rdpvisor/EntryProvider.hpp"
#include "rdpvisor/LaunchSupport.hpp"
#include "rdpvisor/MockEntryProvider.hpp"

#include <QFile>
#include <QSettings>
#include <QString>
#include <QTemporaryDir>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using testsupport::TestContext;

namespace {

using rdpvisor::CommandRequest;
using rdpvisor::Config;
using rdpvisor::ConnectionDescriptorFile;
using rdpvisor::EntrySettings;
using rdpvisor::LaunchSpec;
using rdpvisor::MstscCommandBuilder;
using rdpvisor::TargetAddress;

void test_entry_settings_defaults(TestContext &t) {
    EntrySettings s;
    std::string err;
    t.check(rdpvisor::parseEntrySettings("", s, err), "empty blob accepted");
    t.check(!s.ignore && s.useCredPicker && s.includeDefaultParameters &&
                s.recurseGroups && !s.forceLocalUser,
            "defaults for an empty blob");
    t.check(!s.connectionDescriptor, "no descriptor by default");
    t.check(rdpvisor::parseEntrySettings("  {}  ", s, err), "empty object accepted");
}

void test_entry_settings_full(TestContext &t) {
    const std::string blob = R"({
        "Ignore": true,
        "UseCredpicker": false,
        "ForceLocalUser": true,
        "IncludeDefaultParameters": false,
        "CpRecurseGroups": false,
        "CpGroupUUIDs": ["g1", " g2 ", ""],
        "CpExcludedGroupUUIDs": ["x1"],
        "CpRegExPatterns": ["^admin", "ops$"],
        "MstscParameters": ["/prompt", "/noConsentPrompt"],
        "RdpFile": "full address:s:host\n"
    })";
    EntrySettings s;
    std::string err;
    t.check(rdpvisor::parseEntrySettings(blob, s, err), "full blob parsed");
    t.check(s.ignore && !s.useCredPicker && s.forceLocalUser &&
                !s.includeDefaultParameters && !s.recurseGroups,
            "flags read");
    t.check(s.includeGroups == std::vector<std::string>{"g1", "g2"},
            "group ids trimmed, blanks dropped");
    t.check(s.excludeGroups == std::vector<std::string>{"x1"}, "exclusions read");
    t.check(s.regexPatterns.size() == 2, "patterns read");
    t.check(s.extraParameters.size() == 2 && s.extraParameters[1] == "/noConsentPrompt",
            "extra parameters read in order");
    t.check(s.connectionDescriptor && *s.connectionDescriptor == "full address:s:host\n",
            "descriptor payload read");
}

void test_entry_settings_malformed(TestContext &t) {
    EntrySettings s;
    std::string err;
    t.check(!rdpvisor::parseEntrySettings("{\"Ignore\": tru", s, err),
            "broken JSON rejected");
    t.check(!err.empty(), "parse error described");
    t.check(!s.ignore, "defaults kept on error");

    err.clear();
    t.check(!rdpvisor::parseEntrySettings("[1, 2]", s, err), "non-object rejected");
    err.clear();
    t.check(!rdpvisor::parseEntrySettings(R"({"RdpFile": 3})", s, err),
            "non-string descriptor rejected");
    t.check(!s.connectionDescriptor, "no descriptor after rejection");

    rdpvisor::MockEntryProvider db;
    db.addGroup("g", "G");
    rdpvisor::EntryRecord e;
    e.id = "e";
    e.groupId = "g";
    db.addEntry(e, "not json");
    t.check(!rdpvisor::loadEntrySettings(db, "e").ignore,
            "provider lookup falls back to defaults");
}

void test_config_round_trip_and_clamping(TestContext &t) {
    QTemporaryDir dir;
    t.check(dir.isValid(), "temporary directory");
    const QString path = dir.filePath(QStringLiteral("rdpvisor.ini"));

    {
        QSettings s(path, QSettings::IniFormat);
        Config defaults = rdpvisor::loadConfig(s);
        t.check(defaults.vault.ttlSeconds == 10 && defaults.vault.useWindowsVault,
                "defaults when nothing is stored");
        t.check(defaults.picker.customGroup == "RDP", "default credential group");
        t.check(defaults.automation.certificateConfirmId == "14004",
                "default control ids");
    }

    Config cfg;
    cfg.connectToAll = false;
    cfg.alwaysConfirm = true;
    cfg.vault.ttlSeconds = 30;
    cfg.vault.removeOnExit = true;
    cfg.client.useAdmin = true;
    cfg.client.width = 1920;
    cfg.client.confirmCertificate = true;
    cfg.picker.customGroup = "Jump";
    cfg.picker.includeSelected = true;
    cfg.automation.connectionFailedId = "CommandButton_9";
    cfg.timings.hangEscalations = 5;
    {
        QSettings s(path, QSettings::IniFormat);
        rdpvisor::saveConfig(s, cfg);
    }
    {
        QSettings s(path, QSettings::IniFormat);
        const Config loaded = rdpvisor::loadConfig(s);
        t.check(!loaded.connectToAll && loaded.alwaysConfirm, "connection keys");
        t.check(loaded.vault.ttlSeconds == 30 && loaded.vault.removeOnExit,
                "vault keys");
        t.check(loaded.client.useAdmin && loaded.client.width == 1920 &&
                    loaded.client.confirmCertificate,
                "client keys");
        t.check(loaded.picker.customGroup == "Jump" && loaded.picker.includeSelected,
                "picker keys");
        t.check(loaded.automation.connectionFailedId == "CommandButton_9",
                "automation ids");
        t.check(loaded.timings.hangEscalations == 5, "hang escalations");
    }
    {
        QSettings s(path, QSettings::IniFormat);
        s.setValue("Vault/ttlSeconds", -5);
        s.setValue("Client/width", -1);
        s.setValue("Client/height", QStringLiteral("tall"));
        s.setValue("Automation/hangEscalations", 0);
        s.setValue("Picker/customGroup", QStringLiteral("   "));
        s.sync();
        const Config clamped = rdpvisor::loadConfig(s);
        t.check(clamped.vault.ttlSeconds == 0, "negative ttl clamped to 0");
        t.check(clamped.client.width == 0, "negative width clamped to 0");
        t.check(clamped.client.height == 0, "unreadable height keeps default");
        t.check(clamped.timings.hangEscalations == 1, "at least one escalation");
        t.check(clamped.picker.customGroup == "RDP", "blank group name ignored");
    }
}

void test_parse_target(TestContext &t) {
    TargetAddress a;
    std::string err;

    t.check(rdpvisor::parseTarget("rdp://srv01.example.com:3390", a, err) &&
                a.host == "srv01.example.com" && a.port == 3390,
            "rdp url with port");
    t.check(rdpvisor::parseTarget("rdp://srv01:3389", a, err) && a.port == -1,
            "default rdp port dropped");
    t.check(rdpvisor::parseTarget("https://web.example.com:443", a, err) &&
                a.host == "web.example.com" && a.port == -1,
            "scheme default port dropped");
    t.check(rdpvisor::parseTarget("https://web.example.com:8443", a, err) &&
                a.port == 8443,
            "non-default port kept");
    t.check(rdpvisor::parseTarget("srv01:3390", a, err) && a.host == "srv01" &&
                a.port == 3390,
            "bare host and port");
    t.check(rdpvisor::parseTarget("  10.0.0.5  ", a, err) && a.host == "10.0.0.5" &&
                a.port == -1,
            "bare IPv4 address, trimmed");
    t.check(rdpvisor::parseTarget("rdp://[fe80::1]:3390", a, err) &&
                a.host == "fe80::1" && a.hostPort() == "[fe80::1]:3390",
            "IPv6 literal bracketed again");

    err.clear();
    t.check(!rdpvisor::parseTarget("not a valid uri!!", a, err), "garbage rejected");
    t.checkContains(err, "not a valid uri!!", "error names the input");
    t.check(!rdpvisor::parseTarget("", a, err), "empty target rejected");
    t.check(!rdpvisor::parseTarget("rdp://bad_host!", a, err),
            "invalid host name rejected");
}

void test_mstsc_arguments(TestContext &t) {
    MstscCommandBuilder builder("C:\\Windows\\System32\\mstsc.exe");
    CommandRequest req;
    req.target.host = "srv01";
    req.target.port = 3390;
    LaunchSpec spec = builder.build(req);
    t.check(spec.executable == "C:\\Windows\\System32\\mstsc.exe", "executable");
    t.check(spec.arguments == "/v:srv01:3390", "target only");

    req.admin = true;
    req.restrictedAdmin = true;
    req.publicMode = true;
    req.remoteGuard = true;
    req.fullscreen = true;
    req.span = true;
    req.multimon = true;
    req.width = 1600;
    req.height = 900;
    req.descriptorPath = "/tmp/rdpvisor-abc.rdp";
    spec = builder.build(req);
    t.check(spec.arguments ==
                "\"/tmp/rdpvisor-abc.rdp\" /v:srv01:3390 /admin /restrictedAdmin "
                "/public /remoteGuard /f /span /multimon /w:1600 /h:900",
            "every flag in order, descriptor first");
}

void test_descriptor_file(TestContext &t) {
    ConnectionDescriptorFile file;
    std::string err;
    t.check(file.write("full address:s:srv01\n", err), "descriptor written");
    const std::string path = file.path();
    t.check(!path.empty() && file.exists(), "file on disk");

    QFile f(QString::fromStdString(path));
    t.check(f.open(QIODevice::ReadOnly) &&
                f.readAll() == QByteArray("full address:s:srv01\n"),
            "payload readable by the client");
    f.close();

    file.dispose();
    t.check(!QFile::exists(QString::fromStdString(path)), "removed on dispose");
    t.check(!file.exists() && file.path().empty(), "no path after dispose");
    t.check(!file.write("again", err), "disposed file cannot be rewritten");

    std::string scopedPath;
    {
        ConnectionDescriptorFile scoped;
        scoped.write("x", err);
        scopedPath = scoped.path();
    }
    t.check(!QFile::exists(QString::fromStdString(scopedPath)),
            "removed on destruction");
}

} // namespace

int main() {
    TestContext t;
    test_entry_settings_defaults(t);
    test_entry_settings_full(t);
    test_entry_settings_malformed(t);
    test_config_round_trip_and_clamping(t);
    test_parse_target(t);
    test_mstsc_arguments(t);
    test_descriptor_file(t);

    if (t.failures > 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] config_tests\n";
    return EXIT_SUCCESS;
}
