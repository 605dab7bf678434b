// Target parsing, mstsc argument assembly and temporary descriptor files.
#include "rdpvisor/LaunchSupport.hpp"

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QTemporaryFile>
#include <QUrl>
#include <QtGlobal>

#include <map>

Q_LOGGING_CATEGORY(rvLaunch, "rdpvisor.session")

namespace rdpvisor {

// QUrl has already validated bracketed IPv6 literals; IPv4 addresses pass
// the host name pattern.
static bool isValidHost(const QString &host) {
    if (host.isEmpty())
        return false;
    if (host.contains(QLatin1Char(':')))
        return true;
    static const QRegularExpression re(QStringLiteral(
        "^[A-Za-z0-9]([A-Za-z0-9-]{0,62}[A-Za-z0-9])?"
        "(\\.[A-Za-z0-9]([A-Za-z0-9-]{0,62}[A-Za-z0-9])?)*\\.?$"));
    return host.size() <= 253 && re.match(host).hasMatch();
}

static int schemeDefaultPort(const QString &scheme) {
    static const std::map<QString, int> ports = {
        {QStringLiteral("http"), 80},   {QStringLiteral("https"), 443},
        {QStringLiteral("ftp"), 21},    {QStringLiteral("ssh"), 22},
        {QStringLiteral("telnet"), 23}, {QStringLiteral("ldap"), 389},
    };
    auto it = ports.find(scheme.toLower());
    return it == ports.end() ? -1 : it->second;
}

static bool fromUrl(const QUrl &url, TargetAddress &out) {
    if (!url.isValid() || url.scheme().isEmpty())
        return false;
    const QString host = url.host();
    if (!isValidHost(host))
        return false;
    out.host = host.toStdString();
    const int port = url.port();
    out.port = (port > 0 && port != kDefaultRdpPort &&
                port != schemeDefaultPort(url.scheme()))
                   ? port
                   : -1;
    return true;
}

std::string TargetAddress::hostPort() const {
    std::string s = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port > 0)
        s += ":" + std::to_string(port);
    return s;
}

bool parseTarget(const std::string &text, TargetAddress &out, std::string &err) {
    const QString raw = QString::fromStdString(text).trimmed();
    if (raw.isEmpty()) {
        err = "Empty target";
        return false;
    }
    // Bare targets ("host", "host:port") are read as rdp:// URLs.
    const QString candidate = raw.contains(QStringLiteral("://"))
                                  ? raw
                                  : QStringLiteral("rdp://") + raw;
    TargetAddress parsed;
    if (fromUrl(QUrl(candidate, QUrl::StrictMode), parsed)) {
        out = parsed;
        return true;
    }
    err = "The target '" + text + "' could not be parsed";
    return false;
}

MstscCommandBuilder::MstscCommandBuilder(std::string executable)
    : executable_(std::move(executable)) {}

std::string MstscCommandBuilder::defaultExecutable() {
#if defined(_WIN32)
    const QString root =
        qEnvironmentVariable("SystemRoot", QStringLiteral("C:\\Windows"));
    return QDir::toNativeSeparators(root + QStringLiteral("/System32/mstsc.exe"))
        .toStdString();
#else
    return "mstsc.exe";
#endif
}

LaunchSpec MstscCommandBuilder::build(const CommandRequest &req) const {
    QStringList args;
    if (!req.descriptorPath.empty())
        args << QStringLiteral("\"%1\"").arg(QDir::toNativeSeparators(
            QString::fromStdString(req.descriptorPath)));
    if (!req.target.host.empty())
        args << QStringLiteral("/v:") + QString::fromStdString(req.target.hostPort());
    if (req.admin)
        args << QStringLiteral("/admin");
    if (req.restrictedAdmin)
        args << QStringLiteral("/restrictedAdmin");
    if (req.publicMode)
        args << QStringLiteral("/public");
    if (req.remoteGuard)
        args << QStringLiteral("/remoteGuard");
    if (req.fullscreen)
        args << QStringLiteral("/f");
    if (req.span)
        args << QStringLiteral("/span");
    if (req.multimon)
        args << QStringLiteral("/multimon");
    if (req.width > 0)
        args << QStringLiteral("/w:%1").arg(req.width);
    if (req.height > 0)
        args << QStringLiteral("/h:%1").arg(req.height);

    LaunchSpec spec;
    spec.executable = executable_;
    spec.arguments = args.join(QLatin1Char(' ')).toStdString();
    return spec;
}

ConnectionDescriptorFile::ConnectionDescriptorFile()
    : file_(std::make_unique<QTemporaryFile>(
          QDir::tempPath() + QStringLiteral("/rdpvisor-XXXXXX.rdp"))) {
    file_->setAutoRemove(true);
}

ConnectionDescriptorFile::~ConnectionDescriptorFile() { dispose(); }

bool ConnectionDescriptorFile::write(const std::string &contents,
                                     std::string &err) {
    if (!file_) {
        err = "Descriptor file already disposed";
        return false;
    }
    if (!file_->open()) {
        err = "Could not create descriptor file: " +
              file_->errorString().toStdString();
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(contents);
    if (file_->write(data) != data.size() || !file_->flush()) {
        err = "Could not write descriptor file: " +
              file_->errorString().toStdString();
        file_->close();
        return false;
    }
    // Closed but kept on disk so the client can open it.
    file_->close();
    qCDebug(rvLaunch) << "descriptor file written" << "bytes=" << data.size();
    return true;
}

std::string ConnectionDescriptorFile::path() const {
    return file_ ? file_->fileName().toStdString() : std::string();
}

bool ConnectionDescriptorFile::exists() const {
    return file_ && !file_->fileName().isEmpty() &&
           QFile::exists(file_->fileName());
}

void ConnectionDescriptorFile::dispose() { file_.reset(); }

} // namespace rdpvisor
