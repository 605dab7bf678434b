// Pieces needed to turn an entry into a client command line: target
// parsing, argument assembly and the temporary connection-descriptor file.
#pragma once
#include "ClientProcess.hpp"

#include <memory>
#include <string>

class QTemporaryFile;

namespace rdpvisor {

constexpr int kDefaultRdpPort = 3389;

struct TargetAddress {
    std::string host;
    int port = -1;  // -1 = client default

    // host[:port], IPv6 literals bracketed.
    std::string hostPort() const;
};

// Accepts absolute URLs ("rdp://host:3390", "https://host") and bare targets
// ("host", "host:3390", "10.0.0.5"). The port is dropped when it is the
// RDP default or the scheme's own default.
bool parseTarget(const std::string &text, TargetAddress &out, std::string &err);

struct CommandRequest {
    TargetAddress target;
    bool admin = false;
    bool restrictedAdmin = false;
    bool publicMode = false;
    bool remoteGuard = false;
    bool fullscreen = false;
    bool span = false;
    bool multimon = false;
    int width = 0;
    int height = 0;
    std::string descriptorPath;  // empty = none
};

class CommandBuilder {
public:
    virtual ~CommandBuilder() = default;
    virtual LaunchSpec build(const CommandRequest &req) const = 0;
};

// Command line of the Windows Remote Desktop client.
class MstscCommandBuilder : public CommandBuilder {
public:
    explicit MstscCommandBuilder(std::string executable = defaultExecutable());

    LaunchSpec build(const CommandRequest &req) const override;

    static std::string defaultExecutable();

private:
    std::string executable_;
};

// Descriptor payload written to a private temporary .rdp file that is
// removed on dispose() or destruction.
class ConnectionDescriptorFile {
public:
    ConnectionDescriptorFile();
    ~ConnectionDescriptorFile();

    ConnectionDescriptorFile(const ConnectionDescriptorFile &) = delete;
    ConnectionDescriptorFile &operator=(const ConnectionDescriptorFile &) = delete;

    bool write(const std::string &contents, std::string &err);
    std::string path() const;
    bool exists() const;
    void dispose();

private:
    std::unique_ptr<QTemporaryFile> file_;
};

} // namespace rdpvisor
