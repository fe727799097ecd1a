#pragma once

#include "remote_session.hpp"
#include <libssh/libssh.h>

namespace tailf {

class SshStream : public RemoteStream {
public:
    explicit SshStream(ssh_channel channel);
    ~SshStream() override;

    ReadResult read(char* buffer, std::size_t size, std::chrono::milliseconds timeout) override;
    void close() override;

private:
    ssh_channel channel_;
};

class SshSession : public RemoteSession {
public:
    SshSession(ssh_session session, std::string key);
    ~SshSession() override;

    bool is_alive() override;
    std::unique_ptr<RemoteStream> open_stream(const std::string& command) override;
    std::string run(const std::string& command, std::size_t max_output) override;
    void close() override;

private:
    ssh_channel open_channel(const std::string& command);

    ssh_session session_;
    std::string key_;
};

// Opens authenticated libssh sessions. Host keys are checked against the
// known_hosts file according to the host's policy before any credential
// is sent.
class SshConnector : public RemoteConnector {
public:
    std::unique_ptr<RemoteSession> connect(const RemoteHost& host) override;

private:
    static void verify_host_key(ssh_session session, const RemoteHost& host);
    static void authenticate(ssh_session session, const RemoteHost& host);
};

} // namespace tailf
