#include "ssh_session.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <memory>
#include <type_traits>
#include <sys/stat.h>

namespace tailf {

namespace {

constexpr long kConnectTimeoutSec = 10;
constexpr int kRunTimeoutMs = 10000;

struct SessionDeleter {
    void operator()(ssh_session session) const {
        if (ssh_is_connected(session)) {
            ssh_disconnect(session);
        }
        ssh_free(session);
    }
};

using SessionHandle = std::unique_ptr<std::remove_pointer_t<ssh_session>, SessionDeleter>;

std::string session_error(ssh_session session) {
    return ssh_get_error(session);
}

} // namespace

// ---- SshStream ----

SshStream::SshStream(ssh_channel channel)
    : channel_(channel)
{
}

SshStream::~SshStream() {
    close();
}

ReadResult SshStream::read(char* buffer, std::size_t size, std::chrono::milliseconds timeout) {
    ReadResult result;
    if (!channel_) {
        result.status = ReadStatus::Eof;
        return result;
    }

    int n = ssh_channel_read_timeout(channel_, buffer, static_cast<uint32_t>(size), 0,
                                     static_cast<int>(timeout.count()));
    if (n > 0) {
        result.status = ReadStatus::Data;
        result.bytes = static_cast<std::size_t>(n);
    } else if (n == SSH_ERROR) {
        result.status = ReadStatus::Error;
        result.error = session_error(ssh_channel_get_session(channel_));
    } else if (ssh_channel_is_eof(channel_) || ssh_channel_is_closed(channel_)) {
        result.status = ReadStatus::Eof;
    } else {
        result.status = ReadStatus::Timeout;
    }
    return result;
}

void SshStream::close() {
    if (!channel_) return;
    if (ssh_channel_is_open(channel_)) {
        ssh_channel_send_eof(channel_);
        ssh_channel_close(channel_);
    }
    ssh_channel_free(channel_);
    channel_ = nullptr;
}

// ---- SshSession ----

SshSession::SshSession(ssh_session session, std::string key)
    : session_(session)
    , key_(std::move(key))
{
}

SshSession::~SshSession() {
    close();
}

bool SshSession::is_alive() {
    if (!session_ || !ssh_is_connected(session_)) {
        return false;
    }
    return ssh_send_keepalive(session_) == SSH_OK;
}

ssh_channel SshSession::open_channel(const std::string& command) {
    if (!session_) {
        throw RemoteError(key_ + ": session closed");
    }

    ssh_channel channel = ssh_channel_new(session_);
    if (!channel) {
        throw RemoteError(key_ + ": cannot create channel: " + session_error(session_));
    }

    if (ssh_channel_open_session(channel) != SSH_OK) {
        std::string error = session_error(session_);
        ssh_channel_free(channel);
        throw RemoteError(key_ + ": cannot open channel: " + error);
    }

    if (ssh_channel_request_exec(channel, command.c_str()) != SSH_OK) {
        std::string error = session_error(session_);
        ssh_channel_close(channel);
        ssh_channel_free(channel);
        throw RemoteError(key_ + ": exec failed: " + error);
    }
    return channel;
}

std::unique_ptr<RemoteStream> SshSession::open_stream(const std::string& command) {
    return std::make_unique<SshStream>(open_channel(command));
}

std::string SshSession::run(const std::string& command, std::size_t max_output) {
    SshStream stream(open_channel(command));

    std::string output;
    char buffer[4096];
    for (;;) {
        ReadResult result = stream.read(buffer, sizeof(buffer), std::chrono::milliseconds(kRunTimeoutMs));
        if (result.status == ReadStatus::Data) {
            std::size_t room = max_output > output.size() ? max_output - output.size() : 0;
            output.append(buffer, std::min(room, result.bytes));
            continue;
        }
        if (result.status == ReadStatus::Error) {
            throw RemoteError(key_ + ": " + result.error);
        }
        if (result.status == ReadStatus::Timeout) {
            throw RemoteError(key_ + ": command timed out");
        }
        break;
    }
    return output;
}

void SshSession::close() {
    if (!session_) return;
    ssh_disconnect(session_);
    ssh_free(session_);
    session_ = nullptr;
}

// ---- SshConnector ----

std::unique_ptr<RemoteSession> SshConnector::connect(const RemoteHost& host) {
    const std::string key = host.pool_key();

    SessionHandle session(ssh_new());
    if (!session) {
        throw PoolError(PoolErrorKind::Unreachable, key + ": cannot allocate ssh session");
    }

    unsigned int port = host.port;
    long timeout = kConnectTimeoutSec;
    ssh_options_set(session.get(), SSH_OPTIONS_HOST, host.host.c_str());
    ssh_options_set(session.get(), SSH_OPTIONS_PORT, &port);
    ssh_options_set(session.get(), SSH_OPTIONS_USER, host.user.c_str());
    ssh_options_set(session.get(), SSH_OPTIONS_TIMEOUT, &timeout);
    if (!host.known_hosts_path.empty()) {
        ssh_options_set(session.get(), SSH_OPTIONS_KNOWNHOSTS, host.known_hosts_path.c_str());
    }

    if (ssh_connect(session.get()) != SSH_OK) {
        throw PoolError(PoolErrorKind::Unreachable, key + ": " + session_error(session.get()));
    }

    verify_host_key(session.get(), host);
    authenticate(session.get(), host);

    ServerLog::debug("SSH", "Authenticated to " + key + " using " +
                     auth_method_to_string(host.auth_method));
    return std::make_unique<SshSession>(session.release(), key);
}

void SshConnector::verify_host_key(ssh_session session, const RemoteHost& host) {
    const std::string key = host.pool_key();

    switch (ssh_session_is_known_server(session)) {
        case SSH_KNOWN_HOSTS_OK:
            return;

        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            throw PoolError(PoolErrorKind::HostKeyRejected,
                            key + ": host key does not match known_hosts");

        case SSH_KNOWN_HOSTS_NOT_FOUND:
        case SSH_KNOWN_HOSTS_UNKNOWN:
            if (host.host_key_policy != HostKeyPolicy::AcceptNew) {
                throw PoolError(PoolErrorKind::HostKeyRejected, key + ": unknown host key");
            }
            if (ssh_session_update_known_hosts(session) != SSH_OK) {
                throw PoolError(PoolErrorKind::HostKeyRejected,
                                key + ": cannot record host key: " + session_error(session));
            }
            ServerLog::warn("SSH", "Accepted new host key for " + key);
            return;

        case SSH_KNOWN_HOSTS_ERROR:
        default:
            throw PoolError(PoolErrorKind::HostKeyRejected,
                            key + ": host key check failed: " + session_error(session));
    }
}

void SshConnector::authenticate(ssh_session session, const RemoteHost& host) {
    const std::string key = host.pool_key();
    int rc = SSH_AUTH_DENIED;

    if (host.auth_method == AuthMethod::Password) {
        rc = ssh_userauth_password(session, nullptr, host.password.c_str());
    } else if (host.key_path.empty()) {
        rc = ssh_userauth_publickey_auto(session, nullptr, nullptr);
    } else {
        struct stat st{};
        if (::stat(host.key_path.c_str(), &st) == 0 && (st.st_mode & 077) != 0) {
            ServerLog::warn("SSH", "Private key " + host.key_path +
                            " is readable by group or others");
        }

        ssh_key private_key = nullptr;
        if (ssh_pki_import_privkey_file(host.key_path.c_str(), nullptr, nullptr, nullptr,
                                        &private_key) != SSH_OK) {
            throw PoolError(PoolErrorKind::AuthFailed,
                            key + ": cannot load private key " + host.key_path);
        }
        rc = ssh_userauth_publickey(session, nullptr, private_key);
        ssh_key_free(private_key);
    }

    if (rc != SSH_AUTH_SUCCESS) {
        throw PoolError(PoolErrorKind::AuthFailed, key + ": authentication rejected");
    }
}

} // namespace tailf
