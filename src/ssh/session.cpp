#include "session.hpp"
#include <core/log.hpp>
#include <libssh2.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>
#include <mutex>

static Result<void> init_libssh2() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) return Result<void>::Err("Failed to initialize libssh2");
    return Result<void>::Ok();
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target) {}

SessionManager::~SessionManager() {
    close();
}

Result<void> SessionManager::connect_socket() {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addrs = nullptr;
    std::string port = std::to_string(target_.port);
    int rc = getaddrinfo(target_.host.c_str(), port.c_str(), &hints, &addrs);
    if (rc != 0) {
        return Result<void>::Err(fmt::format("Failed to resolve host {}: {}",
                                             target_.host, gai_strerror(rc)));
    }

    std::string last_error = "no addresses";
    for (auto* ai = addrs; ai; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            sock_ = fd;
            break;
        }
        last_error = std::strerror(errno);
        ::close(fd);
    }
    freeaddrinfo(addrs);

    if (sock_ < 0) {
        return Result<void>::Err(fmt::format("Failed to connect to {}:{}: {}",
                                             target_.host, target_.port, last_error));
    }
    return Result<void>::Ok();
}

Result<void> SessionManager::establish() {
    if (active_) return Result<void>::Ok();

    auto init = init_libssh2();
    if (init.is_err()) return init;

    cj_log(fmt::format("ssh connecting to {}:{}", target_.host, target_.port));

    auto conn = connect_socket();
    if (conn.is_err()) return conn;

    session_ = libssh2_session_init();
    if (!session_) {
        close();
        return Result<void>::Err("Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(target_.timeout) * 1000);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        close();
        return Result<void>::Err("SSH handshake failed with " + target_.host);
    }

    auto auth = ssh_userauth();
    if (auth.is_err()) {
        close();
        return auth;
    }

    active_ = true;
    cj_log(fmt::format("ssh session established: {}@{}:{}",
                       target_.user, target_.host, target_.port));
    return Result<void>::Ok();
}

Result<void> SessionManager::ssh_userauth() {
    if (target_.ssh_key_path) {
        cj_log("ssh auth: public key " + *target_.ssh_key_path);
        int rc = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(), nullptr,
                                                     target_.ssh_key_path->c_str(), nullptr);
        if (rc == 0) return Result<void>::Ok();
        return Result<void>::Err(fmt::format("Public key authentication failed for {} ({})",
                                             target_.user, *target_.ssh_key_path));
    }

    cj_log("ssh auth: ssh-agent");
    return agent_userauth();
}

Result<void> SessionManager::agent_userauth() {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) return Result<void>::Err("Failed to initialize ssh-agent support");

    if (libssh2_agent_connect(agent) != 0) {
        libssh2_agent_free(agent);
        return Result<void>::Err("Failed to connect to ssh-agent");
    }
    if (libssh2_agent_list_identities(agent) != 0) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
        return Result<void>::Err("Failed to list ssh-agent identities");
    }

    bool authenticated = false;
    struct libssh2_agent_publickey* identity = nullptr;
    struct libssh2_agent_publickey* prev = nullptr;
    while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
        if (libssh2_agent_userauth(agent, target_.user.c_str(), identity) == 0) {
            authenticated = true;
            break;
        }
        prev = identity;
    }

    libssh2_agent_disconnect(agent);
    libssh2_agent_free(agent);

    if (!authenticated) {
        return Result<void>::Err("No ssh-agent identity was accepted for " + target_.user);
    }
    return Result<void>::Ok();
}

void SessionManager::close() {
    active_ = false;

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}
