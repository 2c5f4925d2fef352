#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    std::string user;
    int port = 22;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;  // unset: authenticate through ssh-agent
};

// One authenticated, blocking libssh2 session.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    Result<void> establish();
    void close();
    bool is_active() const { return active_; }

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    const SessionTarget& target() const { return target_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_ = nullptr;
    int sock_ = -1;
    bool active_ = false;

    Result<void> connect_socket();
    Result<void> ssh_userauth();
    Result<void> agent_userauth();
};
