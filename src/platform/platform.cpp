#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);

    // Batch daemons often start us without HOME
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir && *pw->pw_dir) return fs::path(pw->pw_dir);
    return temp_dir();
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return dir;
}

fs::path state_dir() {
    return home_dir() / ".condorjob";
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    struct timespec req;
    req.tv_sec = ms / 1000;
    req.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
    while (nanosleep(&req, &req) != 0 && errno == EINTR) {}
}

} // namespace platform
