#include "platform.hpp"
#include <pwd.h>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

// $HOME, then the passwd entry (daemons and cron often run without HOME)
fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);

    if (const struct passwd* pw = getpwuid(getuid())) {
        if (pw->pw_dir && *pw->pw_dir) return fs::path(pw->pw_dir);
    }
    return temp_dir();
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : dir;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

std::string errno_text(int err) {
    return std::strerror(err);
}

PartialFile::~PartialFile() {
    if (committed_) return;
    std::error_code ec;
    fs::remove(path_, ec);
}

} // namespace platform
