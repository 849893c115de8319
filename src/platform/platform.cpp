#include "platform.hpp"
#include <cstdlib>
#include <unistd.h>
#include <limits.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return fs::temp_directory_path();
    return fs::path(home);
}

std::string hostname() {
#ifdef HOST_NAME_MAX
    char buf[HOST_NAME_MAX + 1];
#else
    char buf[256];
#endif
    if (gethostname(buf, sizeof(buf)) != 0) return "unknown";
    buf[sizeof(buf) - 1] = '\0';
    return std::string(buf);
}

int process_id() {
    return static_cast<int>(getpid());
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
