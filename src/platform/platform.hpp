#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory ($HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Short host name of this machine ("unknown" if it cannot be read).
std::string hostname();

int process_id();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
