#pragma once

#include <filesystem>

namespace platform {

// The user's home directory: $HOME, else the password database entry,
// else the temporary directory.
std::filesystem::path home_dir();

// The system temporary directory (/tmp when it cannot be determined).
std::filesystem::path temp_dir();

// Per-user state: config.yaml and logs/ live here (~/.condorjob).
std::filesystem::path state_dir();

// Sleep for the given number of milliseconds, resuming after signals.
void sleep_ms(int ms);

} // namespace platform
