#pragma once
#include <optional>
#include <string>

namespace cronreg {

// Trim whitespace
std::string trim(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Expand ~ to home directory ($HOME, else the passwd entry)
std::string expand_home(const std::string& path);

// Environment variable, treating set-but-empty as unset (like ${VAR:-default})
std::optional<std::string> env_value(const char* name);

// Single-quote a token for /bin/sh if it contains anything but safe characters.
// Plain paths and words are returned unchanged.
std::string shell_quote(const std::string& token);

// Join a directory and a name with exactly one '/' between them
std::string join_path(const std::string& dir, const std::string& name);

} // namespace cronreg
