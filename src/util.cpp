#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace cronreg {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string replace_all(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return std::string(home) + path.substr(1);
        }
        struct passwd* pw = getpwuid(getuid());
        if (pw && pw->pw_dir && *pw->pw_dir) {
            return std::string(pw->pw_dir) + path.substr(1);
        }
    }
    return path;
}

std::optional<std::string> env_value(const char* name) {
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return std::nullopt;
    return std::string(v);
}

static bool is_shell_safe(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '/' || c == '.' || c == '_' || c == '-' ||
           c == '+' || c == ':' || c == ',' || c == '=' || c == '@';
}

std::string shell_quote(const std::string& token) {
    if (token.empty()) return "''";

    bool safe = true;
    for (char c : token) {
        if (!is_shell_safe(c)) {
            safe = false;
            break;
        }
    }
    if (safe) return token;

    return "'" + replace_all(token, "'", "'\\''") + "'";
}

std::string join_path(const std::string& dir, const std::string& name) {
    std::string base = dir;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    if (base.empty()) return name;
    if (base == "/") return "/" + name;
    return base + "/" + name;
}

} // namespace cronreg
