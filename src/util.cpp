#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace middleman {

uint64_t epoch_millis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

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

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) return false;
        out << content;
        if (!out.good()) return false;
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

std::optional<uint64_t> parse_bytes(const std::string& text) {
    std::string s = to_lower(trim(text));
    if (s.empty()) return std::nullopt;

    // Numeric part: digits with at most one decimal point
    size_t i = 0;
    bool seen_digit = false;
    bool seen_dot = false;
    while (i < s.size()) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            seen_digit = true;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            break;
        }
        ++i;
    }
    if (!seen_digit) return std::nullopt;

    double number = std::strtod(s.substr(0, i).c_str(), nullptr);
    std::string unit = trim(s.substr(i));

    double multiplier = 1.0;
    if (unit.empty() || unit == "b")  multiplier = 1.0;
    else if (unit == "kb")            multiplier = 1024.0;
    else if (unit == "mb")            multiplier = 1024.0 * 1024.0;
    else if (unit == "gb")            multiplier = 1024.0 * 1024.0 * 1024.0;
    else if (unit == "tb")            multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0;
    else if (unit == "pb")            multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0 * 1024.0;
    else return std::nullopt;

    double bytes = std::floor(number * multiplier);
    // 2^64: anything at or above does not fit the result type
    if (!(bytes < 18446744073709551616.0)) return std::nullopt;
    return static_cast<uint64_t>(bytes);
}

std::string url_join(const std::string& base, const std::string& path) {
    if (path.empty()) return base;
    if (base.empty()) return path;
    bool base_slash = base.back() == '/';
    bool path_slash = path.front() == '/';
    if (base_slash && path_slash) return base + path.substr(1);
    if (!base_slash && !path_slash) return base + "/" + path;
    return base + path;
}

} // namespace middleman
