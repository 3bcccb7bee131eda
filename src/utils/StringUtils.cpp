/**
 * StringUtils.cpp
 * 
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace heal::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case handling --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool StringUtils::equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

// -- Splitting and searching --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) parts.push_back(part);
    return parts;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatDuration(std::chrono::seconds duration) {
    auto h = std::chrono::duration_cast<std::chrono::hours>(duration);
    auto m = std::chrono::duration_cast<std::chrono::minutes>(duration - h);
    auto s = duration - h - m;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << h.count() << ":"
        << std::setfill('0') << std::setw(2) << m.count() << ":"
        << std::setfill('0') << std::setw(2) << s.count();
    return oss.str();
}

// -- Parsing --

std::optional<int64_t> StringUtils::parseInt64(const std::string& str) {
    std::string trimmed = trim(str);
    if (trimmed.empty()) return std::nullopt;

    int64_t value = 0;
    const char* first = trimmed.data();
    const char* last = first + trimmed.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value < 0) {
        return std::nullopt;
    }
    return value;
}

std::string StringUtils::urlDecode(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size() &&
            std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
            int code = std::stoi(str.substr(i + 1, 2), nullptr, 16);
            result += static_cast<char>(code);
            i += 2;
        } else {
            result += str[i];
        }
    }
    return result;
}

} // namespace heal::utils
