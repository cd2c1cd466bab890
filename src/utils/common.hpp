#pragma once

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace interjudge::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

inline std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

// Strips trailing whitespace, including the line terminator.
inline std::string TrimRight(std::string value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

// Splits on '\n', dropping a '\r' before each terminator.
inline std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

template <typename Rep, typename Period>
double ToSeconds(std::chrono::duration<Rep, Period> duration) {
    return std::chrono::duration_cast<std::chrono::duration<double>>(duration).count();
}

// Upper bound for any configured or requested duration.
constexpr double kMaxSeconds = 7 * 24 * 3600.0;

// nullopt for NaN, infinity, negative values and anything above kMaxSeconds.
inline std::optional<std::chrono::milliseconds> SecondsToMillis(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0 || seconds > kMaxSeconds) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::llround(seconds * 1000.0)));
}

// Whole-string decimal integer; "3.5", "7x" and "" are rejected.
inline std::optional<int> ParseInt(const std::string& text) {
    try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Positive number of seconds as text, e.g. "2.5".
inline std::optional<std::chrono::milliseconds> ParseSeconds(const std::string& text) {
    double seconds = 0;
    try {
        std::size_t used = 0;
        seconds = std::stod(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (!(seconds > 0)) {
        return std::nullopt;
    }
    return SecondsToMillis(seconds);
}

}  // namespace interjudge::utils
