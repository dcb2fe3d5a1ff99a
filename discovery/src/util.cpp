#include "util.hpp"
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <ctime>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) {
        return default_value;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Environment variable " + name + " is not an integer: " + value);
    }
}

double get_env_double(const std::string& name, double default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) {
        return default_value;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Environment variable " + name + " is not a number: " + value);
    }
}

bool get_env_bool(const std::string& name, bool default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) {
        return default_value;
    }
    auto v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string current_iso8601() {
    return format_timestamp(std::chrono::system_clock::now());
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';

    return ss.str();
}

} // namespace util
