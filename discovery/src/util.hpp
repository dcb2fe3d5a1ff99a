#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);

// Time utilities
std::string current_iso8601();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

template <typename Rep, typename Period>
double to_seconds(const std::chrono::duration<Rep, Period>& d) {
    return std::chrono::duration_cast<std::chrono::duration<double>>(d).count();
}

inline std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // namespace util
