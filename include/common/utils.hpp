#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

namespace utils {

std::string urlEncode(const std::string& str);
std::string urlDecode(const std::string& str);

// Hex string of `bytes` random bytes from the OpenSSL CSPRNG
std::string randomHex(size_t bytes);

// Millisecond timestamp prefix followed by random suffix, sortable by creation time
std::string generateId(const std::string& prefix = "");

bool sha256File(const std::string& path, std::string& digest, std::string& error);

int64_t toMillis(TimePoint time);
TimePoint fromMillis(int64_t millis);

// RFC 3339 in UTC with millisecond precision; epoch maps to ""
std::string formatTimestamp(TimePoint time);
bool parseTimestamp(const std::string& text, TimePoint& time);

std::vector<std::string> split(const std::string& str, char delimiter);
std::string trim(const std::string& str);

// Keeps [A-Za-z0-9._-], replaces anything else with '_'
std::string sanitizePathComponent(const std::string& str);

} // namespace utils
