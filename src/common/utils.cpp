#include "common/utils.hpp"
#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace utils {

std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return str;
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    std::string result = encoded ? std::string(encoded) : str;
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

std::string urlDecode(const std::string& str) {
    std::string plus = str;
    for (auto& c : plus) {
        if (c == '+') {
            c = ' ';
        }
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return plus;
    }

    int length = 0;
    char* decoded = curl_easy_unescape(curl, plus.c_str(), static_cast<int>(plus.length()), &length);
    std::string result = decoded ? std::string(decoded, static_cast<size_t>(length)) : plus;
    curl_free(decoded);
    curl_easy_cleanup(curl);
    return result;
}

std::string randomHex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    std::stringstream ss;
    for (unsigned char b : buffer) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

std::string generateId(const std::string& prefix) {
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());

    std::stringstream ss;
    ss << prefix << std::hex << nowMs.count() << randomHex(4);
    return ss.str();
}

bool sha256File(const std::string& path, std::string& digest, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "cannot open " + path;
        return false;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        error = "Failed to create OpenSSL context";
        return false;
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        error = "Failed to initialize digest";
        return false;
    }

    char buffer[65536];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0 &&
            EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
            EVP_MD_CTX_free(ctx);
            error = "Failed to update digest";
            return false;
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        error = "Failed to finalize digest";
        return false;
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    digest = ss.str();
    return true;
}

int64_t toMillis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint fromMillis(int64_t millis) {
    return TimePoint(std::chrono::milliseconds(millis));
}

std::string formatTimestamp(TimePoint time) {
    if (time == TimePoint{}) {
        return "";
    }

    auto seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = toMillis(time) % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

bool parseTimestamp(const std::string& text, TimePoint& time) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return false;
    }

    int64_t fractionMs = 0;
    int offsetSeconds = 0;
    char c = 0;
    if (ss.get(c) && c == '.') {
        int digits = 0;
        while (ss.get(c) && std::isdigit(static_cast<unsigned char>(c))) {
            if (digits < 3) {
                fractionMs = fractionMs * 10 + (c - '0');
            }
            ++digits;
        }
        for (; digits < 3; ++digits) {
            fractionMs *= 10;
        }
    }

    if (ss && (c == '+' || c == '-')) {
        int hours = 0;
        int minutes = 0;
        char colon = 0;
        ss >> std::setw(2) >> hours >> colon >> std::setw(2) >> minutes;
        if (ss.fail() || colon != ':') {
            return false;
        }
        offsetSeconds = (hours * 3600 + minutes * 60) * (c == '+' ? 1 : -1);
    } else if (ss && c != 'Z') {
        return false;
    }

    time_t seconds = timegm(&tm) - offsetSeconds;
    time = std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(fractionMs);
    return true;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream ss(str);
    while (std::getline(ss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string sanitizePathComponent(const std::string& str) {
    std::string result = str;
    for (auto& c : result) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            c = '_';
        }
    }
    if (result.empty() || result == "." || result == "..") {
        result = "_" + result;
    }
    return result;
}

} // namespace utils
