#include "util.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace util {

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

} // namespace

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string generate_id(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dis(0, 0xffff);

    std::ostringstream ss;
    ss << prefix << "_" << std::hex << current_timestamp_ms()
       << "_" << counter.fetch_add(1) << "_" << std::setw(4) << std::setfill('0') << dis(gen);
    return ss.str();
}

std::string trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) start++;

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) end--;

    return std::string(start, end);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return contains(to_lower(haystack), to_lower(needle));
}

std::string normalize_path(const std::string& path) {
    std::string out = path;
    std::replace(out.begin(), out.end(), '\\', '/');
    return to_lower(out);
}

bool contains_word(const std::string& text, const std::string& word) {
    if (word.empty()) return false;

    size_t pos = text.find(word);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !is_ident_char(text[pos - 1]);
        size_t after = pos + word.size();
        bool right_ok = after >= text.size() || !is_ident_char(text[after]);
        if (left_ok && right_ok) return true;
        pos = text.find(word, pos + 1);
    }
    return false;
}

std::string escape_regex(const std::string& str) {
    static const std::string special = ".*+?^${}()|[]\\";
    std::string out;
    out.reserve(str.size() * 2);
    for (char c : str) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

size_t count_lines(const std::string& content) {
    if (content.empty()) return 0;
    size_t lines = static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
    if (content.back() != '\n') lines++;
    return lines;
}

} // namespace util
