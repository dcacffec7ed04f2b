#include "signal_extractor.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace {

const std::unordered_set<std::string> kSourceExtensions = {
    "c", "cc", "cpp", "cxx", "h", "hh", "hpp", "hxx",
    "ts", "tsx", "js", "jsx", "mjs", "cjs", "json",
    "py", "rb", "go", "rs", "java", "kt", "swift", "cs",
    "php", "scala", "sh", "yaml", "yml", "toml", "md", "sql"
};

const std::unordered_set<std::string> kErrnoNames = {
    "ENOENT", "EACCES", "EPERM", "EEXIST", "ENOTDIR", "EISDIR", "EINVAL",
    "EMFILE", "ENOSPC", "EPIPE", "EAGAIN", "EBUSY", "ETIMEDOUT",
    "ECONNREFUSED", "ECONNRESET", "EADDRINUSE", "ENOTEMPTY"
};

// Common words that show up as `word(` in prose.
const std::unordered_set<std::string> kCallStopwords = {
    "if", "for", "while", "switch", "return", "catch", "function", "sizeof", "e.g", "i.e"
};

const std::regex kJsFrame(R"(^\s*at\s+(?:(\S+)\s+\()?([^\s()]+?):(\d+):(\d+)\)?\s*$)");
const std::regex kPyFrame(R"rx(^\s*File\s+"([^"]+)",\s+line\s+(\d+)(?:,\s+in\s+(\S+))?)rx");
const std::regex kGdbFrame(R"(^\s*#(\d+)\s+(?:0x[0-9a-fA-F]+\s+in\s+)?(\S+)\s*(?:\([^)]*\))?\s+(?:at|from)\s+([^\s:]+):(\d+))");

// Frame regexes only see lines up to this length; longer lines are never frames.
constexpr size_t kMaxFrameLine = 1024;

// Digit runs from a frame; oversized values clamp instead of throwing.
int to_position(const std::string& digits) {
    long v = std::strtol(digits.c_str(), nullptr, 10);
    return v > INT_MAX ? INT_MAX : static_cast<int>(v);
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_symbol_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_symbol_char(char c) {
    return is_word_char(c) || c == '$' || c == '.';
}

bool all_alnum(const std::string& s, size_t from, size_t to) {
    for (size_t i = from; i < to; i++) {
        if (!std::isalnum(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// "TypeError", "NullPointerException"
bool is_error_name(const std::string& word) {
    if (word.empty() || !std::isupper(static_cast<unsigned char>(word[0]))) return false;
    for (const char* suffix : {"Error", "Exception"}) {
        std::string sfx(suffix);
        if (word.size() > sfx.size() && util::ends_with(word, sfx) &&
            all_alnum(word, 0, word.size() - sfx.size())) {
            return true;
        }
    }
    return false;
}

// Whole [A-Za-z0-9_] runs, left to right.
std::vector<std::string> words(const std::string& text) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_word_char(text[i])) {
            i++;
            continue;
        }
        size_t start = i;
        while (i < text.size() && is_word_char(text[i])) i++;
        out.push_back(text.substr(start, i - start));
    }
    return out;
}

// Names written as `name`, scanned in one pass.
std::vector<std::string> backticked_names(const std::string& text) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '`') {
            i++;
            continue;
        }
        size_t start = i + 1;
        size_t j = start;
        if (j < text.size() && is_symbol_start(text[j])) {
            while (j < text.size() && (is_symbol_char(text[j]) || text[j] == ':')) j++;
        }
        if (j > start && j < text.size() && text[j] == '`') {
            out.push_back(text.substr(start, j - start));
            i = j + 1;
        } else {
            i = start;
        }
    }
    return out;
}

// Names directly followed by "(", scanned in one pass. Leading digits of a
// run are skipped so "1foo(" yields "foo".
std::vector<std::string> call_names(const std::string& text) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_symbol_char(text[i])) {
            i++;
            continue;
        }
        size_t start = i;
        while (i < text.size() && is_symbol_char(text[i])) i++;
        if (i >= text.size() || text[i] != '(') continue;
        while (start < i && !is_symbol_start(text[start])) start++;
        if (start < i) out.push_back(text.substr(start, i - start));
    }
    return out;
}

std::string strip_punct(const std::string& token) {
    size_t start = 0;
    size_t end = token.size();
    auto is_edge = [](char c) {
        return c == '\'' || c == '"' || c == '`' || c == ',' || c == ';' ||
               c == '(' || c == ')' || c == '[' || c == ']' || c == '<' || c == '>';
    };
    while (start < end && is_edge(token[start])) start++;
    while (end > start && (is_edge(token[end - 1]) || token[end - 1] == '.' || token[end - 1] == ':')) end--;
    return token.substr(start, end - start);
}

// Drops a trailing ":line" or ":line:col" from "file.ts:12:3".
std::string strip_position(const std::string& token) {
    std::string out = token;
    for (int i = 0; i < 2; i++) {
        size_t colon = out.rfind(':');
        if (colon == std::string::npos || colon + 1 >= out.size()) break;
        bool digits = true;
        for (size_t j = colon + 1; j < out.size(); j++) {
            if (!std::isdigit(static_cast<unsigned char>(out[j]))) {
                digits = false;
                break;
            }
        }
        if (!digits) break;
        out = out.substr(0, colon);
    }
    return out;
}

Signal frame_signal(const std::string& symbol, const std::string& path, int line, int character, int depth) {
    Signal s;
    s.type = SignalType::Symbol;
    s.value = symbol;
    s.source = SignalSource::StackTrace;
    s.confidence = 0.9;
    // LSP positions are 0-based; traces are 1-based.
    s.metadata = {
        {"path", path},
        {"line", std::max(0, line - 1)},
        {"character", std::max(0, character - 1)},
        {"depth", depth}
    };
    return s;
}

} // namespace

bool SignalExtractor::looks_like_path(const std::string& token) {
    if (token.empty() || token.find("://") != std::string::npos) return false;

    size_t dot = token.rfind('.');
    if (dot != std::string::npos && dot + 1 < token.size()) {
        std::string ext = util::to_lower(token.substr(dot + 1));
        if (kSourceExtensions.count(ext)) return true;
    }
    // "src/foo" but not "and/or"
    size_t slash = token.find('/');
    return slash != std::string::npos && slash > 0 && slash + 1 < token.size() &&
           (token.find('.') != std::string::npos || std::count(token.begin(), token.end(), '/') >= 2);
}

void SignalExtractor::push_unique(std::vector<Signal>& out, Signal signal) {
    for (const auto& existing : out) {
        if (existing.same_fact(signal)) return;
    }
    out.push_back(std::move(signal));
}

void SignalExtractor::extract_stack_frames(const std::string& text, std::vector<Signal>& out) {
    int depth = 0;
    for (const auto& raw_line : util::split(text, '\n')) {
        if (raw_line.size() > kMaxFrameLine) continue;
        std::smatch m;
        std::string symbol;
        std::string path;
        int line = 0;
        int character = 1;

        if (std::regex_match(raw_line, m, kJsFrame)) {
            symbol = m[1].matched ? m[1].str() : "";
            path = m[2].str();
            line = to_position(m[3].str());
            character = to_position(m[4].str());
        } else if (std::regex_search(raw_line, m, kPyFrame)) {
            path = m[1].str();
            line = to_position(m[2].str());
            symbol = m[3].matched ? m[3].str() : "";
        } else if (std::regex_search(raw_line, m, kGdbFrame)) {
            symbol = m[2].str();
            path = m[3].str();
            line = to_position(m[4].str());
        } else {
            continue;
        }

        if (!path.empty()) {
            Signal p;
            p.type = SignalType::Path;
            p.value = path;
            p.source = SignalSource::StackTrace;
            p.confidence = 0.9;
            push_unique(out, std::move(p));
        }
        if (!symbol.empty() && symbol != "<module>" && symbol != "<anonymous>") {
            // "Object.handler" -> "handler"
            size_t dot = symbol.rfind('.');
            if (dot != std::string::npos && dot + 1 < symbol.size()) symbol = symbol.substr(dot + 1);
            push_unique(out, frame_signal(symbol, path, line, character, depth));
        }
        depth++;
    }
}

void SignalExtractor::extract_tokens(const std::string& text, std::vector<Signal>& out) {
    std::istringstream ss(text);
    std::string word;
    while (ss >> word) {
        std::string token = strip_position(strip_punct(word));
        if (looks_like_path(token)) {
            Signal s;
            s.type = SignalType::Path;
            s.value = token;
            s.confidence = 0.9;
            push_unique(out, std::move(s));
        }
    }

    std::vector<std::string> text_words = words(text);
    for (const auto& word : text_words) {
        if (!is_error_name(word)) continue;
        Signal s;
        s.type = SignalType::ErrorToken;
        s.value = word;
        s.source = SignalSource::ErrorOutput;
        s.confidence = 0.8;
        push_unique(out, std::move(s));
    }
    for (const auto& word : text_words) {
        if (!kErrnoNames.count(word)) continue;
        Signal s;
        s.type = SignalType::ErrorToken;
        s.value = word;
        s.source = SignalSource::ErrorOutput;
        s.confidence = 0.8;
        push_unique(out, std::move(s));
    }

    auto add_symbol = [&out](std::string name) {
        size_t dot = name.rfind('.');
        if (dot != std::string::npos) name = name.substr(dot + 1);
        size_t scope = name.rfind("::");
        if (scope != std::string::npos) name = name.substr(scope + 2);
        if (name.size() < 2 || kCallStopwords.count(name)) return;
        Signal s;
        s.type = SignalType::Symbol;
        s.value = name;
        s.confidence = 0.7;
        push_unique(out, std::move(s));
    };
    for (const auto& name : backticked_names(text)) {
        if (looks_like_path(name)) continue;
        add_symbol(name);
    }
    for (const auto& name : call_names(text)) {
        add_symbol(name);
    }
}

std::vector<Signal> SignalExtractor::extract(const std::string& text) {
    std::vector<Signal> out;
    if (util::trim(text).empty()) return out;

    // Frames first so their positioned symbols win deduplication.
    extract_stack_frames(text, out);
    extract_tokens(text, out);
    return out;
}

std::vector<Signal> SignalExtractor::from_working_set(const std::vector<std::string>& paths) {
    std::vector<Signal> out;
    for (const auto& path : paths) {
        if (path.empty()) continue;
        Signal s;
        s.type = SignalType::Path;
        s.value = path;
        s.source = SignalSource::WorkingSet;
        s.confidence = 0.6;
        push_unique(out, std::move(s));
    }
    return out;
}
