#include "ripgrep_backend.hpp"
#include "process.hpp"
#include "util.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

// rg exit codes: 0 = matches, 1 = no match, 2 = error
constexpr int kRgNoMatch = 1;
constexpr int kRgError = 2;

std::string strip_newline(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

} // namespace

RipgrepBackend::RipgrepBackend(std::string rg_path, std::chrono::milliseconds timeout)
    : rg_path_(std::move(rg_path)), timeout_(timeout) {}

bool RipgrepBackend::is_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_) return *available_;

    ProcessSpec spec;
    spec.argv = {rg_path_, "--version"};
    spec.timeout = std::chrono::milliseconds(3000);
    ProcessResult res = run_process(spec);

    available_ = res.ok();
    if (!*available_) {
        spdlog::warn("ripgrep not available at '{}'", rg_path_);
    }
    return *available_;
}

std::vector<SearchMatch> RipgrepBackend::parse_json_output(const std::string& output, int context_lines) {
    struct FileLines {
        std::vector<int> match_lines;
        std::map<int, std::string> text;
    };
    std::map<std::string, FileLines> files;
    std::vector<std::string> file_order;

    for (const auto& line : util::split(output, '\n')) {
        if (line.empty()) continue;

        nlohmann::json event;
        try {
            event = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::debug("Skipping unparsable rg line: {}", e.what());
            continue;
        }

        std::string type = event.value("type", "");
        if (type != "match" && type != "context") continue;

        const auto& data = event["data"];
        if (!data.contains("path") || !data["path"].contains("text")) continue;
        if (!data.contains("line_number") || !data["line_number"].is_number_integer()) continue;

        std::string file = data["path"]["text"].get<std::string>();
        int line_number = data["line_number"].get<int>();
        std::string text;
        if (data.contains("lines") && data["lines"].contains("text")) {
            text = strip_newline(data["lines"]["text"].get<std::string>());
        }

        auto it = files.find(file);
        if (it == files.end()) {
            file_order.push_back(file);
            it = files.emplace(file, FileLines{}).first;
        }
        it->second.text[line_number] = text;
        if (type == "match") {
            it->second.match_lines.push_back(line_number);
        }
    }

    std::vector<SearchMatch> matches;
    for (const auto& file : file_order) {
        const FileLines& fl = files[file];
        for (int ln : fl.match_lines) {
            SearchMatch m;
            m.file = file;
            m.line = ln;
            m.content = fl.text.at(ln);
            for (int b = ln - context_lines; b < ln; b++) {
                auto t = fl.text.find(b);
                if (t != fl.text.end()) m.before.push_back(t->second);
            }
            for (int a = ln + 1; a <= ln + context_lines; a++) {
                auto t = fl.text.find(a);
                if (t != fl.text.end()) m.after.push_back(t->second);
            }
            matches.push_back(std::move(m));
        }
    }
    return matches;
}

std::optional<std::vector<SearchMatch>> RipgrepBackend::search(const SearchRequest& request) {
    if (request.pattern.empty()) {
        spdlog::debug("ripgrep: empty pattern");
        return std::nullopt;
    }

    ProcessSpec spec;
    spec.timeout = timeout_;
    spec.argv.push_back(rg_path_);
    spec.argv.push_back("--json");
    spec.argv.push_back(request.case_sensitive ? "--case-sensitive" : "--ignore-case");
    if (request.context_lines > 0) {
        spec.argv.push_back("-C");
        spec.argv.push_back(std::to_string(request.context_lines));
    }
    for (const auto& g : request.globs) {
        spec.argv.push_back("-g");
        spec.argv.push_back(g);
    }
    for (const auto& x : request.excludes) {
        spec.argv.push_back("-g");
        spec.argv.push_back("!" + x);
    }
    spec.argv.push_back("-e");
    spec.argv.push_back(request.pattern);
    for (const auto& p : request.paths) {
        spec.argv.push_back(p);
    }

    ProcessResult res = run_process(spec);
    if (!res.started || res.timed_out) {
        spdlog::warn("ripgrep did not complete (timed_out={})", res.timed_out);
        return std::nullopt;
    }
    if (res.exit_code == kRgNoMatch) {
        return std::vector<SearchMatch>{};
    }

    std::vector<SearchMatch> matches = parse_json_output(res.out, request.context_lines);
    if (res.exit_code == kRgError && matches.empty()) {
        spdlog::warn("ripgrep failed: {}", util::trim(res.err));
        return std::nullopt;
    }

    if (request.max_results > 0 && matches.size() > request.max_results) {
        matches.resize(request.max_results);
    }
    return matches;
}
