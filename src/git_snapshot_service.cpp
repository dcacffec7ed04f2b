#include "git_snapshot_service.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

std::string to_string(FileChangeType type) {
    switch (type) {
        case FileChangeType::Added: return "added";
        case FileChangeType::Modified: return "modified";
        case FileChangeType::Deleted: return "deleted";
        case FileChangeType::Renamed: return "renamed";
    }
    return "modified";
}

GitSnapshotService::GitSnapshotService(const std::string& work_dir,
                                       std::chrono::milliseconds command_timeout)
    : work_dir_(work_dir), command_timeout_(command_timeout) {}

ProcessResult GitSnapshotService::git(const std::vector<std::string>& args) {
    ProcessSpec spec;
    spec.argv.push_back("git");
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.cwd = work_dir_;
    spec.timeout = command_timeout_;

    auto index = index_file();
    if (!index) {
        ProcessResult res;
        res.err = "not a git work tree: " + work_dir_;
        return res;
    }
    spec.env["GIT_INDEX_FILE"] = *index;
    return run_process(spec);
}

std::optional<std::string> GitSnapshotService::index_file() {
    std::lock_guard<std::mutex> lock(path_mutex_);
    if (index_path_) return index_path_;

    ProcessSpec spec;
    spec.argv = {"git", "rev-parse", "--absolute-git-dir"};
    spec.cwd = work_dir_;
    spec.timeout = command_timeout_;

    ProcessResult res = run_process(spec);
    if (!res.ok()) {
        spdlog::debug("git rev-parse failed in {}: {}", work_dir_, util::trim(res.err));
        return std::nullopt;
    }
    index_path_ = util::trim(res.out) + "/ctxrank-index";
    return index_path_;
}

bool GitSnapshotService::stage_all() {
    ProcessResult res = git({"add", "-A", "."});
    if (!res.ok()) {
        spdlog::warn("git add failed: {}", util::trim(res.err));
        return false;
    }
    return true;
}

std::optional<std::string> GitSnapshotService::track() {
    std::lock_guard<std::mutex> lock(index_mutex_);

    if (!stage_all()) return std::nullopt;

    ProcessResult res = git({"write-tree"});
    if (!res.ok()) {
        spdlog::warn("git write-tree failed: {}", util::trim(res.err));
        return std::nullopt;
    }

    std::string hash = util::trim(res.out);
    spdlog::info("Snapshot created: {}", hash);
    return hash;
}

FileChangeType GitSnapshotService::map_status(char status) {
    switch (status) {
        case 'A': return FileChangeType::Added;
        case 'M': return FileChangeType::Modified;
        case 'D': return FileChangeType::Deleted;
        case 'R': return FileChangeType::Renamed;
        case 'C': return FileChangeType::Added;  // copies count as new files
        default: return FileChangeType::Modified;
    }
}

std::vector<DiffNameEntry> GitSnapshotService::parse_name_status(const std::string& output) {
    std::vector<DiffNameEntry> entries;

    for (const auto& raw : util::split(output, '\n')) {
        std::string line = raw;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto fields = util::split(line, '\t');
        if (fields.size() < 2 || fields[0].empty()) continue;

        DiffNameEntry entry;
        entry.status = fields[0][0];
        // R100 / C075 lines carry "old<TAB>new"
        if ((entry.status == 'R' || entry.status == 'C') && fields.size() >= 3) {
            entry.old_path = fields[1];
            entry.path = fields[2];
        } else {
            entry.path = fields[1];
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::optional<std::vector<DiffNameEntry>> GitSnapshotService::diff_names(const std::string& snapshot_hash) {
    std::lock_guard<std::mutex> lock(index_mutex_);

    if (!stage_all()) return std::nullopt;

    ProcessResult res = git({"diff", "--cached", "--name-status", "-M", snapshot_hash});
    if (!res.ok()) {
        spdlog::warn("git diff against {} failed: {}", snapshot_hash, util::trim(res.err));
        return std::nullopt;
    }
    return parse_name_status(res.out);
}

std::optional<std::string> GitSnapshotService::show_file(const std::string& snapshot_hash,
                                                         const std::string& path) {
    ProcessResult res = git({"show", snapshot_hash + ":" + path});
    if (!res.ok()) {
        spdlog::debug("git show {}:{} failed", snapshot_hash, path);
        return std::nullopt;
    }
    return res.out;
}

std::optional<std::string> GitSnapshotService::read_work_file(const std::string& path) const {
    fs::path full = fs::path(work_dir_) / path;
    std::ifstream in(full, std::ios::binary);
    if (!in) return std::nullopt;

    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::optional<Patch> GitSnapshotService::patch(const std::string& snapshot_hash) {
    auto names = diff_names(snapshot_hash);
    if (!names) return std::nullopt;

    Patch p;
    p.snapshot_hash = snapshot_hash;
    p.timestamp_ms = util::current_timestamp_ms();
    for (const auto& entry : *names) {
        p.files.push_back({entry.path, map_status(entry.status), entry.old_path});
    }

    spdlog::debug("Patch against {}: {} files", snapshot_hash, p.files.size());
    return p;
}

std::optional<std::vector<FileDiff>> GitSnapshotService::diff_full(const std::string& snapshot_hash) {
    auto names = diff_names(snapshot_hash);
    if (!names) return std::nullopt;

    std::vector<FileDiff> diffs;
    diffs.reserve(names->size());

    for (const auto& entry : *names) {
        FileDiff diff;
        diff.path = entry.path;
        diff.old_path = entry.old_path;
        diff.type = map_status(entry.status);

        if (diff.type != FileChangeType::Added) {
            diff.before_content = show_file(snapshot_hash, entry.old_path.value_or(entry.path));
        }
        if (diff.type != FileChangeType::Deleted) {
            diff.after_content = read_work_file(entry.path);
        }
        diffs.push_back(std::move(diff));
    }

    spdlog::debug("Full diff against {}: {} files", snapshot_hash, diffs.size());
    return diffs;
}
