#pragma once

#include "process.hpp"
#include "snapshot_service.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct DiffNameEntry {
    char status = 'M';
    std::string path;
    std::optional<std::string> old_path;
};

// Snapshot service over a git work tree. Snapshots are tree objects written
// from a private index so the user's own index is never touched.
class GitSnapshotService : public SnapshotService {
public:
    explicit GitSnapshotService(const std::string& work_dir,
                                std::chrono::milliseconds command_timeout = std::chrono::milliseconds(10000));

    // Stages the work tree into the private index and returns the tree hash.
    std::optional<std::string> track();

    std::optional<std::vector<FileDiff>> diff_full(const std::string& snapshot_hash) override;
    std::optional<Patch> patch(const std::string& snapshot_hash) override;

    static FileChangeType map_status(char status);
    static std::vector<DiffNameEntry> parse_name_status(const std::string& output);

private:
    std::string work_dir_;
    std::chrono::milliseconds command_timeout_;
    std::mutex index_mutex_;
    std::mutex path_mutex_;
    std::optional<std::string> index_path_;

    ProcessResult git(const std::vector<std::string>& args);
    std::optional<std::string> index_file();
    bool stage_all();
    std::optional<std::vector<DiffNameEntry>> diff_names(const std::string& snapshot_hash);
    std::optional<std::string> show_file(const std::string& snapshot_hash, const std::string& path);
    std::optional<std::string> read_work_file(const std::string& path) const;
};
