#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class FileChangeType {
    Added,
    Modified,
    Deleted,
    Renamed
};

struct FileDiff {
    std::string path;
    std::optional<std::string> old_path;
    FileChangeType type = FileChangeType::Modified;
    std::optional<std::string> before_content;
    std::optional<std::string> after_content;
};

struct PatchEntry {
    std::string path;
    FileChangeType type = FileChangeType::Modified;
    std::optional<std::string> old_path;
};

struct Patch {
    std::string snapshot_hash;
    std::vector<PatchEntry> files;
    int64_t timestamp_ms = 0;
};

// Versioned-snapshot diff backend. A failed call returns std::nullopt.
class SnapshotService {
public:
    virtual ~SnapshotService() = default;

    virtual std::optional<std::vector<FileDiff>> diff_full(const std::string& snapshot_hash) = 0;
    virtual std::optional<Patch> patch(const std::string& snapshot_hash) = 0;
};

std::string to_string(FileChangeType type);
