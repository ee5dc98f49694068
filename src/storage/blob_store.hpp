#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scriptbox::storage {

struct FileEntry {
    std::string name;
    std::uintmax_t size = 0;
    long long mtime_ms = 0;
};

enum class RemoveStatus {
    kRemoved,
    kNotFound,
    kFailed
};

struct RemoveResult {
    RemoveStatus status = RemoveStatus::kRemoved;
    std::string error;
};

class BlobStore {
public:
    virtual ~BlobStore() = default;

    // Newest first.
    virtual std::vector<FileEntry> List() const = 0;
    // Path of a stored file, or nullopt when no such file exists.
    virtual std::optional<std::filesystem::path> Resolve(const std::string& name) const = 0;
    // Stored name of the new file, or nullopt when it could not be written.
    virtual std::optional<std::string> Save(const std::string& original_name, const std::string& content) = 0;
    virtual RemoveResult Remove(const std::string& name) = 0;
};

// Replaces every byte outside [A-Za-z0-9_.-] with '_'.
std::string SanitizeUploadName(const std::string& original_name);

// Flat directory of uploads. Saved files are named <ms>_<uuid>_<safe name>
// and made executable.
class DirectoryBlobStore : public BlobStore {
public:
    explicit DirectoryBlobStore(std::filesystem::path root);

    std::vector<FileEntry> List() const override;
    std::optional<std::filesystem::path> Resolve(const std::string& name) const override;
    std::optional<std::string> Save(const std::string& original_name, const std::string& content) override;
    RemoveResult Remove(const std::string& name) override;

private:
    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

}  // namespace scriptbox::storage
