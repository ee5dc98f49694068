#include "storage/blob_store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "run/run_request.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::storage {
namespace {

long long ToEpochMs(std::filesystem::file_time_type time) {
    const auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    return utils::ToEpochMs(system_time);
}

}  // namespace

std::string SanitizeUploadName(const std::string& original_name) {
    std::string safe = original_name;
    std::replace_if(safe.begin(), safe.end(), [](unsigned char c) {
        return !(std::isalnum(c) || c == '_' || c == '.' || c == '-');
    }, '_');
    return safe;
}

DirectoryBlobStore::DirectoryBlobStore(std::filesystem::path root)
    : root_(std::filesystem::absolute(std::move(root))) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        utils::LogError("storage", "failed to create " + root_.string() + ": " + ec.message());
    }
}

std::vector<FileEntry> DirectoryBlobStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FileEntry> entries;
    std::error_code ec;
    for (const auto& item : std::filesystem::directory_iterator(root_, ec)) {
        std::error_code entry_ec;
        if (!item.is_regular_file(entry_ec)) {
            continue;
        }
        FileEntry entry{};
        entry.name = item.path().filename().string();
        entry.size = item.file_size(entry_ec);
        entry.mtime_ms = ToEpochMs(item.last_write_time(entry_ec));
        entries.push_back(std::move(entry));
    }
    if (ec) {
        utils::LogWarn("storage", "failed to list " + root_.string() + ": " + ec.message());
    }
    std::sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.mtime_ms > b.mtime_ms;
    });
    return entries;
}

std::optional<std::filesystem::path> DirectoryBlobStore::Resolve(const std::string& name) const {
    if (!run::IsValidFileName(name)) {
        return std::nullopt;
    }
    const auto path = root_ / name;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    return path;
}

std::optional<std::string> DirectoryBlobStore::Save(const std::string& original_name, const std::string& content) {
    auto safe = SanitizeUploadName(original_name);
    // Names must stay runnable: no "..", and short enough after the prefix.
    for (auto pos = safe.find(".."); pos != std::string::npos; pos = safe.find("..")) {
        safe[pos] = '_';
    }
    constexpr std::size_t kMaxSafeLength = 200;
    if (safe.size() > kMaxSafeLength) {
        safe = safe.substr(safe.size() - kMaxSafeLength);
    }
    if (safe.empty()) {
        safe = "upload";
    }
    const auto name = std::to_string(utils::NowMs()) + "_" +
                      boost::uuids::to_string(boost::uuids::random_generator()()) + "_" + safe;
    if (!run::IsValidFileName(name)) {
        utils::LogWarn("storage", "rejected upload name " + safe);
        return std::nullopt;
    }
    const auto path = root_ / name;

    std::lock_guard<std::mutex> lock(mutex_);
    {
        std::ofstream output(path, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            utils::LogError("storage", "failed to open " + path.string());
            return std::nullopt;
        }
        output.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!output) {
            utils::LogError("storage", "failed to write " + path.string());
            std::error_code ec;
            std::filesystem::remove(path, ec);
            return std::nullopt;
        }
    }
    std::error_code ec;
    std::filesystem::permissions(path, std::filesystem::perms(0755), std::filesystem::perm_options::replace, ec);
    if (ec) {
        utils::LogWarn("storage", "chmod failed for " + name + ": " + ec.message());
    }
    return name;
}

RemoveResult DirectoryBlobStore::Remove(const std::string& name) {
    if (!Resolve(name)) {
        return RemoveResult{RemoveStatus::kNotFound, {}};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::remove(root_ / name, ec)) {
        if (ec) {
            return RemoveResult{RemoveStatus::kFailed, ec.message()};
        }
        return RemoveResult{RemoveStatus::kNotFound, {}};
    }
    return RemoveResult{RemoveStatus::kRemoved, {}};
}

}  // namespace scriptbox::storage
