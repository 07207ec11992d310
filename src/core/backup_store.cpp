#include <vibecli/core/backup_store.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>
#include <cstdio>

namespace vibecli {

BackupStore::BackupStore(const Workspace& workspace, const std::string& backup_dir)
    : workspace_(workspace)
    , backup_dir_(backup_dir)
{}

std::string BackupStore::directory() const {
    if (!backup_dir_.empty() && backup_dir_[0] == '/') {
        return backup_dir_;
    }
    return join_path(workspace_.root(), backup_dir_);
}

std::string BackupStore::sanitize(const std::string& relative_path) {
    std::string safe = relative_path;
    for (size_t i = 0; i < safe.size(); ++i) {
        if (safe[i] == '/' || safe[i] == '\\') {
            safe[i] = '_';
        }
    }
    return safe;
}

bool BackupStore::prepare(const std::string& abs_path, BackupRecord& record, std::string& error) {
    if (!path_exists(abs_path)) {
        error = "nothing to back up at " + abs_path;
        return false;
    }
    
    std::string dir = directory();
    if (!Workspace::ensure_directory(dir)) {
        error = "cannot create backup directory " + dir;
        return false;
    }
    
    int64_t now = current_timestamp_ms();
    char millis[8];
    snprintf(millis, sizeof(millis), "_%03d", static_cast<int>(now % 1000));
    
    record.original_relative_path = workspace_.relative_to_root(abs_path);
    record.timestamp = format_local_time(now, "%Y%m%d_%H%M%S") + millis;
    
    std::string stem = join_path(dir, sanitize(record.original_relative_path) + "_" + record.timestamp);
    record.backup_path = stem + ".bak";
    for (int n = 1; path_exists(record.backup_path); ++n) {
        record.backup_path = stem + "_" + std::to_string(n) + ".bak";
    }
    return true;
}

bool BackupStore::backup_file(const std::string& abs_path, BackupRecord& record, std::string& error) {
    if (!prepare(abs_path, record, error)) {
        return false;
    }
    
    if (!Workspace::copy_file(abs_path, record.backup_path)) {
        error = "failed to copy " + record.original_relative_path + " to " + record.backup_path;
        std::remove(record.backup_path.c_str());
        return false;
    }
    
    LOG_DEBUG("Backed up %s -> %s", record.original_relative_path.c_str(), record.backup_path.c_str());
    return true;
}

bool BackupStore::backup_directory(const std::string& abs_path, BackupRecord& record, std::string& error) {
    if (!prepare(abs_path, record, error)) {
        return false;
    }
    
    if (!Workspace::copy_tree(abs_path, record.backup_path)) {
        error = "failed to copy directory " + record.original_relative_path;
        std::string cleanup_error;
        if (path_exists(record.backup_path) &&
            !Workspace::remove_tree(record.backup_path, cleanup_error)) {
            LOG_WARN("Partial backup left at %s: %s", record.backup_path.c_str(), cleanup_error.c_str());
        }
        return false;
    }
    
    LOG_DEBUG("Backed up directory %s -> %s",
              record.original_relative_path.c_str(), record.backup_path.c_str());
    return true;
}

} // namespace vibecli
