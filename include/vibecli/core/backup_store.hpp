/*
 * vibecli C++17 - Backup store
 *
 * Copies a file (or directory tree) into the sidecar backup directory
 * before it is overwritten or deleted:
 *
 *   <root>/.vibe/backups/<rel path with '/' -> '_'>_<YYYYmmdd_HHMMSS_mmm>.bak
 *
 * Backups are never rotated or overwritten; a name clash within the same
 * millisecond gets a _<n> suffix before ".bak".
 */
#ifndef vibecli_CORE_BACKUP_STORE_HPP
#define vibecli_CORE_BACKUP_STORE_HPP

#include "workspace.hpp"
#include <string>

namespace vibecli {

struct BackupRecord {
    std::string original_relative_path;
    std::string timestamp;
    std::string backup_path;
};

class BackupStore {
public:
    BackupStore(const Workspace& workspace, const std::string& backup_dir = ".vibe/backups");
    
    // abs_path must exist. On failure error describes why and nothing
    // is left behind.
    bool backup_file(const std::string& abs_path, BackupRecord& record, std::string& error);
    bool backup_directory(const std::string& abs_path, BackupRecord& record, std::string& error);
    
    // Absolute backup directory
    std::string directory() const;
    
    static std::string sanitize(const std::string& relative_path);

private:
    const Workspace& workspace_;
    std::string backup_dir_;
    
    bool prepare(const std::string& abs_path, BackupRecord& record, std::string& error);
};

} // namespace vibecli

#endif // vibecli_CORE_BACKUP_STORE_HPP
