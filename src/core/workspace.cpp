#include <vibecli/core/workspace.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace vibecli {

std::string canonicalize(const std::string& abs_path) {
    std::string head = normalize_path(abs_path);
    std::string tail;
    
    while (true) {
        char resolved[PATH_MAX];
        if (realpath(head.c_str(), resolved)) {
            std::string result(resolved);
            if (tail.empty()) {
                return result;
            }
            return normalize_path(join_path(result, tail));
        }
        
        size_t pos = head.rfind('/');
        if (pos == std::string::npos || head == "/") {
            return normalize_path(abs_path);
        }
        std::string leaf = head.substr(pos + 1);
        tail = tail.empty() ? leaf : leaf + "/" + tail;
        head = pos == 0 ? "/" : head.substr(0, pos);
    }
}

Workspace::Workspace() {}

bool Workspace::open(const std::string& root) {
    std::string abs = root;
    if (abs.empty()) {
        abs = ".";
    }
    if (abs[0] != '/') {
        char cwd[PATH_MAX];
        if (!getcwd(cwd, sizeof(cwd))) {
            LOG_ERROR("getcwd failed: %s", strerror(errno));
            return false;
        }
        abs = join_path(cwd, abs);
    }
    
    if (!ensure_directory(normalize_path(abs))) {
        LOG_ERROR("Cannot create project root %s: %s", abs.c_str(), strerror(errno));
        return false;
    }
    
    char resolved[PATH_MAX];
    if (!realpath(abs.c_str(), resolved)) {
        LOG_ERROR("Cannot resolve project root %s: %s", abs.c_str(), strerror(errno));
        return false;
    }
    root_ = resolved;
    return is_directory(root_);
}

std::string Workspace::resolve(const std::string& cwd, const std::string& path) const {
    std::string p = path;
    std::replace(p.begin(), p.end(), '\\', '/');
    p = trim(p);
    
    // Strip surrounding quotes the backend sometimes adds
    if (p.size() >= 2 && (p[0] == '"' || p[0] == '\'') && p[p.size() - 1] == p[0]) {
        p = p.substr(1, p.size() - 2);
    }
    
    std::string base = cwd.empty() ? root_ : cwd;
    std::string joined = (!p.empty() && p[0] == '/') ? p : join_path(base, p);
    return canonicalize(joined);
}

bool Workspace::contains(const std::string& abs_path) const {
    if (root_.empty()) return false;
    if (root_ == "/") return !abs_path.empty() && abs_path[0] == '/';
    
    if (abs_path.size() >= root_.size() &&
        abs_path.compare(0, root_.size(), root_) == 0) {
        return (abs_path.size() == root_.size() || abs_path[root_.size()] == '/');
    }
    return false;
}

std::string Workspace::relative_to_root(const std::string& abs_path) const {
    if (abs_path == root_) {
        return ".";
    }
    if (contains(abs_path)) {
        return abs_path.substr(root_ == "/" ? 1 : root_.size() + 1);
    }
    return abs_path;
}

// ============================================================================
// Filesystem helpers
// ============================================================================

bool Workspace::ensure_directory(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    // Create recursively
    size_t pos = path.rfind('/');
    if (pos != std::string::npos && pos > 0) {
        std::string parent = path.substr(0, pos);
        if (!ensure_directory(parent)) {
            return false;
        }
    }
    return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
}

bool Workspace::remove_tree(const std::string& path, std::string& error) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        error = path + ": " + strerror(errno);
        return false;
    }
    
    if (S_ISDIR(st.st_mode)) {
        DIR* d = opendir(path.c_str());
        if (!d) {
            error = path + ": " + strerror(errno);
            return false;
        }
        bool ok = true;
        struct dirent* ent;
        while ((ent = readdir(d)) != nullptr) {
            if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) {
                continue;
            }
            if (!remove_tree(join_path(path, ent->d_name), error)) {
                ok = false;
                break;
            }
        }
        closedir(d);
        if (!ok) {
            return false;
        }
        if (rmdir(path.c_str()) != 0) {
            error = path + ": " + strerror(errno);
            return false;
        }
        return true;
    }
    
    if (unlink(path.c_str()) != 0) {
        error = path + ": " + strerror(errno);
        return false;
    }
    return true;
}

size_t Workspace::count_files(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return 0;
    }
    if (!S_ISDIR(st.st_mode)) {
        return 1;
    }
    
    size_t count = 0;
    DIR* d = opendir(path.c_str());
    if (!d) {
        return 0;
    }
    struct dirent* ent;
    while ((ent = readdir(d)) != nullptr) {
        if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) {
            continue;
        }
        count += count_files(join_path(path, ent->d_name));
    }
    closedir(d);
    return count;
}

bool Workspace::copy_file(const std::string& src, const std::string& dst) {
    int in = ::open(src.c_str(), O_RDONLY | O_CLOEXEC);
    if (in < 0) {
        return false;
    }
    struct stat st;
    if (fstat(in, &st) != 0) {
        close(in);
        return false;
    }
    int out = ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, st.st_mode & 07777);
    if (out < 0) {
        close(in);
        return false;
    }
    
    // An empty source is a complete copy once dst exists
    bool ok = true;
    char buf[16384];
    for (;;) {
        ssize_t n = read(in, buf, sizeof(buf));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            ok = false;
            break;
        }
        size_t done = 0;
        while (ok && done < static_cast<size_t>(n)) {
            ssize_t w = write(out, buf + done, static_cast<size_t>(n) - done);
            if (w < 0) {
                if (errno != EINTR) ok = false;
                continue;
            }
            done += static_cast<size_t>(w);
        }
        if (!ok) break;
    }
    close(in);
    if (close(out) != 0) {
        ok = false;
    }
    if (ok && chmod(dst.c_str(), st.st_mode & 07777) != 0) {
        LOG_DEBUG("Cannot copy mode bits to %s: %s", dst.c_str(), strerror(errno));
    }
    return ok;
}

bool Workspace::copy_tree(const std::string& src, const std::string& dst) {
    struct stat st;
    if (lstat(src.c_str(), &st) != 0) {
        return false;
    }
    
    if (S_ISLNK(st.st_mode)) {
        char target[PATH_MAX];
        ssize_t n = readlink(src.c_str(), target, sizeof(target) - 1);
        if (n < 0) {
            return false;
        }
        target[n] = '\0';
        return symlink(target, dst.c_str()) == 0;
    }
    
    if (!S_ISDIR(st.st_mode)) {
        return copy_file(src, dst);
    }
    
    if (mkdir(dst.c_str(), 0755) != 0 && errno != EEXIST) {
        return false;
    }
    
    DIR* d = opendir(src.c_str());
    if (!d) {
        return false;
    }
    bool ok = true;
    struct dirent* ent;
    while ((ent = readdir(d)) != nullptr) {
        if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) {
            continue;
        }
        if (!copy_tree(join_path(src, ent->d_name), join_path(dst, ent->d_name))) {
            ok = false;
            break;
        }
    }
    closedir(d);
    return ok;
}

} // namespace vibecli
