#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace codeowners {

/**
 * GitWorkTree
 *
 * The version-control operations the not-owned-file check performs against a
 * working directory. Every method runs `git` synchronously inside the
 * repository and throws CommandError when it exits non-zero.
 *
 * The mutating steps are virtual so a caller can wrap them.
 */
class GitWorkTree {
public:
    explicit GitWorkTree(std::string repo_dir);
    virtual ~GitWorkTree() = default;

    const std::string& directory() const { return repo_dir_; }

    /// `git status --porcelain`; empty output means a clean tree.
    virtual std::string status_porcelain() const;

    /// Appends one pattern per line to the root ignore-rules file, starting on a
    /// fresh line. Creates the file when missing.
    /// Throws std::system_error on I/O failure.
    virtual void append_ignore_rules(const std::vector<std::string>& patterns) const;

    bool has_ignore_file() const;

    /// Deletes the root ignore-rules file; a missing file is not an error.
    void remove_ignore_file() const;

    /// Untracks (index only) every tracked path matched by the active ignore rules.
    /// Returns the number of paths removed from the index.
    virtual std::size_t remove_ignored_from_index() const;

    /// Tracked paths, optionally limited to the given subdirectories.
    virtual std::vector<std::string> list_files(const std::vector<std::string>& subdirectories) const;

    /// `git reset --hard`: restores index and tracked files to HEAD.
    virtual void reset_hard() const;

    /// Registers the directory in the global `safe.directory` list.
    virtual void trust_directory() const;

    std::string ignore_file_path() const;

private:
    std::string git(const std::vector<std::string>& args) const;

    std::string repo_dir_;
};

/// Splits NUL-terminated `git -z` output into paths.
std::vector<std::string> split_nul_separated(const std::string& output);

/// Exclusive access to a working directory, held for a mutating check's full
/// lifetime. Directories are keyed by their normalised absolute path.
std::unique_lock<std::mutex> lock_workspace(const std::string& repo_dir);

/// Non-blocking variant; the returned lock owns nothing when the directory is busy.
std::unique_lock<std::mutex> lock_workspace(const std::string& repo_dir, std::try_to_lock_t);

} // namespace codeowners
