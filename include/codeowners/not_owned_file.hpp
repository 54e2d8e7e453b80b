#pragma once

#include "codeowners/cancellation.hpp"
#include "codeowners/check.hpp"
#include "codeowners/git.hpp"
#include "codeowners/types.hpp"

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace codeowners {

struct NotOwnedFileConfig {
    // Adds the repository to git's global safe.directory list first. Needed when
    // the checkout is owned by a different user than the process.
    bool                     trust_workspace = false;
    std::vector<std::string> skip_patterns;
    std::vector<std::string> subdirectories;   // empty: whole tree
};

/**
 * NotOwnedFile
 *
 * Reports tracked files that no ownership pattern covers. The check appends
 * every non-skipped pattern to .gitignore, untracks whatever those rules now
 * ignore and lists what is still tracked. The working tree is reset to HEAD
 * before returning on every path once the clean-tree precondition held, and
 * a .gitignore that did not exist beforehand is removed again.
 *
 * The caller must hold lock_workspace() for the repository; CheckRunner does
 * so for every check marked as mutating.
 */
class NotOwnedFile {
public:
    using WorkTreeFactory = std::function<std::unique_ptr<GitWorkTree>(const std::string&)>;

    explicit NotOwnedFile(NotOwnedFileConfig cfg);
    NotOwnedFile(NotOwnedFileConfig cfg, WorkTreeFactory open_work_tree);

    CheckOutput check(const CheckInput& in, const CancellationToken& token) const;

    /// Skip patterns, sorted and comma-joined.
    std::string skip_patterns_list() const;

    static std::string format_list(const std::vector<std::string>& paths);

private:
    CheckOutput inspect(const GitWorkTree& repo, const std::vector<std::string>& patterns,
                        const CancellationToken& token) const;

    void restore(const GitWorkTree& repo, bool ignore_file_existed) const;

    std::set<std::string>    skip_patterns_;
    std::vector<std::string> subdirectories_;
    bool                     trust_workspace_;
    WorkTreeFactory          open_work_tree_;
};

/// "[Experimental] Not Owned File Checker", mutates the working tree.
Check not_owned_file_check(NotOwnedFileConfig cfg);

} // namespace codeowners
