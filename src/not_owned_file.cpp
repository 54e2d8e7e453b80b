#include "codeowners/not_owned_file.hpp"
#include "codeowners/errors.hpp"
#include "codeowners/exclusion.hpp"

#include <exception>
#include <memory>
#include <sstream>

namespace codeowners {

namespace {

std::string describe(const std::exception_ptr& failure) {
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace

NotOwnedFile::NotOwnedFile(NotOwnedFileConfig cfg)
    : NotOwnedFile(std::move(cfg), [](const std::string& dir) {
          return std::make_unique<GitWorkTree>(dir);
      }) {}

NotOwnedFile::NotOwnedFile(NotOwnedFileConfig cfg, WorkTreeFactory open_work_tree)
    : skip_patterns_(cfg.skip_patterns.begin(), cfg.skip_patterns.end()),
      subdirectories_(std::move(cfg.subdirectories)),
      trust_workspace_(cfg.trust_workspace),
      open_work_tree_(std::move(open_work_tree)) {}

CheckOutput NotOwnedFile::check(const CheckInput& in, const CancellationToken& token) const {
    token.throw_if_cancelled();

    OutputBuilder bldr;
    if (in.entries.empty()) {
        bldr.report_issue("The CODEOWNERS file is empty. The files in the repository don't have any owner.");
        return bldr.output();
    }

    const auto patterns = compute_excluded_patterns(in.entries, skip_patterns_);
    const auto work_tree = open_work_tree_(in.repository_directory);
    const GitWorkTree& repo = *work_tree;

    if (trust_workspace_) {
        token.throw_if_cancelled();
        repo.trust_directory();
    }

    token.throw_if_cancelled();
    if (!repo.status_porcelain().empty()) {
        bldr.report_issue("git state is dirty: commit all changes before executing this check");
        return bldr.output();
    }

    // From here on the tree is mutated and must be restored on every path.
    const bool ignore_file_existed = repo.has_ignore_file();
    CheckOutput output;
    std::exception_ptr failure;
    try {
        output = inspect(repo, patterns, token);
    } catch (...) {
        failure = std::current_exception();
    }

    try {
        restore(repo, ignore_file_existed);
    } catch (const std::exception& e) {
        if (!failure) throw;
        throw MultiError({ describe(failure), e.what() });
    }

    if (failure) std::rethrow_exception(failure);
    return output;
}

CheckOutput NotOwnedFile::inspect(const GitWorkTree& repo, const std::vector<std::string>& patterns,
                                  const CancellationToken& token) const {
    token.throw_if_cancelled();
    repo.append_ignore_rules(patterns);

    token.throw_if_cancelled();
    repo.remove_ignored_from_index();

    token.throw_if_cancelled();
    const auto files = repo.list_files(subdirectories_);

    OutputBuilder bldr;
    if (!files.empty()) {
        std::ostringstream msg;
        msg << "Found " << files.size() << " not owned files (skipped patterns: \""
            << skip_patterns_list() << "\"):\n" << format_list(files);
        bldr.report_issue(msg.str());
    }
    return bldr.output();
}

void NotOwnedFile::restore(const GitWorkTree& repo, bool ignore_file_existed) const {
    repo.reset_hard();
    // A reset leaves untracked files alone, so a .gitignore we created stays behind.
    if (!ignore_file_existed) repo.remove_ignore_file();
}

std::string NotOwnedFile::skip_patterns_list() const {
    std::string list;
    for (const auto& p : skip_patterns_) {
        if (!list.empty()) list += ",";
        list += p;
    }
    return list;
}

std::string NotOwnedFile::format_list(const std::vector<std::string>& paths) {
    std::string out;
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) out += "\n";
        out += "            * " + paths[i];
    }
    return out;
}

Check not_owned_file_check(NotOwnedFileConfig cfg) {
    auto checker = std::make_shared<const NotOwnedFile>(std::move(cfg));
    return {
        "[Experimental] Not Owned File Checker",
        "Reports tracked files that are not covered by any ownership pattern.",
        true,
        [checker](const CheckInput& in, const CancellationToken& token) {
            return checker->check(in, token);
        }
    };
}

} // namespace codeowners
