#include "codeowners/git.hpp"
#include "codeowners/errors.hpp"
#include "codeowners/process.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace codeowners {

namespace {

// Keeps each `git rm --cached` command line well below ARG_MAX.
constexpr std::size_t kRemoveBatchSize = 512;

} // namespace

std::vector<std::string> split_nul_separated(const std::string& output) {
    std::vector<std::string> paths;
    std::string::size_type start = 0;
    while (start < output.size()) {
        auto end = output.find('\0', start);
        if (end == std::string::npos) end = output.size();
        if (end > start) paths.emplace_back(output, start, end - start);
        start = end + 1;
    }
    return paths;
}

GitWorkTree::GitWorkTree(std::string repo_dir) : repo_dir_(std::move(repo_dir)) {}

std::string GitWorkTree::git(const std::vector<std::string>& args) const {
    auto result = run_process("git", args, repo_dir_);
    if (!result.success()) {
        throw CommandError(format_command_line("git", args), result.exit_code, result.error);
    }
    return result.output;
}

std::string GitWorkTree::ignore_file_path() const {
    return (fs::path(repo_dir_) / ".gitignore").string();
}

std::string GitWorkTree::status_porcelain() const {
    return git({ "status", "--porcelain" });
}

bool GitWorkTree::has_ignore_file() const {
    std::error_code ec;
    return fs::exists(ignore_file_path(), ec);
}

void GitWorkTree::remove_ignore_file() const {
    std::error_code ec;
    fs::remove(ignore_file_path(), ec);
    if (ec) throw std::system_error(ec, "remove " + ignore_file_path());
}

void GitWorkTree::append_ignore_rules(const std::vector<std::string>& patterns) const {
    const auto path = ignore_file_path();
    std::ofstream out(path, std::ios::out | std::ios::app | std::ios::binary);
    if (!out) {
        throw std::system_error(errno, std::generic_category(), "open " + path);
    }

    std::string content = "\n";
    for (const auto& p : patterns)
        content += p + "\n";

    out << content;
    out.flush();
    if (!out) {
        throw std::system_error(errno, std::generic_category(), "write " + path);
    }
}

std::size_t GitWorkTree::remove_ignored_from_index() const {
    auto ignored = split_nul_separated(
        git({ "ls-files", "--cached", "--ignored", "--exclude-standard", "-z" }));

    for (std::size_t i = 0; i < ignored.size(); i += kRemoveBatchSize) {
        // Paths come back verbatim; without literal pathspecs a name such as
        // "foo[1].txt" would also match and untrack "foo1.txt".
        std::vector<std::string> args = { "--literal-pathspecs", "rm", "--cached", "--quiet", "--" };
        auto last = std::min(ignored.size(), i + kRemoveBatchSize);
        args.insert(args.end(), ignored.begin() + i, ignored.begin() + last);
        git(args);
    }
    return ignored.size();
}

std::vector<std::string> GitWorkTree::list_files(const std::vector<std::string>& subdirectories) const {
    std::vector<std::string> args = { "ls-files", "-z" };
    if (!subdirectories.empty()) {
        args.push_back("--");
        args.insert(args.end(), subdirectories.begin(), subdirectories.end());
    }
    return split_nul_separated(git(args));
}

void GitWorkTree::reset_hard() const {
    git({ "reset", "--hard", "--quiet" });
}

void GitWorkTree::trust_directory() const {
    git({ "config", "--global", "--add", "safe.directory", repo_dir_ });
}

namespace {

std::mutex& workspace_mutex(const std::string& repo_dir) {
    static std::mutex registry_mutex;
    static std::map<std::string, std::unique_ptr<std::mutex>> workspaces;

    std::string key = repo_dir;
    std::error_code ec;
    auto absolute = fs::absolute(repo_dir, ec);
    if (!ec) {
        auto canonical = fs::weakly_canonical(absolute, ec);
        key = ec ? absolute.lexically_normal().string() : canonical.string();
    }

    std::lock_guard<std::mutex> guard(registry_mutex);
    auto& slot = workspaces[key];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

} // namespace

std::unique_lock<std::mutex> lock_workspace(const std::string& repo_dir) {
    return std::unique_lock<std::mutex>(workspace_mutex(repo_dir));
}

std::unique_lock<std::mutex> lock_workspace(const std::string& repo_dir, std::try_to_lock_t) {
    return std::unique_lock<std::mutex>(workspace_mutex(repo_dir), std::try_to_lock);
}

} // namespace codeowners
