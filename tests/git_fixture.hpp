#pragma once

#include "codeowners/process.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// A throwaway directory under the system temp dir, removed on destruction.
// With `init` it is a git repository with a local identity configured.
class TempRepo {
public:
    explicit TempRepo(bool init = true) {
        std::string tmpl = (fs::temp_directory_path() / "codeowners-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) throw std::runtime_error("mkdtemp failed");
        dir_ = buf.data();

        if (init) {
            git({ "init", "--quiet" });
            git({ "config", "user.email", "tests@example.com" });
            git({ "config", "user.name", "Tests" });
            git({ "config", "commit.gpgsign", "false" });
        }
    }

    ~TempRepo() {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    TempRepo(const TempRepo&) = delete;
    TempRepo& operator=(const TempRepo&) = delete;

    const std::string& dir() const { return dir_; }

    std::string git(const std::vector<std::string>& args) const {
        auto result = codeowners::run_process("git", args, dir_);
        if (!result.success())
            throw std::runtime_error("git " + args.front() + " failed: " + result.error);
        return result.output;
    }

    void write(const std::string& rel, const std::string& content) const {
        auto path = fs::path(dir_) / rel;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read(const std::string& rel) const {
        std::ifstream in(fs::path(dir_) / rel, std::ios::binary);
        std::ostringstream os;
        os << in.rdbuf();
        return os.str();
    }

    bool exists(const std::string& rel) const {
        return fs::exists(fs::path(dir_) / rel);
    }

    void commit_all(const std::string& message = "snapshot") const {
        git({ "add", "--all" });
        git({ "commit", "--quiet", "-m", message });
    }

    // Staged entries (mode, blob, stage, path) - the index content without stat data.
    std::string index_snapshot() const { return git({ "ls-files", "--stage" }); }

    std::string status() const { return git({ "status", "--porcelain" }); }

private:
    std::string dir_;
};
