#include "codeowners/codeowners_file.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace codeowners {

std::optional<std::string> find_codeowners_file(const std::string& repo_dir) {
    for (const char* sub : { "", ".github", "docs" }) {
        auto candidate = fs::path(repo_dir) / sub / "CODEOWNERS";
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) return candidate.lexically_normal().string();
    }
    return std::nullopt;
}

std::vector<OwnershipEntry> read_entries(std::istream& in) {
    std::vector<OwnershipEntry> entries;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream fields(line);
        OwnershipEntry entry;
        if (!(fields >> entry.pattern)) continue;

        entry.line_no = line_no;
        std::string owner;
        while (fields >> owner)
            entry.owners.push_back(owner);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<OwnershipEntry> load_entries(const std::string& repo_dir) {
    auto path = find_codeowners_file(repo_dir);
    if (!path) {
        throw std::runtime_error("no CODEOWNERS file found in " + repo_dir +
                                 " (looked in ./, .github/ and docs/)");
    }

    std::ifstream in(*path);
    if (!in) throw std::runtime_error("cannot open " + *path);
    return read_entries(in);
}

} // namespace codeowners
