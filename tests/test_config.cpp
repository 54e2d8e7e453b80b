#include "codeowners/codeowners_file.hpp"
#include "codeowners/config.hpp"

#include "git_fixture.hpp"

#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace codeowners;

static int passed = 0;
static int failed = 0;

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

static EnvLookup env(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

static bool rejects(const std::map<std::string, std::string>& vars) {
    try {
        load_config(env(vars));
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

// ── Suites ────────────────────────────────────────────────────────────────────

void test_defaults() {
    std::cout << "\n[Defaults]\n";
    auto cfg = load_config(env({ { "REPOSITORY_PATH", "/src/repo" } }));
    ASSERT_EQ("repository path", std::string("/src/repo"), cfg.repository_path);
    ASSERT_EQ("failure level defaults to warning", SeverityLevel::Warning, cfg.check_failure_level);
    ASSERT_EQ("stable checks default on", static_cast<std::size_t>(1), cfg.selection.checks.size());
    ASSERT_TRUE("no experimental checks", cfg.selection.experimental_checks.empty());
    ASSERT_TRUE("workspace not trusted", !cfg.selection.not_owned.trust_workspace);
    ASSERT_TRUE("text output", cfg.output_format == OutputFormat::Text);
}

void test_full_configuration() {
    std::cout << "\n[FullConfiguration]\n";
    auto cfg = load_config(env({
        { "REPOSITORY_PATH", " ./repo " },
        { "CHECK_FAILURE_LEVEL", "Error" },
        { "CHECKS", "" },
        { "EXPERIMENTAL_CHECKS", "notowned" },
        { "NOT_OWNED_CHECKER_SKIP_PATTERNS", "*, /vendor/ ,," },
        { "NOT_OWNED_CHECKER_SUBDIRECTORIES", "src,docs" },
        { "NOT_OWNED_CHECKER_TRUST_WORKSPACE", "true" },
        { "OUTPUT_FORMAT", "json" },
    }));
    ASSERT_EQ("path trimmed", std::string("./repo"), cfg.repository_path);
    ASSERT_EQ("level parsed case-insensitively", SeverityLevel::Error, cfg.check_failure_level);
    ASSERT_TRUE("explicitly empty stable list", cfg.selection.checks.empty());
    ASSERT_EQ("experimental list", std::string("notowned"), cfg.selection.experimental_checks.at(0));
    ASSERT_EQ("blank items dropped", static_cast<std::size_t>(2), cfg.selection.not_owned.skip_patterns.size());
    ASSERT_EQ("items trimmed", std::string("/vendor/"), cfg.selection.not_owned.skip_patterns.at(1));
    ASSERT_EQ("subdirectories", std::string("docs"), cfg.selection.not_owned.subdirectories.at(1));
    ASSERT_TRUE("trust flag", cfg.selection.not_owned.trust_workspace);
    ASSERT_TRUE("json output", cfg.output_format == OutputFormat::Json);
}

void test_invalid_values() {
    std::cout << "\n[InvalidValues]\n";
    ASSERT_TRUE("missing repository path", rejects({}));
    ASSERT_TRUE("blank repository path", rejects({ { "REPOSITORY_PATH", "  " } }));
    ASSERT_TRUE("bad failure level",
                rejects({ { "REPOSITORY_PATH", "." }, { "CHECK_FAILURE_LEVEL", "fatal" } }));
    ASSERT_TRUE("bad boolean",
                rejects({ { "REPOSITORY_PATH", "." }, { "NOT_OWNED_CHECKER_TRUST_WORKSPACE", "maybe" } }));
    ASSERT_TRUE("bad output format",
                rejects({ { "REPOSITORY_PATH", "." }, { "OUTPUT_FORMAT", "xml" } }));

    std::string message;
    try {
        load_config(env({ { "REPOSITORY_PATH", "." }, { "CHECK_FAILURE_LEVEL", "fatal" } }));
    } catch (const std::invalid_argument& e) {
        message = e.what();
    }
    ASSERT_TRUE("message names the variable",
                message.find("CODEOWNERS_CHECK_FAILURE_LEVEL") != std::string::npos);
}

void test_severity() {
    std::cout << "\n[Severity]\n";
    ASSERT_TRUE("info < warning", SeverityLevel::Info < SeverityLevel::Warning);
    ASSERT_TRUE("warning < error", SeverityLevel::Warning < SeverityLevel::Error);
    ASSERT_TRUE("warn alias", parse_severity("WARN") == SeverityLevel::Warning);
    ASSERT_TRUE("err alias", parse_severity("err") == SeverityLevel::Error);
    ASSERT_TRUE("unknown -> nullopt", !parse_severity("critical").has_value());
    ASSERT_EQ("to_string", std::string("info"), to_string(SeverityLevel::Info));
}

void test_read_entries() {
    std::cout << "\n[ReadEntries]\n";
    std::istringstream in(
        "# global owners\n"
        "*       @org/everyone\n"
        "\n"
        "/docs/  @org/writers  alice@example.com  # inline comment\n"
        "   \n"
        "/build/\n");

    auto entries = read_entries(in);
    ASSERT_EQ("three entries", static_cast<std::size_t>(3), entries.size());
    ASSERT_EQ("first pattern", std::string("*"), entries[0].pattern);
    ASSERT_EQ("first line number", static_cast<std::size_t>(2), entries[0].line_no);
    ASSERT_EQ("owners split on whitespace", static_cast<std::size_t>(2), entries[1].owners.size());
    ASSERT_EQ("email owner kept", std::string("alice@example.com"), entries[1].owners[1]);
    ASSERT_EQ("line numbers count blank lines", static_cast<std::size_t>(6), entries[2].line_no);
    ASSERT_TRUE("pattern without owners", entries[2].owners.empty());
}

void test_find_codeowners_file() {
    std::cout << "\n[FindCodeownersFile]\n";
    TempRepo dir(false);
    ASSERT_TRUE("nothing found", !find_codeowners_file(dir.dir()).has_value());

    bool threw = false;
    try {
        load_entries(dir.dir());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE("load without a file throws", threw);

    dir.write("docs/CODEOWNERS", "* @docs\n");
    dir.write(".github/CODEOWNERS", "* @github\n");
    auto found = find_codeowners_file(dir.dir());
    ASSERT_TRUE(".github preferred over docs",
                found && found->find(".github/CODEOWNERS") != std::string::npos);

    dir.write("CODEOWNERS", "* @root\n/src/ @dev\n");
    auto entries = load_entries(dir.dir());
    ASSERT_EQ("root preferred", static_cast<std::size_t>(2), entries.size());
    ASSERT_EQ("root owners", std::string("@root"), entries[0].owners.at(0));
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Configuration Tests ===\n";

    test_defaults();
    test_full_configuration();
    test_invalid_values();
    test_severity();
    test_read_entries();
    test_find_codeowners_file();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
