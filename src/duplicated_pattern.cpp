#include "codeowners/duplicated_pattern.hpp"

#include <map>
#include <sstream>
#include <vector>

namespace codeowners {

namespace {

std::string join_owners(const std::vector<std::string>& owners) {
    std::string out;
    for (const auto& o : owners) {
        if (!out.empty()) out += " ";
        out += o;
    }
    return out;
}

} // namespace

Check duplicated_pattern_check() {
    return {
        "Duplicated Pattern Checker",
        "Reports ownership patterns that are declared more than once.",
        false,
        [](const CheckInput& in, const CancellationToken& token) {
            token.throw_if_cancelled();

            std::vector<std::string> order;
            std::map<std::string, std::vector<const OwnershipEntry*>> by_pattern;
            for (const auto& entry : in.entries) {
                auto& seen = by_pattern[entry.pattern];
                if (seen.empty()) order.push_back(entry.pattern);
                seen.push_back(&entry);
            }

            OutputBuilder bldr;
            for (const auto& pattern : order) {
                const auto& decls = by_pattern[pattern];
                if (decls.size() < 2) continue;

                std::ostringstream msg;
                msg << "Pattern \"" << pattern << "\" is defined " << decls.size()
                    << " times in lines:";
                for (const auto* e : decls)
                    msg << "\n            * " << e->line_no << ": " << e->pattern
                        << " " << join_owners(e->owners);
                bldr.report_issue(msg.str());
            }
            return bldr.output();
        }
    };
}

} // namespace codeowners
