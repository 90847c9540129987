#pragma once

#include <set>
#include <string>
#include <vector>

namespace calcrun {

// A fenced block found in a content blob
struct FencedBlock {
    std::string language;   // Tag as written after the opening fence (may be empty)
    std::string code;       // Body between the fences, untrimmed
};

// Pulls the runnable snippet out of a content blob
class CodeExtractor {
public:
    // Tags accepted for the execution language, compared lowercase
    explicit CodeExtractor(std::set<std::string> language_aliases = {"py", "python", "python3"});

    // Best-guess snippet: the first block tagged with a known alias, else the
    // first block, else the whole blob. Always trimmed; never fails.
    std::string extract(const std::string& content) const;

    // All complete ```lang\n...``` blocks in order of appearance
    static std::vector<FencedBlock> find_blocks(const std::string& text);

    static std::string trim(const std::string& text);

private:
    std::set<std::string> aliases_;
};

} // namespace calcrun
