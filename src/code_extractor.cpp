#include "calcrun/code_extractor.h"
#include <algorithm>
#include <cctype>

namespace calcrun {

namespace {

const std::string FENCE = "```";

bool is_tag_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '+' || c == '-';
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

CodeExtractor::CodeExtractor(std::set<std::string> language_aliases) {
    for (const auto& alias : language_aliases) {
        aliases_.insert(to_lower(alias));
    }
}

std::string CodeExtractor::trim(const std::string& text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

std::vector<FencedBlock> CodeExtractor::find_blocks(const std::string& text) {
    std::vector<FencedBlock> blocks;

    size_t pos = 0;
    while (true) {
        size_t open = text.find(FENCE, pos);
        if (open == std::string::npos) break;

        // Opening fence: ``` + optional tag + newline
        size_t tag_start = open + FENCE.size();
        size_t tag_end = tag_start;
        while (tag_end < text.size() && is_tag_char(text[tag_end])) {
            ++tag_end;
        }
        size_t newline = tag_end;
        if (newline < text.size() && text[newline] == '\r') ++newline;
        if (newline >= text.size() || text[newline] != '\n') {
            pos = open + 1;
            continue;
        }

        size_t body_start = newline + 1;
        size_t close = text.find(FENCE, body_start);
        if (close == std::string::npos) break;

        FencedBlock block;
        block.language = text.substr(tag_start, tag_end - tag_start);
        block.code = text.substr(body_start, close - body_start);
        blocks.push_back(block);

        pos = close + FENCE.size();
    }

    return blocks;
}

std::string CodeExtractor::extract(const std::string& content) const {
    std::string raw = trim(content);
    if (raw.empty()) return "";

    auto blocks = find_blocks(raw);
    if (blocks.empty()) return raw;

    for (const auto& block : blocks) {
        if (aliases_.count(to_lower(trim(block.language)))) {
            return trim(block.code);
        }
    }
    return trim(blocks.front().code);
}

} // namespace calcrun
