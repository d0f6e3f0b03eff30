#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "shroud/blocklist/blocklist.h"
#include "shroud/loader/source.h"

namespace shroud::dns {

struct ParsedRule {
    /** Normalized domain */
    std::string domain;
    MatchType match_type = MatchType::EXACT;
    Action action = Action::BLOCK;
};

struct ParseResult {
    std::vector<ParsedRule> rules;
    /** Number of invalid or unsupported rules */
    size_t rejected = 0;
};

/**
 * Parse one line of a source.
 * Comments, blank lines and cosmetic rules produce nothing.
 * @param line trimmed line
 * @param format source format
 * @param result receives the rules and the rejected counter
 */
void parse_line(std::string_view line, SourceFormat format, ParseResult &result);

/**
 * Parse the whole source content line by line
 */
ParseResult parse_source(std::string_view content, SourceFormat format);

} // namespace shroud::dns
