#include <algorithm>
#include <array>

#include "shroud/blocklist/domain.h"
#include "shroud/common/file.h"
#include "shroud/common/utils.h"
#include "shroud/loader/source_parser.h"

namespace shroud::dns {

static constexpr std::string_view EXCEPTION_MARKER = "@@";
static constexpr std::string_view DOMAIN_START_MARKER = "||";
static constexpr char LINE_START_MARKER = '|';
static constexpr char MODIFIERS_MARKER = '$';
static constexpr std::string_view WILDCARD_PREFIX = "*.";
static constexpr std::string_view SPECIAL_SUFFIXES[] = {"^", "|"};
static constexpr std::string_view COSMETIC_MARKERS[] = {"##", "#@#", "#?#", "#$#", "#%#"};
static constexpr std::string_view LOCAL_HOST_NAMES[] = {
        "localhost", "localhost.localdomain", "local", "broadcasthost", "0.0.0.0"};

static bool is_comment(std::string_view line) {
    return line.empty() || line.front() == '#' || line.front() == '!'
            || (line.front() == '[' && line.back() == ']');
}

static std::string_view strip_inline_comment(std::string_view line) {
    size_t pos = line.find('#');
    if (pos != std::string_view::npos) {
        line = utils::trim(line.substr(0, pos));
    }
    return line;
}

static bool add_rule(std::string_view domain, MatchType type, Action action, ParseResult &result) {
    auto normalized = normalize_domain(domain);
    if (normalized.has_error()) {
        ++result.rejected;
        return false;
    }
    result.rules.push_back(ParsedRule{.domain = std::move(normalized.value()), .match_type = type, .action = action});
    return true;
}

static bool is_local_host_name(std::string_view name) {
    return std::find(std::begin(LOCAL_HOST_NAMES), std::end(LOCAL_HOST_NAMES), name) != std::end(LOCAL_HOST_NAMES)
            || utils::starts_with(name, "ip6-");
}

// `ip domain [domain...]`, the entry covers subdomains as well
static void parse_hosts_line(std::string_view line, ParseResult &result) {
    line = strip_inline_comment(line);
    std::vector<std::string_view> parts = utils::split_by_any_of(line, " \t");
    if (parts.size() < 2 || (!utils::is_valid_ip4(parts[0]) && !utils::is_valid_ip6(parts[0]))) {
        ++result.rejected;
        return;
    }
    for (size_t i = 1; i < parts.size(); ++i) {
        std::string name = utils::to_lower(parts[i]);
        if (is_local_host_name(name)) {
            continue;
        }
        // Top level domains are not eligible for subdomains matching
        if (name.find('.') == std::string::npos) {
            continue;
        }
        add_rule(name, MatchType::SUFFIX, Action::BLOCK, result);
    }
}

static void parse_filter_list_line(std::string_view line, ParseResult &result) {
    for (std::string_view marker : COSMETIC_MARKERS) {
        if (line.find(marker) != std::string_view::npos) {
            return;
        }
    }

    Action action = Action::BLOCK;
    if (utils::starts_with(line, EXCEPTION_MARKER)) {
        line.remove_prefix(EXCEPTION_MARKER.size());
        action = Action::ALLOW;
    }

    // Modifiers and regular expressions are not supported
    if (line.find(MODIFIERS_MARKER) != std::string_view::npos
            || (line.size() > 1 && line.front() == '/' && line.back() == '/')) {
        ++result.rejected;
        return;
    }

    MatchType type = MatchType::EXACT;
    if (utils::starts_with(line, DOMAIN_START_MARKER)) {
        line.remove_prefix(DOMAIN_START_MARKER.size());
        type = MatchType::SUFFIX;
    } else if (!line.empty() && line.front() == LINE_START_MARKER) {
        line.remove_prefix(1);
    }

    for (bool removed = true; removed;) {
        removed = false;
        for (std::string_view suffix : SPECIAL_SUFFIXES) {
            if (utils::ends_with(line, suffix)) {
                line.remove_suffix(suffix.size());
                removed = true;
            }
        }
    }

    add_rule(line, type, action, result);
}

static void parse_plain_line(std::string_view line, ParseResult &result) {
    line = strip_inline_comment(line);
    if (utils::starts_with(line, WILDCARD_PREFIX)) {
        line.remove_prefix(WILDCARD_PREFIX.size());
        add_rule(line, MatchType::SUFFIX, Action::BLOCK, result);
        return;
    }
    add_rule(line, MatchType::EXACT, Action::BLOCK, result);
}

void parse_line(std::string_view line, SourceFormat format, ParseResult &result) {
    if (is_comment(line)) {
        return;
    }
    switch (format) {
    case SourceFormat::HOSTS:
        parse_hosts_line(line, result);
        break;
    case SourceFormat::FILTER_LIST:
        parse_filter_list_line(line, result);
        break;
    case SourceFormat::PLAIN_DOMAINS:
        parse_plain_line(line, result);
        break;
    }
}

ParseResult parse_source(std::string_view content, SourceFormat format) {
    ParseResult result;
    file::for_each_line(content, [&](size_t, std::string_view line) {
        parse_line(line, format, result);
        return true;
    });
    return result;
}

} // namespace shroud::dns
