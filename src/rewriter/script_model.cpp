#include "buildprobe/rewriter/script_model.hpp"

#include <cctype>
#include <optional>

#include "buildprobe/core/logger.hpp"

namespace buildprobe::rewriter {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

auto line_end(std::string_view s, size_t pos) -> size_t {
    auto nl = s.find('\n', pos);
    return nl == std::string_view::npos ? s.size() : nl + 1;
}

auto skip_blanks(std::string_view s, size_t pos) -> size_t {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' ||
                              s[pos] == '\f' || s[pos] == '\r')) {
        ++pos;
    }
    return pos;
}

/// True if only whitespace, an optional comment and a line break remain.
auto rest_of_line_is_empty(std::string_view s, size_t pos) -> bool {
    pos = skip_blanks(s, pos);
    return pos >= s.size() || s[pos] == '\n' || s[pos] == '#';
}

/// Length of a string prefix (r, u, b, br, rb, ...) followed by a quote at
/// `pos`, or nullopt if no string literal starts there.
auto string_prefix_length(std::string_view s, size_t pos) -> std::optional<size_t> {
    size_t n = 0;
    while (n < 2 && pos + n < s.size() &&
           std::string_view("rRuUbB").find(s[pos + n]) != std::string_view::npos) {
        ++n;
    }
    if (pos + n < s.size() && (s[pos + n] == '"' || s[pos + n] == '\'')) {
        return n;
    }
    return std::nullopt;
}

/// Returns the position just past the string literal starting at `pos`,
/// or nullopt if it is not terminated.
auto scan_string_literal(std::string_view s, size_t pos) -> std::optional<size_t> {
    auto prefix = string_prefix_length(s, pos);
    if (!prefix) return std::nullopt;
    pos += *prefix;

    char quote = s[pos];
    bool triple = s.substr(pos, 3) == std::string(3, quote);
    pos += triple ? 3 : 1;

    while (pos < s.size()) {
        char c = s[pos];
        if (c == '\\') {
            pos += 2;
            continue;
        }
        if (triple) {
            if (s.substr(pos, 3) == std::string(3, quote)) return pos + 3;
        } else {
            if (c == quote) return pos + 1;
            if (c == '\n') return std::nullopt;
        }
        ++pos;
    }
    return std::nullopt;
}

auto is_future_import(std::string_view s, size_t pos) -> bool {
    auto word = [&](std::string_view kw) {
        if (s.substr(pos, kw.size()) != kw) return false;
        auto after = pos + kw.size();
        if (after < s.size() && (std::isalnum(static_cast<unsigned char>(s[after])) ||
                                 s[after] == '_')) {
            return false;
        }
        pos = after;
        return true;
    };
    auto gap = [&]() {
        auto start = pos;
        while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' ||
                                  (s[pos] == '\\' && pos + 1 < s.size() && s[pos + 1] == '\n'))) {
            pos += s[pos] == '\\' ? 2 : 1;
        }
        return pos > start;
    };
    return word("from") && gap() && word("__future__") && gap() && word("import");
}

/// Returns the position just past the logical line starting at `pos`,
/// following parentheses and backslash continuations, or nullopt if the
/// statement is still open at end of input.
auto scan_logical_line(std::string_view s, size_t pos) -> std::optional<size_t> {
    int depth = 0;
    while (pos < s.size()) {
        char c = s[pos];
        if (c == '#') {
            pos = s.find('\n', pos);
            if (pos == std::string_view::npos) {
                return depth == 0 ? std::optional<size_t>(s.size()) : std::nullopt;
            }
            continue;
        }
        if (c == '\\' && pos + 1 < s.size() && s[pos + 1] == '\n') {
            pos += 2;
            continue;
        }
        if (c == '\\' && pos + 2 < s.size() && s[pos + 1] == '\r' && s[pos + 2] == '\n') {
            pos += 3;
            continue;
        }
        if (c == '"' || c == '\'') {
            auto end = scan_string_literal(s, pos);
            if (!end) return std::nullopt;
            pos = *end;
            continue;
        }
        if (c == '(') ++depth;
        if (c == ')') --depth;
        if (c == '\n' && depth <= 0) return pos + 1;
        ++pos;
    }
    if (depth > 0) return std::nullopt;
    return s.size();
}

auto ensure_newline(std::string& out) {
    if (!out.empty() && out.back() != '\n') out += '\n';
}

} // anonymous namespace

auto ScriptModel::render() const -> std::string {
    std::string out;
    out.reserve(preamble.size() + instrumentation.size() + body.size() + 2);
    out += preamble;
    ensure_newline(out);
    out += instrumentation;
    ensure_newline(out);
    out += body;
    return out;
}

auto split_script(std::string_view source) -> ScriptModel {
    ScriptModel model;

    // A byte order mark is only valid at the very start of the file, so it
    // stays in the preamble even when nothing else does.
    const size_t bom = source.starts_with(kUtf8Bom) ? kUtf8Bom.size() : 0;
    size_t pos = bom;
    size_t preamble_end = bom;

    auto give_up = [&](std::string_view reason) {
        LOG_DEBUG("Rewriter: cannot separate preamble ({}), treating script as body", reason);
        model.preamble = std::string(source.substr(0, bom));
        model.body = std::string(source.substr(bom));
        model.fallback = true;
        return model;
    };

    bool seen_docstring = false;
    bool seen_future = false;

    while (pos < source.size()) {
        auto start = skip_blanks(source, pos);

        if (start >= source.size() || source[start] == '\n' || source[start] == '#') {
            pos = line_end(source, start);
            preamble_end = pos;
            continue;
        }

        // Statements must start in column zero; anything indented ends the scan.
        if (start != pos) break;

        if (!seen_docstring && !seen_future && string_prefix_length(source, start)) {
            auto end = scan_string_literal(source, start);
            if (!end) return give_up("unterminated docstring");
            if (!rest_of_line_is_empty(source, *end)) break;
            seen_docstring = true;
            pos = line_end(source, *end);
            preamble_end = pos;
            continue;
        }

        if (is_future_import(source, start)) {
            auto end = scan_logical_line(source, start);
            if (!end) return give_up("unterminated __future__ import");
            seen_future = true;
            pos = *end;
            preamble_end = pos;
            continue;
        }

        break;
    }

    model.preamble = std::string(source.substr(0, preamble_end));
    model.body = std::string(source.substr(preamble_end));
    return model;
}

} // namespace buildprobe::rewriter
