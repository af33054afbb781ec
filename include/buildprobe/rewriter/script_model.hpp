#pragma once

#include <string>
#include <string_view>

namespace buildprobe::rewriter {

/// A build script split into the three parts that are recombined when it is
/// rewritten: the declarations that must stay first, the injected recorder,
/// and everything else.
struct ScriptModel {
    /// Shebang, encoding/comment/blank lines, module docstring and
    /// `from __future__ import` statements, verbatim.
    std::string preamble;
    std::string instrumentation;
    /// The rest of the original script, verbatim.
    std::string body;
    /// True when the preamble could not be separated and the whole source
    /// was kept as body.
    bool fallback = false;

    /// Concatenates preamble, instrumentation and body in that order,
    /// inserting a newline wherever a part does not end with one.
    [[nodiscard]] auto render() const -> std::string;
};

/// Splits `source` into preamble and body. Never fails: a docstring or
/// future import that runs off the end of the file yields an empty
/// preamble with `fallback` set.
auto split_script(std::string_view source) -> ScriptModel;

} // namespace buildprobe::rewriter
