#pragma once

#include <string>
#include <string_view>

#include "buildprobe/rewriter/script_model.hpp"

namespace buildprobe::rewriter {

/// Bumped whenever the recorder's output changes; part of the result cache key.
inline constexpr int kInstrumentationVersion = 1;

struct InstrumentationOptions {
    /// Absolute path the recorder writes its JSON document to.
    std::string artifact_path;
};

/// Python 2/3 source that replaces `setuptools.setup` and
/// `distutils.core.setup` with a recorder serializing the call's
/// parameters to `options.artifact_path`, and makes `input()` /
/// `raw_input()` return an empty string.
auto instrumentation_block(const InstrumentationOptions& options) -> std::string;

/// Encodes `text` as a Python string literal valid under both Python 2 and 3.
/// Non-ASCII input is emitted as an escaped UTF-8 bytes literal decoded at
/// runtime.
auto python_string_literal(std::string_view text) -> std::string;

/// Splits `source` and inserts the instrumentation block after its preamble.
auto rewrite(std::string_view source, const InstrumentationOptions& options) -> ScriptModel;

} // namespace buildprobe::rewriter
