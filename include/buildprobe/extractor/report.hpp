#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "buildprobe/core/error.hpp"
#include "buildprobe/extractor/request.hpp"

namespace buildprobe::extractor {

using json = nlohmann::json;

auto to_json(const supervisor::Attempt& attempt) -> json;

/// Report document for one request. A JSON artifact is embedded as a value;
/// anything else is embedded as a string. Strings come from untrusted code
/// and need not be valid UTF-8: serialize with dump_report().
auto to_json(const ExtractionResult& result) -> json;

/// Report entry for a request that failed with an infrastructure error.
auto error_to_json(const std::filesystem::path& source, const Error& error) -> json;

/// Batch report: {"results": [...], "exit_code": N}.
auto batch_report(const std::vector<ExtractionRequest>& requests,
                  const std::vector<Result<ExtractionResult>>& results) -> json;

/// Serializes a report, replacing invalid UTF-8 rather than throwing.
auto dump_report(const json& report, int indent = 2) -> std::string;

/// Exit code for a batch: 4 if any request hit an infrastructure error,
/// otherwise the code of the first request that did not extract.
auto batch_exit_code(const std::vector<Result<ExtractionResult>>& results) -> int;

} // namespace buildprobe::extractor
