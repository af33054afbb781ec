#include "buildprobe/extractor/report.hpp"

namespace buildprobe::extractor {

auto to_json(const supervisor::Attempt& attempt) -> json {
    json j = {
        {"interpreter", attempt.interpreter},
        {"status", supervisor::attempt_status_to_string(attempt.status)},
        {"elapsed_ms", attempt.elapsed.count()},
    };
    j["executable"] = attempt.executable ? json(attempt.executable->string()) : json(nullptr);
    j["exit_code"] = attempt.exit_code ? json(*attempt.exit_code) : json(nullptr);
    j["signal"] = attempt.signal ? json(*attempt.signal) : json(nullptr);
    if (attempt.process_group > 0) j["process_group"] = attempt.process_group;
    if (!attempt.detail.empty()) j["detail"] = attempt.detail;
    if (!attempt.diagnostics.empty()) j["diagnostics"] = attempt.diagnostics;
    return j;
}

auto to_json(const ExtractionResult& result) -> json {
    json attempts = json::array();
    for (const auto& attempt : result.attempts) {
        attempts.push_back(to_json(attempt));
    }

    json j = {
        {"source", result.source.string()},
        {"outcome", outcome_to_string(result.outcome)},
        {"from_cache", result.from_cache},
        {"rewrite_fallback", result.rewrite_fallback},
        {"attempts", std::move(attempts)},
    };
    j["interpreter"] = result.interpreter ? json(*result.interpreter) : json(nullptr);
    if (!result.artifact_problem.empty()) {
        j["artifact_problem"] = result.artifact_problem;
    }

    if (result.artifact) {
        auto parsed = json::parse(*result.artifact, nullptr, false);
        if (parsed.is_discarded()) {
            j["artifact"] = *result.artifact;
        } else {
            j["artifact"] = std::move(parsed);
        }
    } else {
        j["artifact"] = nullptr;
    }
    return j;
}

auto error_to_json(const std::filesystem::path& source, const Error& error) -> json {
    return {
        {"source", source.string()},
        {"outcome", "error"},
        {"error", {
            {"code", error_code_to_string(error.code())},
            {"message", error.what()},
        }},
    };
}

auto batch_report(const std::vector<ExtractionRequest>& requests,
                  const std::vector<Result<ExtractionResult>>& results) -> json {
    json entries = json::array();
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i]) {
            entries.push_back(to_json(*results[i]));
        } else {
            entries.push_back(error_to_json(requests[i].source, results[i].error()));
        }
    }
    return {
        {"results", std::move(entries)},
        {"exit_code", batch_exit_code(results)},
    };
}

auto dump_report(const json& report, int indent) -> std::string {
    return report.dump(indent, ' ', false, json::error_handler_t::replace);
}

auto batch_exit_code(const std::vector<Result<ExtractionResult>>& results) -> int {
    int code = 0;
    for (const auto& result : results) {
        if (!result) return kInfrastructureExitCode;
        if (code == 0) code = outcome_exit_code(result->outcome);
    }
    return code;
}

} // namespace buildprobe::extractor
