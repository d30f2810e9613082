#include "reasoning/reasoning_engine.hpp"

#include <chrono>
#include <exception>

#include "reasoning/guidance.hpp"
#include "reasoning/step_format.hpp"
#include "reasoning/step_validator.hpp"
#include "utils/debug_log.hpp"

namespace reasoning_engine {

using reasoning::ReasonCode;

const char *status_name(ProcessStatus status) {
    switch (status) {
    case ProcessStatus::Processed: return "processed";
    case ProcessStatus::Failed: return "failed";
    case ProcessStatus::Aborted: return "aborted";
    }
    return "failed";
}

// Shape and cross-field problems are reported as schema validation errors; length,
// reference and numbering problems carry their own message.
static bool is_schema_error(ReasonCode reason) {
    switch (reason) {
    case ReasonCode::NotAnObject:
    case ReasonCode::MissingField:
    case ReasonCode::InvalidType:
    case ReasonCode::EmptyText:
    case ReasonCode::NonPositiveNumber:
    case ReasonCode::RevisionTargetMissing:
    case ReasonCode::RevisionTargetWithoutFlag:
    case ReasonCode::RevisionWithBranch:
        return true;
    default:
        return false;
    }
}

ReasoningEngine::ReasoningEngine(const config::Config &settings) : settings_(settings) {
    json fields;
    fields["max_thought_length"] = settings_.max_thought_length;
    fields["max_thoughts"] = settings_.max_thoughts;
    fields["timeout_ms"] = settings_.timeout_ms;
    fields["debug"] = settings_.debug;
    debug_log::info("Code reasoning engine initialized", fields);
}

ProcessResult ReasoningEngine::build_failure(ReasonCode reason, const std::string &field,
                                             const std::string &message) const {
    guidance::Guidance advice = guidance::example_for(reason, settings_.max_thought_length);

    ProcessResult result;
    result.status = ProcessStatus::Failed;
    result.response["error"] = is_schema_error(reason) ? "Validation Error: " + message : message;
    result.response["status"] = status_name(ProcessStatus::Failed);
    result.response["reason"] = reasoning::reason_code_name(reason);
    if (!field.empty()) {
        result.response["field"] = field;
    }
    result.response["guidance"] = advice.hint;
    result.response["example"] = guidance::step_to_request(advice.example);
    return result;
}

ProcessResult ReasoningEngine::build_aborted(int thought_number) const {
    chain_tracker::ChainSummary summary = tracker_.summary();

    json fields;
    fields["max"] = settings_.max_thoughts;
    fields["current"] = thought_number;
    debug_log::info("Aborting chain - exceeded max thoughts", fields);

    ProcessResult result;
    result.status = ProcessStatus::Aborted;
    result.response["error"] = "Max thought_number exceeded (" + std::to_string(settings_.max_thoughts) + ")";
    result.response["status"] = status_name(ProcessStatus::Aborted);
    result.response["guidance"] = guidance::limit_hint(settings_.max_thoughts);
    result.response["max_thoughts"] = settings_.max_thoughts;
    result.response["thought_history_length"] = summary.history_length;
    result.response["branch_count"] = summary.branch_count;
    result.response["revision_count"] = summary.revision_count;
    return result;
}

ProcessResult ReasoningEngine::build_success(const chain_tracker::TrackResult &tracked) const {
    ProcessResult result;
    result.status = ProcessStatus::Processed;
    result.response["status"] = status_name(ProcessStatus::Processed);
    result.response["thought_number"] = tracked.step.index;
    result.response["total_thoughts"] = tracked.step.estimated_total;
    result.response["next_thought_needed"] = tracked.step.continues;
    result.response["branches"] = tracked.branch_ids;
    result.response["thought_history_length"] = tracked.history_length;
    return result;
}

ProcessResult ReasoningEngine::run(const json &raw) {
    // 1. Schema validation.
    debug_log::log("Validating thought data");
    step_validator::ValidationResult validated = step_validator::validate(raw, settings_.max_thought_length);
    if (!validated.success) {
        json fields;
        fields["reason"] = reasoning::reason_code_name(validated.reason);
        fields["error"] = validated.error_message;
        debug_log::info("Rejected thought", fields);
        return build_failure(validated.reason, validated.field, validated.error_message);
    }
    debug_log::log("Validation successful", json{{"thought_number", validated.step.index}});

    // 2. Step cap. Reported, never tracked.
    if (validated.step.index > settings_.max_thoughts) {
        return build_aborted(validated.step.index);
    }

    // 3. References, numbering, termination; commit on success only.
    int submitted_total = validated.step.estimated_total;
    chain_tracker::TrackResult tracked = tracker_.track(validated.step);
    if (!tracked.success) {
        json fields;
        fields["reason"] = reasoning::reason_code_name(tracked.reason);
        fields["error"] = tracked.error_message;
        fields["thought_number"] = validated.step.index;
        debug_log::info("Rejected thought", fields);
        return build_failure(tracked.reason, tracked.field, tracked.error_message);
    }

    if (tracked.step.estimated_total != submitted_total) {
        json fields;
        fields["old_total"] = submitted_total;
        fields["new_total"] = tracked.step.estimated_total;
        debug_log::log("Adjusted total_thoughts to match thought_number", fields);
    }
    if (tracked.branch_created) {
        json fields;
        fields["branch_id"] = tracked.step.branch_id.value_or("");
        fields["from_thought"] = tracked.step.branch_from_index.value_or(0);
        debug_log::info("Created a new branch", fields);
    }

    debug_log::print_block(step_format::format_step(tracked.step));

    // 4. Response.
    return build_success(tracked);
}

ProcessResult ReasoningEngine::process(const json &raw) {
    auto start_time = std::chrono::steady_clock::now();

    ProcessResult result;
    try {
        result = run(raw);
    } catch (const std::exception &error) {
        // Only reachable through a defect (e.g. a JSON type error); the client still gets a frame.
        debug_log::error("Error processing thought", json{{"error", error.what()}});
        result = build_failure(ReasonCode::None, "", std::string("Internal error: ") + error.what());
    }

    long elapsed_milliseconds = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count());

    if (result.status == ProcessStatus::Processed) {
        json fields;
        fields["thought_number"] = result.response["thought_number"];
        fields["next_thought_needed"] = result.response["next_thought_needed"];
        fields["thought_history_length"] = result.response["thought_history_length"];
        fields["processing_time_ms"] = elapsed_milliseconds;
        debug_log::info("Thought processed successfully", fields);
    }
    if (elapsed_milliseconds > settings_.timeout_ms) {
        json fields;
        fields["processing_time_ms"] = elapsed_milliseconds;
        fields["timeout_ms"] = settings_.timeout_ms;
        debug_log::warn("Thought processing exceeded the configured timeout", fields);
    }

    return result;
}

} // namespace reasoning_engine
