#ifndef CRMCPS_STEP_VALIDATOR_HPP
#define CRMCPS_STEP_VALIDATOR_HPP

// Schema validation for incoming "code-reasoning" tool arguments.
// Turns the raw JSON arguments object into a ReasoningStep, or reports the
// first problem found together with a reason code and the offending key.
// Pure: no state, no logging.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

#include "reasoning/reasoning_step.hpp"

namespace step_validator {

using json = nlohmann::json;

// Wire keys of the tool arguments.
constexpr const char *kKeyThought = "thought";
constexpr const char *kKeyThoughtNumber = "thought_number";
constexpr const char *kKeyTotalThoughts = "total_thoughts";
constexpr const char *kKeyNextThoughtNeeded = "next_thought_needed";
constexpr const char *kKeyIsRevision = "is_revision";
constexpr const char *kKeyRevisesThought = "revises_thought";
constexpr const char *kKeyBranchFromThought = "branch_from_thought";
constexpr const char *kKeyBranchId = "branch_id";
constexpr const char *kKeyNeedsMoreThoughts = "needs_more_thoughts";

struct ValidationResult {
    bool success = false;
    reasoning::ReasoningStep step;
    reasoning::ReasonCode reason = reasoning::ReasonCode::None;
    std::string field;         // wire key at fault, empty for whole-object errors
    std::string error_message;
};

// Validate raw tool arguments. max_text_length is measured in code points of the trimmed text.
ValidationResult validate(const json &raw, std::size_t max_text_length);

// Strip leading and trailing ASCII whitespace.
std::string trim(const std::string &text);

} // namespace step_validator

#endif // CRMCPS_STEP_VALIDATOR_HPP
