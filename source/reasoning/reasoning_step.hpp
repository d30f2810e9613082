#ifndef CRMCPS_REASONING_STEP_HPP
#define CRMCPS_REASONING_STEP_HPP

// Core data types shared by the validator, tracker, guidance and engine.

#include <optional>
#include <string>

namespace reasoning {

// One validated unit of the reasoning chain.
struct ReasoningStep {
    std::string text;
    int index = 0;
    int estimated_total = 0;
    bool continues = true;

    bool is_revision = false;
    std::optional<int> revises_index;

    std::optional<std::string> branch_id;
    std::optional<int> branch_from_index;

    std::optional<bool> more_steps_hint;

    bool is_branch() const { return branch_id.has_value(); }
    bool is_main_line() const { return !branch_id.has_value(); }
};

// Machine-readable reason attached to every validation or tracking failure.
enum class ReasonCode {
    None,
    NotAnObject,
    MissingField,
    InvalidType,
    EmptyText,
    TextTooLong,
    NonPositiveNumber,
    RevisionTargetMissing,
    RevisionTargetWithoutFlag,
    RevisionWithBranch,
    IncompleteBranch,
    InvalidRevisionReference,
    InvalidBranchReference,
    DuplicateIndex,
    DuplicateTermination,
};

// Coarse grouping used to pick guidance and an example.
enum class GuidanceCategory {
    Length,
    Branch,
    Revision,
    Numbering,
    Generic,
};

// Snake-case name of a reason code, as sent in the "reason" field of error responses.
const char *reason_code_name(ReasonCode code);

GuidanceCategory category_for(ReasonCode code);

} // namespace reasoning

#endif // CRMCPS_REASONING_STEP_HPP
