#include "reasoning/reasoning_step.hpp"

namespace reasoning {

const char *reason_code_name(ReasonCode code) {
    switch (code) {
    case ReasonCode::None: return "none";
    case ReasonCode::NotAnObject: return "not_an_object";
    case ReasonCode::MissingField: return "missing_field";
    case ReasonCode::InvalidType: return "invalid_type";
    case ReasonCode::EmptyText: return "empty_text";
    case ReasonCode::TextTooLong: return "text_too_long";
    case ReasonCode::NonPositiveNumber: return "non_positive_number";
    case ReasonCode::RevisionTargetMissing: return "revision_target_missing";
    case ReasonCode::RevisionTargetWithoutFlag: return "revision_target_without_flag";
    case ReasonCode::RevisionWithBranch: return "revision_with_branch";
    case ReasonCode::IncompleteBranch: return "incomplete_branch";
    case ReasonCode::InvalidRevisionReference: return "invalid_revision_reference";
    case ReasonCode::InvalidBranchReference: return "invalid_branch_reference";
    case ReasonCode::DuplicateIndex: return "duplicate_index";
    case ReasonCode::DuplicateTermination: return "duplicate_termination";
    }
    return "unknown";
}

GuidanceCategory category_for(ReasonCode code) {
    switch (code) {
    case ReasonCode::EmptyText:
    case ReasonCode::TextTooLong:
        return GuidanceCategory::Length;
    case ReasonCode::IncompleteBranch:
    case ReasonCode::InvalidBranchReference:
        return GuidanceCategory::Branch;
    case ReasonCode::RevisionTargetMissing:
    case ReasonCode::RevisionTargetWithoutFlag:
    case ReasonCode::RevisionWithBranch:
    case ReasonCode::InvalidRevisionReference:
        return GuidanceCategory::Revision;
    case ReasonCode::NonPositiveNumber:
    case ReasonCode::DuplicateIndex:
    case ReasonCode::DuplicateTermination:
        return GuidanceCategory::Numbering;
    default:
        return GuidanceCategory::Generic;
    }
}

} // namespace reasoning
