// Tests for schema validation of code-reasoning tool arguments:
// required fields, types, text limits and revision/branch pairing rules.

#include "reasoning/step_validator.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

using json = nlohmann::json;
using reasoning::ReasonCode;

namespace test_step_validator {

static const std::size_t kMaxLength = 100;

static json base_arguments() {
    return json{
        {"thought", "Define the problem."},
        {"thought_number", 1},
        {"total_thoughts", 3},
        {"next_thought_needed", true}
    };
}

static bool expect_reason(const json &arguments, ReasonCode expected, const std::string &test_description) {
    step_validator::ValidationResult result = step_validator::validate(arguments, kMaxLength);
    bool success = !result.success && result.reason == expected;
    if (success) {
        std::cout << "  OK: " << test_description << std::endl;
    } else {
        std::cout << "  FAIL: " << test_description << " (got success=" << result.success
                  << " reason=" << reasoning::reason_code_name(result.reason)
                  << " message='" << result.error_message << "')" << std::endl;
    }
    return success;
}

// Test: A minimal plain step is accepted and every field is mapped.
static bool test_plain_step_accepted() {
    json arguments = base_arguments();
    arguments["needs_more_thoughts"] = true;
    step_validator::ValidationResult result = step_validator::validate(arguments, kMaxLength);

    bool success = result.success &&
                   result.step.text == "Define the problem." &&
                   result.step.index == 1 &&
                   result.step.estimated_total == 3 &&
                   result.step.continues &&
                   !result.step.is_revision &&
                   !result.step.branch_id.has_value() &&
                   result.step.more_steps_hint.has_value() && *result.step.more_steps_hint;
    if (success) {
        std::cout << "  OK: Plain step accepted with all fields mapped" << std::endl;
    } else {
        std::cout << "  FAIL: Plain step not mapped correctly: " << result.error_message << std::endl;
    }
    return success;
}

// Test: Non-object arguments are rejected.
static bool test_rejects_non_object() {
    bool success = true;
    success &= expect_reason(json::array({1, 2}), ReasonCode::NotAnObject, "Array arguments rejected");
    success &= expect_reason(json("text"), ReasonCode::NotAnObject, "String arguments rejected");
    return success;
}

// Test: Each required field is reported when missing.
static bool test_missing_required_fields() {
    bool success = true;
    for (const char *key : {"thought", "thought_number", "total_thoughts", "next_thought_needed"}) {
        json arguments = base_arguments();
        arguments.erase(key);
        step_validator::ValidationResult result = step_validator::validate(arguments, kMaxLength);
        bool passed = !result.success && result.reason == ReasonCode::MissingField && result.field == key;
        if (passed) {
            std::cout << "  OK: Missing '" << key << "' reported" << std::endl;
        } else {
            std::cout << "  FAIL: Missing '" << key << "' not reported, field='" << result.field << "'" << std::endl;
        }
        success &= passed;
    }
    return success;
}

// Test: Text that is empty after trimming is rejected; surrounding whitespace is stripped.
static bool test_text_trimming() {
    bool success = true;
    json arguments = base_arguments();
    arguments["thought"] = "   \n\t ";
    success &= expect_reason(arguments, ReasonCode::EmptyText, "Whitespace-only thought rejected");

    arguments["thought"] = "  padded  ";
    step_validator::ValidationResult result = step_validator::validate(arguments, kMaxLength);
    bool trimmed = result.success && result.step.text == "padded";
    std::cout << (trimmed ? "  OK: " : "  FAIL: ") << "Thought text is stored trimmed" << std::endl;
    return success && trimmed;
}

// Test: The length limit is inclusive, counted in code points, and named in the error.
static bool test_text_length_limit() {
    json arguments = base_arguments();
    arguments["thought"] = std::string(kMaxLength, 'a');
    bool at_limit = step_validator::validate(arguments, kMaxLength).success;
    std::cout << (at_limit ? "  OK: " : "  FAIL: ") << "Thought exactly at the limit accepted" << std::endl;

    // 100 two-byte characters are 200 bytes but only 100 code points.
    std::string accented;
    for (std::size_t count = 0; count < kMaxLength; count++) {
        accented += "\xC3\xA9";
    }
    arguments["thought"] = accented;
    bool multibyte = step_validator::validate(arguments, kMaxLength).success;
    std::cout << (multibyte ? "  OK: " : "  FAIL: ") << "Length counted in code points, not bytes" << std::endl;

    arguments["thought"] = std::string(kMaxLength + 1, 'a');
    step_validator::ValidationResult result = step_validator::validate(arguments, kMaxLength);
    bool too_long = !result.success && result.reason == ReasonCode::TextTooLong &&
                    result.error_message.find("100") != std::string::npos;
    std::cout << (too_long ? "  OK: " : "  FAIL: ") << "Over-long thought rejected, error names the limit" << std::endl;

    return at_limit && multibyte && too_long;
}

// Test: Numbers must be positive integers; integral floats are accepted.
static bool test_number_rules() {
    bool success = true;
    json arguments = base_arguments();

    arguments["thought_number"] = "1";
    success &= expect_reason(arguments, ReasonCode::InvalidType, "String thought_number rejected");

    arguments["thought_number"] = 1.5;
    success &= expect_reason(arguments, ReasonCode::InvalidType, "Fractional thought_number rejected");

    arguments["thought_number"] = 0;
    success &= expect_reason(arguments, ReasonCode::NonPositiveNumber, "Zero thought_number rejected");

    arguments = base_arguments();
    arguments["total_thoughts"] = -2;
    success &= expect_reason(arguments, ReasonCode::NonPositiveNumber, "Negative total_thoughts rejected");

    arguments = base_arguments();
    arguments["thought_number"] = 2.0;
    step_validator::ValidationResult result = step_validator::validate(arguments, kMaxLength);
    bool integral_float = result.success && result.step.index == 2;
    std::cout << (integral_float ? "  OK: " : "  FAIL: ") << "Integral float thought_number accepted" << std::endl;

    arguments = base_arguments();
    arguments["next_thought_needed"] = "yes";
    success &= expect_reason(arguments, ReasonCode::InvalidType, "Non-boolean next_thought_needed rejected");

    return success && integral_float;
}

// Test: Revision pairing rules.
static bool test_revision_rules() {
    bool success = true;

    json arguments = base_arguments();
    arguments["is_revision"] = true;
    success &= expect_reason(arguments, ReasonCode::RevisionTargetMissing, "is_revision without revises_thought rejected");

    arguments = base_arguments();
    arguments["revises_thought"] = 1;
    success &= expect_reason(arguments, ReasonCode::RevisionTargetWithoutFlag, "revises_thought without is_revision rejected");

    arguments["is_revision"] = false;
    success &= expect_reason(arguments, ReasonCode::RevisionTargetWithoutFlag, "revises_thought with is_revision=false rejected");

    arguments = base_arguments();
    arguments["is_revision"] = true;
    arguments["revises_thought"] = 1;
    step_validator::ValidationResult result = step_validator::validate(arguments, kMaxLength);
    bool accepted = result.success && result.step.is_revision && result.step.revises_index == 1;
    std::cout << (accepted ? "  OK: " : "  FAIL: ") << "Complete revision accepted" << std::endl;

    return success && accepted;
}

// Test: Branch pairing rules and mutual exclusion with revision.
static bool test_branch_rules() {
    bool success = true;

    json arguments = base_arguments();
    arguments["branch_from_thought"] = 1;
    success &= expect_reason(arguments, ReasonCode::IncompleteBranch, "branch_from_thought without branch_id rejected");

    arguments = base_arguments();
    arguments["branch_id"] = "   ";
    success &= expect_reason(arguments, ReasonCode::IncompleteBranch, "Blank branch_id rejected");

    arguments = base_arguments();
    arguments["is_revision"] = true;
    arguments["revises_thought"] = 1;
    arguments["branch_id"] = "X";
    success &= expect_reason(arguments, ReasonCode::RevisionWithBranch, "Revision combined with branch_id rejected");

    arguments = base_arguments();
    arguments["is_revision"] = true;
    arguments["branch_id"] = "X";
    arguments["branch_from_thought"] = 1;
    success &= expect_reason(arguments, ReasonCode::RevisionWithBranch, "Revision flag with full branch rejected");

    // A branch_id alone is a continuation; existence is the tracker's business.
    arguments = base_arguments();
    arguments["branch_id"] = " X ";
    step_validator::ValidationResult continuation = step_validator::validate(arguments, kMaxLength);
    bool continuation_ok = continuation.success && continuation.step.branch_id == std::string("X") &&
                           !continuation.step.branch_from_index.has_value();
    std::cout << (continuation_ok ? "  OK: " : "  FAIL: ") << "branch_id alone passes validation (trimmed)" << std::endl;

    arguments["branch_from_thought"] = 1;
    arguments["is_revision"] = false;
    bool full_branch = step_validator::validate(arguments, kMaxLength).success;
    std::cout << (full_branch ? "  OK: " : "  FAIL: ") << "Full branch with is_revision=false accepted" << std::endl;

    return success && continuation_ok && full_branch;
}

// Test: Optional keys holding null count as absent; unknown keys are ignored.
static bool test_null_and_unknown_keys() {
    json arguments = base_arguments();
    arguments["is_revision"] = nullptr;
    arguments["revises_thought"] = nullptr;
    arguments["branch_id"] = nullptr;
    arguments["extra"] = "ignored";
    step_validator::ValidationResult result = step_validator::validate(arguments, kMaxLength);
    bool success = result.success && !result.step.is_revision && !result.step.branch_id.has_value();
    std::cout << (success ? "  OK: " : "  FAIL: ") << "Null optionals treated as absent, unknown keys ignored" << std::endl;
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_plain_step_accepted();
    all_passed &= test_rejects_non_object();
    all_passed &= test_missing_required_fields();
    all_passed &= test_text_trimming();
    all_passed &= test_text_length_limit();
    all_passed &= test_number_rules();
    all_passed &= test_revision_rules();
    all_passed &= test_branch_rules();
    all_passed &= test_null_and_unknown_keys();
    return all_passed;
}

} // namespace test_step_validator
