#include "reasoning/step_validator.hpp"

#include <cmath>
#include <limits>

#include "utils/utf8_sanitize.hpp"

namespace step_validator {

using reasoning::ReasonCode;

static ValidationResult fail(ReasonCode reason, const std::string &field, const std::string &message) {
    ValidationResult result;
    result.success = false;
    result.reason = reason;
    result.field = field;
    result.error_message = message;
    return result;
}

// Optional keys holding null are treated as absent.
static bool has_value(const json &raw, const char *key) {
    return raw.contains(key) && !raw[key].is_null();
}

// Accepts JSON integers and floats with an integral value. Returns false on any other type
// or on values that do not fit in an int.
static bool read_integer(const json &value, long long &output) {
    if (value.is_number_integer()) {
        if (value.is_number_unsigned()) {
            unsigned long long unsigned_value = value.get<unsigned long long>();
            if (unsigned_value > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
                return false;
            }
            output = static_cast<long long>(unsigned_value);
            return true;
        }
        output = value.get<long long>();
        return output >= std::numeric_limits<int>::min() && output <= std::numeric_limits<int>::max();
    }
    if (value.is_number_float()) {
        double floating = value.get<double>();
        if (!std::isfinite(floating) || std::floor(floating) != floating) {
            return false;
        }
        if (floating < static_cast<double>(std::numeric_limits<int>::min()) ||
            floating > static_cast<double>(std::numeric_limits<int>::max())) {
            return false;
        }
        output = static_cast<long long>(floating);
        return true;
    }
    return false;
}

// Reads a positive integer field into output. On failure returns false and fills failure.
static bool read_positive_integer(const json &raw, const char *key, int &output, ValidationResult &failure) {
    long long value = 0;
    if (!read_integer(raw[key], value)) {
        failure = fail(ReasonCode::InvalidType, key,
                       std::string(key) + ": Expected an integer, received " + raw[key].type_name() + ".");
        return false;
    }
    if (value <= 0) {
        failure = fail(ReasonCode::NonPositiveNumber, key,
                       std::string(key) + ": Must be a positive integer (got " + std::to_string(value) + ").");
        return false;
    }
    output = static_cast<int>(value);
    return true;
}

static bool read_boolean(const json &raw, const char *key, bool &output, ValidationResult &failure) {
    if (!raw[key].is_boolean()) {
        failure = fail(ReasonCode::InvalidType, key,
                       std::string(key) + ": Expected a boolean, received " + raw[key].type_name() + ".");
        return false;
    }
    output = raw[key].get<bool>();
    return true;
}

std::string trim(const std::string &text) {
    const char *whitespace = " \t\n\r\f\v";
    std::size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

ValidationResult validate(const json &raw, std::size_t max_text_length) {
    if (!raw.is_object()) {
        return fail(ReasonCode::NotAnObject, "",
                    std::string("Arguments must be a JSON object, received ") + raw.type_name() + ".");
    }

    // Required keys first, in wire order.
    for (const char *key : {kKeyThought, kKeyThoughtNumber, kKeyTotalThoughts, kKeyNextThoughtNeeded}) {
        if (!raw.contains(key)) {
            return fail(ReasonCode::MissingField, key, std::string(key) + ": Required field is missing.");
        }
    }

    ValidationResult failure;
    reasoning::ReasoningStep step;

    // thought
    if (!raw[kKeyThought].is_string()) {
        return fail(ReasonCode::InvalidType, kKeyThought,
                    std::string(kKeyThought) + ": Expected a string, received " + raw[kKeyThought].type_name() + ".");
    }
    step.text = trim(raw[kKeyThought].get<std::string>());
    if (step.text.empty()) {
        return fail(ReasonCode::EmptyText, kKeyThought, "thought: Thought cannot be empty.");
    }
    if (utf8_sanitize::count_code_points(step.text) > max_text_length) {
        return fail(ReasonCode::TextTooLong, kKeyThought,
                    "Thought exceeds maximum length of " + std::to_string(max_text_length) +
                    " characters. Break it into multiple steps.");
    }

    // Numbering and continuation.
    if (!read_positive_integer(raw, kKeyThoughtNumber, step.index, failure)) {
        return failure;
    }
    if (!read_positive_integer(raw, kKeyTotalThoughts, step.estimated_total, failure)) {
        return failure;
    }
    if (!read_boolean(raw, kKeyNextThoughtNeeded, step.continues, failure)) {
        return failure;
    }

    // Optional fields: type checks only.
    if (has_value(raw, kKeyIsRevision)) {
        if (!read_boolean(raw, kKeyIsRevision, step.is_revision, failure)) {
            return failure;
        }
    }
    if (has_value(raw, kKeyRevisesThought)) {
        int revises = 0;
        if (!read_positive_integer(raw, kKeyRevisesThought, revises, failure)) {
            return failure;
        }
        step.revises_index = revises;
    }
    if (has_value(raw, kKeyBranchFromThought)) {
        int branch_from = 0;
        if (!read_positive_integer(raw, kKeyBranchFromThought, branch_from, failure)) {
            return failure;
        }
        step.branch_from_index = branch_from;
    }
    if (has_value(raw, kKeyBranchId)) {
        if (!raw[kKeyBranchId].is_string()) {
            return fail(ReasonCode::InvalidType, kKeyBranchId,
                        std::string(kKeyBranchId) + ": Expected a string, received " +
                        raw[kKeyBranchId].type_name() + ".");
        }
        std::string branch_id = trim(raw[kKeyBranchId].get<std::string>());
        if (branch_id.empty()) {
            return fail(ReasonCode::IncompleteBranch, kKeyBranchId,
                        "branch_id: Branch id must be a non-empty string.");
        }
        step.branch_id = branch_id;
    }
    if (has_value(raw, kKeyNeedsMoreThoughts)) {
        bool hint = false;
        if (!read_boolean(raw, kKeyNeedsMoreThoughts, hint, failure)) {
            return failure;
        }
        step.more_steps_hint = hint;
    }

    // Cross-field: revision and branch markers are mutually exclusive.
    bool has_branch_marker = step.branch_id.has_value() || step.branch_from_index.has_value();
    if (step.is_revision) {
        if (has_branch_marker) {
            return fail(ReasonCode::RevisionWithBranch, kKeyIsRevision,
                        "If is_revision is true, branch_id/branch_from_thought must not be set.");
        }
        if (!step.revises_index.has_value()) {
            return fail(ReasonCode::RevisionTargetMissing, kKeyRevisesThought,
                        "If is_revision is true, revises_thought (number) is required.");
        }
    } else if (step.revises_index.has_value()) {
        return fail(ReasonCode::RevisionTargetWithoutFlag, kKeyRevisesThought,
                    "Cannot set revises_thought if is_revision is not true.");
    }

    // branch_from_thought always needs a branch_id. A branch_id alone is a continuation of an
    // existing branch; whether that branch exists is checked by the tracker.
    if (step.branch_from_index.has_value() && !step.branch_id.has_value()) {
        return fail(ReasonCode::IncompleteBranch, kKeyBranchId,
                    "If branching, both branch_id (string) and branch_from_thought (number) are required.");
    }

    ValidationResult result;
    result.success = true;
    result.step = step;
    return result;
}

} // namespace step_validator
