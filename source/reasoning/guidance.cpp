#include "reasoning/guidance.hpp"

#include "reasoning/step_validator.hpp"

namespace guidance {

using reasoning::GuidanceCategory;
using reasoning::ReasonCode;
using reasoning::ReasoningStep;

static ReasoningStep make_step(const std::string &text, int index, int estimated_total) {
    ReasoningStep step;
    step.text = text;
    step.index = index;
    step.estimated_total = estimated_total;
    step.continues = true;
    return step;
}

Guidance example_for(ReasonCode code, std::size_t max_text_length) {
    Guidance result;

    switch (reasoning::category_for(code)) {
    case GuidanceCategory::Length:
        result.example = make_step("Breaking down the thought into smaller parts...", 2, 5);
        result.hint = "The 'thought' field must be a non-empty string of at most " +
                      std::to_string(max_text_length) +
                      " characters. Split long reasoning into several thoughts.";
        break;

    case GuidanceCategory::Branch:
        result.example = make_step("Exploring alternative: Consider algorithm X.", 3, 7);
        result.example.branch_from_index = 2;
        result.example.branch_id = std::string("alternative-algo-x");
        result.hint = "When branching, provide both \"branch_from_thought\" (an existing thought number) and "
                      "\"branch_id\" (string) on the first step of the branch, and do not combine with "
                      "revision (is_revision=true).";
        break;

    case GuidanceCategory::Revision:
        result.example = make_step("Revisiting earlier point: Assumption Y was flawed.", 4, 6);
        result.example.is_revision = true;
        result.example.revises_index = 2;
        result.hint = "When revising, set is_revision=true and provide revises_thought (an existing thought "
                      "number). Do not combine with branching.";
        break;

    case GuidanceCategory::Numbering:
        result.example = make_step("Continuing the analysis with the next step.", 3, 5);
        result.hint = "Ensure thought_number is a positive integer that is not reused on the main line, and "
                      "set next_thought_needed=false only once per line of reasoning.";
        break;

    case GuidanceCategory::Generic:
        result.example = make_step("Initial exploration of the problem.", 1, 5);
        result.hint = "Check the tool description and provided schema for correct usage. Required fields: "
                      "thought, thought_number, total_thoughts, next_thought_needed.";
        break;
    }

    return result;
}

std::string limit_hint(int max_steps) {
    return "The maximum thought limit (" + std::to_string(max_steps) +
           ") was reached. Summarize the conclusions so far instead of continuing.";
}

json step_to_request(const ReasoningStep &step) {
    json request;
    request[step_validator::kKeyThought] = step.text;
    request[step_validator::kKeyThoughtNumber] = step.index;
    request[step_validator::kKeyTotalThoughts] = step.estimated_total;
    request[step_validator::kKeyNextThoughtNeeded] = step.continues;
    if (step.is_revision) {
        request[step_validator::kKeyIsRevision] = true;
    }
    if (step.revises_index.has_value()) {
        request[step_validator::kKeyRevisesThought] = *step.revises_index;
    }
    if (step.branch_from_index.has_value()) {
        request[step_validator::kKeyBranchFromThought] = *step.branch_from_index;
    }
    if (step.branch_id.has_value()) {
        request[step_validator::kKeyBranchId] = *step.branch_id;
    }
    if (step.more_steps_hint.has_value()) {
        request[step_validator::kKeyNeedsMoreThoughts] = *step.more_steps_hint;
    }
    return request;
}

} // namespace guidance
