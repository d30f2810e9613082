#include "reasoning/step_format.hpp"

#include <sstream>

namespace step_format {

std::string header(const reasoning::ReasoningStep &step) {
    std::string prefix;
    std::string context;

    if (step.is_revision) {
        prefix = "Revision";
        context = " (revising thought " + std::to_string(step.revises_index.value_or(0)) + ")";
    } else if (step.branch_id.has_value()) {
        prefix = "Branch";
        if (step.branch_from_index.has_value()) {
            context = " (from thought " + std::to_string(*step.branch_from_index) + ", ID: " + *step.branch_id + ")";
        } else {
            context = " (ID: " + *step.branch_id + ")";
        }
    } else {
        prefix = "Thought";
    }

    return prefix + " " + std::to_string(step.index) + "/" + std::to_string(step.estimated_total) + context;
}

std::string format_step(const reasoning::ReasoningStep &step) {
    const std::string separator = "---";

    std::ostringstream output;
    output << "\n" << header(step) << "\n" << separator << "\n";

    std::istringstream lines(step.text);
    std::string line;
    while (std::getline(lines, line)) {
        output << "  " << line << "\n";
    }
    output << separator;
    return output.str();
}

} // namespace step_format
