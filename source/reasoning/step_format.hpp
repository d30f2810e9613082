#ifndef CRMCPS_STEP_FORMAT_HPP
#define CRMCPS_STEP_FORMAT_HPP

// Human-readable rendering of an accepted step for the stderr log.

#include <string>

#include "reasoning/reasoning_step.hpp"

namespace step_format {

// Header line: "Thought 2/5", "Revision 4/6 (revising thought 2)" or
// "Branch 3/7 (from thought 2, ID: alt)".
std::string header(const reasoning::ReasoningStep &step);

// Header, separator, text indented by two spaces per line, separator.
std::string format_step(const reasoning::ReasoningStep &step);

} // namespace step_format

#endif // CRMCPS_STEP_FORMAT_HPP
