#ifndef CRMCPS_GUIDANCE_HPP
#define CRMCPS_GUIDANCE_HPP

// Corrective guidance for rejected steps: one sentence of advice plus a
// complete, valid example step of the right shape for the failure category.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

#include "reasoning/reasoning_step.hpp"

namespace guidance {

using json = nlohmann::json;

struct Guidance {
    std::string hint;
    reasoning::ReasoningStep example;
};

// Guidance for a validation or tracking failure.
Guidance example_for(reasoning::ReasonCode code, std::size_t max_text_length);

// Hint sent with an aborted response.
std::string limit_hint(int max_steps);

// Wire-shaped request object for a step (only the keys that are set).
json step_to_request(const reasoning::ReasoningStep &step);

} // namespace guidance

#endif // CRMCPS_GUIDANCE_HPP
