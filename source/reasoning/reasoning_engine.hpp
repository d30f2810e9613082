#ifndef CRMCPS_REASONING_ENGINE_HPP
#define CRMCPS_REASONING_ENGINE_HPP

// Reasoning engine: the single long-lived object behind the "code-reasoning"
// tool. Each process() call validates the raw arguments, applies the step
// cap, tracks the step and builds the response object. Every failure is
// turned into a structured response; nothing propagates to the transport.

#include <nlohmann/json.hpp>
#include <string>

#include "reasoning/chain_tracker.hpp"
#include "reasoning/reasoning_step.hpp"
#include "utils/config.hpp"

namespace reasoning_engine {

using json = nlohmann::json;

enum class ProcessStatus {
    Processed,
    Failed,
    Aborted,
};

// "processed", "failed" or "aborted".
const char *status_name(ProcessStatus status);

struct ProcessResult {
    ProcessStatus status = ProcessStatus::Failed;
    json response; // the object sent back to the client

    bool is_error() const { return status != ProcessStatus::Processed; }
};

class ReasoningEngine {
public:
    explicit ReasoningEngine(const config::Config &settings);
    ReasoningEngine(const ReasoningEngine &) = delete;
    ReasoningEngine &operator=(const ReasoningEngine &) = delete;

    ProcessResult process(const json &raw);

    const config::Config &settings() const { return settings_; }
    const chain_tracker::ChainTracker &tracker() const { return tracker_; }

private:
    ProcessResult build_failure(reasoning::ReasonCode reason, const std::string &field,
                                const std::string &message) const;
    ProcessResult build_aborted(int thought_number) const;
    ProcessResult build_success(const chain_tracker::TrackResult &tracked) const;

    ProcessResult run(const json &raw);

    config::Config settings_;
    chain_tracker::ChainTracker tracker_;
};

} // namespace reasoning_engine

#endif // CRMCPS_REASONING_ENGINE_HPP
