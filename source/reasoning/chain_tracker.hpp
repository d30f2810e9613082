#ifndef CRMCPS_CHAIN_TRACKER_HPP
#define CRMCPS_CHAIN_TRACKER_HPP

// Chain tracker: owns the accepted history and the branch index for one
// reasoning chain and enforces the chain-level invariants (reference
// validity, unique main-line numbering, one termination per line).
//
// All public methods take the tracker's mutex, so a tracker may be shared by
// concurrent callers. track() checks everything before it mutates anything:
// a rejected step leaves the chain exactly as it was.

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "reasoning/reasoning_step.hpp"

namespace chain_tracker {

// Outcome of tracking one step.
struct TrackResult {
    bool success = false;
    reasoning::ReasonCode reason = reasoning::ReasonCode::None;
    std::string field;
    std::string error_message;

    reasoning::ReasoningStep step; // normalized copy of what was stored
    bool branch_created = false;
    std::size_t history_length = 0;
    std::vector<std::string> branch_ids; // in creation order
};

// Counts reported when a chain is aborted.
struct ChainSummary {
    std::size_t history_length = 0;
    std::size_t branch_count = 0;
    std::size_t revision_count = 0;
};

class ChainTracker {
public:
    ChainTracker() = default;
    ChainTracker(const ChainTracker &) = delete;
    ChainTracker &operator=(const ChainTracker &) = delete;

    TrackResult track(reasoning::ReasoningStep step);

    ChainSummary summary() const;

    std::vector<reasoning::ReasoningStep> history() const;
    std::vector<reasoning::ReasoningStep> branch(const std::string &branch_id) const;
    std::vector<std::string> branch_ids() const;

private:
    // Returns an empty string if the reference is valid, else the error message.
    std::string check_reference(const char *field, int referenced_index) const;

    mutable std::mutex mutex_;
    std::vector<reasoning::ReasoningStep> history_;
    std::map<std::string, std::vector<reasoning::ReasoningStep>> branches_;
    std::vector<std::string> branch_order_;

    std::set<int> main_line_indices_;
    bool main_line_terminated_ = false;
    std::set<std::string> terminated_branches_;
    std::size_t revision_count_ = 0;
};

} // namespace chain_tracker

#endif // CRMCPS_CHAIN_TRACKER_HPP
