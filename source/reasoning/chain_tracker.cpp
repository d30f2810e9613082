#include "reasoning/chain_tracker.hpp"

#include <utility>

namespace chain_tracker {

using reasoning::ReasonCode;
using reasoning::ReasoningStep;

static TrackResult reject(ReasonCode reason, const std::string &field, const std::string &message) {
    TrackResult result;
    result.success = false;
    result.reason = reason;
    result.field = field;
    result.error_message = message;
    return result;
}

std::string ChainTracker::check_reference(const char *field, int referenced_index) const {
    if (referenced_index >= 1 && static_cast<std::size_t>(referenced_index) <= history_.size()) {
        return "";
    }
    return "Invalid " + std::string(field) + " (" + std::to_string(referenced_index) +
           "): cannot reference a non-existent thought. Current thought history has " +
           std::to_string(history_.size()) + " thoughts.";
}

TrackResult ChainTracker::track(ReasoningStep step) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (step.is_revision && step.revises_index.has_value()) {
        std::string problem = check_reference("revises_thought", *step.revises_index);
        if (!problem.empty()) {
            return reject(ReasonCode::InvalidRevisionReference, "revises_thought", problem);
        }
    }

    bool branch_created = false;
    if (step.branch_id.has_value()) {
        const std::string &branch_id = *step.branch_id;
        bool branch_known = (branches_.find(branch_id) != branches_.end());

        if (step.branch_from_index.has_value()) {
            std::string problem = check_reference("branch_from_thought", *step.branch_from_index);
            if (!problem.empty()) {
                return reject(ReasonCode::InvalidBranchReference, "branch_from_thought", problem);
            }
        } else if (!branch_known) {
            return reject(ReasonCode::IncompleteBranch, "branch_from_thought",
                          "branch_from_thought is required to start new branch '" + branch_id + "'.");
        }
        branch_created = !branch_known;
    }

    bool plain_main_step = step.is_main_line() && !step.is_revision;
    if (plain_main_step && main_line_indices_.count(step.index) > 0) {
        return reject(ReasonCode::DuplicateIndex, "thought_number",
                      "thought_number " + std::to_string(step.index) +
                      " is already used on the main line. Use the next free number, or set "
                      "is_revision=true to revise it.");
    }

    if (!step.continues) {
        bool already_terminated = step.is_main_line()
            ? main_line_terminated_
            : (terminated_branches_.count(*step.branch_id) > 0);
        if (already_terminated) {
            std::string line_name = step.is_main_line() ? std::string("the main line")
                                                        : "branch '" + *step.branch_id + "'";
            return reject(ReasonCode::DuplicateTermination, "next_thought_needed",
                          "next_thought_needed=false was already sent for " + line_name +
                          ". A line of reasoning can only be finished once.");
        }
    }

    // All checks passed: normalize and commit.
    if (step.index > step.estimated_total) {
        step.estimated_total = step.index;
    }

    history_.push_back(step);
    if (step.branch_id.has_value()) {
        if (branch_created) {
            branch_order_.push_back(*step.branch_id);
        }
        branches_[*step.branch_id].push_back(step);
        if (!step.continues) {
            terminated_branches_.insert(*step.branch_id);
        }
    } else {
        if (plain_main_step) {
            main_line_indices_.insert(step.index);
        }
        if (!step.continues) {
            main_line_terminated_ = true;
        }
    }
    if (step.is_revision) {
        revision_count_++;
    }

    TrackResult result;
    result.success = true;
    result.step = std::move(step);
    result.branch_created = branch_created;
    result.history_length = history_.size();
    result.branch_ids = branch_order_;
    return result;
}

ChainSummary ChainTracker::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ChainSummary result;
    result.history_length = history_.size();
    result.branch_count = branches_.size();
    result.revision_count = revision_count_;
    return result;
}

std::vector<ReasoningStep> ChainTracker::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

std::vector<ReasoningStep> ChainTracker::branch(const std::string &branch_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iterator = branches_.find(branch_id);
    if (iterator == branches_.end()) {
        return {};
    }
    return iterator->second;
}

std::vector<std::string> ChainTracker::branch_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return branch_order_;
}

} // namespace chain_tracker
