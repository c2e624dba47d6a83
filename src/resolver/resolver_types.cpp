#include "resolver_types.hpp"

namespace Resolver {

const char* load_state_to_string(LoadState state) {
    switch (state) {
        case LoadState::Loaded: return "loaded";
        case LoadState::Rejected: return "rejected";
        case LoadState::Unverified: break;
    }
    return "unverified";
}

const char* attempt_outcome_to_string(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::Success: return "success";
        case AttemptOutcome::Timeout: return "timeout";
        case AttemptOutcome::NoMatch: return "no-match";
        case AttemptOutcome::Error: break;
    }
    return "error";
}

const char* resolution_state_to_string(ResolutionState state) {
    switch (state) {
        case ResolutionState::Pending: return "pending";
        case ResolutionState::Attempting: return "attempting";
        case ResolutionState::Succeeded: return "succeeded";
        case ResolutionState::Exhausted: return "exhausted";
        case ResolutionState::Cancelled: return "cancelled";
    }
    return "pending";
}

} // namespace Resolver
