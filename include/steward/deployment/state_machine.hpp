#pragma once

#include <steward/schema/deployment_state.hpp>

namespace steward::deployment {

/// Pure transition function of a deployment attempt.
///
/// `ok` is the outcome of the current state's entry action and
/// `snapshot_available` whether a rollback snapshot was captured. Failures
/// before anything changed end the attempt; later failures roll back, or end
/// it when there is nothing to roll back to. Terminal states are absorbing.
schema::deployment_state_t next_state(schema::deployment_state_t current,
                                      bool ok,
                                      bool snapshot_available);

/// Whether a failure in `state` happens after the running service was
/// touched.
bool requires_rollback(schema::deployment_state_t state);

}  // namespace steward::deployment
