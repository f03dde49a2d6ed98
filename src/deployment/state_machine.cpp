#include <steward/deployment/state_machine.hpp>

namespace steward::deployment {

bool requires_rollback(const schema::deployment_state_t state) {
  using enum schema::deployment_state_t;
  switch (state) {
    case stopping_old:
    case provisioning:
    case migrating:
    case starting:
    case health_checking:
      return true;
    default:
      return false;
  }
}

schema::deployment_state_t next_state(const schema::deployment_state_t current,
                                      const bool ok,
                                      const bool snapshot_available) {
  using enum schema::deployment_state_t;
  if (schema::is_terminal(current)) {
    return current;
  }
  if (current == rolling_back) {
    return ok ? rolled_back : failed;
  }
  if (!ok) {
    if (requires_rollback(current) && snapshot_available) {
      return rolling_back;
    }
    return failed;
  }
  switch (current) {
    case validating:
      return backing_up;
    case backing_up:
      return stopping_old;
    case stopping_old:
      return provisioning;
    case provisioning:
      return migrating;
    case migrating:
      return starting;
    case starting:
      return health_checking;
    case health_checking:
      return succeeded;
    default:
      return failed;
  }
}

}  // namespace steward::deployment
