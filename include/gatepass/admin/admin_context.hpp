#pragma once

#include <string>

namespace gatepass::admin {

/// Request-scoped proof that the caller authenticated as an administrator.
/// Built by the RPC layer after the bearer token check; never stored.
struct admin_context final {
  std::string operator_id;
};

}  // namespace gatepass::admin
