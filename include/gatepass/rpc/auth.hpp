#pragma once

#include <gatepass/admin/admin_context.hpp>

#include <grpcpp/support/string_ref.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gatepass::rpc {

inline constexpr auto kAuthorizationHeader = std::string_view{"authorization"};
inline constexpr auto kOperatorHeader = std::string_view{"x-operator-id"};
inline constexpr auto kDefaultOperatorId = std::string_view{"admin"};
inline constexpr auto kMaxOperatorIdLength = size_t{64};

using client_metadata_t = std::multimap<grpc::string_ref, grpc::string_ref>;

/// Build an admin_context from request metadata. std::nullopt unless a
/// "Bearer" token matching `admin_token` is present. An empty configured
/// token disables the admin surface entirely.
std::optional<gatepass::admin::admin_context> authenticate_admin(
    const client_metadata_t& metadata,
    std::string_view admin_token);

}  // namespace gatepass::rpc
