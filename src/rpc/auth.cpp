#include <gatepass/blake3/hash.hpp>
#include <gatepass/crypto/random.hpp>
#include <gatepass/rpc/auth.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace gatepass::rpc {

namespace {

inline constexpr auto kBearerPrefix = std::string_view{"Bearer "};

std::optional<std::string_view> find_header(const client_metadata_t& metadata,
                                            const std::string_view name) {
  auto found = metadata.find(grpc::string_ref{name.data(), name.size()});
  if (found == std::end(metadata)) {
    return std::nullopt;
  }
  return std::string_view{found->second.data(), found->second.size()};
}

bool is_valid_operator_id(const std::string_view value) {
  return !value.empty() && value.size() <= kMaxOperatorIdLength &&
         std::all_of(std::begin(value), std::end(value), [](const char c) {
           return c > 0x20 && c < 0x7F;
         });
}

}  // namespace

std::optional<gatepass::admin::admin_context> authenticate_admin(
    const client_metadata_t& metadata,
    const std::string_view admin_token) {
  if (admin_token.empty()) {
    return std::nullopt;
  }
  auto authorization = find_header(metadata, kAuthorizationHeader);
  if (!authorization || !authorization->starts_with(kBearerPrefix)) {
    return std::nullopt;
  }
  auto presented = authorization->substr(kBearerPrefix.size());
  // Digest first: constant_time_equal needs equal lengths.
  auto presented_digest = gatepass::blake3::hash(presented);
  auto expected_digest = gatepass::blake3::hash(admin_token);
  if (!gatepass::crypto::constant_time_equal(
          gatepass::schema::bytes_view_t{presented_digest.data(),
                                         presented_digest.size()},
          gatepass::schema::bytes_view_t{expected_digest.data(),
                                         expected_digest.size()})) {
    spdlog::warn("Rejected admin request with a wrong bearer token");
    return std::nullopt;
  }

  auto context = gatepass::admin::admin_context{
      .operator_id = std::string{kDefaultOperatorId}};
  if (auto operator_id = find_header(metadata, kOperatorHeader)) {
    if (!is_valid_operator_id(*operator_id)) {
      return std::nullopt;
    }
    context.operator_id = std::string{*operator_id};
  }
  return context;
}

}  // namespace gatepass::rpc
