#pragma once

#include <gatepass/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gatepass::schema {

enum class revoke_result_t : uint8_t {
  revoked = 0,
  already_consumed = 1,
  not_found = 2
};

inline constexpr auto kRevokeResultMappings = std::array{
    std::pair<std::string_view, revoke_result_t>{"revoked",
                                        revoke_result_t::revoked},
    std::pair<std::string_view, revoke_result_t>{"already_consumed",
                                        revoke_result_t::already_consumed},
    std::pair<std::string_view, revoke_result_t>{"not_found",
                                        revoke_result_t::not_found}};

template <>
inline std::optional<revoke_result_t> try_from_string<revoke_result_t>(
    const std::string_view value) {
  return from_string(value, kRevokeResultMappings);
}

inline constexpr std::string_view to_string(const revoke_result_t value) {
  return to_string(value, kRevokeResultMappings).value_or("unknown");
}

}  // namespace gatepass::schema
