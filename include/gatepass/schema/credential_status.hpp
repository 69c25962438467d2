#pragma once

#include <gatepass/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: credential status.
// Check-in lifecycle: unused until the first admitted scan, consumed after,
// revoked when an administrator withdraws it.
namespace gatepass::schema {

enum class credential_status_t : uint8_t {
  unused = 0,
  consumed = 1,
  revoked = 2
};

inline constexpr auto kCredentialStatusMappings = std::array{
    std::pair<std::string_view, credential_status_t>{"unused",
                                        credential_status_t::unused},
    std::pair<std::string_view, credential_status_t>{"consumed",
                                        credential_status_t::consumed},
    std::pair<std::string_view, credential_status_t>{"revoked",
                                        credential_status_t::revoked}};

template <>
inline std::optional<credential_status_t> try_from_string<credential_status_t>(
    const std::string_view value) {
  return from_string(value, kCredentialStatusMappings);
}

inline constexpr std::string_view to_string(const credential_status_t value) {
  return to_string(value, kCredentialStatusMappings).value_or("unknown");
}

}  // namespace gatepass::schema
