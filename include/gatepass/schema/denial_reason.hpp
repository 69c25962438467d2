#pragma once

#include <gatepass/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: denial reason.
// Reason codes recorded with every denied scan attempt.
namespace gatepass::schema {

enum class denial_reason_t : uint16_t {
  malformed = 1,
  tag_mismatch = 2,
  unsupported = 3,
  duplicate_scan = 4,
  revoked = 5,
  expired = 6,
  unknown_credential = 7
};

inline constexpr auto kDenialReasonMappings = std::array{
    std::pair<std::string_view, denial_reason_t>{"malformed",
                                        denial_reason_t::malformed},
    std::pair<std::string_view, denial_reason_t>{"tag_mismatch",
                                        denial_reason_t::tag_mismatch},
    std::pair<std::string_view, denial_reason_t>{"unsupported",
                                        denial_reason_t::unsupported},
    std::pair<std::string_view, denial_reason_t>{"duplicate_scan",
                                        denial_reason_t::duplicate_scan},
    std::pair<std::string_view, denial_reason_t>{"revoked",
                                        denial_reason_t::revoked},
    std::pair<std::string_view, denial_reason_t>{"expired",
                                        denial_reason_t::expired},
    std::pair<std::string_view, denial_reason_t>{"unknown_credential",
                                        denial_reason_t::unknown_credential}};

template <>
inline std::optional<denial_reason_t> try_from_string<denial_reason_t>(
    const std::string_view value) {
  return from_string(value, kDenialReasonMappings);
}

inline constexpr std::string_view to_string(const denial_reason_t value) {
  return to_string(value, kDenialReasonMappings).value_or("unknown");
}

}  // namespace gatepass::schema
