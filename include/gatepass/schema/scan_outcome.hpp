#pragma once

#include <gatepass/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gatepass::schema {

enum class scan_outcome_t : uint8_t {
  admitted = 0,
  denied = 1,
  unavailable = 2
};

inline constexpr auto kScanOutcomeMappings = std::array{
    std::pair<std::string_view, scan_outcome_t>{"admitted",
                                        scan_outcome_t::admitted},
    std::pair<std::string_view, scan_outcome_t>{"denied",
                                        scan_outcome_t::denied},
    std::pair<std::string_view, scan_outcome_t>{"unavailable",
                                        scan_outcome_t::unavailable}};

template <>
inline std::optional<scan_outcome_t> try_from_string<scan_outcome_t>(
    const std::string_view value) {
  return from_string(value, kScanOutcomeMappings);
}

inline constexpr std::string_view to_string(const scan_outcome_t value) {
  return to_string(value, kScanOutcomeMappings).value_or("unknown");
}

}  // namespace gatepass::schema
