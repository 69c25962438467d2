#pragma once

#include <gatepass/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Result of the atomic check-and-set on a credential.
namespace gatepass::schema {

enum class consume_result_t : uint8_t {
  consumed = 0,
  already_consumed = 1,
  revoked = 2,
  expired = 3,
  not_found = 4
};

inline constexpr auto kConsumeResultMappings = std::array{
    std::pair<std::string_view, consume_result_t>{"consumed",
                                        consume_result_t::consumed},
    std::pair<std::string_view, consume_result_t>{"already_consumed",
                                        consume_result_t::already_consumed},
    std::pair<std::string_view, consume_result_t>{"revoked",
                                        consume_result_t::revoked},
    std::pair<std::string_view, consume_result_t>{"expired",
                                        consume_result_t::expired},
    std::pair<std::string_view, consume_result_t>{"not_found",
                                        consume_result_t::not_found}};

template <>
inline std::optional<consume_result_t> try_from_string<consume_result_t>(
    const std::string_view value) {
  return from_string(value, kConsumeResultMappings);
}

inline constexpr std::string_view to_string(const consume_result_t value) {
  return to_string(value, kConsumeResultMappings).value_or("unknown");
}

}  // namespace gatepass::schema
