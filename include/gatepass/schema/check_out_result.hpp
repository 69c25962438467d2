#pragma once

#include <gatepass/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gatepass::schema {

enum class check_out_result_t : uint8_t {
  checked_out = 0,
  already_checked_out = 1,
  not_checked_in = 2,
  not_found = 3
};

inline constexpr auto kCheckOutResultMappings = std::array{
    std::pair<std::string_view, check_out_result_t>{"checked_out",
                                        check_out_result_t::checked_out},
    std::pair<std::string_view, check_out_result_t>{"already_checked_out",
                                        check_out_result_t::already_checked_out},
    std::pair<std::string_view, check_out_result_t>{"not_checked_in",
                                        check_out_result_t::not_checked_in},
    std::pair<std::string_view, check_out_result_t>{"not_found",
                                        check_out_result_t::not_found}};

template <>
inline std::optional<check_out_result_t> try_from_string<check_out_result_t>(
    const std::string_view value) {
  return from_string(value, kCheckOutResultMappings);
}

inline constexpr std::string_view to_string(const check_out_result_t value) {
  return to_string(value, kCheckOutResultMappings).value_or("unknown");
}

}  // namespace gatepass::schema
