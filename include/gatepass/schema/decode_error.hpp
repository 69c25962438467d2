#pragma once

#include <gatepass/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gatepass::schema {

enum class decode_error_t : uint8_t {
  malformed = 1,
  tag_mismatch = 2,
  unsupported = 3
};

inline constexpr auto kDecodeErrorMappings = std::array{
    std::pair<std::string_view, decode_error_t>{"malformed",
                                        decode_error_t::malformed},
    std::pair<std::string_view, decode_error_t>{"tag_mismatch",
                                        decode_error_t::tag_mismatch},
    std::pair<std::string_view, decode_error_t>{"unsupported",
                                        decode_error_t::unsupported}};

template <>
inline std::optional<decode_error_t> try_from_string<decode_error_t>(
    const std::string_view value) {
  return from_string(value, kDecodeErrorMappings);
}

inline constexpr std::string_view to_string(const decode_error_t value) {
  return to_string(value, kDecodeErrorMappings).value_or("unknown");
}

}  // namespace gatepass::schema
