#pragma once

#include <gatepass/schema/enum_string.hpp>

#include <array>
#include <cstddef>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace gatepass::schema::encoding::scale {

template <typename Enum>
void encode_enum(const Enum value, ::scale::Encoder& encoder) {
  encode(static_cast<std::underlying_type_t<Enum>>(value), encoder);
}

/// Decode the underlying integer and reject values outside the mapping table.
template <typename Enum, std::size_t N>
void decode_enum(
    Enum& value,
    ::scale::Decoder& decoder,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  auto raw = std::underlying_type_t<Enum>{};
  decode(raw, decoder);
  auto candidate = static_cast<Enum>(raw);
  if (!gatepass::schema::to_string(candidate, mappings).has_value()) {
    throw std::system_error{std::make_error_code(std::errc::invalid_argument),
                            "unknown enum value"};
  }
  value = candidate;
}

}  // namespace gatepass::schema::encoding::scale
