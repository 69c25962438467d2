#pragma once

#include <gatepass/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gatepass::admin {

enum class admin_error_t : uint8_t {
  invalid_subject = 1,
  invalid_ttl = 2,
  invalid_phone = 3,
  invalid_purpose = 4
};

inline constexpr auto kAdminErrorMappings = std::array{
    std::pair<std::string_view, admin_error_t>{"invalid_subject",
                                               admin_error_t::invalid_subject},
    std::pair<std::string_view, admin_error_t>{"invalid_ttl",
                                               admin_error_t::invalid_ttl},
    std::pair<std::string_view, admin_error_t>{"invalid_phone",
                                               admin_error_t::invalid_phone},
    std::pair<std::string_view, admin_error_t>{
        "invalid_purpose", admin_error_t::invalid_purpose}};

inline constexpr std::string_view to_string(const admin_error_t value) {
  return gatepass::schema::to_string(value, kAdminErrorMappings)
      .value_or("unknown");
}

}  // namespace gatepass::admin
