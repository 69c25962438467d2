#pragma once

#include <gatepass/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: scan source.
// Which ingestion path delivered the payload; used only for audit tagging.
namespace gatepass::schema {

enum class scan_source_t : uint8_t {
  local_camera = 0,
  mobile_upload = 1
};

inline constexpr auto kScanSourceMappings = std::array{
    std::pair<std::string_view, scan_source_t>{"local_camera",
                                        scan_source_t::local_camera},
    std::pair<std::string_view, scan_source_t>{"mobile_upload",
                                        scan_source_t::mobile_upload}};

template <>
inline std::optional<scan_source_t> try_from_string<scan_source_t>(
    const std::string_view value) {
  return from_string(value, kScanSourceMappings);
}

inline constexpr std::string_view to_string(const scan_source_t value) {
  return to_string(value, kScanSourceMappings).value_or("unknown");
}

}  // namespace gatepass::schema
