#pragma once

#include <gatepass/schema/primitives.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace gatepass::crypto {

inline constexpr auto kTokenTagKeyContext =
    std::string_view{"gatepass 2026-01 token integrity tag v1"};
inline constexpr auto kContactSealKeyContext =
    std::string_view{"gatepass 2026-01 contact seal v1"};

/// Load the 32-byte root secret stored as 64 hex characters, creating the
/// file (mode 0600) with a fresh random secret when it does not exist.
/// Returns std::nullopt and logs when the file is unreadable or malformed.
std::optional<gatepass::schema::secret_key_t> load_or_create_secret(
    const std::filesystem::path& path);

std::optional<gatepass::schema::secret_key_t> load_secret(
    const std::filesystem::path& path);

/// Write a new secret to a file that must not exist yet.
std::optional<gatepass::schema::secret_key_t> create_secret(
    const std::filesystem::path& path);

}  // namespace gatepass::crypto
