#pragma once

#include <gatepass/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: store keys.
// Canonical key prefixes and key codecs for credential state and the scan
// attempt journal.
namespace gatepass::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kCredentialKeyPrefix{
    "SYS|STATE|CREDENTIAL|"};
inline constexpr std::string_view kAuditPrefix{"SYS|AUDIT|"};
inline constexpr std::string_view kAttemptKeyPrefix{"SYS|AUDIT|ATTEMPT|"};

inline constexpr std::array<std::string_view, 4> kStoreKeyspaces{
    kStatePrefix, kCredentialKeyPrefix, kAuditPrefix, kAttemptKeyPrefix};

gatepass::schema::bytes_t make_prefix_key(std::string_view prefix);

gatepass::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const gatepass::schema::bytes_view_t& id);

gatepass::schema::bytes_t make_credential_key(
    const gatepass::schema::credential_id_t& credential_id);

/// Attempt keys carry a big-endian sequence so byte order equals append order.
gatepass::schema::bytes_t make_attempt_key(uint64_t sequence);

std::optional<uint64_t> parse_attempt_key(
    const gatepass::schema::bytes_view_t& key);

}  // namespace gatepass::schema::key
