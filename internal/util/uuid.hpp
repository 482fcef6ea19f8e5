#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace aoef::util {

/*
  UUID helpers

  Domain objects carry raw 16 byte RFC4122 UUIDs; exchange records carry the
  canonical 8-4-4-4-12 lowercase hex form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Throws MalformedDocumentError on anything but 32 hex digits (dashes allowed
// in the canonical positions).
UUID FromString(std::string_view str);

std::optional<UUID> TryFromString(std::string_view str);

} // namespace aoef::util
