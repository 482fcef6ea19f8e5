#include "uuid.hpp"

#include <random>

#include "internal/util/errors.hpp"

namespace aoef::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

std::optional<UUID> TryFromString(std::string_view str) {
  if (str.size() != 32 && str.size() != 36) {
    return std::nullopt;
  }

  UUID   id{};
  size_t nibble = 0;
  for (size_t i = 0; i < str.size(); ++i) {
    const char c = str[i];
    if (str.size() == 36 && (i == 8 || i == 13 || i == 18 || i == 23)) {
      if (c != '-') return std::nullopt;
      continue;
    }

    const int value = HexNibble(c);
    if (value < 0 || nibble >= 32) return std::nullopt;

    if (nibble % 2 == 0) {
      id[nibble / 2] = static_cast<uint8_t>(value << 4);
    } else {
      id[nibble / 2] |= static_cast<uint8_t>(value);
    }
    ++nibble;
  }

  if (nibble != 32) return std::nullopt;
  return id;
}

UUID FromString(std::string_view str) {
  auto id = TryFromString(str);
  if (!id) {
    throw MalformedDocumentError("Invalid UUID string: '" + std::string(str) + "'");
  }
  return *id;
}

} // namespace aoef::util
