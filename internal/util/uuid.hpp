#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace gigbook::util {

/*
  UUID helpers

  Entity ids are RFC4122 version 4 UUIDs in canonical lowercase text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// 8-4-4-4-12 hex form, any case.
bool IsUuidString(std::string_view str);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace gigbook::util
