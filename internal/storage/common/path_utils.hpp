#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace gigbook::storage::common {

inline void ValidateBlobKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("blob key must not be empty");
  }
  for (char c : key) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("blob key contains invalid character");
    }
  }
  if (key == "." || key == "..") {
    throw std::invalid_argument("blob key must not be a relative path component");
  }
}

inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& key) {
  ValidateBlobKey(key);
  return root / (key + ".bin");
}

} // namespace gigbook::storage::common
