#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/blob/blob_store.hpp"
#include "internal/db/api/result.hpp"
#include "internal/util/outcome.hpp"

namespace gigbook::media {

struct ImageOptions {
  uint32_t max_width = 0;
  double   quality   = 0;
};

struct StoredImage {
  std::string key;
  uint32_t    width      = 0;
  uint32_t    height     = 0;
  uint64_t    size_bytes = 0;
};

/*
  Media helpers over the blob store.

  Audio is stored byte for byte. Images are decoded, shrunk to the
  configured width and re-encoded as JPEG; the original dimensions are
  not kept anywhere, callers that need them record them themselves.
*/
class MediaStorage {
 public:
  MediaStorage(std::shared_ptr<blob::BlobStore> blobs, gigbook::runtime::config::MediaConfig config);

  util::Outcome<std::string> StoreAudio(std::string bytes, const std::string& mime_type);

  util::Outcome<StoredImage> StoreImage(const std::string& bytes);
  util::Outcome<StoredImage> StoreImage(const std::string& bytes, const ImageOptions& options);

  std::optional<blob::StoredBlob> GetMedia(const std::string& key);

  void DeleteMedia(const std::string& key);

  // ValidationFailure for disallowed types or oversized files.
  db::Result ValidateMediaFile(uint64_t size_bytes, const std::string& mime_type) const;

  ImageOptions DefaultImageOptions() const;

 private:
  std::shared_ptr<blob::BlobStore>      blobs_;
  gigbook::runtime::config::MediaConfig config_;
};

} // namespace gigbook::media
