#include "media_storage.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string_view>

#include "image_codec.hpp"
#include "internal/observability/logging.hpp"

namespace gigbook::media {

namespace {

constexpr std::array<std::string_view, 4> kAudioTypes = {"audio/webm", "audio/mp4", "audio/mpeg", "audio/wav"};
constexpr std::array<std::string_view, 3> kImageTypes = {"image/jpeg", "image/png", "image/webp"};

template <size_t N>
bool Contains(const std::array<std::string_view, N>& list, std::string_view value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

std::string MiB(uint64_t bytes) {
  return std::to_string(bytes / (1024 * 1024)) + "MB";
}

} // namespace

MediaStorage::MediaStorage(std::shared_ptr<blob::BlobStore> blobs, gigbook::runtime::config::MediaConfig config)
    : blobs_(std::move(blobs)), config_(std::move(config)) {
  if (!blobs_) throw std::invalid_argument("MediaStorage requires a blob store");
}

ImageOptions MediaStorage::DefaultImageOptions() const {
  return ImageOptions{config_.image_max_width(), config_.image_quality()};
}

db::Result MediaStorage::ValidateMediaFile(uint64_t size_bytes, const std::string& mime_type) const {
  if (Contains(kAudioTypes, mime_type)) {
    if (size_bytes > config_.max_audio_bytes()) {
      return db::Result::Err(db::ErrorCode::ValidationFailure, "audio file too large (max " + MiB(config_.max_audio_bytes()) + ")");
    }
    return db::Result::Ok();
  }
  if (Contains(kImageTypes, mime_type)) {
    if (size_bytes > config_.max_image_bytes()) {
      return db::Result::Err(db::ErrorCode::ValidationFailure, "image file too large (max " + MiB(config_.max_image_bytes()) + ")");
    }
    return db::Result::Ok();
  }
  return db::Result::Err(db::ErrorCode::ValidationFailure, "unsupported media type: " + mime_type);
}

util::Outcome<std::string> MediaStorage::StoreAudio(std::string bytes, const std::string& mime_type) {
  if (!Contains(kAudioTypes, mime_type)) {
    return util::Outcome<std::string>::Err(db::ErrorCode::ValidationFailure, "not an audio type: " + mime_type);
  }
  auto valid = ValidateMediaFile(bytes.size(), mime_type);
  if (!valid) return util::Outcome<std::string>::From(valid);

  auto key = blobs_->StoreBlob(blob::BlobStore::GenerateKey("audio"), std::move(bytes), mime_type);
  return util::Outcome<std::string>::Ok(std::move(key));
}

util::Outcome<StoredImage> MediaStorage::StoreImage(const std::string& bytes) {
  return StoreImage(bytes, DefaultImageOptions());
}

util::Outcome<StoredImage> MediaStorage::StoreImage(const std::string& bytes, const ImageOptions& options) {
  if (bytes.size() > config_.max_image_bytes()) {
    return util::Outcome<StoredImage>::Err(db::ErrorCode::ValidationFailure, "image file too large (max " + MiB(config_.max_image_bytes()) + ")");
  }
  if (options.quality < 0.0 || options.quality > 1.0) {
    return util::Outcome<StoredImage>::Err(db::ErrorCode::ValidationFailure, "image quality must be within 0..1");
  }

  std::string error;
  auto        decoded = DecodeImage(bytes, config_.max_image_pixels(), &error);
  if (!decoded) {
    return util::Outcome<StoredImage>::Err(db::ErrorCode::ValidationFailure, "cannot decode image: " + error);
  }

  auto        scaled  = Downscale(*decoded, options.max_width);
  std::string encoded = EncodeJpeg(scaled, options.quality);

  StoredImage stored;
  stored.width      = scaled.width;
  stored.height     = scaled.height;
  stored.size_bytes = encoded.size();
  stored.key        = blobs_->StoreBlob(blob::BlobStore::GenerateKey("image"), std::move(encoded), "image/jpeg");

  GIGBOOK_LOG_DEBUG("image stored", {observability::StringField("key", stored.key),
                                     observability::IntField("source_width", decoded->width),
                                     observability::IntField("width", stored.width),
                                     observability::IntField("bytes_in", static_cast<int64_t>(bytes.size())),
                                     observability::IntField("bytes_out", static_cast<int64_t>(stored.size_bytes))});
  return util::Outcome<StoredImage>::Ok(std::move(stored));
}

std::optional<blob::StoredBlob> MediaStorage::GetMedia(const std::string& key) {
  return blobs_->GetBlob(key);
}

void MediaStorage::DeleteMedia(const std::string& key) {
  blobs_->DeleteBlob(key);
}

} // namespace gigbook::media
