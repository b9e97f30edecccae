#pragma once

#include <arrow/result.h>
#include <arrow/util/compression.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "internal/model/sync_record.hpp"

namespace edgesync::codec {

/*
  Payload blob framing (opaque to the sync path):

    codec     1   0 none, 1 zstd, 2 lz4-frame
    raw_len   4   big-endian uncompressed length
    body      n   codec output

  Compression goes through arrow::util::Codec.
*/
class PayloadCodec {
 public:
  enum class Kind : uint8_t {
    kNone = 0,
    kZstd = 1,
    kLz4  = 2,
  };

  explicit PayloadCodec(Kind kind);
  static PayloadCodec FromConfig(edgesync::runtime::config::PayloadCompression compression);

  Kind kind() const {
    return kind_;
  }

  std::string Compress(std::string_view raw) const;

  // Accepts blobs from any codec kind, not only this instance's.
  static std::string Decompress(std::string_view blob);

  // SHA-256 of the uncompressed payload.
  static model::Hash256 Digest(std::string_view raw);

 private:
  static arrow::Result<std::unique_ptr<arrow::util::Codec>> MakeCodec(Kind kind);

  Kind kind_;
};

} // namespace edgesync::codec
