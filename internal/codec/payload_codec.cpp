#include "payload_codec.hpp"

#include <vector>

#include "internal/crypto/sha256.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::codec {

namespace {

constexpr std::size_t kHeaderBytes = 5;
constexpr uint32_t    kMaxRawBytes = 256U * 1024 * 1024;

template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::CodecError(result.status().ToString());
  return std::move(*result);
}

} // namespace

PayloadCodec::PayloadCodec(Kind kind) : kind_(kind) {
}

PayloadCodec PayloadCodec::FromConfig(edgesync::runtime::config::PayloadCompression compression) {
  using namespace edgesync::runtime::config;
  switch (compression) {
    case PAYLOAD_COMPRESSION_NONE:
      return PayloadCodec(Kind::kNone);
    case PAYLOAD_COMPRESSION_LZ4:
      return PayloadCodec(Kind::kLz4);
    case PAYLOAD_COMPRESSION_ZSTD:
    case PAYLOAD_COMPRESSION_UNSPECIFIED:
    default:
      return PayloadCodec(Kind::kZstd);
  }
}

arrow::Result<std::unique_ptr<arrow::util::Codec>> PayloadCodec::MakeCodec(Kind kind) {
  switch (kind) {
    case Kind::kZstd:
      return arrow::util::Codec::Create(arrow::Compression::ZSTD);
    case Kind::kLz4:
      return arrow::util::Codec::Create(arrow::Compression::LZ4_FRAME);
    case Kind::kNone:
    default:
      return arrow::util::Codec::Create(arrow::Compression::UNCOMPRESSED);
  }
}

std::string PayloadCodec::Compress(std::string_view raw) const {
  if (raw.size() > kMaxRawBytes) {
    throw util::CodecError("payload too large to compress");
  }

  std::string blob;
  blob.push_back(static_cast<char>(kind_));
  util::AppendU32BE(blob, static_cast<uint32_t>(raw.size()));

  if (kind_ == Kind::kNone || raw.empty()) {
    blob.append(raw);
    return blob;
  }

  auto       codec   = Unwrap(MakeCodec(kind_));
  const auto* input  = reinterpret_cast<const uint8_t*>(raw.data());
  const auto  max_len = codec->MaxCompressedLen(static_cast<int64_t>(raw.size()), input);

  std::vector<uint8_t> out(static_cast<std::size_t>(max_len));
  const auto written = Unwrap(codec->Compress(static_cast<int64_t>(raw.size()), input, max_len, out.data()));

  blob.append(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
  return blob;
}

std::string PayloadCodec::Decompress(std::string_view blob) {
  if (blob.size() < kHeaderBytes) {
    throw util::CodecError("payload blob truncated");
  }

  const auto     kind    = static_cast<Kind>(static_cast<uint8_t>(blob[0]));
  const uint32_t raw_len = util::ReadU32BE(blob.substr(1));
  const auto     body    = blob.substr(kHeaderBytes);

  if (raw_len > kMaxRawBytes) {
    throw util::CodecError("payload blob declares oversized body");
  }
  if (kind != Kind::kNone && kind != Kind::kZstd && kind != Kind::kLz4) {
    throw util::CodecError("unknown payload codec: " + std::to_string(static_cast<int>(kind)));
  }

  if (kind == Kind::kNone || raw_len == 0) {
    if (body.size() != raw_len) {
      throw util::CodecError("payload blob length mismatch");
    }
    return std::string(body);
  }

  auto        codec = Unwrap(MakeCodec(kind));
  std::string raw(raw_len, '\0');
  const auto  n = Unwrap(codec->Decompress(static_cast<int64_t>(body.size()), reinterpret_cast<const uint8_t*>(body.data()),
                                           static_cast<int64_t>(raw_len), reinterpret_cast<uint8_t*>(raw.data())));
  if (static_cast<uint32_t>(n) != raw_len) {
    throw util::CodecError("payload decompressed to unexpected size");
  }
  return raw;
}

model::Hash256 PayloadCodec::Digest(std::string_view raw) {
  return crypto::Sha256(raw);
}

} // namespace edgesync::codec
