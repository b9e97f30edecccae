#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/chain/chain_builder.hpp"
#include "internal/chain/chain_verifier.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/factory.hpp"
#include "internal/model/priority.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

using edgesync::runtime::config::RuntimeConfig;

static void Usage() {
  std::cout << "Usage:\n"
            << "  edgesyncctl keygen <private.pem> <public.bin>\n"
            << "  edgesyncctl verify <db> <public.bin>\n"
            << "  edgesyncctl stats <db>\n"
            << "  edgesyncctl publish <config.yaml> <priority 0-5> <type> <file>\n"
            << "types: evidence detection health_alert track_history telemetry debug_log\n";
}

static RuntimeConfig SqliteConfig(const std::string& path) {
  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(path);
  edgesync::config::ConfigLoader::ApplyDefaults(config);
  return config;
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static edgesync::v1::MessageType ParseType(std::string name) {
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  edgesync::v1::MessageType type;
  if (!edgesync::v1::MessageType_Parse("MESSAGE_TYPE_" + name, &type)) {
    throw std::invalid_argument("unknown message type: " + name);
  }
  return type;
}

static int Keygen(const std::string& private_path, const std::string& public_path) {
  auto key = edgesync::crypto::Ed25519Signer::Generate();
  key->SavePem(private_path);
  edgesync::crypto::SavePublicKey(key->Public(), public_path);
  std::cout << "public key " << edgesync::util::HexEncode(key->Public()) << "\n";
  return 0;
}

static int Verify(const std::string& db_path, const std::string& public_path) {
  auto store   = edgesync::factory::BuildStore(SqliteConfig(db_path));
  auto records = store->IterChained();

  edgesync::chain::ChainVerifier verifier(edgesync::crypto::LoadPublicKey(public_path));
  try {
    const auto checked = verifier.VerifySegments(records);
    const auto head    = store->ChainHead();
    if (!records.empty() && records.back().sequence > head.last_sequence) {
      throw edgesync::util::ChainIntegrityViolation("stored record beyond chain head", records.back().sequence);
    }
    std::cout << "ok: " << checked << " records verified, head sequence " << head.last_sequence << "\n";
    return 0;
  } catch (const edgesync::util::ChainIntegrityViolation& e) {
    std::cerr << "chain integrity violation at sequence " << e.Sequence() << ": " << e.what() << "\n";
    return 3;
  }
}

static int Stats(const std::string& db_path) {
  auto store = edgesync::factory::BuildStore(SqliteConfig(db_path));
  auto head  = store->ChainHead();

  std::cout << "used_bytes     " << store->UsedBytes() << "\n"
            << "head_sequence  " << head.last_sequence << "\n"
            << "head_hash      " << edgesync::util::HexEncode(head.last_hash) << "\n"
            << "pending        " << store->Pending().size() << "\n";
  for (std::uint8_t p = 0; p < edgesync::model::kPriorityCount; ++p) {
    std::cout << "P" << static_cast<int>(p) << " " << edgesync::model::ClassOf(p).data_class << " " << store->CountByPriority(p) << "\n";
  }
  return 0;
}

static int Publish(const std::string& config_path, const std::string& priority_arg, const std::string& type_arg,
                   const std::string& file) {
  auto config = edgesync::config::ConfigLoader::LoadFromYaml(config_path);

  const int priority = std::stoi(priority_arg);
  if (!edgesync::model::IsValidPriority(priority)) {
    throw std::invalid_argument("priority must be 0-5");
  }
  const auto type = ParseType(type_arg);
  const auto raw  = ReadFile(file);

  auto store = edgesync::factory::BuildStore(config);
  auto chain = std::make_shared<edgesync::chain::ChainBuilder>(store, edgesync::factory::LoadNodeKey(config));

  const auto now = edgesync::util::Now();

  edgesync::model::SyncRecord record;
  record.id           = edgesync::util::GenerateUUIDv7(now);
  record.priority     = static_cast<std::uint8_t>(priority);
  record.msg_type     = type;
  record.payload      = edgesync::codec::PayloadCodec::FromConfig(config.storage().compression()).Compress(raw);
  record.digest       = edgesync::codec::PayloadCodec::Digest(raw);
  record.timestamp_ms = edgesync::util::ToUnixMillis(now);

  store->Append(record);
  const auto chained = chain->ChainAppend(record);
  std::cout << edgesync::util::ToString(chained.id) << " sequence " << chained.sequence << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[1];

  try {
    if (cmd == "keygen" && argc == 4) return Keygen(argv[2], argv[3]);
    if (cmd == "verify" && argc == 4) return Verify(argv[2], argv[3]);
    if (cmd == "stats" && argc == 3) return Stats(argv[2]);
    if (cmd == "publish" && argc == 6) return Publish(argv[2], argv[3], argv[4], argv[5]);
  } catch (const std::exception& e) {
    std::cerr << cmd << " failed: " << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
