#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace mediacache::config {

namespace {

constexpr uint64_t kDefaultChunkSize          = 10ull * 1024 * 1024;
constexpr uint64_t kDefaultDirectReadBytes    = 50ull * 1024 * 1024;
constexpr uint64_t kDefaultWaitTimeoutMs      = 30000;
constexpr uint32_t kDefaultRetryAfterSeconds  = 5;
constexpr uint32_t kDefaultProxyPort          = 8787;
constexpr uint32_t kDefaultMaxConcurrent      = 3;
constexpr uint32_t kDefaultLookaheadChunks    = 10;
constexpr uint32_t kDefaultMaxAttempts        = 3;
constexpr uint64_t kDefaultInitialBackoffMs   = 500;
constexpr uint64_t kDefaultMaxBackoffMs       = 30000;
constexpr double   kDefaultBackoffMultiplier  = 2.0;
constexpr uint64_t kDefaultConnectTimeoutMs   = 10000;
constexpr uint64_t kDefaultTransferTimeoutMs  = 300000;
constexpr uint64_t kDefaultStatsIntervalMs    = 30000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

mediacache::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  mediacache::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(mediacache::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("127.0.0.1:50061");

  auto* proxy = config.mutable_proxy();
  if (proxy->bind_address().empty()) proxy->set_bind_address("127.0.0.1");
  if (proxy->port() == 0) proxy->set_port(kDefaultProxyPort);
  if (proxy->advertise_host().empty()) proxy->set_advertise_host("127.0.0.1");
  if (proxy->direct_read_threshold_bytes() == 0) proxy->set_direct_read_threshold_bytes(kDefaultDirectReadBytes);
  if (proxy->chunk_wait_timeout_ms() == 0) proxy->set_chunk_wait_timeout_ms(kDefaultWaitTimeoutMs);
  if (proxy->retry_after_seconds() == 0) proxy->set_retry_after_seconds(kDefaultRetryAfterSeconds);

  auto* cache = config.mutable_cache();
  if (cache->directory().empty()) cache->set_directory("./mediacache-data");
  if (cache->chunk_size_bytes() == 0) cache->set_chunk_size_bytes(kDefaultChunkSize);
  if (cache->max_concurrent_downloads() == 0) cache->set_max_concurrent_downloads(kDefaultMaxConcurrent);
  if (cache->lookahead_chunks() == 0) cache->set_lookahead_chunks(kDefaultLookaheadChunks);

  auto* downloader = config.mutable_downloader();
  if (downloader->max_attempts() == 0) downloader->set_max_attempts(kDefaultMaxAttempts);
  if (downloader->initial_backoff_ms() == 0) downloader->set_initial_backoff_ms(kDefaultInitialBackoffMs);
  if (downloader->max_backoff_ms() == 0) downloader->set_max_backoff_ms(kDefaultMaxBackoffMs);
  if (downloader->backoff_multiplier() <= 0.0) downloader->set_backoff_multiplier(kDefaultBackoffMultiplier);
  if (downloader->connect_timeout_ms() == 0) downloader->set_connect_timeout_ms(kDefaultConnectTimeoutMs);
  if (downloader->transfer_timeout_ms() == 0) downloader->set_transfer_timeout_ms(kDefaultTransferTimeoutMs);
  if (downloader->user_agent().empty()) downloader->set_user_agent("mediacache/0.1");

  auto* stats = config.mutable_stats();
  if (stats->interval_ms() == 0) stats->set_interval_ms(kDefaultStatsIntervalMs);
}

} // namespace mediacache::config
