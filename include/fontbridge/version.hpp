#pragma once

// fontbridge/version.hpp — Version constants for every external surface.
//
// Bump the matching constant when a surface changes shape:
//   HOST_CONTRACT_VERSION    argv form passed to the host and the output-file
//                            result shape.
//   RPC_PROTOCOL_VERSION     MCP revision announced in "initialize".
//   EVENT_LOG_VERSION        JSONL record shape in FONTBRIDGE_EVENT_LOG.

#include <cstdint>
#include <string>

#include "fontbridge/jsonlite.hpp"

namespace fontbridge {
namespace version {

constexpr const char *SERVER_NAME = "fontbridge";
constexpr const char *SERVER_SEMVER = "0.3.0";
constexpr const char *RPC_PROTOCOL_VERSION = "2024-11-05";
constexpr uint32_t HOST_CONTRACT_VERSION = 1;
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  std::string server_name{SERVER_NAME};
  std::string server_semver{SERVER_SEMVER};
  std::string rpc_protocol{RPC_PROTOCOL_VERSION};
  uint32_t host_contract{HOST_CONTRACT_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

jsonlite::Value manifest_to_value(const VersionManifest &m);

} // namespace version
} // namespace fontbridge
