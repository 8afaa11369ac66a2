#include "fontbridge/version.hpp"

#include "fontbridge/hash.hpp"

namespace fontbridge {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.hash_primitive = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

jsonlite::Value manifest_to_value(const VersionManifest &m) {
  jsonlite::Object o;
  o["server_name"] = m.server_name;
  o["server_semver"] = m.server_semver;
  o["rpc_protocol"] = m.rpc_protocol;
  o["host_contract"] = m.host_contract;
  o["event_log"] = m.event_log;
  o["hash_primitive"] = m.hash_primitive;
  o["build_timestamp"] = m.build_timestamp;
  return jsonlite::Value{std::move(o)};
}

} // namespace version
} // namespace fontbridge
