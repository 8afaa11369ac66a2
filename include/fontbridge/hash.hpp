#pragma once

// fontbridge/hash.hpp — BLAKE3 digests.
//
// Execution ids are domain-separated digests of the script body, so a call can
// be correlated across log lines without the body itself ever being logged.

#include <string>
#include <string_view>

namespace fontbridge {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// blake3_hex(domain + payload). Domains in use: "script:".
std::string hash_domain(std::string_view domain, std::string_view payload);

// hash_domain("script:", body).
std::string script_digest(std::string_view script_body);

} // namespace fontbridge
