#pragma once

// fontbridge/rpc_server.hpp — Newline-delimited JSON-RPC 2.0 over stdio.
//
// Implements the tool/resource subset of the Model Context Protocol:
// initialize, notifications/initialized, ping, tools/list, tools/call,
// resources/list, resources/read.
//
// THREADING:
//   tools/call and resources/read run on their own detached thread so that
//   several calls can wait in the bridge at once. At most max_in_flight such
//   threads exist; when the cap is reached the reader stops reading until one
//   finishes. A request whose thread cannot be created is answered with
//   internal_error on the reader thread. Everything else is answered on the
//   reader thread. Response lines are written under out_mu_, one complete
//   line per write. serve() returns only after every spawned request has
//   answered.
//
// Nothing but protocol frames is written to the output stream.

#include <condition_variable>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

#include "fontbridge/jsonlite.hpp"
#include "fontbridge/operations.hpp"

namespace fontbridge {

namespace rpc_error {
constexpr int parse_error = -32700;
constexpr int invalid_request = -32600;
constexpr int method_not_found = -32601;
constexpr int invalid_params = -32602;
constexpr int internal_error = -32603;
} // namespace rpc_error

class RpcServer {
public:
  static constexpr std::size_t kDefaultMaxInFlight = 32;

  // Throws ConfigError when max_in_flight is 0.
  RpcServer(OperationDispatcher &dispatcher, std::ostream &out,
            std::size_t max_in_flight = kDefaultMaxInFlight);
  RpcServer(const RpcServer &) = delete;
  RpcServer &operator=(const RpcServer &) = delete;

  // Reads requests until EOF. Returns the process exit code.
  int serve(std::istream &in);

  // Handles one frame synchronously. Returns the response line (without the
  // trailing newline), or nullopt for notifications.
  std::optional<std::string> handle_line(const std::string &line);

  std::size_t max_in_flight() const { return max_in_flight_; }
  // Highest number of dispatch threads alive at once during serve().
  std::size_t peak_in_flight() const;

private:
  std::optional<jsonlite::Value> handle_request(const jsonlite::Value &request);
  jsonlite::Value dispatch(const std::string &method, const jsonlite::Value &params);

  jsonlite::Value tools_call(const jsonlite::Value &params);
  jsonlite::Value resources_read(const jsonlite::Value &params);

  void send(const std::string &line);
  void dispatch_detached(jsonlite::Value request);

  OperationDispatcher &dispatcher_;
  std::ostream &out_;
  std::mutex out_mu_;

  const std::size_t max_in_flight_;
  mutable std::mutex pending_mu_;
  std::condition_variable pending_cv_;
  std::size_t pending_{0};
  std::size_t peak_pending_{0};
};

// Builds a JSON-RPC error response. id may be null.
jsonlite::Value make_error_response(const jsonlite::Value &id, int code,
                                    const std::string &message);

} // namespace fontbridge
