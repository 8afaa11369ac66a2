#include "fontbridge/rpc_server.hpp"

#include <algorithm>
#include <csignal>
#include <iostream>
#include <system_error>
#include <thread>

#include "fontbridge/log.hpp"
#include "fontbridge/version.hpp"

namespace fontbridge {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

// Protocol-level failure raised inside a handler.
class RpcError : public Error {
public:
  RpcError(int code, const std::string &message) : Error(message), code_(code) {}
  int code() const noexcept { return code_; }

private:
  int code_;
};

const Object &params_object(const Value &params) {
  static const Object empty;
  if (params.is_null())
    return empty;
  if (!params.is_object())
    throw RpcError(rpc_error::invalid_params, "params must be an object");
  return std::get<Object>(params.v);
}

std::string required_string(const Object &params, const std::string &key) {
  const Value *v = jsonlite::find(params, key);
  if (!v || !v->is_string())
    throw RpcError(rpc_error::invalid_params, "Missing or invalid '" + key + "'");
  return std::get<std::string>(v->v);
}

bool runs_detached(const std::string &method) {
  return method == "tools/call" || method == "resources/read";
}

std::string method_of(const Value &request) {
  if (!request.is_object())
    return "";
  return jsonlite::get_string(std::get<Object>(request.v), "method", "");
}

// nullopt for notifications.
std::optional<Value> id_of(const Value &request) {
  if (!request.is_object())
    return Value{};
  const Value *id = jsonlite::find(std::get<Object>(request.v), "id");
  if (!id)
    return std::nullopt;
  return *id;
}

} // namespace

Value make_error_response(const Value &id, int code, const std::string &message) {
  return Object{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", Object{{"code", code}, {"message", message}}}};
}

RpcServer::RpcServer(OperationDispatcher &dispatcher, std::ostream &out,
                     std::size_t max_in_flight)
    : dispatcher_(dispatcher), out_(out), max_in_flight_(max_in_flight) {
  if (max_in_flight_ == 0)
    throw ConfigError("rpc max_in_flight must be at least 1");
}

std::size_t RpcServer::peak_in_flight() const {
  std::lock_guard<std::mutex> lk(pending_mu_);
  return peak_pending_;
}

void RpcServer::send(const std::string &line) {
  std::lock_guard<std::mutex> lk(out_mu_);
  out_ << line << '\n';
  out_.flush();
}

std::optional<std::string> RpcServer::handle_line(const std::string &line) {
  std::optional<jsonlite::JsonError> err;
  Value request = jsonlite::parse_value(line, &err);
  if (err) {
    log_event(LogLevel::warn, "rpc", "parse_error", {{"code", Value{err->code}}});
    return jsonlite::to_json(make_error_response(nullptr, rpc_error::parse_error,
                                                 "Parse error"));
  }
  auto response = handle_request(request);
  if (!response)
    return std::nullopt;
  return jsonlite::to_json(*response);
}

std::optional<Value> RpcServer::handle_request(const Value &request) {
  if (!request.is_object())
    return make_error_response(nullptr, rpc_error::invalid_request, "Invalid Request");
  const auto &obj = std::get<Object>(request.v);

  const Value *id_ptr = jsonlite::find(obj, "id");
  const bool is_notification = id_ptr == nullptr;
  const Value id = id_ptr ? *id_ptr : Value{};

  const Value *method = jsonlite::find(obj, "method");
  if (!method || !method->is_string()) {
    if (is_notification)
      return std::nullopt;
    return make_error_response(id, rpc_error::invalid_request, "Invalid Request");
  }
  const std::string &name = std::get<std::string>(method->v);
  const Value *params = jsonlite::find(obj, "params");

  try {
    Value result = dispatch(name, params ? *params : Value{});
    if (is_notification)
      return std::nullopt;
    return Object{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
  } catch (const RpcError &e) {
    if (is_notification)
      return std::nullopt;
    return make_error_response(id, e.code(), e.what());
  } catch (const std::exception &e) {
    log_event(LogLevel::error, "rpc", "internal_error",
              {{"method", Value{name}}, {"error", Value{e.what()}}});
    if (is_notification)
      return std::nullopt;
    return make_error_response(id, rpc_error::internal_error, "Internal error");
  }
}

Value RpcServer::dispatch(const std::string &method, const Value &params) {
  if (method == "initialize") {
    return Object{
        {"protocolVersion", version::RPC_PROTOCOL_VERSION},
        {"capabilities", Object{{"tools", Object{}}, {"resources", Object{}}}},
        {"serverInfo",
         Object{{"name", version::SERVER_NAME}, {"version", version::SERVER_SEMVER}}}};
  }
  if (method == "notifications/initialized" || method == "ping")
    return Object{};
  if (method == "tools/list") {
    Array tools;
    for (const auto &t : tool_catalog())
      tools.push_back(tool_to_value(t));
    return Object{{"tools", std::move(tools)}};
  }
  if (method == "tools/call")
    return tools_call(params);
  if (method == "resources/list") {
    Array resources;
    for (const auto &r : resource_catalog())
      resources.push_back(resource_to_value(r));
    return Object{{"resources", std::move(resources)}};
  }
  if (method == "resources/read")
    return resources_read(params);
  throw RpcError(rpc_error::method_not_found, "Method not found: " + method);
}

Value RpcServer::tools_call(const Value &params) {
  const Object &p = params_object(params);
  const std::string name = required_string(p, "name");
  const Value *args = jsonlite::find(p, "arguments");

  ExecutionResult r;
  try {
    r = dispatcher_.call_tool(name, args ? *args : Value{});
  } catch (const UnknownOperationError &e) {
    throw RpcError(rpc_error::invalid_params, "Unknown tool: " + e.name());
  }
  Array content;
  content.push_back(Object{{"type", "text"},
                           {"text", jsonlite::to_json_pretty(result_to_value(r))}});
  return Object{{"content", std::move(content)}, {"isError", !r.ok}};
}

Value RpcServer::resources_read(const Value &params) {
  const Object &p = params_object(params);
  const std::string uri = required_string(p, "uri");

  ExecutionResult r;
  try {
    r = dispatcher_.read_resource(uri);
  } catch (const UnknownOperationError &) {
    throw RpcError(rpc_error::invalid_params, "Unknown resource");
  }
  Array contents;
  contents.push_back(Object{{"uri", uri},
                            {"mimeType", "application/json"},
                            {"text", jsonlite::to_json_pretty(result_to_value(r))}});
  return Object{{"contents", std::move(contents)}};
}

void RpcServer::dispatch_detached(Value request) {
  {
    std::unique_lock<std::mutex> lk(pending_mu_);
    pending_cv_.wait(lk, [this] { return pending_ < max_in_flight_; });
    ++pending_;
    peak_pending_ = std::max(peak_pending_, pending_);
  }

  const std::optional<Value> id = id_of(request);
  try {
    std::thread([this, request = std::move(request)]() {
      if (auto response = handle_request(request))
        send(jsonlite::to_json(*response));
      std::lock_guard<std::mutex> lk(pending_mu_);
      --pending_;
      pending_cv_.notify_all();
    }).detach();
  } catch (const std::system_error &e) {
    {
      std::lock_guard<std::mutex> lk(pending_mu_);
      --pending_;
      pending_cv_.notify_all();
    }
    log_event(LogLevel::error, "rpc", "dispatch_thread_failed",
              {{"error", Value{e.what()}}});
    if (id)
      send(jsonlite::to_json(
          make_error_response(*id, rpc_error::internal_error, "Server busy")));
  }
}

int RpcServer::serve(std::istream &in) {
  std::signal(SIGPIPE, SIG_IGN);
  log_event(LogLevel::info, "rpc", "serve_start",
            {{"protocol", Value{version::RPC_PROTOCOL_VERSION}}});

  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      continue;

    std::optional<jsonlite::JsonError> err;
    Value request = jsonlite::parse_value(line, &err);
    if (err) {
      log_event(LogLevel::warn, "rpc", "parse_error", {{"code", Value{err->code}}});
      send(jsonlite::to_json(
          make_error_response(nullptr, rpc_error::parse_error, "Parse error")));
      continue;
    }

    if (!runs_detached(method_of(request))) {
      if (auto response = handle_request(request))
        send(jsonlite::to_json(*response));
      continue;
    }

    dispatch_detached(std::move(request));
  }

  std::unique_lock<std::mutex> lk(pending_mu_);
  pending_cv_.wait(lk, [this] { return pending_ == 0; });
  log_event(LogLevel::info, "rpc", "serve_stop");
  return 0;
}

} // namespace fontbridge
