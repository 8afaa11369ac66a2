#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "fontbridge/bridge.hpp"
#include "fontbridge/config.hpp"
#include "fontbridge/hash.hpp"
#include "fontbridge/host_locator.hpp"
#include "fontbridge/jsonlite.hpp"
#include "fontbridge/log.hpp"
#include "fontbridge/operations.hpp"
#include "fontbridge/rpc_server.hpp"
#include "fontbridge/types.hpp"
#include "fontbridge/version.hpp"

namespace {

using fontbridge::jsonlite::Array;
using fontbridge::jsonlite::Object;
using fontbridge::jsonlite::Value;

struct CliOptions {
  std::string cmd{"serve"};
  std::string host;
  std::string config_file;
  std::optional<std::size_t> max_concurrency;
  bool strict_errors{false};
  std::string script_file;
  std::optional<uint64_t> timeout_ms;
};

std::string read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    throw fontbridge::ConfigError("cannot read file: " + path);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

uint64_t parse_u64(const std::string &flag, const std::string &text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
    throw fontbridge::ConfigError(flag + " expects a non-negative integer");
  try {
    return std::stoull(text);
  } catch (const std::out_of_range &) {
    throw fontbridge::ConfigError(flag + " is out of range");
  }
}

CliOptions parse_args(int argc, char **argv) {
  CliOptions o;
  bool have_cmd = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc)
        throw fontbridge::ConfigError(arg + " expects a value");
      return argv[++i];
    };
    if (arg == "--host")
      o.host = value();
    else if (arg == "--config")
      o.config_file = value();
    else if (arg == "--max-concurrency")
      o.max_concurrency = static_cast<std::size_t>(parse_u64(arg, value()));
    else if (arg == "--strict-errors")
      o.strict_errors = true;
    else if (arg == "--script")
      o.script_file = value();
    else if (arg == "--timeout-ms")
      o.timeout_ms = parse_u64(arg, value());
    else if (arg.rfind("--", 0) == 0)
      throw fontbridge::ConfigError("unknown flag: " + arg);
    else if (!have_cmd) {
      o.cmd = arg;
      have_cmd = true;
    } else
      throw fontbridge::ConfigError("unexpected argument: " + arg);
  }
  return o;
}

// defaults < environment < config file < CLI flags
fontbridge::BridgeConfig load_config(const CliOptions &o) {
  fontbridge::BridgeConfig cfg = fontbridge::BridgeConfig::from_env();
  if (!o.config_file.empty())
    cfg.apply_json(read_file(o.config_file));
  if (!o.host.empty())
    cfg.host_path = o.host;
  if (o.max_concurrency)
    cfg.max_concurrency = *o.max_concurrency;
  if (o.strict_errors)
    cfg.strict_errors = true;

  const auto check = fontbridge::validate_config(cfg);
  for (const auto &w : check.warnings)
    fontbridge::log_event(fontbridge::LogLevel::warn, "config", "config_warning",
                          {{"warning", Value{w}}});
  if (!check.ok)
    throw fontbridge::ConfigError(check.errors.front());
  return cfg;
}

void print(const Value &v) { std::cout << fontbridge::jsonlite::to_json_pretty(v) << "\n"; }

int cmd_health() {
  const auto h = fontbridge::hash_runtime_info();
  print(Object{{"server", fontbridge::version::SERVER_NAME},
               {"version", fontbridge::version::SERVER_SEMVER},
               {"rpc_protocol", fontbridge::version::RPC_PROTOCOL_VERSION},
               {"hash_primitive", h.primitive},
               {"hash_version", h.version}});
  return 0;
}

int cmd_tools() {
  Array tools;
  for (const auto &t : fontbridge::tool_catalog())
    tools.push_back(fontbridge::tool_to_value(t));
  print(Object{{"tools", std::move(tools)}});
  return 0;
}

int cmd_resources() {
  Array resources;
  for (const auto &r : fontbridge::resource_catalog())
    resources.push_back(fontbridge::resource_to_value(r));
  print(Object{{"resources", std::move(resources)}});
  return 0;
}

int cmd_doctor(const CliOptions &o) {
  Array blockers;
  Array warnings;
  Object report;

  std::optional<fontbridge::BridgeConfig> cfg;
  try {
    cfg = load_config(o);
    report["config"] = cfg->to_value();
    for (const auto &w : fontbridge::validate_config(*cfg).warnings)
      warnings.emplace_back(w);
  } catch (const fontbridge::ConfigError &e) {
    blockers.emplace_back(std::string("config: ") + e.what());
  }

  if (cfg) {
    try {
      const auto host = fontbridge::locate_host(cfg->host_path);
      report["host"] = host.str();
      if (!host.name_plausible())
        warnings.emplace_back("host executable name does not start with 'fontlab'");
    } catch (const fontbridge::HostNotFoundError &e) {
      blockers.emplace_back(std::string("host: ") + e.what());
    }
  }

  if (fontbridge::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262")
    blockers.emplace_back("hash: blake3 test vector mismatch");

  const bool ok = blockers.empty();
  report["ok"] = ok;
  report["blockers"] = std::move(blockers);
  report["warnings"] = std::move(warnings);
  report["version"] =
      fontbridge::version::manifest_to_value(fontbridge::version::current_manifest());
  print(Value{std::move(report)});
  return ok ? 0 : 1;
}

int cmd_exec(const CliOptions &o) {
  if (o.script_file.empty())
    throw fontbridge::ConfigError("exec requires --script <file>");
  const std::string body = read_file(o.script_file);
  auto cfg = load_config(o);
  auto host = fontbridge::locate_host(cfg.host_path);
  fontbridge::ExecutionBridge bridge(std::move(cfg), std::move(host));
  const auto result = bridge.execute(body, o.timeout_ms, "exec");
  print(fontbridge::result_to_value(result));
  return result.ok ? 0 : 1;
}

int cmd_serve(const CliOptions &o) {
  auto cfg = load_config(o);
  const std::size_t max_pending = cfg.max_pending_requests;
  auto host = fontbridge::locate_host(cfg.host_path);
  fontbridge::ExecutionBridge bridge(std::move(cfg), std::move(host));
  fontbridge::OperationDispatcher dispatcher(bridge);
  fontbridge::RpcServer server(dispatcher, std::cout, max_pending);
  return server.serve(std::cin);
}

void usage() {
  std::cerr << "usage: fontbridge [serve|health|doctor|tools|resources|exec]\n"
               "       [--host <path>] [--config <file>] [--max-concurrency N]\n"
               "       [--strict-errors] [--script <file>] [--timeout-ms N]\n";
}

void report_fatal(const std::string &kind, const std::string &message) {
  fontbridge::log_event(fontbridge::LogLevel::error, "config", "fatal",
                        {{"kind", Value{kind}}, {"message", Value{message}}});
  std::cerr << fontbridge::jsonlite::to_json(
                   Object{{"error", Object{{"kind", kind}, {"message", message}}}})
            << "\n";
}

} // namespace

int main(int argc, char **argv) {
  try {
    fontbridge::init_logging_from_env();
    const CliOptions o = parse_args(argc, argv);

    if (o.cmd == "serve")
      return cmd_serve(o);
    if (o.cmd == "health")
      return cmd_health();
    if (o.cmd == "doctor")
      return cmd_doctor(o);
    if (o.cmd == "tools")
      return cmd_tools();
    if (o.cmd == "resources")
      return cmd_resources();
    if (o.cmd == "exec")
      return cmd_exec(o);

    usage();
    return 1;
  } catch (const fontbridge::HostNotFoundError &e) {
    report_fatal("host_not_found", e.what());
    return 2;
  } catch (const fontbridge::ConfigError &e) {
    report_fatal("config_error", e.what());
    usage();
    return 2;
  } catch (const std::exception &e) {
    report_fatal("internal_error", e.what());
    return 1;
  }
}
