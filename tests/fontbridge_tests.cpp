#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "fontbridge/bridge.hpp"
#include "fontbridge/concurrency_gate.hpp"
#include "fontbridge/config.hpp"
#include "fontbridge/hash.hpp"
#include "fontbridge/host_locator.hpp"
#include "fontbridge/host_process.hpp"
#include "fontbridge/jsonlite.hpp"
#include "fontbridge/observability.hpp"
#include "fontbridge/operations.hpp"
#include "fontbridge/rpc_server.hpp"
#include "fontbridge/sanitize.hpp"
#include "fontbridge/script_template.hpp"
#include "fontbridge/templates.hpp"
#include "fontbridge/types.hpp"
#include "fontbridge/validation.hpp"
#include "fontbridge/version.hpp"
#include "fontbridge/work_area.hpp"

#ifndef FONTBRIDGE_STUB_HOST_PATH
#error "FONTBRIDGE_STUB_HOST_PATH must name the fontlab_stub executable"
#endif

namespace fs = std::filesystem;
using fontbridge::jsonlite::Array;
using fontbridge::jsonlite::Object;
using fontbridge::jsonlite::Value;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string &message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string &name, void (*fn)()) {
  std::cout << "  " << name << "...";
  std::cout.flush();
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

template <typename E, typename F>
bool throws(F &&fn) {
  try {
    fn();
  } catch (const E &) {
    return true;
  }
  return false;
}

template <typename F>
std::string validation_field(F &&fn) {
  try {
    fn();
  } catch (const fontbridge::ValidationError &e) {
    return e.field();
  }
  return "";
}

fs::path fresh_dir(const std::string &tag) {
  const fs::path base = fs::canonical(fs::temp_directory_path());
  const fs::path dir =
      base / ("fontbridge_test_" + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

bool dir_empty(const fs::path &dir) {
  return fs::is_empty(dir);
}

std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

fontbridge::HostPath stub_host() {
  return fontbridge::validate_host_path(FONTBRIDGE_STUB_HOST_PATH);
}

fontbridge::BridgeConfig test_config(const fs::path &work_root) {
  fontbridge::BridgeConfig c;
  c.max_concurrency = 3;
  c.max_timeout_ms = 5000;
  c.default_timeout_ms = 5000;
  c.grace_period_ms = 200;
  c.kill_wait_ms = 1000;
  c.work_root = work_root.string();
  return c;
}

uint64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - since)
                                   .count());
}

// ============================================================================
// Literal encoding
// ============================================================================

void test_literal_scalars() {
  using fontbridge::encode_literal;
  expect(encode_literal(Value{nullptr}).text() == "None", "null -> None");
  expect(encode_literal(Value{true}).text() == "True", "true -> True");
  expect(encode_literal(Value{false}).text() == "False", "false -> False");
  expect(encode_literal(Value{42}).text() == "42", "integer literal");
  expect(encode_literal(Value{-7}).text() == "-7", "negative integer literal");
  expect(encode_literal(Value{600.0}).text() == "600.0", "double keeps a decimal point");
  const Value width = fontbridge::decode_literal(encode_literal(Value{600.0}).text());
  expect(std::holds_alternative<double>(width.v), "whole double decodes as a double");
  expect(encode_literal(Value{"A"}).text() == "\"A\"", "plain string");
}

void test_literal_control_characters() {
  const std::string raw = std::string("a\"b\\c\nd\re\tf") + '\x01' + '\x7f' + "g";
  const std::string lit = fontbridge::encode_literal(Value{raw}).text();
  expect(lit == "\"a\\\"b\\\\c\\nd\\re\\tf\\x01\\x7fg\"", "control characters escaped: " + lit);
  for (char c : lit)
    expect(static_cast<unsigned char>(c) >= 0x20 && static_cast<unsigned char>(c) < 0x7f,
           "literal is printable ASCII");
}

void test_literal_non_ascii() {
  const std::string lit =
      fontbridge::encode_literal(Value{std::string("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80")})
          .text();
  expect(lit == "\"\\xe9\\u20ac\\U0001f600\"", "non-ASCII escaped by width: " + lit);
}

void test_literal_rejects_bad_input() {
  expect(throws<fontbridge::ValidationError>(
             [] { fontbridge::encode_literal(Value{std::string("\xC3\x28")}); }),
         "invalid UTF-8 rejected");
  expect(throws<fontbridge::ValidationError>(
             [] { fontbridge::encode_literal(Value{std::nan("")}); }),
         "NaN rejected");
}

void test_literal_round_trip_hostile_strings() {
  const std::vector<std::string> samples = {
      "",
      "'''",
      "\"\"\"",
      "\\",
      "\"); import os; os.system(\"rm -rf /\"); (\"",
      "line1\nline2\r\n",
      std::string("nul\0byte", 8),
      "{{glyph_name}}",
      "\xE2\x80\xA8 separator",
  };
  for (const auto &s : samples) {
    const auto lit = fontbridge::encode_literal(Value{s});
    expect(lit.text().find('\n') == std::string::npos, "no raw newline in literal");
    expect(fontbridge::decode_literal(lit.text()) == Value{s}, "string round-trips");
  }

  Value nested = Object{{"family_name", "X\"Y"},
                        {"list", Array{Value{1}, Value{-2}, Value{2.5}, Value{nullptr}}},
                        {"flag", true}};
  expect(fontbridge::decode_literal(fontbridge::encode_literal(nested).text()) == nested,
         "nested value round-trips");
}

void test_decode_rejects_foreign_syntax() {
  expect(throws<fontbridge::ValidationError>([] { fontbridge::decode_literal("'single'"); }),
         "single-quoted literal rejected");
  expect(throws<fontbridge::ValidationError>([] { fontbridge::decode_literal("[1,2]"); }),
         "separator without space rejected");
  expect(throws<fontbridge::ValidationError>([] { fontbridge::decode_literal("None x"); }),
         "trailing data rejected");
}

// ============================================================================
// Validators
// ============================================================================

void test_identifier_boundaries() {
  using fontbridge::validate_identifier_string;
  expect(validate_identifier_string(Value{std::string(255, 'a')}, "name").size() == 255,
         "255 chars accepted");
  expect(validation_field([] {
           validate_identifier_string(Value{std::string(256, 'a')}, "name");
         }) == "name",
         "256 chars rejected");
  expect(validation_field([] { validate_identifier_string(Value{""}, "name"); }) == "name",
         "empty rejected");
  expect(validation_field([] { validate_identifier_string(Value{"a\nb"}, "name"); }) ==
             "name",
         "newline rejected");
  expect(validation_field([] { validate_identifier_string(Value{"a\rb"}, "name"); }) ==
             "name",
         "carriage return rejected");
  expect(validation_field([] {
           validate_identifier_string(Value{std::string("a\0b", 3)}, "name");
         }) == "name",
         "NUL rejected");
  expect(validation_field([] { validate_identifier_string(Value{5}, "name"); }) == "name",
         "non-string rejected");
}

void test_numeric_boundaries() {
  using fontbridge::validate_numeric_range;
  namespace rules = fontbridge::rules;
  expect(validate_numeric_range(Value{0}, "width", rules::kWidthMin, rules::kWidthMax) == 0,
         "width 0 accepted");
  expect(validate_numeric_range(Value{10000}, "width", rules::kWidthMin, rules::kWidthMax) ==
             10000,
         "width 10000 accepted");
  expect(validation_field([] {
           validate_numeric_range(Value{10000.5}, "width", rules::kWidthMin,
                                  rules::kWidthMax);
         }) == "width",
         "width above max rejected");
  expect(validation_field([] {
           validate_numeric_range(Value{-0.5}, "width", rules::kWidthMin, rules::kWidthMax);
         }) == "width",
         "negative width rejected");
  expect(validate_numeric_range(Value{-360}, "rotate", rules::kRotateMin,
                                rules::kRotateMax) == -360,
         "rotate -360 accepted");
  expect(validation_field([] {
           validate_numeric_range(Value{360.01}, "rotate", rules::kRotateMin,
                                  rules::kRotateMax);
         }) == "rotate",
         "rotate above 360 rejected");
  expect(validation_field([] {
           validate_numeric_range(Value{"5"}, "scale_x", rules::kScaleMin, rules::kScaleMax);
         }) == "scale_x",
         "string number rejected");
  expect(validation_field([] {
           validate_numeric_range(Value{true}, "scale_x", rules::kScaleMin,
                                  rules::kScaleMax);
         }) == "scale_x",
         "bool rejected as number");
}

void test_codepoint_boundaries() {
  using fontbridge::validate_unicode_codepoint;
  expect(validate_unicode_codepoint(Value{0}, "unicode") == 0, "0 accepted");
  expect(validate_unicode_codepoint(Value{0x10FFFF}, "unicode") == 0x10FFFF,
         "0x10FFFF accepted");
  expect(validation_field([] { validate_unicode_codepoint(Value{0x110000}, "unicode"); }) ==
             "unicode",
         "0x110000 rejected");
  expect(validation_field([] { validate_unicode_codepoint(Value{-1}, "unicode"); }) ==
             "unicode",
         "-1 rejected");
  expect(validation_field([] { validate_unicode_codepoint(Value{0xD800}, "unicode"); }) ==
             "unicode",
         "high surrogate rejected");
  expect(validation_field([] { validate_unicode_codepoint(Value{0xDFFF}, "unicode"); }) ==
             "unicode",
         "low surrogate rejected");
  expect(validation_field([] { validate_unicode_codepoint(Value{65.5}, "unicode"); }) ==
             "unicode",
         "fractional code point rejected");
}

void test_string_length_counts_code_points() {
  const std::string four_euros = "\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC";
  expect(fontbridge::validate_string_length(Value{four_euros}, "copyright", 4) == four_euros,
         "4 code points fit max 4");
  expect(validation_field([&] {
           fontbridge::validate_string_length(Value{four_euros}, "copyright", 3);
         }) == "copyright",
         "4 code points exceed max 3");
}

void test_choice() {
  expect(fontbridge::validate_choice(Value{"ttf"}, "format",
                                     fontbridge::rules::export_formats()) == "ttf",
         "known format accepted");
  expect(validation_field([] {
           fontbridge::validate_choice(Value{"exe"}, "format",
                                       fontbridge::rules::export_formats());
         }) == "format",
         "unknown format rejected");
}

void test_export_path_traversal() {
  expect(validation_field([] {
           fontbridge::validate_export_path(Value{"../../etc/passwd"});
         }) == "path",
         "../../etc/passwd rejected");
  const fs::path dir = fresh_dir("traversal");
  fs::create_directories(dir / "sub");
  expect(throws<fontbridge::ValidationError>([&] {
           fontbridge::validate_export_path(Value{(dir / "sub" / ".." / "font.otf").string()});
         }),
         "traversal collapsing to a valid location still rejected");
  fs::remove_all(dir);
}

void test_export_path_symlink_ancestor() {
  const fs::path dir = fresh_dir("symlink");
  fs::create_directories(dir / "real");
  fs::create_directory_symlink(dir / "real", dir / "link");

  const std::string ok = fontbridge::validate_export_path(Value{(dir / "real" / "a.otf").string()});
  expect(ok == (dir / "real" / "a.otf").string(), "plain path accepted and absolute");

  expect(validation_field([&] {
           fontbridge::validate_export_path(Value{(dir / "link" / "a.otf").string()});
         }) == "path",
         "symlinked ancestor rejected");

  std::ofstream(dir / "real" / "target.ttf") << "x";
  fs::create_symlink(dir / "real" / "target.ttf", dir / "real" / "swap.ttf");
  expect(throws<fontbridge::ValidationError>([&] {
           fontbridge::validate_export_path(Value{(dir / "real" / "swap.ttf").string()});
         }),
         "symlinked target rejected");
  fs::remove_all(dir);
}

void test_export_path_extension_and_parent() {
  const fs::path dir = fresh_dir("ext");
  expect(!fontbridge::validate_export_path(Value{(dir / "A.WOFF2").string()}).empty(),
         "extension match is case-insensitive");
  expect(throws<fontbridge::ValidationError>([&] {
           fontbridge::validate_export_path(Value{(dir / "font.exe").string()});
         }),
         "disallowed extension rejected");
  expect(throws<fontbridge::ValidationError>([&] {
           fontbridge::validate_export_path(Value{(dir / "missing" / "font.otf").string()});
         }),
         "missing parent rejected");
  fs::remove_all(dir);
}

void test_request_size_cap() {
  expect(fontbridge::validate_request_size(Value{Object{{"name", "A"}}}) < 100,
         "small payload accepted");
  bool thrown = false;
  try {
    fontbridge::validate_request_size(Value{std::string(1000001, 'x')});
  } catch (const fontbridge::RequestSizeError &e) {
    thrown = e.actual_bytes() > e.max_bytes();
  }
  expect(thrown, "payload above 1,000,000 bytes rejected");
}

// ============================================================================
// Sanitizer
// ============================================================================

void test_sanitize_path_and_line() {
  const std::string out =
      fontbridge::sanitize_error("Error in /Users/alice/secret/project/script.py, line 42");
  expect(out.find("alice") == std::string::npos, "user name removed: " + out);
  expect(out.find("secret") == std::string::npos, "directory removed: " + out);
  expect(out.find("42") == std::string::npos, "line number removed: " + out);
  expect(out.find("[PATH]") != std::string::npos, "path placeholder present: " + out);
}

void test_sanitize_windows_path_and_colon_line() {
  const std::string out =
      fontbridge::sanitize_error("C:\\Users\\bob\\font.py:17: NameError: x");
  expect(out.find("bob") == std::string::npos, "windows user removed: " + out);
  expect(out.find("17") == std::string::npos, "colon line removed: " + out);
}

void test_sanitize_non_ascii_paths() {
  const std::string mac = fontbridge::sanitize_error(
      "Error in /Users/\xC3\xA5lice/secret/project/script.py, line 42");
  expect(mac == "Error in [PATH], line [REDACTED]", "accented user name consumed: " + mac);

  const std::string linux_path =
      fontbridge::sanitize_error("IOError: cannot open /home/j\xC3\xBCrgen/fonts/MyFont.vfc");
  expect(linux_path == "IOError: cannot open [PATH]", "umlaut path consumed: " + linux_path);

  const std::string windows = fontbridge::sanitize_error(
      "C:\\Users\\j\xC3\xBCrgen\\font.py:17: boom");
  expect(windows.find("rgen") == std::string::npos, "windows non-ASCII user removed: " + windows);
  expect(windows.find("17") == std::string::npos, "windows colon line removed: " + windows);

  const std::string stream =
      fontbridge::sanitize_stream_text("saved /home/j\xC3\xBCrgen/out.otf\n");
  expect(stream == "saved [PATH]\n", "stream text redacts non-ASCII path: " + stream);
}

void test_sanitize_glued_path_categorized() {
  const std::string out = fontbridge::sanitize_error("cache/home/bob/file not found");
  expect(out == "Resource not found", "partially redacted path falls back to category: " + out);
  expect(fontbridge::sanitize_error("wrote (/tmp/x.otf).") == "wrote ([PATH]).",
         "path inside punctuation stays readable");
}

void test_sanitize_traceback_collapse() {
  const std::string raw =
      "Traceback (most recent call last):\n"
      "  File \"/home/carol/work/run.py\", line 12, in <module>\n"
      "    main()\n"
      "ValueError: width must be positive\n";
  const std::string out = fontbridge::sanitize_error(raw);
  expect(out == "ValueError: width must be positive", "traceback collapsed: " + out);
}

void test_sanitize_strict_and_truncation() {
  fontbridge::SanitizeOptions strict;
  strict.strict = true;
  expect(fontbridge::sanitize_error("Permission denied: /home/dave/out.otf", strict) ==
             "Permission denied",
         "strict mode categorizes");
  expect(fontbridge::sanitize_error("") == "An error occurred", "empty text");

  fontbridge::SanitizeOptions small;
  small.max_chars = 20;
  const std::string out = fontbridge::sanitize_error(std::string(100, 'e'), small);
  expect(out.size() == 20, "truncated to max_chars");

  const std::string multibyte = fontbridge::sanitize_error(
      std::string(19, 'a') + "\xE2\x82\xAC", small);
  expect(multibyte == std::string(19, 'a'), "truncation does not split UTF-8");
}

void test_categorize() {
  expect(fontbridge::categorize_error("No such file") == "Resource not found", "not found");
  expect(fontbridge::categorize_error("operation timed out") == "Operation timed out",
         "timeout");
  expect(fontbridge::categorize_error("invalid value") == "Invalid input", "invalid");
  expect(fontbridge::categorize_error("boom") == "Operation failed", "fallback category");
}

// ============================================================================
// Host locator, work area, process runner
// ============================================================================

void test_host_locator() {
  const auto host = stub_host();
  expect(host.name_plausible(), "fontlab_stub name is plausible");
  expect(fs::path(host.str()).is_absolute(), "host path is canonical");
  expect(throws<fontbridge::HostNotFoundError>(
             [] { fontbridge::validate_host_path("/nonexistent/fontlab"); }),
         "missing host rejected");

  const fs::path dir = fresh_dir("locator");
  std::ofstream(dir / "fontlab") << "#!/bin/sh\n";
  ::chmod((dir / "fontlab").c_str(), 0644);
  expect(throws<fontbridge::HostNotFoundError>(
             [&] { fontbridge::validate_host_path((dir / "fontlab").string()); }),
         "non-executable host rejected");
  expect(throws<fontbridge::HostNotFoundError>(
             [&] { fontbridge::validate_host_path(dir.string()); }),
         "directory rejected");

  const auto found = fontbridge::locate_host("", {"/nonexistent/a", FONTBRIDGE_STUB_HOST_PATH});
  expect(found.str() == host.str(), "first usable candidate wins");
  expect(throws<fontbridge::HostNotFoundError>(
             [] { fontbridge::locate_host("", {"/nonexistent/a"}); }),
         "no candidates -> HostNotFoundError");
  fs::remove_all(dir);
}

void test_work_area_lifecycle() {
  const fs::path root = fresh_dir("workarea");
  std::string dir;
  {
    fontbridge::SecureWorkArea area(root.string());
    dir = area.dir();
    expect(fs::is_directory(dir), "work area exists");
    struct stat st {};
    ::stat(dir.c_str(), &st);
    expect((st.st_mode & 0777) == 0700, "work area is 0700");

    area.write_script("print('x')\n");
    ::stat(area.script_path().c_str(), &st);
    expect((st.st_mode & 0777) == 0600, "script is 0600");
    expect(slurp(area.script_path()) == "print('x')\n", "script content");

    expect(!area.read_output(1024).has_value(), "absent output -> nullopt");
    std::ofstream(area.output_path()) << "{}";
    expect(area.read_output(1024).value_or("") == "{}", "output read back");
  }
  expect(!fs::exists(dir), "destructor removes work area");
  expect(dir_empty(root), "nothing left under work root");

  fontbridge::SecureWorkArea area(root.string());
  expect(area.remove(), "explicit remove");
  expect(area.remove(), "remove is idempotent");
  fs::remove_all(root);
}

void test_secret_env_filtering() {
  expect(fontbridge::is_secret_key("GITHUB_TOKEN"), "GITHUB_TOKEN is secret");
  expect(fontbridge::is_secret_key("AWS_SECRET_ACCESS_KEY"), "AWS secret");
  expect(fontbridge::is_secret_key("MY_API_KEY"), "_KEY suffix");
  expect(!fontbridge::is_secret_key("HOME"), "HOME is not secret");
  ::setenv("FONTBRIDGE_TEST_PASSWORD", "hunter2", 1);
  const auto env = fontbridge::host_environment();
  expect(env.find("FONTBRIDGE_TEST_PASSWORD") == env.end(), "secret dropped from env");
  ::unsetenv("FONTBRIDGE_TEST_PASSWORD");
}

void test_process_spawn_failure() {
  fontbridge::ProcessSpec spec;
  spec.command = "/nonexistent/binary";
  const auto r = fontbridge::run_host_process(spec);
  expect(!r.spawned, "missing binary not spawned");
  expect(!r.spawn_error.empty(), "spawn error recorded");
}

// ============================================================================
// Concurrency gate
// ============================================================================

void test_gate_rejects_zero_capacity() {
  expect(throws<fontbridge::ConfigError>([] { fontbridge::ConcurrencyGate g(0); }),
         "capacity 0 rejected");
}

void test_gate_blocks_at_capacity() {
  fontbridge::ConcurrencyGate gate(2);
  auto a = gate.acquire();
  auto b = gate.acquire();
  expect(gate.in_flight() == 2, "two slots held");

  std::atomic<bool> admitted{false};
  std::thread t([&] {
    auto c = gate.acquire();
    admitted = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  expect(!admitted.load(), "third acquirer waits");
  expect(gate.waiting() == 1, "one waiter");

  a.release();
  expect(!a.held(), "released slot no longer held");
  expect(b.held(), "other slot still held");
  t.join();
  expect(admitted.load(), "waiter admitted after release");
  expect(gate.peak() == 2, "peak never exceeds capacity");
  expect(gate.contention_count() == 1, "contention counted");
  b.release();
  expect(gate.in_flight() == 0, "all slots returned");
}

void test_gate_slot_released_on_exception() {
  fontbridge::ConcurrencyGate gate(1);
  try {
    auto slot = gate.acquire();
    throw std::runtime_error("boom");
  } catch (const std::runtime_error &) {
  }
  expect(gate.in_flight() == 0, "slot released during unwinding");
}

// ============================================================================
// Execution bridge (against fontlab_stub)
// ============================================================================

void test_bridge_end_to_end_success() {
  const fs::path root = fresh_dir("e2e");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  const auto r = bridge.execute(
      "# stub-result: {\"success\": true, \"data\": {\"x\": 1}, \"message\": \"done\"}\n");
  expect(r.ok, "success result: " + r.error);
  expect(r.data == Value{Object{{"x", 1}}}, "data carried through");
  expect(r.message == "done", "message carried through");
  expect(r.error_code == fontbridge::ErrorCode::none, "no error code");
  expect(r.final_state == fontbridge::ProcessState::exited, "process exited");
  expect(r.execution_id.size() == 64, "execution id is a digest");
  expect(dir_empty(root), "no residual work area");
  expect(bridge.stats().successes.load() == 1, "success counted");
  expect(bridge.gate().in_flight() == 0, "slot released");
  fs::remove_all(root);
}

void test_bridge_host_reported_failure_sanitized() {
  const fs::path root = fresh_dir("hostfail");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  const auto r = bridge.execute(
      "# stub-result: {\"success\": false, \"error\": \"cannot open "
      "/Users/alice/fonts/Demo.vfj, line 9\"}\n");
  expect(!r.ok, "failure result");
  expect(r.error_code == fontbridge::ErrorCode::host_execution_failed, "host failure code");
  expect(r.error.find("alice") == std::string::npos, "path sanitized: " + r.error);
  expect(r.error.find("9") == std::string::npos, "line sanitized: " + r.error);
  expect(dir_empty(root), "no residual work area");
  fs::remove_all(root);
}

void test_bridge_fallback_paths() {
  const fs::path root = fresh_dir("fallback");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());

  const auto ok = bridge.execute("# stub-stdout: hello from host\n");
  expect(ok.ok, "clean exit without output file is success");
  expect(ok.data.is_null(), "fallback data is null");
  expect(ok.stdout_text.value_or("").find("hello from host") != std::string::npos,
         "stdout captured");

  const auto bad = bridge.execute(
      "# stub-stderr: RuntimeError: failed in /home/bob/x.py\n# stub-exit: 3\n");
  expect(!bad.ok, "non-zero exit without output file is failure");
  expect(bad.error_code == fontbridge::ErrorCode::host_execution_failed, "host failure");
  expect(bad.exit_code == 3, "exit code reported");
  expect(bad.error.find("/home/bob") == std::string::npos, "stderr summary sanitized");
  expect(bad.stderr_text.value_or("").find("/home/bob") == std::string::npos,
         "captured stderr redacted");
  expect(bridge.stats().fallback_results.load() == 2, "fallbacks counted");
  expect(dir_empty(root), "no residual work area");
  fs::remove_all(root);
}

void test_bridge_malformed_output() {
  const fs::path root = fresh_dir("malformed");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  const auto r = bridge.execute("# stub-raw-output: {not json\n");
  expect(!r.ok, "malformed output is a failure");
  expect(r.error_code == fontbridge::ErrorCode::malformed_result, "malformed code");
  expect(r.error == "Host returned a malformed result", "generic message");

  const auto arr = bridge.execute("# stub-raw-output: [1, 2]\n");
  expect(arr.error_code == fontbridge::ErrorCode::malformed_result, "non-object malformed");
  expect(dir_empty(root), "no residual work area");
  fs::remove_all(root);
}

void test_bridge_exit_status_overrides_file() {
  const fs::path root = fresh_dir("exitprec");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  const auto r = bridge.execute(
      "# stub-result: {\"success\": true, \"data\": 1}\n# stub-exit: 2\n");
  expect(!r.ok, "non-zero exit wins over claimed success");
  expect(r.error_code == fontbridge::ErrorCode::host_execution_failed, "host failure code");

  const auto missing = bridge.execute("# stub-result: {\"data\": 1}\n");
  expect(!missing.ok, "missing success flag is a failure");

  const auto non_bool = bridge.execute("# stub-result: {\"success\": \"yes\"}\n");
  expect(!non_bool.ok, "non-boolean success flag is a failure");
  fs::remove_all(root);
}

void test_bridge_timeout_kills_host() {
  const fs::path root = fresh_dir("timeout");
  const fs::path pidfile = root / "host.pid";
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());

  const auto t0 = std::chrono::steady_clock::now();
  const auto r = bridge.execute("# stub-pidfile: " + pidfile.string() + "\n# stub-hang\n", 300);
  const uint64_t took = elapsed_ms(t0);

  expect(!r.ok, "timeout is a failure");
  expect(r.timed_out(), "timeout error code");
  expect(r.error.find("300") != std::string::npos, "timeout message names the limit");
  expect(r.final_state == fontbridge::ProcessState::killed,
         "SIGTERM-ignoring host ends killed, got " + fontbridge::to_string(r.final_state));
  expect(took < 300 + 200 + 1000 + 1500, "bounded return: " + std::to_string(took) + "ms");

  int pid = 0;
  std::ifstream(pidfile) >> pid;
  expect(pid > 0, "host wrote its pid");
  expect(::kill(pid, 0) == -1 && errno == ESRCH, "host process no longer exists");

  fs::remove(pidfile);
  expect(dir_empty(root), "no residual work area after timeout");
  expect(bridge.stats().timeouts.load() == 1, "timeout counted");
  fs::remove_all(root);
}

void test_bridge_timeout_clamped() {
  const fs::path root = fresh_dir("clamp");
  auto cfg = test_config(root);
  cfg.max_timeout_ms = 200;
  cfg.default_timeout_ms = 30000;
  fontbridge::ExecutionBridge bridge(cfg, stub_host());
  expect(bridge.effective_timeout_ms(std::nullopt) == 200, "default clamped to max");
  expect(bridge.effective_timeout_ms(99999) == 200, "request clamped to max");
  expect(bridge.effective_timeout_ms(50) == 50, "smaller request kept");

  const auto t0 = std::chrono::steady_clock::now();
  const auto r = bridge.execute("# stub-sleep-ms: 5000\n", 60000);
  expect(r.timed_out(), "clamped timeout fires");
  expect(elapsed_ms(t0) < 200 + 200 + 1000 + 1500, "returns within clamped bound");
  fs::remove_all(root);
}

void test_bridge_concurrency_cap() {
  const fs::path root = fresh_dir("cap");
  const fs::path track = root / "track";
  fs::create_directories(track);
  const fs::path work = root / "work";
  fs::create_directories(work);

  auto cfg = test_config(work);
  cfg.max_concurrency = 2;
  fontbridge::ExecutionBridge bridge(cfg, stub_host());

  const std::string script = "# stub-track: " + track.string() +
                             "\n# stub-sleep-ms: 150\n"
                             "# stub-result: {\"success\": true}\n";
  constexpr int kCalls = 6;
  std::vector<fontbridge::ExecutionResult> results(kCalls);
  std::vector<std::thread> threads;
  for (int i = 0; i < kCalls; ++i)
    threads.emplace_back([&, i] { results[i] = bridge.execute(script); });
  for (auto &t : threads)
    t.join();

  for (const auto &r : results)
    expect(r.ok, "every queued call completes: " + r.error);

  std::istringstream counts(slurp(track / "counts"));
  int max_seen = 0;
  int lines = 0;
  for (int n; counts >> n; ++lines)
    max_seen = std::max(max_seen, n);
  expect(lines == kCalls, "every host recorded itself");
  expect(max_seen >= 1 && max_seen <= 2, "at most 2 hosts alive at once, saw " +
                                             std::to_string(max_seen));
  expect(bridge.gate().peak() <= 2, "gate peak within capacity");
  expect(bridge.gate().in_flight() == 0, "all slots released");
  expect(dir_empty(work), "no residual work areas");
  fs::remove_all(root);
}

void test_bridge_spawn_failure() {
  const fs::path root = fresh_dir("spawn");
  const fs::path broken = root / "fontlab_broken";
  std::ofstream(broken) << "this is not an executable image\n";
  ::chmod(broken.c_str(), 0755);

  const fs::path work = root / "work";
  fs::create_directories(work);
  fontbridge::ExecutionBridge bridge(test_config(work),
                                     fontbridge::validate_host_path(broken.string()));
  const auto r = bridge.execute("pass\n");
  expect(!r.ok, "unexecutable host fails");
  expect(r.error_code == fontbridge::ErrorCode::spawn_failed, "spawn_failed code");
  expect(r.error.find(root.string()) == std::string::npos, "no path in error");
  expect(dir_empty(work), "no residual work area");
  fs::remove_all(root);
}

void test_bridge_work_area_failure() {
  auto cfg = test_config("/nonexistent/fontbridge/root");
  fontbridge::ExecutionBridge bridge(cfg, stub_host());
  const auto r = bridge.execute("# stub-result: {\"success\": true}\n");
  expect(!r.ok, "unusable work root fails");
  expect(r.error_code == fontbridge::ErrorCode::work_area_failed, "work_area_failed code");
  expect(bridge.gate().in_flight() == 0, "slot released on preparation failure");
}

void test_interpret_host_run_direct() {
  fontbridge::BridgeConfig cfg;
  auto r = fontbridge::interpret_host_run(std::string("{\"success\": false}"), 0, 0, "", "",
                                          cfg);
  expect(!r.ok && r.error == "Operation failed", "failure without text");

  r = fontbridge::interpret_host_run(std::nullopt, 0, SIGKILL, "", "", cfg);
  expect(!r.ok, "signal without output is failure");
  expect(r.error.find("signal") != std::string::npos, "signal described");

  r = fontbridge::interpret_host_run(std::string("{\"success\": true}"), 0, 0, "", "", cfg);
  expect(r.ok && r.data.is_null(), "success without data has null data");
}

// ============================================================================
// Templates
// ============================================================================

void test_template_binding_rules() {
  fontbridge::ScriptTemplate tpl("t", "a = {{alpha}}\nb = {{beta}}\n");
  expect(tpl.placeholders().size() == 2, "two placeholders");

  fontbridge::Bindings b;
  b.emplace("alpha", fontbridge::encode_literal(Value{"x"}));
  expect(throws<fontbridge::TemplateError>([&] { tpl.render(b); }), "unbound placeholder");

  b.emplace("beta", fontbridge::encode_literal(Value{2}));
  expect(tpl.render(b) == "a = \"x\"\nb = 2\n", "rendered");

  b.emplace("gamma", fontbridge::encode_literal(Value{3}));
  expect(throws<fontbridge::TemplateError>([&] { tpl.render(b); }), "unused binding");

  expect(throws<fontbridge::TemplateError>([] { fontbridge::ScriptTemplate("t", "{{oops"); }),
         "unterminated placeholder");
  expect(throws<fontbridge::TemplateError>([] { fontbridge::ScriptTemplate("t", "{{A-B}}"); }),
         "malformed placeholder");
}

void test_all_templates_render() {
  const std::map<std::string, Value> args = {
      {"get_glyph", Object{{"name", "A"}}},
      {"get_glyph_metadata", Object{{"name", "A"}}},
      {"get_glyph_contours", Object{{"name", "A"}}},
      {"get_glyph_paths", Object{{"name", "A"}}},
      {"get_glyph_components", Object{{"name", "A"}}},
      {"delete_glyph", Object{{"name", "A"}}},
      {"find_glyph_by_unicode", Object{{"codepoint", 65}}},
      {"search_glyphs", Object{{"pattern", "a*"}}},
      {"create_glyph", Object{{"name", "A"}}},
      {"modify_glyph_width", Object{{"name", "A"}, {"width", 500}}},
      {"transform_glyph", Object{{"name", "A"}, {"rotate", 15}}},
      {"update_font_info", Object{{"family_name", "Demo"}}},
      {"export_font", Object{{"path", (fs::canonical(fs::temp_directory_path()) / "x.otf").string()}}},
  };
  expect(fontbridge::templates::names().size() == 18, "18 operation templates");
  for (const auto &name : fontbridge::templates::names()) {
    auto it = args.find(name);
    const std::string script =
        fontbridge::build_tool_script(name, it == args.end() ? Value{} : it->second);
    expect(script.find("{{") == std::string::npos, name + " fully rendered");
    expect(script.find("json.dump(result, f)") != std::string::npos, name + " writes result");
    expect(script.find("sys.argv[-1]") != std::string::npos, name + " uses output arg");
  }
}

void test_glyph_lookup_preamble() {
  const std::string needle = "glyph = font.findGlyph(glyph_name)";
  for (const char *name : {"get_glyph", "get_glyph_metadata", "get_glyph_contours",
                           "get_glyph_paths", "get_glyph_components", "delete_glyph"}) {
    const std::string script = fontbridge::build_tool_script(name, Object{{"name", "A"}});
    const auto first = script.find(needle);
    expect(first != std::string::npos, std::string(name) + " looks the glyph up");
    expect(script.find(needle, first + 1) == std::string::npos,
           std::string(name) + " looks the glyph up once");
    expect(script.find("Glyph not found: {glyph_name}") != std::string::npos,
           std::string(name) + " reports a missing glyph");
  }
  for (const auto &[name, args] : std::map<std::string, Value>{
           {"modify_glyph_width", Object{{"name", "A"}, {"width", 500}}},
           {"transform_glyph", Object{{"name", "A"}, {"rotate", 15}}}}) {
    const std::string script = fontbridge::build_tool_script(name, args);
    expect(script.find(needle) != std::string::npos, name + " looks the glyph up");
  }
  for (const char *name : {"get_kerning", "get_current_font"}) {
    const std::string script = fontbridge::build_tool_script(name, Value{});
    expect(script.find(needle) == std::string::npos,
           std::string(name) + " does not look up a glyph");
  }
}

void test_injection_stays_literal() {
  const std::string hostile = "A\"); import os; os.system(\"id\"); (\"";
  const std::string script =
      fontbridge::build_tool_script("get_glyph", Object{{"name", hostile}});
  const std::string prefix = "glyph_name = ";
  const auto pos = script.find(prefix);
  expect(pos != std::string::npos, "binding line present");
  const auto eol = script.find('\n', pos);
  const std::string literal = script.substr(pos + prefix.size(), eol - pos - prefix.size());
  expect(fontbridge::decode_literal(literal) == Value{hostile},
         "hostile name is one string literal");
  expect(script.find("\nimport os") == std::string::npos, "no injected statement");
}

void test_create_glyph_defaults() {
  const std::string script =
      fontbridge::build_tool_script("create_glyph", Object{{"name", "space"}});
  expect(script.find("unicode_value = None\n") != std::string::npos, "unicode defaults to None");
  expect(script.find("width = 600.0\n") != std::string::npos, "width defaults to 600");

  const std::string with_cp = fontbridge::build_tool_script(
      "create_glyph", Object{{"name", "A"}, {"unicode", 65}, {"width", 550}});
  expect(with_cp.find("unicode_value = 65\n") != std::string::npos, "unicode bound");
  expect(with_cp.find("width = 550.0\n") != std::string::npos, "width bound");
}

void test_update_font_info_only_given_fields() {
  const std::string script = fontbridge::build_tool_script(
      "update_font_info", Object{{"family_name", "Demo"}, {"copyright", "(c) X"}});
  expect(script.find("updates = {\"copyright\": \"(c) X\", \"family_name\": \"Demo\"}\n") !=
             std::string::npos,
         "updates dict holds only supplied fields");
}

// ============================================================================
// Operation dispatch
// ============================================================================

void test_dispatch_validation_never_spawns() {
  const fs::path root = fresh_dir("dispatch");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  fontbridge::OperationDispatcher ops(bridge);

  auto r = ops.call_tool("create_glyph", Object{{"name", ""}});
  expect(!r.ok, "empty name rejected");
  expect(r.error_code == fontbridge::ErrorCode::validation_failed, "validation code");
  expect(r.error == "Validation error: name: must be a non-empty string", "message: " + r.error);

  r = ops.call_tool("modify_glyph_width", Object{{"name", "A"}});
  expect(r.error == "Validation error: width: is required", "missing arg: " + r.error);

  r = ops.call_tool("get_glyph", Object{{"name", "A"}, {"extra", 1}});
  expect(r.error_code == fontbridge::ErrorCode::validation_failed, "unknown argument rejected");

  r = ops.call_tool("get_glyph", Value{"A"});
  expect(r.error_code == fontbridge::ErrorCode::validation_failed, "non-object args rejected");

  r = ops.call_tool("transform_glyph", Object{{"name", "A"}, {"scale_x", 101}});
  expect(r.error_code == fontbridge::ErrorCode::validation_failed, "scale out of range");

  r = ops.call_tool("export_font", Object{{"path", "../../etc/passwd"}});
  expect(r.error.rfind("Validation error: path:", 0) == 0, "traversal rejected: " + r.error);

  r = ops.call_tool("export_font", Object{{"path", (root / "a.otf").string()}, {"format", "ttf"}});
  expect(r.error == "Validation error: format: does not match the path extension",
         "format mismatch: " + r.error);

  r = ops.call_tool("create_glyph", Object{{"name", std::string(1000001, 'a')}});
  expect(r.error_code == fontbridge::ErrorCode::request_too_large, "oversized request");
  expect(r.error == "Request payload too large", "generic size message");

  expect(bridge.stats().executions.load() == 0, "no host was ever spawned");
  expect(bridge.stats().validation_rejections.load() == 7, "rejections counted");
  expect(bridge.stats().oversized_requests.load() == 1, "oversize counted");
  expect(dir_empty(root), "no work area created");

  expect(throws<fontbridge::UnknownOperationError>(
             [&] { ops.call_tool("get_current_font", Value{}); }),
         "resource-only template is not a tool");
  expect(throws<fontbridge::UnknownOperationError>(
             [&] { ops.call_tool("rm_rf", Value{}); }),
         "unknown tool throws");
  fs::remove_all(root);
}

void test_dispatch_reaches_host() {
  const fs::path root = fresh_dir("dispatch_host");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  fontbridge::OperationDispatcher ops(bridge);

  const auto r = ops.call_tool("get_kerning", Value{});
  expect(r.ok, "stub exits cleanly without output: " + r.error);
  expect(bridge.stats().executions.load() == 1, "one execution");
  expect(bridge.stats().recent_events_snapshot().front().operation == "get_kerning",
         "event labelled with operation");
  fs::remove_all(root);
}

void test_dispatch_resources() {
  const fs::path root = fresh_dir("resources");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  fontbridge::OperationDispatcher ops(bridge);

  expect(ops.read_resource("fontlab://font/current").ok, "current font resource");
  expect(ops.read_resource("fontlab://glyph/A%20B").ok, "percent-encoded glyph resource");

  const auto bad = ops.read_resource("fontlab://glyph/A%0AB");
  expect(bad.error_code == fontbridge::ErrorCode::validation_failed,
         "decoded newline rejected");
  const auto broken = ops.read_resource("fontlab://glyph/A%G1");
  expect(broken.error_code == fontbridge::ErrorCode::validation_failed, "bad escape rejected");

  const auto stats = ops.read_resource(fontbridge::kStatsResourceUri);
  expect(stats.ok && stats.data.is_object(), "stats resource");
  const auto &o = std::get<Object>(stats.data.v);
  expect(fontbridge::jsonlite::find(o, "gate") != nullptr, "stats carry gate");
  expect(fontbridge::jsonlite::find(o, "version") != nullptr, "stats carry version");

  expect(throws<fontbridge::UnknownOperationError>(
             [&] { ops.read_resource("fontlab://nothing"); }),
         "unknown resource throws");
  expect(fontbridge::percent_decode("a%2Fb") == "a/b", "percent decode");
  fs::remove_all(root);
}

void test_catalog_shape() {
  expect(fontbridge::tool_catalog().size() == 16, "16 tools");
  for (const auto &t : fontbridge::tool_catalog()) {
    const Value v = fontbridge::tool_to_value(t);
    const auto &o = std::get<Object>(v.v);
    expect(fontbridge::jsonlite::get_string(o, "name") == t.name, "tool name");
    const Value *schema = fontbridge::jsonlite::find(o, "inputSchema");
    expect(schema && schema->is_object(), t.name + " has an input schema");
  }
  expect(fontbridge::resource_catalog().size() == 5, "5 resources");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_validation() {
  auto r = fontbridge::validate_config("{\"max_concurrency\": 4, \"colour\": \"blue\"}");
  expect(r.ok, "unknown key is not an error");
  expect(r.warnings.size() == 1, "unknown key warned");

  r = fontbridge::validate_config("{\"max_concurrency\": 0}");
  expect(!r.ok, "zero concurrency is an error");
  r = fontbridge::validate_config("{\"max_timeout_ms\": \"fast\"}");
  expect(!r.ok, "wrong type is an error");
  r = fontbridge::validate_config("{not json");
  expect(!r.ok, "parse error is an error");

  expect(throws<fontbridge::ConfigError>(
             [] { fontbridge::BridgeConfig::from_json("{\"max_concurrency\": 1000}"); }),
         "from_json throws on out-of-range");

  const auto c = fontbridge::BridgeConfig::from_json(
      "{\"max_concurrency\": 5, \"strict_errors\": true, \"host_path\": \"/opt/x/fontlab\"}");
  expect(c.max_concurrency == 5, "numeric applied");
  expect(c.strict_errors, "bool applied");
  expect(c.host_path == "/opt/x/fontlab", "string applied");
  expect(c.max_timeout_ms == 10000, "default kept");
  expect(c.max_pending_requests == 32, "pending request cap defaults to 32");
  expect(fontbridge::BridgeConfig::from_json("{\"max_pending_requests\": 8}")
                 .max_pending_requests == 8,
         "pending request cap applied");
  expect(!fontbridge::validate_config("{\"max_pending_requests\": 0}").ok,
         "pending request cap of 0 is an error");

  const auto w = fontbridge::validate_config(fontbridge::BridgeConfig{});
  expect(w.ok && !w.warnings.empty(), "default timeout above max is warned");
}

void test_config_env() {
  ::setenv("FONTBRIDGE_MAX_CONCURRENCY", "7", 1);
  ::setenv("FONTBRIDGE_STRICT_ERRORS", "1", 1);
  auto c = fontbridge::BridgeConfig::from_env();
  expect(c.max_concurrency == 7, "env concurrency");
  expect(c.strict_errors, "env strict errors");

  ::setenv("FONTBRIDGE_MAX_CONCURRENCY", "many", 1);
  expect(throws<fontbridge::ConfigError>([] { fontbridge::BridgeConfig::from_env(); }),
         "unparsable env throws");
  ::unsetenv("FONTBRIDGE_MAX_CONCURRENCY");
  ::unsetenv("FONTBRIDGE_STRICT_ERRORS");
}

// ============================================================================
// Observability, hashing, version
// ============================================================================

void test_stats_and_histogram() {
  fontbridge::BridgeStats stats;
  fontbridge::BridgeEvent ev;
  ev.ok = false;
  ev.error_code = "timeout";
  ev.final_state = "killed";
  ev.run_ns = 2'000'000;
  stats.record_execution(ev);
  ev.ok = true;
  ev.error_code = "none";
  ev.final_state = "exited";
  stats.record_execution(ev);

  expect(stats.executions.load() == 2, "executions");
  expect(stats.timeouts.load() == 1, "timeouts");
  expect(stats.successes.load() == 1, "successes");
  expect(stats.run_latency.count() == 2, "histogram count");

  std::optional<fontbridge::jsonlite::JsonError> err;
  const auto parsed = fontbridge::jsonlite::parse(stats.to_json(), &err);
  expect(!err, "stats JSON parses");
  expect(fontbridge::jsonlite::get_u64(parsed, "failures") == 1, "failures in JSON");
}

void test_hash_vectors() {
  expect(fontbridge::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(fontbridge::script_digest("x") == fontbridge::script_digest("x"), "deterministic");
  expect(fontbridge::script_digest("x") != fontbridge::blake3_hex("x"), "domain separated");
  expect(fontbridge::hash_runtime_info().primitive == "blake3", "primitive");
}

void test_result_shape() {
  auto ok = fontbridge::ExecutionResult::success(Value{Object{{"n", 1}}}, "m");
  const auto v = std::get<Object>(fontbridge::result_to_value(ok).v);
  expect(fontbridge::jsonlite::get_bool(v, "success"), "success flag");
  expect(fontbridge::jsonlite::get_string(v, "message") == "m", "message");

  auto bad = fontbridge::ExecutionResult::failure(fontbridge::ErrorCode::timeout, "slow");
  const auto b = std::get<Object>(fontbridge::result_to_value(bad).v);
  expect(!fontbridge::jsonlite::get_bool(b, "success", true), "failure flag");
  expect(fontbridge::jsonlite::get_string(b, "error_code") == "timeout", "error code");
  expect(fontbridge::jsonlite::find(b, "data") == nullptr, "no data on failure");
}

// ============================================================================
// RPC server
// ============================================================================

Object response_object(const std::optional<std::string> &line) {
  expect(line.has_value(), "response expected");
  std::optional<fontbridge::jsonlite::JsonError> err;
  auto o = fontbridge::jsonlite::parse(*line, &err);
  expect(!err, "response is JSON");
  return o;
}

int64_t error_code_of(const Object &response) {
  const Value *e = fontbridge::jsonlite::find(response, "error");
  expect(e && e->is_object(), "error member present");
  const Value *code = fontbridge::jsonlite::find(std::get<Object>(e->v), "code");
  expect(code && std::holds_alternative<int64_t>(code->v), "numeric error code");
  return std::get<int64_t>(code->v);
}

void test_rpc_protocol_errors() {
  const fs::path root = fresh_dir("rpc_errors");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  fontbridge::OperationDispatcher ops(bridge);
  std::ostringstream out;
  fontbridge::RpcServer server(ops, out);

  expect(error_code_of(response_object(server.handle_line("{bad"))) == -32700, "parse error");
  expect(error_code_of(response_object(server.handle_line(
             "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"nope\"}"))) == -32601,
         "unknown method");
  expect(error_code_of(response_object(server.handle_line(
             "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\","
             "\"params\":{\"name\":\"rm_rf\"}}"))) == -32602,
         "unknown tool");
  expect(error_code_of(response_object(server.handle_line(
             "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"resources/read\","
             "\"params\":{}}"))) == -32602,
         "missing uri");
  expect(!server.handle_line("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}"),
         "notification gets no response");
  expect(!server.handle_line("{\"jsonrpc\":\"2.0\",\"method\":\"nope\"}"),
         "unknown notification ignored");
  fs::remove_all(root);
}

void test_rpc_methods() {
  const fs::path root = fresh_dir("rpc_methods");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  fontbridge::OperationDispatcher ops(bridge);
  std::ostringstream out;
  fontbridge::RpcServer server(ops, out);

  auto init = response_object(server.handle_line(
      "{\"jsonrpc\":\"2.0\",\"id\":\"a\",\"method\":\"initialize\",\"params\":{}}"));
  const auto &result = std::get<Object>(fontbridge::jsonlite::find(init, "result")->v);
  expect(fontbridge::jsonlite::get_string(result, "protocolVersion") == "2024-11-05",
         "protocol version");
  expect(*fontbridge::jsonlite::find(init, "id") == Value{"a"}, "string id echoed");

  auto list = response_object(
      server.handle_line("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}"));
  const auto &tools = std::get<Array>(
      std::get<Object>(fontbridge::jsonlite::find(list, "result")->v).at("tools").v);
  expect(tools.size() == 16, "tools/list returns the catalog");

  auto call = response_object(server.handle_line(
      "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/call\","
      "\"params\":{\"name\":\"get_glyph\",\"arguments\":{\"name\":\"\"}}}"));
  const auto &call_result = std::get<Object>(fontbridge::jsonlite::find(call, "result")->v);
  expect(fontbridge::jsonlite::get_bool(call_result, "isError"), "validation failure isError");
  const auto &content = std::get<Array>(call_result.at("content").v);
  const auto &text = std::get<Object>(content.at(0).v);
  expect(fontbridge::jsonlite::get_string(text, "text").find("Validation error: name") !=
             std::string::npos,
         "failure text carried in content");

  auto read = response_object(server.handle_line(
      "{\"jsonrpc\":\"2.0\",\"id\":4,\"method\":\"resources/read\","
      "\"params\":{\"uri\":\"fontlab://font/info\"}}"));
  const auto &contents = std::get<Array>(
      std::get<Object>(fontbridge::jsonlite::find(read, "result")->v).at("contents").v);
  expect(contents.size() == 1, "one content entry");

  expect(out.str().empty(), "handle_line does not write to the stream");
  fs::remove_all(root);
}

void test_rpc_serve_loop() {
  const fs::path root = fresh_dir("rpc_serve");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  fontbridge::OperationDispatcher ops(bridge);
  std::ostringstream out;
  fontbridge::RpcServer server(ops, out);

  std::istringstream in(
      "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n"
      "\n"
      "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
      "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\","
      "\"params\":{\"name\":\"get_font_features\"}}\n"
      "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/call\","
      "\"params\":{\"name\":\"get_glyph_classes\"}}\n"
      "{\"jsonrpc\":\"2.0\",\"id\":4,\"method\":\"ping\"}\n");
  expect(server.serve(in) == 0, "serve exits cleanly at EOF");

  std::istringstream lines(out.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    std::optional<fontbridge::jsonlite::JsonError> err;
    fontbridge::jsonlite::parse(line, &err);
    expect(!err, "each output line is one JSON frame");
    ++count;
  }
  expect(count == 4, "one response per request, none for notifications");
  expect(bridge.stats().executions.load() == 2, "both tool calls finished before return");
  fs::remove_all(root);
}

void test_rpc_serve_caps_in_flight_calls() {
  const fs::path root = fresh_dir("rpc_cap");
  fontbridge::ExecutionBridge bridge(test_config(root), stub_host());
  fontbridge::OperationDispatcher ops(bridge);
  std::ostringstream out;
  fontbridge::RpcServer server(ops, out, 2);
  expect(server.max_in_flight() == 2, "cap stored");

  std::string input;
  for (int id = 1; id <= 8; ++id)
    input += "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) +
             ",\"method\":\"tools/call\",\"params\":{\"name\":\"get_kerning\"}}\n";
  std::istringstream in(input);

  ::setenv("FONTLAB_STUB_DELAY_MS", "100", 1);
  const int rc = server.serve(in);
  ::unsetenv("FONTLAB_STUB_DELAY_MS");
  expect(rc == 0, "serve exits cleanly at EOF");

  std::istringstream lines(out.str());
  std::string line;
  std::vector<int64_t> ids;
  while (std::getline(lines, line)) {
    const auto response = response_object(line);
    const Value *id = fontbridge::jsonlite::find(response, "id");
    expect(id && std::holds_alternative<int64_t>(id->v), "response carries its id");
    expect(fontbridge::jsonlite::find(response, "result") != nullptr,
           "call answered with a result");
    ids.push_back(std::get<int64_t>(id->v));
  }
  std::sort(ids.begin(), ids.end());
  expect(ids == std::vector<int64_t>{1, 2, 3, 4, 5, 6, 7, 8}, "every call answered once");
  expect(server.peak_in_flight() >= 1 && server.peak_in_flight() <= 2,
         "dispatch never exceeds the cap");
  expect(bridge.gate().peak() <= 2, "bridge saw at most the capped calls");
  expect(bridge.stats().executions.load() == 8, "all calls executed");

  expect(throws<fontbridge::ConfigError>([&] { fontbridge::RpcServer s(ops, out, 0); }),
         "cap of 0 rejected");
  fs::remove_all(root);
}

void test_version_manifest() {
  const auto m = fontbridge::version::current_manifest();
  expect(m.server_name == "fontbridge", "server name");
  expect(m.hash_primitive == "blake3", "hash primitive in manifest");
  expect(fontbridge::version::manifest_to_value(m).is_object(), "manifest serializes");
}

} // namespace

int main() {
  std::cout << "=== fontbridge Test Suite ===\n";

  std::cout << "\n[Literal Encoding]\n";
  run_test("scalar literals", test_literal_scalars);
  run_test("control characters", test_literal_control_characters);
  run_test("non-ASCII escapes", test_literal_non_ascii);
  run_test("invalid input rejected", test_literal_rejects_bad_input);
  run_test("hostile strings round-trip", test_literal_round_trip_hostile_strings);
  run_test("decoder rejects foreign syntax", test_decode_rejects_foreign_syntax);

  std::cout << "\n[Validators]\n";
  run_test("identifier boundaries", test_identifier_boundaries);
  run_test("numeric boundaries", test_numeric_boundaries);
  run_test("code point boundaries", test_codepoint_boundaries);
  run_test("string length in code points", test_string_length_counts_code_points);
  run_test("choice", test_choice);
  run_test("export path traversal", test_export_path_traversal);
  run_test("export path symlink ancestor", test_export_path_symlink_ancestor);
  run_test("export path extension and parent", test_export_path_extension_and_parent);
  run_test("request size cap", test_request_size_cap);

  std::cout << "\n[Error Sanitizer]\n";
  run_test("path and line redaction", test_sanitize_path_and_line);
  run_test("windows path and colon line", test_sanitize_windows_path_and_colon_line);
  run_test("non-ASCII paths", test_sanitize_non_ascii_paths);
  run_test("glued path categorized", test_sanitize_glued_path_categorized);
  run_test("traceback collapse", test_sanitize_traceback_collapse);
  run_test("strict mode and truncation", test_sanitize_strict_and_truncation);
  run_test("categories", test_categorize);

  std::cout << "\n[Host Process]\n";
  run_test("host locator", test_host_locator);
  run_test("work area lifecycle", test_work_area_lifecycle);
  run_test("secret env filtering", test_secret_env_filtering);
  run_test("spawn failure", test_process_spawn_failure);

  std::cout << "\n[Concurrency Gate]\n";
  run_test("zero capacity rejected", test_gate_rejects_zero_capacity);
  run_test("blocks at capacity", test_gate_blocks_at_capacity);
  run_test("slot released on exception", test_gate_slot_released_on_exception);

  std::cout << "\n[Execution Bridge]\n";
  run_test("end-to-end success", test_bridge_end_to_end_success);
  run_test("host-reported failure sanitized", test_bridge_host_reported_failure_sanitized);
  run_test("fallback without output file", test_bridge_fallback_paths);
  run_test("malformed output", test_bridge_malformed_output);
  run_test("exit status precedence", test_bridge_exit_status_overrides_file);
  run_test("timeout kills host", test_bridge_timeout_kills_host);
  run_test("timeout clamped", test_bridge_timeout_clamped);
  run_test("concurrency cap", test_bridge_concurrency_cap);
  run_test("spawn failure", test_bridge_spawn_failure);
  run_test("work area failure", test_bridge_work_area_failure);
  run_test("result interpretation", test_interpret_host_run_direct);

  std::cout << "\n[Templates]\n";
  run_test("binding rules", test_template_binding_rules);
  run_test("all templates render", test_all_templates_render);
  run_test("glyph lookup preamble", test_glyph_lookup_preamble);
  run_test("injection stays literal", test_injection_stays_literal);
  run_test("create_glyph defaults", test_create_glyph_defaults);
  run_test("update_font_info fields", test_update_font_info_only_given_fields);

  std::cout << "\n[Operations]\n";
  run_test("validation never spawns", test_dispatch_validation_never_spawns);
  run_test("dispatch reaches host", test_dispatch_reaches_host);
  run_test("resources", test_dispatch_resources);
  run_test("catalog shape", test_catalog_shape);

  std::cout << "\n[Configuration]\n";
  run_test("config validation", test_config_validation);
  run_test("config from environment", test_config_env);

  std::cout << "\n[Observability]\n";
  run_test("stats and histogram", test_stats_and_histogram);
  run_test("hash vectors", test_hash_vectors);
  run_test("result shape", test_result_shape);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[RPC Server]\n";
  run_test("protocol errors", test_rpc_protocol_errors);
  run_test("methods", test_rpc_methods);
  run_test("serve loop", test_rpc_serve_loop);
  run_test("in-flight cap", test_rpc_serve_caps_in_flight_calls);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
