#include "common.h"

#include "uusid/report/json.h"

#include <charconv>
#include <fstream>
#include <sstream>

std::optional<std::int64_t> parse_int(const std::string& text) {
  std::int64_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last || text.empty()) {
    return std::nullopt;
  }
  return value;
}

uusid::core::Result<uusid::id::GeneratorOptions> resolve_generator_options(
    const GeneratorFlags& flags) {
  nlohmann::json merged = nlohmann::json::object();

  if (flags.config_path.has_value()) {
    const auto text = read_text_file(flags.config_path.value());
    if (!text.has_value()) {
      return uusid::core::fail<uusid::id::GeneratorOptions>(uusid::core::ErrorKind::kConfiguration,
                                                            text.error());
    }
    merged = nlohmann::json::parse(text.value(), nullptr, false);
    if (merged.is_discarded()) {
      return uusid::core::fail<uusid::id::GeneratorOptions>(
          uusid::core::ErrorKind::kConfiguration,
          "config file is not valid JSON: " + flags.config_path.value());
    }
  }

  if (merged.is_object()) {
    merged.update(flags.overrides);
  }
  return uusid::report::generator_options_from_json(merged);
}

uusid::core::Result<std::string, std::string> read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return uusid::core::Result<std::string, std::string>::err("cannot open file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return uusid::core::Result<std::string, std::string>::ok(buffer.str());
}

uusid::core::Result<bool, std::string> write_text_file(const std::string& path,
                                                       const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return uusid::core::Result<bool, std::string>::err("cannot write file: " + path);
  }
  out << text;
  if (!out) {
    return uusid::core::Result<bool, std::string>::err("write failed: " + path);
  }
  return uusid::core::Result<bool, std::string>::ok(true);
}

void print_error(const uusid::core::Error& error) {
  std::cerr << "Error [" << uusid::core::error_kind_name(error.kind) << "]: " << error.message
            << "\n";
}
