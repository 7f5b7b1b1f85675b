#include "config.h"

#include "errors.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <utility>

namespace packup {

namespace {

bool is_comment_start(char c) { return c == ';' || c == '#'; }

// A comment marker only starts an inline comment when preceded by whitespace, so
// values like "Utility;" survive.
std::string_view strip_inline_comment(std::string_view value) {
  for (size_t i{ 1 }; i < value.size(); ++i) {
    if (is_comment_start(value[i]) && (value[i - 1] == ' ' || value[i - 1] == '\t')) {
      return value.substr(0, i);
    }
  }
  return value;
}

std::string_view strip_quotes(std::string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

[[noreturn]] void throw_parse_error(std::string_view source_name,
                                    size_t line_no,
                                    std::string_view message) {
  throw config_error{ std::string{ source_name } + ":" + std::to_string(line_no) + ": " +
                      std::string{ message } };
}

bool parse_bool(std::string_view source_name,
                std::string_view key,
                std::string const &raw) {
  std::string value{ raw };
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (value == "true" || value == "yes" || value == "on" || value == "1") { return true; }
  if (value == "false" || value == "no" || value == "off" || value == "0") { return false; }

  throw config_error{ std::string{ source_name } + ": " + std::string{ key } +
                      " must be a boolean, got '" + raw + "'" };
}

std::string require(ini_document const &doc,
                    std::string_view source_name,
                    std::string_view section,
                    std::string_view key) {
  auto value{ doc.get(section, key) };
  if (!value || value->empty()) {
    throw config_error{ std::string{ source_name } + ": missing required key '" +
                        std::string{ key } + "' in [" + std::string{ section } + "]" };
  }
  return std::move(*value);
}

}  // namespace

std::optional<std::string> ini_document::get(std::string_view section,
                                             std::string_view key) const {
  auto const sec{ sections.find(std::string{ section }) };
  if (sec == sections.end()) { return std::nullopt; }
  auto const it{ sec->second.find(std::string{ key }) };
  if (it == sec->second.end()) { return std::nullopt; }
  return it->second;
}

ini_document ini_parse(std::string_view text, std::string_view source_name) {
  ini_document doc;
  std::optional<std::string> current_section;
  size_t line_start{ 0 };
  size_t line_no{ 0 };

  while (line_start < text.size()) {
    size_t const line_end{ text.find('\n', line_start) };
    auto const raw{ text.substr(
        line_start,
        (line_end == std::string_view::npos ? text.size() : line_end) - line_start) };
    ++line_no;

    auto const line{ util_trim(raw) };
    if (!line.empty() && !is_comment_start(line.front())) {
      if (line.front() == '[') {
        if (line.back() != ']') {
          throw_parse_error(source_name, line_no, "unterminated section header");
        }
        auto const name{ util_trim(line.substr(1, line.size() - 2)) };
        if (name.empty()) { throw_parse_error(source_name, line_no, "empty section name"); }
        current_section = std::string{ name };
        doc.sections[*current_section];
      } else {
        size_t const eq{ line.find('=') };
        if (eq == std::string_view::npos) {
          throw_parse_error(source_name, line_no, "expected 'key = value'");
        }
        if (!current_section) {
          throw_parse_error(source_name, line_no, "key outside of any section");
        }

        auto const key{ util_trim(line.substr(0, eq)) };
        if (key.empty()) { throw_parse_error(source_name, line_no, "empty key"); }

        auto const value{
          strip_quotes(util_trim(strip_inline_comment(line.substr(eq + 1))))
        };
        doc.sections[*current_section][std::string{ key }] = std::string{ value };
      }
    }

    if (line_end == std::string_view::npos) { break; }
    line_start = line_end + 1;
  }

  return doc;
}

deploy_config config_parse(std::string_view text, std::string_view source_name) {
  auto const doc{ ini_parse(text, source_name) };

  deploy_config cfg;
  cfg.name = require(doc, source_name, "general", "name");
  if (cfg.name.find('/') != std::string::npos || cfg.name == "." || cfg.name == "..") {
    throw config_error{ std::string{ source_name } + ": invalid name '" + cfg.name + "'" };
  }
  cfg.executable = require(doc, source_name, "general", "executable");

  if (auto icon{ doc.get("appimage", "icon") }; icon && !icon->empty()) {
    cfg.appimage.icon = std::filesystem::path{ *icon };
  }
  if (auto categories{ doc.get("appimage", "categories") };
      categories && !categories->empty()) {
    cfg.appimage.categories = std::move(*categories);
    if (cfg.appimage.categories.back() != ';') { cfg.appimage.categories.push_back(';'); }
  }

  cfg.flatpak.app_id = doc.get("flatpak", "app_id").value_or("");
  if (cfg.flatpak.app_id.empty()) { cfg.flatpak.app_id = "org.packup." + cfg.name; }
  if (auto v{ doc.get("flatpak", "runtime") }; v && !v->empty()) { cfg.flatpak.runtime = *v; }
  if (auto v{ doc.get("flatpak", "runtime_version") }; v && !v->empty()) {
    cfg.flatpak.runtime_version = *v;
  }
  if (auto v{ doc.get("flatpak", "sdk") }; v && !v->empty()) { cfg.flatpak.sdk = *v; }
  if (auto v{ doc.get("flatpak", "install") }) {
    cfg.flatpak.install = parse_bool(source_name, "install", *v);
  }

  return cfg;
}

deploy_config config_load(std::filesystem::path const &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw config_error{ "config file not found: " + path.string() };
  }

  std::string text;
  try {
    text = util_load_text(path);
  } catch (std::runtime_error const &e) {
    throw config_error{ "failed to read config file " + path.string() + ": " + e.what() };
  }

  return config_parse(text, path.string());
}

}  // namespace packup
