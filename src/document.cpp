/**
 * @file document.cpp
 * @brief Conversion between TOML/YAML/JSON files and JSON trees.
 */
#include "document.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace gitfindr {

namespace {

using nlohmann::json;

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * In ScalarMode::Infer scalars that spell a boolean or a number become JSON
 * booleans and numbers; otherwise every scalar stays a string.
 *
 * @param node YAML node to transform.
 * @param mode Scalar conversion mode.
 * @return JSON value mirroring the YAML content.
 */
json yaml_to_json(const YAML::Node &node, ScalarMode mode) {
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (mode == ScalarMode::Verbatim)
      return s;
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 0);
      if (idx == s.size())
        return i;
    } catch (const std::logic_error &) {
    }
    try {
      size_t idx = 0;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::logic_error &) {
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(
        node.begin(), node.end(), std::back_inserter(array),
        [mode](const YAML::Node &item) { return yaml_to_json(item, mode); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second, mode);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/// TOML spelling of a single value.
template <typename Value> std::string toml_text(const Value &value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

/**
 * Convert a parsed TOML node to JSON.
 *
 * Strings stay strings; dates and times become their TOML text. Booleans
 * and numbers keep their type in ScalarMode::Infer and are spelled out as
 * strings in ScalarMode::Verbatim, matching yaml_to_json().
 *
 * @param node TOML table, array or value.
 * @param mode Scalar conversion mode.
 * @return JSON value mirroring the TOML content.
 */
json toml_to_json(const toml::node &node, ScalarMode mode) {
  return node.visit([mode](const auto &item) -> json {
    using Item = std::decay_t<decltype(item)>;
    if constexpr (toml::is_table<Item>) {
      json obj = json::object();
      for (auto &&[key, child] : item) {
        obj[std::string(key.str())] = toml_to_json(child, mode);
      }
      return obj;
    } else if constexpr (toml::is_array<Item>) {
      json arr = json::array();
      for (const auto &child : item) {
        arr.push_back(toml_to_json(child, mode));
      }
      return arr;
    } else if constexpr (toml::is_string<Item>) {
      return item.get();
    } else if constexpr (toml::is_date<Item> || toml::is_time<Item> ||
                         toml::is_date_time<Item>) {
      return toml_text(item);
    } else {
      if (mode == ScalarMode::Verbatim) {
        return toml_text(item);
      }
      return item.get();
    }
  });
}

void emit_yaml(YAML::Emitter &out, const json &value) {
  switch (value.type()) {
  case json::value_t::object:
    out << YAML::BeginMap;
    for (const auto &[key, item] : value.items()) {
      out << YAML::Key << YAML::DoubleQuoted << key << YAML::Value;
      emit_yaml(out, item);
    }
    out << YAML::EndMap;
    break;
  case json::value_t::array:
    out << YAML::BeginSeq;
    for (const auto &item : value) {
      emit_yaml(out, item);
    }
    out << YAML::EndSeq;
    break;
  case json::value_t::string:
    out << YAML::DoubleQuoted << value.get<std::string>();
    break;
  case json::value_t::boolean:
    out << value.get<bool>();
    break;
  case json::value_t::number_integer:
    out << value.get<std::int64_t>();
    break;
  case json::value_t::number_unsigned:
    out << value.get<std::uint64_t>();
    break;
  case json::value_t::number_float:
    out << value.get<double>();
    break;
  default:
    out << YAML::Null;
    break;
  }
}

toml::table json_to_toml_table(const json &value);

toml::array json_to_toml_array(const json &value);

/**
 * Append a JSON value to a TOML container through @p put, which receives
 * the converted TOML value.
 */
template <typename Put>
void put_toml_value(const json &value, const std::string &where, Put &&put) {
  switch (value.type()) {
  case json::value_t::object:
    put(json_to_toml_table(value));
    break;
  case json::value_t::array:
    put(json_to_toml_array(value));
    break;
  case json::value_t::string:
    put(value.get<std::string>());
    break;
  case json::value_t::boolean:
    put(value.get<bool>());
    break;
  case json::value_t::number_integer:
  case json::value_t::number_unsigned:
    put(value.get<std::int64_t>());
    break;
  case json::value_t::number_float:
    put(value.get<double>());
    break;
  default:
    throw std::runtime_error("TOML cannot represent a null value at '" +
                             where + "'");
  }
}

toml::table json_to_toml_table(const json &value) {
  toml::table tbl;
  for (const auto &[key, item] : value.items()) {
    put_toml_value(item, key, [&tbl, &key](auto &&converted) {
      tbl.insert_or_assign(key, std::forward<decltype(converted)>(converted));
    });
  }
  return tbl;
}

toml::array json_to_toml_array(const json &value) {
  toml::array arr;
  for (const auto &item : value) {
    put_toml_value(item, "[]", [&arr](auto &&converted) {
      arr.push_back(std::forward<decltype(converted)>(converted));
    });
  }
  return arr;
}

std::string lower_extension(const std::filesystem::path &path) {
  std::string ext = path.extension().string();
  if (!ext.empty() && ext.front() == '.') {
    ext.erase(0, 1);
  }
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

} // namespace

DocumentFormat document_format_from_path(const std::filesystem::path &path) {
  std::string ext = lower_extension(path);
  if (ext == "toml" || ext == "tml") {
    return DocumentFormat::Toml;
  }
  if (ext == "json") {
    return DocumentFormat::Json;
  }
  if (ext == "yaml" || ext == "yml") {
    return DocumentFormat::Yaml;
  }
  if (ext.empty()) {
    throw std::runtime_error("Unknown file extension for " + path.string());
  }
  throw std::runtime_error("Unsupported file format: " + ext);
}

/**
 * Parse a structured file into a JSON tree.
 *
 * Parser-specific exceptions are rethrown as std::runtime_error carrying the
 * file name.
 */
json read_document(const std::filesystem::path &path, ScalarMode mode) {
  DocumentFormat format = document_format_from_path(path);
  try {
    switch (format) {
    case DocumentFormat::Yaml:
      return yaml_to_json(YAML::LoadFile(path.string()), mode);
    case DocumentFormat::Toml:
      return toml_to_json(toml::parse_file(path.string()), mode);
    case DocumentFormat::Json: {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("cannot open file");
      }
      json j;
      f >> j;
      return j;
    }
    }
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to read " + path.string() + ": " +
                             e.what());
  }
  return nullptr;
}

void write_document(const std::filesystem::path &path, const json &doc) {
  DocumentFormat format = document_format_from_path(path);
  std::string text;
  switch (format) {
  case DocumentFormat::Json:
    text = doc.dump(2) + "\n";
    break;
  case DocumentFormat::Yaml: {
    YAML::Emitter out;
    emit_yaml(out, doc);
    if (!out.good()) {
      throw std::runtime_error("Failed to encode YAML for " + path.string() +
                               ": " + out.GetLastError());
    }
    text = std::string(out.c_str()) + "\n";
    break;
  }
  case DocumentFormat::Toml: {
    if (!doc.is_object()) {
      throw std::runtime_error("TOML documents must be tables: " +
                               path.string());
    }
    std::ostringstream oss;
    oss << json_to_toml_table(doc) << "\n";
    text = oss.str();
    break;
  }
  }

  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    throw std::runtime_error("Failed to open " + path.string() +
                             " for writing");
  }
  f << text;
  f.flush();
  if (!f) {
    throw std::runtime_error("Failed to write " + path.string());
  }
  category_logger("store")->debug("Wrote {} bytes to {}", text.size(),
                                  path.string());
}

} // namespace gitfindr
