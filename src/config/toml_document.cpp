#include "config/toml_document.hpp"

#include <toml++/toml.hpp>

#include <cstdint>

namespace comfytest::config {

namespace {

using JsonValue = core::json::Value;

bool ConvertNode(const toml::node& node, const std::string& where, JsonValue& out,
                 std::string& error);

bool ConvertTable(const toml::table& table, const std::string& where, JsonValue& out,
                  std::string& error) {
  out = JsonValue{};
  out.type = JsonValue::Type::kObject;
  for (auto&& [key, node] : table) {
    const std::string name(key.str());
    JsonValue member;
    if (!ConvertNode(node, where.empty() ? name : where + "." + name, member, error)) {
      return false;
    }
    out.object_value.emplace_back(name, std::move(member));
  }
  return true;
}

bool ConvertNode(const toml::node& node, const std::string& where, JsonValue& out,
                 std::string& error) {
  out = JsonValue{};
  if (const toml::table* table = node.as_table(); table != nullptr) {
    return ConvertTable(*table, where, out, error);
  }
  if (const toml::array* array = node.as_array(); array != nullptr) {
    out.type = JsonValue::Type::kArray;
    std::size_t index = 0;
    for (const toml::node& item : *array) {
      JsonValue converted;
      if (!ConvertNode(item, where + "[" + std::to_string(index) + "]", converted, error)) {
        return false;
      }
      out.array_value.push_back(std::move(converted));
      ++index;
    }
    return true;
  }
  if (node.is_string()) {
    out.type = JsonValue::Type::kString;
    out.string_value = node.value<std::string>().value_or(std::string());
    return true;
  }
  if (node.is_integer()) {
    out.type = JsonValue::Type::kNumber;
    out.number_value = static_cast<double>(node.value<std::int64_t>().value_or(0));
    return true;
  }
  if (node.is_floating_point()) {
    out.type = JsonValue::Type::kNumber;
    out.number_value = node.value<double>().value_or(0.0);
    return true;
  }
  if (node.is_boolean()) {
    out.type = JsonValue::Type::kBool;
    out.bool_value = node.value<bool>().value_or(false);
    return true;
  }
  const toml::source_region& source = node.source();
  error = std::to_string(source.begin.line) + ":" + std::to_string(source.begin.column) + ": " +
          where + ": dates and times are not supported";
  return false;
}

} // namespace

bool ParseTomlDocument(std::string_view text, std::string_view source_name, JsonValue& root,
                       std::string& error) {
  toml::table table;
  try {
    table = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    const toml::source_region& source = e.source();
    error = std::to_string(source.begin.line) + ":" + std::to_string(source.begin.column) + ": " +
            std::string(e.description());
    return false;
  }
  return ConvertTable(table, "", root, error);
}

} // namespace comfytest::config
