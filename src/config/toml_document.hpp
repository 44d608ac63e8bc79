#pragma once

#include "core/json_dom.hpp"

#include <string>
#include <string_view>

namespace comfytest::config {

// Parses a TOML document into the JSON value tree the config readers walk.
// Tables become objects, arrays become arrays, integers and floats become
// numbers. Dates and times have no counterpart and are rejected.
//
// On failure `error` carries "<line>:<column>: <description>".
bool ParseTomlDocument(std::string_view text, std::string_view source_name,
                       core::json::Value& root, std::string& error);

} // namespace comfytest::config
