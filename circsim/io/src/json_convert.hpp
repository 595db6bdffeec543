#pragma once

// rapidjson conversions shared by the io sources; not part of the public API.

#include <circsim/core/value.hpp>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>

namespace circsim::io::detail {

/// @throws LoaderError for a JSON object; @p context names the location.
[[nodiscard]] core::Value from_json(const rapidjson::Value& json, const std::string& context);

/// @throws LoaderError for UNDEF or a non-finite double.
void to_json(rapidjson::Writer<rapidjson::StringBuffer>& writer, const core::Value& value);

} // namespace circsim::io::detail
