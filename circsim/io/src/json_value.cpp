#include <circsim/io/json_value.hpp>
#include <circsim/io/error.hpp>
#include "json_convert.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <variant>

namespace circsim::io {

namespace detail {

core::Value from_json(const rapidjson::Value& json, const std::string& context) {
    if (json.IsNull()) {
        return nullptr;
    }
    if (json.IsBool()) {
        return json.GetBool();
    }
    if (json.IsInt64()) {
        return json.GetInt64();
    }
    if (json.IsNumber()) {
        return json.GetDouble();
    }
    if (json.IsString()) {
        return std::string(json.GetString(), json.GetStringLength());
    }
    if (json.IsArray()) {
        core::Value::List list;
        list.reserve(json.Size());
        for (rapidjson::SizeType idx = 0; idx < json.Size(); ++idx) {
            list.push_back(from_json(json[idx], context + "[" + std::to_string(idx) + "]"));
        }
        return list;
    }
    throw LoaderError("JSON objects cannot be converted to a value", context);
}

void to_json(rapidjson::Writer<rapidjson::StringBuffer>& writer, const core::Value& value) {
    std::visit([&writer](const auto& item) {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, core::Undef>) {
            throw LoaderError("<UNDEF> cannot be serialized", "value");
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            writer.Null();
        } else if constexpr (std::is_same_v<T, bool>) {
            writer.Bool(item);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            writer.Int64(item);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(item)) {
                throw LoaderError("non-finite number cannot be serialized", "value");
            }
            writer.Double(item);
        } else if constexpr (std::is_same_v<T, std::string>) {
            writer.String(item.data(), static_cast<rapidjson::SizeType>(item.size()));
        } else {
            writer.StartArray();
            for (const auto& element : item) {
                to_json(writer, element);
            }
            writer.EndArray();
        }
    }, value.storage());
}

} // namespace detail

core::Value value_from_json(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    return detail::from_json(doc, "value");
}

std::string value_to_json(const core::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    detail::to_json(writer, value);
    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace circsim::io
