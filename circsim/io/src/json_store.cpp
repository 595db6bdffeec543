#include <circsim/io/json_store.hpp>
#include <circsim/io/error.hpp>
#include "json_convert.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace circsim::io {

JsonFileStore::JsonFileStore(std::filesystem::path path)
    : path_(std::move(path)) {
    if (!std::filesystem::exists(path_)) {
        return;
    }
    std::ifstream file(path_);
    if (!file) {
        throw LoaderError("cannot open file", path_.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    const std::string content = oss.str();

    rapidjson::Document doc;
    doc.Parse(content.c_str(), content.size());
    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError())
                + " at offset " + std::to_string(doc.GetErrorOffset()),
            path_.string());
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", path_.string());
    }
    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        data_.insert_or_assign(key, detail::from_json(it->value, key));
    }
}

std::optional<core::Value> JsonFileStore::get(std::string_view key) const {
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JsonFileStore::set(const std::string& key, core::Value value) {
    // serialize early so that an unsupported value is reported by set()
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    detail::to_json(writer, value);
    data_.insert_or_assign(key, std::move(value));
    dirty_ = true;
}

void JsonFileStore::erase(std::string_view key) {
    auto it = data_.find(key);
    if (it != data_.end()) {
        data_.erase(it);
        dirty_ = true;
    }
}

std::vector<std::string> JsonFileStore::keys() const {
    std::vector<std::string> result;
    result.reserve(data_.size());
    for (const auto& [key, value] : data_) {
        result.push_back(key);
    }
    return result;
}

void JsonFileStore::flush() {
    if (!dirty_) {
        return;
    }
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    for (const auto& [key, value] : data_) {
        writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
        detail::to_json(writer, value);
    }
    writer.EndObject();

    std::filesystem::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw LoaderError("cannot open file for writing", tmp.string());
        }
        file << buffer.GetString() << '\n';
        if (!file.flush()) {
            throw LoaderError("write error", tmp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        throw LoaderError("cannot replace file: " + ec.message(), path_.string());
    }
    dirty_ = false;
}

} // namespace circsim::io
