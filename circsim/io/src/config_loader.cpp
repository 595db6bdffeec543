#include <circsim/io/config_loader.hpp>
#include <circsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>

namespace circsim::io {

namespace {

bool get_bool_or(const rapidjson::Value& obj, const char* name, bool default_val, const char* context) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    const auto& member = obj[name];
    if (!member.IsBool()) {
        throw LoaderError(std::string("field '") + name + "' must be a boolean", context);
    }
    return member.GetBool();
}

std::string get_string(const rapidjson::Value& obj, const char* name, const char* context) {
    const auto& member = obj[name];
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

void parse_trace(CircuitConfig& config, const rapidjson::Value& trace) {
    if (!trace.IsObject()) {
        throw LoaderError("field 'trace' must be an object", "config");
    }
    if (trace.HasMember("format")) {
        config.trace_format = parse_trace_format(get_string(trace, "format", "trace"));
    }
    if (trace.HasMember("output")) {
        config.trace_output = get_string(trace, "output", "trace");
    }
}

void parse_config_impl(CircuitConfig& config, const rapidjson::Value& doc) {
    config.options.virtual_time = get_bool_or(doc, "virtual_time", false, "config");
    config.circuit_debug = get_bool_or(doc, "circuit_debug", false, "config");

    if (doc.HasMember("max_evals_per_block")) {
        const auto& member = doc["max_evals_per_block"];
        if (!member.IsUint64() || member.GetUint64() == 0) {
            throw LoaderError("field 'max_evals_per_block' must be a positive integer", "config");
        }
        config.options.max_evals_per_block = member.GetUint64();
    }

    if (doc.HasMember("start_time")) {
        const auto& member = doc["start_time"];
        if (!member.IsNumber()) {
            throw LoaderError("field 'start_time' must be a number", "config");
        }
        config.options.start_time = core::time_from_seconds(member.GetDouble());
    }

    if (doc.HasMember("persistent_file")) {
        config.persistent_file = get_string(doc, "persistent_file", "config");
    }

    if (doc.HasMember("debug")) {
        const auto& debug = doc["debug"];
        if (!debug.IsArray()) {
            throw LoaderError("field 'debug' must be an array", "config");
        }
        for (rapidjson::SizeType idx = 0; idx < debug.Size(); ++idx) {
            if (!debug[idx].IsString()) {
                throw LoaderError("must be a string", "debug[" + std::to_string(idx) + "]");
            }
            config.debug.emplace_back(debug[idx].GetString(), debug[idx].GetStringLength());
        }
    }

    if (doc.HasMember("trace")) {
        parse_trace(config, doc["trace"]);
    }
}

} // anonymous namespace

TraceFormat parse_trace_format(std::string_view name) {
    if (name == "none") {
        return TraceFormat::None;
    }
    if (name == "json") {
        return TraceFormat::Json;
    }
    if (name == "text") {
        return TraceFormat::Text;
    }
    throw LoaderError("unknown trace format '" + std::string(name) + "' (expected none, json or text)",
                      "trace");
}

CircuitConfig load_circuit_config_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "config");
    }

    CircuitConfig result;
    parse_config_impl(result, doc);
    return result;
}

CircuitConfig load_circuit_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    try {
        return load_circuit_config_from_string(oss.str());
    } catch (const LoaderError& e) {
        throw LoaderError(e.what(), path.string());
    }
}

void apply_debug_settings(core::Circuit& circuit, const CircuitConfig& config) {
    circuit.set_circuit_debug(config.circuit_debug);
    for (const auto& pattern : config.debug) {
        circuit.set_debug(true, pattern);
    }
}

} // namespace circsim::io
