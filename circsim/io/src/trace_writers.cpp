#include <circsim/io/trace_writers.hpp>

#include <iomanip>
#include <sstream>

namespace circsim::io {

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(core::TimePoint /*time*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output) {
    output_ << "[\n";
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(core::TimePoint time) {
    if (!first_record_) {
        output_ << ",\n";
    }
    first_record_ = false;
    output_ << "  {\"time\": " << std::fixed << std::setprecision(6) << core::time_to_seconds(time);
}

void JsonTraceWriter::type(std::string_view name) {
    output_ << ", \"type\": \"" << escape_json_string(name) << "\"";
}

std::string JsonTraceWriter::escape_json_string(std::string_view str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0') << std::setw(4) << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void JsonTraceWriter::field(std::string_view key, double value) {
    output_ << ", \"" << escape_json_string(key) << "\": " << std::defaultfloat << std::setprecision(15)
            << value;
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    output_ << ", \"" << escape_json_string(key) << "\": " << value;
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    output_ << ", \"" << escape_json_string(key) << "\": \"" << escape_json_string(value) << "\"";
}

void JsonTraceWriter::end() {
    output_ << "}";
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    if (!first_record_) {
        output_ << "\n";
    }
    output_ << "]\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

std::optional<std::string> TraceRecord::text(std::string_view key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    if (const auto* str = std::get_if<std::string>(&it->second)) {
        return *str;
    }
    return std::nullopt;
}

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = core::time_to_seconds(time);
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields.insert_or_assign(std::string(key), std::string(value));
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::vector<TraceRecord> MemoryTraceWriter::records_of(std::string_view type) const {
    std::vector<TraceRecord> result;
    for (const auto& record : records_) {
        if (record.type == type) {
            result.push_back(record);
        }
    }
    return result;
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

std::string_view TextualTraceWriter::color_of(std::string_view type) const noexcept {
    if (!color_enabled_) {
        return {};
    }
    if (type == "abort") {
        return "\033[31m";
    }
    if (type == "state") {
        return "\033[36m";
    }
    if (type == "event") {
        return "\033[33m";
    }
    if (type == "sim_start" || type == "sim_stop") {
        return "\033[1m";
    }
    return {};
}

void TextualTraceWriter::begin(core::TimePoint time) {
    const double seconds = core::time_to_seconds(time);
    if (!origin_) {
        origin_ = seconds;
    }
    current_time_ = seconds - *origin_;
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    current_fields_.push_back({std::string(key), oss.str()});
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.push_back({std::string(key), std::string(value)});
}

void TextualTraceWriter::end() {
    output_ << "[" << std::setw(12) << std::fixed << std::setprecision(6) << current_time_ << "] ";
    if (prev_time_ && current_time_ != *prev_time_) {
        output_ << "(+" << std::setw(10) << std::fixed << std::setprecision(6)
                << (current_time_ - *prev_time_) << ") ";
    } else {
        output_ << "(           ) ";
    }

    const std::string_view color = color_of(current_type_);
    output_ << color << std::setw(10) << std::right << current_type_ << ":";
    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].key << " = " << current_fields_[i].value;
    }
    if (!color.empty()) {
        output_ << "\033[0m";
    }
    output_ << "\n";
    prev_time_ = current_time_;
}

} // namespace circsim::io
