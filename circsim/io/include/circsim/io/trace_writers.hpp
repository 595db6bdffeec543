#pragma once

/// @file trace_writers.hpp
/// @brief TraceWriter implementations recording circuit activity.
/// @ingroup io_writers

#include <circsim/core/trace_writer.hpp>

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace circsim::io {

/// @brief Trace writer discarding all records.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Streams records as the elements of a JSON array.
///
/// Each record is an object with `time` (UNIX seconds), `type` and the
/// record fields. The closing bracket is written by finalize() or by the
/// destructor.
///
/// @ingroup io_writers
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output Destination stream; must outlive the writer.
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Write the closing bracket; later calls have no effect.
    void finalize();

private:
    static std::string escape_json_string(std::string_view str);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief A trace record kept in memory.
/// @ingroup io_writers
struct TraceRecord {
    using FieldValue = std::variant<double, uint64_t, std::string>;

    double time{0.0};
    std::string type;
    std::map<std::string, FieldValue, std::less<>> fields;

    /// @brief String field value, nullopt if missing or not a string.
    [[nodiscard]] std::optional<std::string> text(std::string_view key) const;
};

/// @brief Buffers all records in memory, mainly for tests.
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const noexcept { return records_; }

    /// @brief Records of the given type, in order.
    [[nodiscard]] std::vector<TraceRecord> records_of(std::string_view type) const;

    void clear() noexcept { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief One human readable line per record, optionally colored.
///
/// Format: `[time] (+delta) type: key = value, ...` where time is
/// relative to the first record.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    [[nodiscard]] std::string_view color_of(std::string_view type) const noexcept;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    std::optional<double> origin_;
    double current_time_{0.0};
    std::optional<double> prev_time_;
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace circsim::io
