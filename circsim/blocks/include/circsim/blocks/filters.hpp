#pragma once

#include <circsim/core/block.hpp>
#include <circsim/core/event.hpp>
#include <circsim/core/sblock.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace circsim::blocks {

/// @brief Reject the first output event, i.e. the change from UNDEF.
[[nodiscard]] std::optional<core::EventData> not_from_undef(core::EventData data);

/// @brief Filter output events of logical values by edge direction.
///
/// @c rise passes false -> true, @c fall passes true -> false. The
/// initial change from UNDEF is passed by @c u_rise (defaults to @c rise)
/// for a true value and by @c u_fall for a false value.
///
/// @ingroup blocks_filters
class Edge {
public:
    struct Config {
        bool rise{false};
        bool fall{false};
        std::optional<bool> u_rise;
        bool u_fall{false};
    };

    explicit Edge(Config config);

    std::optional<core::EventData> operator()(core::EventData data) const;

private:
    bool rise_;
    bool fall_;
    bool u_rise_;
    bool u_fall_;
};

/// @brief Pass numeric values only after a change of at least @p delta
/// since the last passed value.
/// @ingroup blocks_filters
class Delta {
public:
    explicit Delta(double delta) : delta_(delta) {}

    std::optional<core::EventData> operator()(core::EventData data);

private:
    double delta_;
    std::optional<double> last_;
};

/// @brief Pass events only while the output of @p control is true.
/// @ingroup blocks_filters
class IfOutput {
public:
    explicit IfOutput(const core::Block& control) : control_(&control) {}

    std::optional<core::EventData> operator()(core::EventData data) const;

private:
    const core::Block* control_;
};

/// @brief Pass events only while @p control is not initialized.
/// @ingroup blocks_filters
class IfNotInitialized {
public:
    explicit IfNotInitialized(const core::SBlock& control) : control_(&control) {}

    std::optional<core::EventData> operator()(core::EventData data) const;

private:
    const core::SBlock* control_;
};

/// @brief Chainable editor of event payloads.
///
/// @code
/// core::Event("dest", "put", {blocks::DataEdit{}.rename("value", "temp").add({{"unit", "C"}})})
/// @endcode
///
/// Edits run in order. A missing key in copy(), rename() or modify()
/// throws std::out_of_range.
///
/// @ingroup blocks_filters
class DataEdit {
public:
    /// @brief Replacement value; nullopt rejects the event, UNDEF deletes the key.
    using Modifier = std::function<std::optional<core::Value>(const core::Value&)>;

    /// @brief Add or overwrite items.
    DataEdit& add(core::EventData items);
    /// @brief Add items only where the key is missing.
    DataEdit& setdefault(core::EventData items);
    /// @brief Set @p key to the current output of @p source.
    DataEdit& add_output(std::string key, const core::Block& source);
    DataEdit& copy(std::string src, std::string dst);
    DataEdit& rename(std::string src, std::string dst);
    /// @brief Delete keys; missing keys are ignored.
    DataEdit& remove(std::vector<std::string> keys);
    /// @brief Delete all keys except the listed ones.
    DataEdit& permit(std::vector<std::string> keys);
    DataEdit& modify(std::string key, Modifier func);

    std::optional<core::EventData> operator()(core::EventData data) const;

private:
    using Edit = std::function<std::optional<core::EventData>(core::EventData)>;

    std::vector<Edit> edits_;
};

} // namespace circsim::blocks
