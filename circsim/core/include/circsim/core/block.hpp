#pragma once

#include <circsim/core/event.hpp>
#include <circsim/core/logging.hpp>
#include <circsim/core/value.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace circsim::core {

class CBlock;
class Circuit;

/// @brief Common construction options of all blocks.
/// @ingroup core_blocks
struct BlockOptions {
    /// Unique block name. Empty means auto-generated `_<Type>_<n>`.
    /// Names starting with an underscore are reserved.
    std::string name;
    std::string comment;
    /// Events sent when the output changes.
    std::vector<Event> on_output;
    /// Events sent on every output update, even when unchanged
    /// (sequential blocks only).
    std::vector<Event> on_every_output;
    bool debug{false};
};

/// @brief Orders blocks by registration index.
struct BlockOrder {
    using is_transparent = void;

    bool operator()(const Block* lhs, const Block* rhs) const noexcept;
};

/// @brief Abstract circuit node.
///
/// A block has a unique name, an output which starts as UNDEF and never
/// returns to UNDEF, and a set of forward connections (`oconnections`)
/// built when the circuit is finalized. Blocks are created with
/// Circuit::add() and destroyed only together with their circuit.
///
/// Concrete blocks derive from CBlock (combinational) or SBlock
/// (sequential).
///
/// @see CBlock, SBlock, Circuit
/// @ingroup core_blocks
class Block {
public:
    virtual ~Block();

    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;
    Block(Block&&) = delete;
    Block& operator=(Block&&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& comment() const noexcept { return comment_; }
    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

    /// @brief Registration index, unique within the circuit.
    [[nodiscard]] std::size_t id() const noexcept { return id_; }

    [[nodiscard]] const Value& output() const noexcept { return output_; }
    [[nodiscard]] bool is_initialized() const noexcept { return !output_.is_undef(); }

    [[nodiscard]] Circuit& circuit() const noexcept { return circuit_; }

    [[nodiscard]] bool debug() const noexcept { return debug_; }
    void set_debug(bool value) noexcept { debug_ = value; }

    /// @brief Blocks whose inputs are connected to this block's output.
    [[nodiscard]] const std::set<CBlock*, BlockOrder>& oconnections() const noexcept {
        return oconnections_;
    }

    /// @brief "<Type 'name'>"
    [[nodiscard]] std::string to_string() const;

    /// @brief Pre-simulation hook.
    virtual void start() {}

    /// @brief Post-simulation hook.
    virtual void stop() {}

    /// @brief Static block information.
    [[nodiscard]] virtual EventData get_conf() const;

    template<typename... Args>
    void log_debug(fmt::format_string<Args...> format, Args&&... args) const {
        if (debug_) {
            logger()->debug("{}: {}", to_string(), fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void log_info(fmt::format_string<Args...> format, Args&&... args) const {
        logger()->info("{}: {}", to_string(), fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void log_warning(fmt::format_string<Args...> format, Args&&... args) const {
        logger()->warn("{}: {}", to_string(), fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void log_error(fmt::format_string<Args...> format, Args&&... args) const {
        logger()->error("{}: {}", to_string(), fmt::format(format, std::forward<Args>(args)...));
    }

protected:
    Block(Circuit& circuit, std::string_view type_name, BlockOptions options);

    /// @brief Store a new output value and send the output events.
    /// @return true if the output changed.
    /// @throws CircuitError if @p value is UNDEF.
    bool update_output(Value value);

    /// @brief Resolve names referenced by this block; called by finalize().
    virtual void resolve_references();

    std::vector<Event>& every_output_events() noexcept { return on_every_output_; }

    /// @brief Stop sending on_output events.
    void disable_output_events() noexcept { on_output_.clear(); }

private:
    friend class Circuit;

    Circuit& circuit_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::string type_name_;
    std::string name_;
    std::string comment_;
    std::vector<Event> on_output_;
    std::vector<Event> on_every_output_;
    bool debug_;
    std::size_t id_{0};
    Value output_;
    std::set<CBlock*, BlockOrder> oconnections_;
};

} // namespace circsim::core
