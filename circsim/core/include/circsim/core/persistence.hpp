#pragma once

#include <circsim/core/value.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace circsim::core {

/// @brief Key of the timestamp stored when the simulation stops.
inline constexpr std::string_view STOP_TIME_KEY = "circsim-stop-time";

/// @brief Keys with this prefix are reserved for the circuit and never pruned.
inline constexpr std::string_view RESERVED_KEY_PREFIX = "circsim-";

/// @brief String-keyed storage of persistent block states.
///
/// The circuit reads and writes opaque per-block state values under keys
/// of the form `<Type 'name'>`, stores the stop timestamp under
/// STOP_TIME_KEY and prunes keys that do not belong to any persistent block.
///
/// Implementations may throw from any member function; the circuit treats
/// storage errors as best-effort failures and logs them.
///
/// @see Circuit::set_persistent_store, MemoryStore
/// @ingroup core_persistence
class PersistentStore {
public:
    virtual ~PersistentStore() = default;

    [[nodiscard]] virtual std::optional<Value> get(std::string_view key) const = 0;
    virtual void set(const std::string& key, Value value) = 0;
    virtual void erase(std::string_view key) = 0;
    [[nodiscard]] virtual std::vector<std::string> keys() const = 0;

    /// @brief Write buffered changes to the backing medium (if any).
    virtual void flush() {}

protected:
    PersistentStore() = default;
    PersistentStore(const PersistentStore&) = default;
    PersistentStore& operator=(const PersistentStore&) = default;
};

/// @brief In-memory PersistentStore.
/// @ingroup core_persistence
class MemoryStore : public PersistentStore {
public:
    [[nodiscard]] std::optional<Value> get(std::string_view key) const override;
    void set(const std::string& key, Value value) override;
    void erase(std::string_view key) override;
    [[nodiscard]] std::vector<std::string> keys() const override;

    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

private:
    std::map<std::string, Value, std::less<>> data_;
};

} // namespace circsim::core
