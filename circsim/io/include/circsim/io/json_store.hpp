#pragma once

#include <circsim/core/persistence.hpp>

#include <filesystem>
#include <map>

namespace circsim::io {

/// @brief PersistentStore backed by a JSON object in a file.
///
/// The file is read once by the constructor; a missing file is an empty
/// store. Changes are kept in memory and written by flush(), which the
/// circuit calls when the simulation stops. The file is replaced through
/// a temporary file in the same directory.
///
/// @ingroup io
class JsonFileStore : public core::PersistentStore {
public:
    /// @throws LoaderError if an existing file cannot be read or parsed.
    explicit JsonFileStore(std::filesystem::path path);

    [[nodiscard]] std::optional<core::Value> get(std::string_view key) const override;
    void set(const std::string& key, core::Value value) override;
    void erase(std::string_view key) override;
    [[nodiscard]] std::vector<std::string> keys() const override;

    /// @throws LoaderError if the file cannot be written.
    void flush() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool dirty() const noexcept { return dirty_; }

private:
    std::filesystem::path path_;
    std::map<std::string, core::Value, std::less<>> data_;
    bool dirty_{false};
};

} // namespace circsim::io
