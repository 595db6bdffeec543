#include <circsim/core/persistence.hpp>

namespace circsim::core {

std::optional<Value> MemoryStore::get(std::string_view key) const {
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStore::set(const std::string& key, Value value) {
    data_.insert_or_assign(key, std::move(value));
}

void MemoryStore::erase(std::string_view key) {
    auto it = data_.find(key);
    if (it != data_.end()) {
        data_.erase(it);
    }
}

std::vector<std::string> MemoryStore::keys() const {
    std::vector<std::string> result;
    result.reserve(data_.size());
    for (const auto& [key, value] : data_) {
        result.push_back(key);
    }
    return result;
}

bool MemoryStore::contains(std::string_view key) const {
    return data_.find(key) != data_.end();
}

} // namespace circsim::core
