#include <circsim/core/const_pool.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

namespace circsim::core {

Const::Const(Value value)
    : value_(std::move(value)) {
    if (value_.is_undef()) {
        throw ConfigurationError("Const value must not be UNDEF");
    }
}

std::string Const::to_string() const {
    return fmt::format("<Const {}>", value_.to_string());
}

const Const& ConstPool::get(const Value& value) {
    auto it = pool_.find(value);
    if (it == pool_.end()) {
        it = pool_.emplace(value, std::make_unique<Const>(value)).first;
    }
    return *it->second;
}

} // namespace circsim::core
