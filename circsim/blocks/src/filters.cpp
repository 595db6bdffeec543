#include <circsim/blocks/filters.hpp>
#include <circsim/core/logging.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace circsim::blocks {

using core::EventData;
using core::Value;

namespace {

const Value& required(const EventData& data, const std::string& key) {
    auto it = data.find(key);
    if (it == data.end()) {
        throw std::out_of_range(fmt::format("event data item '{}' not found", key));
    }
    return it->second;
}

} // anonymous namespace

std::optional<EventData> not_from_undef(EventData data) {
    if (core::get_or(data, "previous").is_undef()) {
        return std::nullopt;
    }
    return data;
}

// ------------------------------------------------------------------- Edge

Edge::Edge(Config config)
    : rise_(config.rise)
    , fall_(config.fall)
    , u_rise_(config.u_rise.value_or(config.rise))
    , u_fall_(config.u_fall) {
    if (!(rise_ || fall_ || u_rise_ || u_fall_)) {
        core::logger()->warn("Edge: all events will be filtered out!");
    }
}

std::optional<EventData> Edge::operator()(EventData data) const {
    const bool value = core::get_or(data, "value").truthy();
    const Value previous = core::get_or(data, "previous");
    bool pass = false;
    if (previous.is_undef()) {
        pass = value ? u_rise_ : u_fall_;
    } else if (value) {
        pass = !previous.truthy() && rise_;
    } else {
        pass = previous.truthy() && fall_;
    }
    if (!pass) {
        return std::nullopt;
    }
    return data;
}

// ------------------------------------------------------------------ Delta

std::optional<EventData> Delta::operator()(EventData data) {
    const double value = required(data, "value").as_double();
    if (last_ && std::abs(*last_ - value) < delta_) {
        return std::nullopt;
    }
    last_ = value;
    return data;
}

std::optional<EventData> IfOutput::operator()(EventData data) const {
    if (!control_->output().truthy()) {
        return std::nullopt;
    }
    return data;
}

std::optional<EventData> IfNotInitialized::operator()(EventData data) const {
    if (control_->is_initialized()) {
        return std::nullopt;
    }
    return data;
}

// --------------------------------------------------------------- DataEdit

DataEdit& DataEdit::add(EventData items) {
    edits_.emplace_back([items = std::move(items)](EventData data) -> std::optional<EventData> {
        for (const auto& [key, value] : items) {
            data.insert_or_assign(key, value);
        }
        return data;
    });
    return *this;
}

DataEdit& DataEdit::setdefault(EventData items) {
    edits_.emplace_back([items = std::move(items)](EventData data) -> std::optional<EventData> {
        data.insert(items.begin(), items.end());
        return data;
    });
    return *this;
}

DataEdit& DataEdit::add_output(std::string key, const core::Block& source) {
    edits_.emplace_back([key = std::move(key), src = &source](EventData data) -> std::optional<EventData> {
        data.insert_or_assign(key, src->output());
        return data;
    });
    return *this;
}

DataEdit& DataEdit::copy(std::string src, std::string dst) {
    edits_.emplace_back([src = std::move(src), dst = std::move(dst)](EventData data) -> std::optional<EventData> {
        data.insert_or_assign(dst, required(data, src));
        return data;
    });
    return *this;
}

DataEdit& DataEdit::rename(std::string src, std::string dst) {
    edits_.emplace_back([src = std::move(src), dst = std::move(dst)](EventData data) -> std::optional<EventData> {
        Value value = required(data, src);
        data.erase(src);
        data.insert_or_assign(dst, std::move(value));
        return data;
    });
    return *this;
}

DataEdit& DataEdit::remove(std::vector<std::string> keys) {
    edits_.emplace_back([keys = std::move(keys)](EventData data) -> std::optional<EventData> {
        for (const auto& key : keys) {
            data.erase(key);
        }
        return data;
    });
    return *this;
}

DataEdit& DataEdit::permit(std::vector<std::string> keys) {
    edits_.emplace_back([keys = std::move(keys)](EventData data) -> std::optional<EventData> {
        std::erase_if(data, [&keys](const auto& item) {
            return std::find(keys.begin(), keys.end(), item.first) == keys.end();
        });
        return data;
    });
    return *this;
}

DataEdit& DataEdit::modify(std::string key, Modifier func) {
    edits_.emplace_back([key = std::move(key), func = std::move(func)](EventData data) -> std::optional<EventData> {
        std::optional<Value> replacement = func(required(data, key));
        if (!replacement) {
            return std::nullopt;
        }
        if (replacement->is_undef()) {
            data.erase(key);
        } else {
            data.insert_or_assign(key, std::move(*replacement));
        }
        return data;
    });
    return *this;
}

std::optional<EventData> DataEdit::operator()(EventData data) const {
    std::optional<EventData> result(std::move(data));
    for (const auto& edit : edits_) {
        result = edit(std::move(*result));
        if (!result) {
            break;
        }
    }
    return result;
}

} // namespace circsim::blocks
