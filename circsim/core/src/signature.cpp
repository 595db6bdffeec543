#include <circsim/core/cblock.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace circsim::core {

namespace {

constexpr double SUGGESTION_CUTOFF = 0.6;
constexpr std::size_t MAX_SUGGESTIONS = 3;

// Similarity in [0, 1]: twice the longest common subsequence over the total length.
double similarity(std::string_view a, std::string_view b) {
    if (a.empty() && b.empty()) {
        return 1.0;
    }
    std::vector<std::size_t> row(b.size() + 1, 0);
    for (char ca : a) {
        std::size_t diag = 0;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            std::size_t saved = row[j];
            row[j] = (ca == b[j - 1]) ? diag + 1 : std::max(row[j], row[j - 1]);
            diag = saved;
        }
    }
    return 2.0 * static_cast<double>(row[b.size()]) / static_cast<double>(a.size() + b.size());
}

std::vector<std::string> close_matches(const std::string& name, const std::set<std::string>& candidates) {
    std::vector<std::pair<double, std::string>> scored;
    for (const auto& candidate : candidates) {
        double score = similarity(name, candidate);
        if (score >= SUGGESTION_CUTOFF) {
            scored.emplace_back(score, candidate);
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.first > rhs.first; });
    std::vector<std::string> result;
    for (std::size_t i = 0; i < scored.size() && i < MAX_SUGGESTIONS; ++i) {
        result.push_back(scored[i].second);
    }
    return result;
}

std::string quoted_list(const std::vector<std::string>& names, std::string_view separator) {
    std::string result;
    for (const auto& name : names) {
        if (!result.empty()) {
            result += separator;
        }
        result += fmt::format("'{}'", name);
    }
    return result;
}

std::string setdiff_message(const std::set<std::string>& actual, const std::set<std::string>& expected) {
    std::vector<std::string> parts;
    std::set<std::string> missing;
    std::set_difference(expected.begin(), expected.end(), actual.begin(), actual.end(),
                        std::inserter(missing, missing.end()));
    std::vector<std::string> unexpected;
    for (const auto& name : actual) {
        if (expected.contains(name)) {
            continue;
        }
        auto suggestions = close_matches(name, missing);
        if (suggestions.empty()) {
            unexpected.push_back(fmt::format("'{}'", name));
        } else {
            unexpected.push_back(
                fmt::format("'{}' (did you mean {} ?)", name, quoted_list(suggestions, " or ")));
        }
    }
    if (!unexpected.empty()) {
        parts.push_back("unexpected: " + fmt::format("{}", fmt::join(unexpected, ", ")));
    }
    if (!missing.empty()) {
        parts.push_back("missing: "
                        + quoted_list(std::vector<std::string>(missing.begin(), missing.end()), ", "));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

std::optional<std::string> item_message(const SignatureItem& item, const std::optional<std::size_t>& actual) {
    if (!item.is_group) {
        if (actual) {
            return fmt::format("{}: is a group, expected was a single input", item.name);
        }
        return std::nullopt;
    }
    if (!actual) {
        return fmt::format("{}: is a single input, expected was a group", item.name);
    }
    if (item.max_size && *item.max_size == item.min_size) {
        if (*actual != item.min_size) {
            return fmt::format("group {}: input count is {}, expected was {}", item.name, *actual, item.min_size);
        }
        return std::nullopt;
    }
    if (*actual < item.min_size) {
        return fmt::format("group {}: input count is {}, minimum is {}", item.name, *actual, item.min_size);
    }
    if (item.max_size && *actual > *item.max_size) {
        return fmt::format("group {}: input count is {}, maximum is {}", item.name, *actual, *item.max_size);
    }
    return std::nullopt;
}

} // anonymous namespace

SignatureItem SignatureItem::single(std::string name) {
    return SignatureItem{.name = std::move(name)};
}

SignatureItem SignatureItem::group(std::string name, std::size_t size) {
    return SignatureItem{.name = std::move(name), .is_group = true, .min_size = size, .max_size = size};
}

SignatureItem SignatureItem::group_range(std::string name, std::size_t min_size,
                                         std::optional<std::size_t> max_size) {
    if (max_size && *max_size < min_size) {
        throw ConfigurationError(fmt::format("signature of '{}': maximum is less than minimum", name));
    }
    return SignatureItem{.name = std::move(name), .is_group = true, .min_size = min_size, .max_size = max_size};
}

InputSignature CBlock::input_signature() const {
    if (!connected_) {
        throw InvalidStateError(fmt::format("{}: not connected yet", to_string()));
    }
    InputSignature signature;
    if (!inputs_.empty()) {
        for (const auto& [name, resolved] : inputs_) {
            signature.emplace(name, resolved.is_group
                                        ? std::optional<std::size_t>(resolved.values.size())
                                        : std::nullopt);
        }
        return signature;
    }
    for (const auto& [name, ref] : pending_.singles_) {
        signature.emplace(name, std::nullopt);
    }
    for (const auto& [name, refs] : pending_.groups_) {
        signature.emplace(name, refs.size());
    }
    return signature;
}

InputSignature CBlock::check_signature(const std::vector<SignatureItem>& expected) const {
    InputSignature actual = input_signature();
    std::set<std::string> actual_names;
    for (const auto& [name, size] : actual) {
        actual_names.insert(name);
    }
    std::set<std::string> expected_names;
    for (const auto& item : expected) {
        expected_names.insert(item.name);
    }
    if (actual_names != expected_names) {
        throw SignatureError(fmt::format("{}: Not connected correctly: {}",
                                         to_string(), setdiff_message(actual_names, expected_names)));
    }
    std::vector<std::string> errors;
    for (const auto& item : expected) {
        if (auto message = item_message(item, actual.find(item.name)->second)) {
            errors.push_back(std::move(*message));
        }
    }
    if (!errors.empty()) {
        throw SignatureError(fmt::format("{}: Not connected correctly: {}",
                                         to_string(), fmt::join(errors, "; ")));
    }
    return actual;
}

} // namespace circsim::core
