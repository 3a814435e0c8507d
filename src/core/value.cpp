#include "dvc/core/value.hpp"

namespace dvc {

bool values_equal(const OptionalValue& lhs, const OptionalValue& rhs) {
    if (!lhs.has_value() || !rhs.has_value()) {
        return lhs.has_value() == rhs.has_value();
    }
    return *lhs == *rhs;
}

bool is_nullish(const OptionalValue& value) noexcept {
    return !value.has_value() || value->is_null();
}

OptionalValue member_of(const OptionalValue& value, const std::string& key) {
    if (!value.has_value() || !value->is_object()) {
        return std::nullopt;
    }
    auto it = value->find(key);
    if (it == value->end()) {
        return std::nullopt;
    }
    return *it;
}

std::string describe(const OptionalValue& value) {
    if (!value.has_value()) {
        return "undefined";
    }
    constexpr std::size_t kMaxLength = 80;
    std::string text = value->dump();
    if (text.size() > kMaxLength) {
        text = text.substr(0, kMaxLength - 3) + "...";
    }
    return text;
}

} // namespace dvc
