#pragma once

#include <concepts>
#include <memory>
#include <vector>

namespace template_model {

// Deep copy capability: clone() returns an independent value of the same type.
template <typename T>
concept Cloneable = requires(const T& t) {
    { t.clone() } -> std::same_as<T>;
};

// Clones an optional owned sub-object; absence stays absence.
template <Cloneable T>
std::unique_ptr<T> clone_optional(const std::unique_ptr<T>& src) {
    if (!src) return nullptr;
    return std::make_unique<T>(src->clone());
}

template <Cloneable T>
std::vector<T> clone_each(const std::vector<T>& src) {
    std::vector<T> out;
    out.reserve(src.size());
    for (const auto& item : src)
        out.push_back(item.clone());
    return out;
}

// Pointee equality for optional owned sub-objects.
template <typename T>
bool optional_equal(const std::unique_ptr<T>& a, const std::unique_ptr<T>& b) {
    if (!a || !b) return !a && !b;
    return *a == *b;
}

} // namespace template_model
