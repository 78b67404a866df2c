// Do not include this file directly. Include "tag_tree.hpp" instead.

#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include "../text.hpp"
#include "../type_registry.hpp"

#ifndef DMCONCEPT_TAG_TREE_HEADER
#include "../tag_tree.hpp" // for linters
#endif

namespace dmconcept {

inline std::vector<PrimitiveType> TagStruct::layout() const {
    std::vector<PrimitiveType> types;
    types.reserve(fields.size());
    for (const auto& field : fields) {
        types.push_back(type_of(field));
    }
    return types;
}

inline std::optional<std::size_t> ElementLayout::element_width() const noexcept {
    if (is_struct) {
        return struct_width(fields);
    }
    return width_of(primitive);
}

inline std::span<const std::byte> TagArray::bytes() const noexcept {
    if (const auto* owned = std::get_if<InlinePayload>(&payload)) {
        return owned->bytes;
    }
    return {};
}

inline uint64_t TagArray::byte_length() const noexcept {
    if (const auto* external = std::get_if<ExternalPayload>(&payload)) {
        return external->byte_length;
    }
    return std::get<InlinePayload>(payload).bytes.size();
}

inline std::optional<ScalarValue> TagArray::element(uint64_t index) const noexcept {
    if (layout.is_struct || !is_inline() || index >= length) {
        return std::nullopt;
    }
    auto width = width_of(layout.primitive);
    const auto data = bytes();
    if (!width || (index + 1) * *width > data.size()) {
        return std::nullopt;
    }
    return load_scalar(layout.primitive, data.subspan(static_cast<std::size_t>(index) * *width, *width));
}

inline TagGroup TagGroup::dict() {
    return TagGroup{};
}

inline TagGroup TagGroup::list() {
    TagGroup group;
    group.is_list = true;
    return group;
}

inline std::size_t TagGroup::size() const noexcept {
    return entries.size();
}

inline bool TagGroup::empty() const noexcept {
    return entries.empty();
}

inline const TagValue* TagGroup::find(std::string_view name) const noexcept {
    for (const auto& entry : entries) {
        if (entry.name == name) {
            return &entry.value;
        }
    }
    return nullptr;
}

inline TagValue* TagGroup::find(std::string_view name) noexcept {
    for (auto& entry : entries) {
        if (entry.name == name) {
            return &entry.value;
        }
    }
    return nullptr;
}

inline const TagGroup* TagGroup::find_group(std::string_view name) const noexcept {
    const auto* value = find(name);
    return value != nullptr ? std::get_if<TagGroup>(value) : nullptr;
}

inline TagGroup* TagGroup::find_group(std::string_view name) noexcept {
    auto* value = find(name);
    return value != nullptr ? std::get_if<TagGroup>(value) : nullptr;
}

inline const TagArray* TagGroup::find_array(std::string_view name) const noexcept {
    const auto* value = find(name);
    return value != nullptr ? std::get_if<TagArray>(value) : nullptr;
}

inline const TagGroup* TagGroup::find_path(std::initializer_list<std::string_view> path) const noexcept {
    const TagGroup* current = this;
    for (std::string_view name : path) {
        current = current->find_group(name);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

inline std::optional<double> TagGroup::find_number(std::string_view name) const noexcept {
    const auto* value = find(name);
    return value != nullptr ? as_number(*value) : std::nullopt;
}

inline std::optional<int64_t> TagGroup::find_integer(std::string_view name) const noexcept {
    const auto* value = find(name);
    return value != nullptr ? as_integer(*value) : std::nullopt;
}

inline std::optional<bool> TagGroup::find_bool(std::string_view name) const noexcept {
    auto number = find_number(name);
    if (!number) {
        return std::nullopt;
    }
    return *number != 0.0;
}

inline std::optional<std::string> TagGroup::find_text(std::string_view name) const noexcept {
    const auto* value = find(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    auto text = as_text(*value);
    if (!text) {
        return std::nullopt;
    }
    return utf16_to_utf8(*text);
}

inline TagValue& TagGroup::add(std::string name, TagValue value) {
    entries.push_back(TagEntry{std::move(name), std::move(value)});
    return entries.back().value;
}

inline TagValue& TagGroup::set(std::string name, TagValue value) {
    if (auto* existing = find(name)) {
        *existing = std::move(value);
        return *existing;
    }
    return add(std::move(name), std::move(value));
}

inline std::size_t TagGroup::remove(std::string_view name) noexcept {
    return static_cast<std::size_t>(std::erase_if(entries, [name](const TagEntry& entry) {
        return entry.name == name;
    }));
}

inline TagGroup& TagGroup::group(std::string name) {
    if (auto* existing = find(name)) {
        if (auto* child = std::get_if<TagGroup>(existing)) {
            return *child;
        }
        *existing = TagGroup{};
        return std::get<TagGroup>(*existing);
    }
    return std::get<TagGroup>(add(std::move(name), TagGroup{}));
}

inline bool operator==(const TagGroup& lhs, const TagGroup& rhs) noexcept {
    return lhs.is_list == rhs.is_list && lhs.open == rhs.open && lhs.entries == rhs.entries;
}

inline TagValue make_text(std::u16string_view text) {
    std::vector<std::byte> bytes(text.size() * 2);
    for (std::size_t i = 0; i < text.size(); ++i) {
        store_value<uint16_t>(std::span<std::byte>(bytes).subspan(i * 2, 2),
                              static_cast<uint16_t>(text[i]), kValueEndian);
    }
    return TagArray{ElementLayout::of(PrimitiveType::UInt16), text.size(), InlinePayload{std::move(bytes)}};
}

inline TagValue make_text(std::string_view utf8) {
    return make_text(std::u16string_view{utf8_to_utf16(utf8)});
}

template <typename T>
TagValue make_array(const std::vector<T>& values) {
    constexpr PrimitiveType type = primitive_type_of_v<T>;
    constexpr std::size_t width = *width_of(type);
    std::vector<std::byte> bytes(values.size() * width);
    for (std::size_t i = 0; i < values.size(); ++i) {
        store_scalar(ScalarValue{std::in_place_type<T>, values[i]},
                     std::span<std::byte>(bytes).subspan(i * width, width));
    }
    return TagArray{ElementLayout::of(type), values.size(), InlinePayload{std::move(bytes)}};
}

template <typename T>
TagGroup make_list(const std::vector<T>& values) {
    TagGroup group = TagGroup::list();
    for (const auto& v : values) {
        group.add(std::string{}, TagScalar{ScalarValue{std::in_place_type<T>, v}});
    }
    return group;
}

inline std::optional<std::u16string> as_text(const TagValue& value) noexcept {
    if (const auto* scalar = std::get_if<TagScalar>(&value)) {
        if (const auto* text = std::get_if<std::u16string>(&scalar->value)) {
            return *text;
        }
        return std::nullopt;
    }
    const auto* array = std::get_if<TagArray>(&value);
    if (array == nullptr || array->layout.is_struct || array->layout.primitive != PrimitiveType::UInt16 ||
        !array->is_inline()) {
        return std::nullopt;
    }
    const auto data = array->bytes();
    std::u16string text(data.size() / 2, u'\0');
    for (std::size_t i = 0; i < text.size(); ++i) {
        text[i] = static_cast<char16_t>(load_value<uint16_t>(data.subspan(i * 2, 2), kValueEndian));
    }
    return text;
}

inline std::optional<double> as_number(const TagValue& value) noexcept {
    const auto* scalar = std::get_if<TagScalar>(&value);
    if (scalar == nullptr) {
        return std::nullopt;
    }
    return std::visit([](const auto& v) -> std::optional<double> {
        using T = std::remove_cvref_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? 1.0 : 0.0;
        } else if constexpr (std::is_arithmetic_v<T>) {
            return static_cast<double>(v);
        } else {
            return std::nullopt;
        }
    }, scalar->value);
}

inline std::optional<int64_t> as_integer(const TagValue& value) noexcept {
    const auto* scalar = std::get_if<TagScalar>(&value);
    if (scalar == nullptr) {
        return std::nullopt;
    }
    return std::visit([](const auto& v) -> std::optional<int64_t> {
        using T = std::remove_cvref_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? 1 : 0;
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return std::nullopt;
            }
            return static_cast<int64_t>(v);
        } else if constexpr (std::is_integral_v<T>) {
            return static_cast<int64_t>(v);
        } else if constexpr (std::is_floating_point_v<T>) {
            // 2^63 is exactly representable, so the range test is exact
            if (!std::isfinite(v) || std::trunc(v) != v || v < -9223372036854775808.0 ||
                v >= 9223372036854775808.0) {
                return std::nullopt;
            }
            return static_cast<int64_t>(v);
        } else {
            return std::nullopt;
        }
    }, scalar->value);
}

inline std::string_view kind_name(const TagValue& value) noexcept {
    switch (value.index()) {
        case 0: return "scalar";
        case 1: return "struct";
        case 2: return "array";
        default: return "group";
    }
}

} // namespace dmconcept
