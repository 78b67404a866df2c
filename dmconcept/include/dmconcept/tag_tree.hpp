#pragma once

/**
 * @file tag_tree.hpp
 * @brief In-memory model of a DM tag tree
 *
 * A DM file is one recursive tree. Every node is one of:
 *
 * - **TagScalar**: a single primitive value (the type follows from the stored alternative)
 * - **TagStruct**: an ordered list of primitive fields
 * - **TagArray**: a run of primitives or structs sharing one element layout
 * - **TagGroup**: an ordered list of named children, either a dictionary or a list
 *
 * Array payloads are either owned (InlinePayload) or a byte region of the
 * source the tree was decoded from (ExternalPayload). The source is never
 * stored in the tree; callers keep it alongside.
 *
 * ## Example Usage
 *
 * @code{.cpp}
 * using namespace dmconcept;
 *
 * TagGroup tags = TagGroup::dict();
 * tags.add("Name", make_text("sample"));
 * tags.add("Exposure (s)", TagScalar{0.5});
 *
 * if (auto exposure = tags.find_number("Exposure (s)")) {
 *     // *exposure == 0.5
 * }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "type_registry.hpp"
#include "types.hpp"

namespace dmconcept {

struct TagScalar {
    ScalarValue value;

    [[nodiscard]] PrimitiveType type() const noexcept { return type_of(value); }

    bool operator==(const TagScalar&) const = default;
};

/// @brief Ordered primitive fields. Field names are never stored on disk.
struct TagStruct {
    std::vector<ScalarValue> fields;

    [[nodiscard]] std::vector<PrimitiveType> layout() const;

    bool operator==(const TagStruct&) const = default;
};

/// @brief Element type of a TagArray: one primitive, or a struct of primitives
struct ElementLayout {
    PrimitiveType primitive{PrimitiveType::UInt8};
    std::vector<PrimitiveType> fields;  ///< Struct field types, used when is_struct
    bool is_struct{false};

    [[nodiscard]] static ElementLayout of(PrimitiveType type) {
        return ElementLayout{type, {}, false};
    }
    [[nodiscard]] static ElementLayout structure(std::vector<PrimitiveType> field_types) {
        return ElementLayout{PrimitiveType::UInt8, std::move(field_types), true};
    }

    /// @brief Bytes per element, std::nullopt if a member has no fixed width
    [[nodiscard]] std::optional<std::size_t> element_width() const noexcept;

    bool operator==(const ElementLayout&) const = default;
};

/// @brief Array payload owned by the tree
struct InlinePayload {
    std::vector<std::byte> bytes;

    bool operator==(const InlinePayload&) const = default;
};

/// @brief Array payload left in a byte source
/// @details On decode, `offset` is a position in the source the tree was read
/// from. On encode, it is a position in the pixel source handed to the writer.
struct ExternalPayload {
    uint64_t offset{0};
    uint64_t byte_length{0};

    bool operator==(const ExternalPayload&) const = default;
};

using PayloadRef = std::variant<InlinePayload, ExternalPayload>;

struct TagArray {
    ElementLayout layout;
    uint64_t length{0};   ///< Number of elements
    PayloadRef payload;

    [[nodiscard]] bool is_inline() const noexcept { return std::holds_alternative<InlinePayload>(payload); }

    /// @brief Payload bytes, empty when the payload is external
    [[nodiscard]] std::span<const std::byte> bytes() const noexcept;

    /// @brief Size of the payload on disk
    [[nodiscard]] uint64_t byte_length() const noexcept;

    /// @brief Element `index` of an inline primitive array
    /// @return std::nullopt for struct arrays, external payloads or an index out of range
    [[nodiscard]] std::optional<ScalarValue> element(uint64_t index) const noexcept;

    bool operator==(const TagArray&) const = default;
};

struct TagEntry;
struct TagGroup;

using TagValue = std::variant<TagScalar, TagStruct, TagArray, TagGroup>;

/// @brief Ordered children, looked up by name with the first match winning
struct TagGroup {
    std::vector<TagEntry> entries;
    bool is_list{false};
    bool open{false};   ///< On-disk "open" flag, kept for round-tripping

    [[nodiscard]] static TagGroup dict();
    [[nodiscard]] static TagGroup list();

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    /// @brief First child named `name`
    [[nodiscard]] const TagValue* find(std::string_view name) const noexcept;
    [[nodiscard]] TagValue* find(std::string_view name) noexcept;

    [[nodiscard]] const TagGroup* find_group(std::string_view name) const noexcept;
    [[nodiscard]] TagGroup* find_group(std::string_view name) noexcept;
    [[nodiscard]] const TagArray* find_array(std::string_view name) const noexcept;

    /// @brief Follow a path of group names, e.g. {"ImageData", "Calibrations"}
    [[nodiscard]] const TagGroup* find_path(std::initializer_list<std::string_view> path) const noexcept;

    /// @brief Numeric value of a scalar child (bools read as 0 or 1)
    [[nodiscard]] std::optional<double> find_number(std::string_view name) const noexcept;
    [[nodiscard]] std::optional<int64_t> find_integer(std::string_view name) const noexcept;
    [[nodiscard]] std::optional<bool> find_bool(std::string_view name) const noexcept;

    /// @brief Text child decoded to UTF-8
    [[nodiscard]] std::optional<std::string> find_text(std::string_view name) const noexcept;

    /// @brief Append a child, keeping any existing child of the same name
    TagValue& add(std::string name, TagValue value);

    /// @brief Replace the first child named `name`, or append it
    TagValue& set(std::string name, TagValue value);

    /// @brief Remove every child named `name`
    /// @return Number of children removed
    std::size_t remove(std::string_view name) noexcept;

    /// @brief Get the first child group named `name`, appending an empty dictionary if absent
    /// @note An existing non-group child of that name is replaced
    TagGroup& group(std::string name);
};

[[nodiscard]] bool operator==(const TagGroup& lhs, const TagGroup& rhs) noexcept;

struct TagEntry {
    std::string name;   ///< Latin-1 bytes as stored. Empty for list items.
    TagValue value;

    bool operator==(const TagEntry&) const = default;
};

/// @brief Text stored the DM way: a UInt16 array of UTF-16 code units
[[nodiscard]] TagValue make_text(std::u16string_view text);
[[nodiscard]] TagValue make_text(std::string_view utf8);

/// @brief Inline primitive array of `values`
template <typename T>
[[nodiscard]] TagValue make_array(const std::vector<T>& values);

/// @brief List group of scalars
template <typename T>
[[nodiscard]] TagGroup make_list(const std::vector<T>& values);

/// @brief Text held by a UInt16 array or a String scalar
[[nodiscard]] std::optional<std::u16string> as_text(const TagValue& value) noexcept;

/// @brief Scalar converted to double. Bools read as 0 or 1, strings are rejected.
[[nodiscard]] std::optional<double> as_number(const TagValue& value) noexcept;

/// @brief Integral scalar. Floating point scalars are accepted when integral-valued.
[[nodiscard]] std::optional<int64_t> as_integer(const TagValue& value) noexcept;

/// @brief Name of the node kind, for diagnostics
[[nodiscard]] std::string_view kind_name(const TagValue& value) noexcept;

} // namespace dmconcept

#define DMCONCEPT_TAG_TREE_HEADER
#include "impl/tag_tree_impl.hpp"
