#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <type_traits>
#include "types/result.hpp"

namespace dmconcept {

/// @brief Writable window into a byte sink
/// @details The bytes written through data() reach the sink at the latest when
/// flush() succeeds. Regions over memory are written in place.
template <typename T>
concept WriteRegion = std::is_nothrow_move_constructible_v<T> && requires(T region) {
    { region.data() } -> std::same_as<std::span<std::byte>>;
    { region.size() } -> std::same_as<std::size_t>;
    { region.flush() } -> std::same_as<Result<void>>;
};

/// @brief Random-access byte source
/// @details read_into() fills exactly `size` bytes or fails. The tag stream
/// and the chunked copier read DM files through this interface only, so a
/// file, a memory buffer or a caller's own store can back a decode.
template <typename T>
concept RawReader = requires(const T reader, std::byte* dest, std::size_t offset, std::size_t size) {
    { reader.read_into(dest, offset, size) } -> std::same_as<Result<void>>;
    { reader.size() } -> std::same_as<Result<std::size_t>>;
    { reader.is_valid() } -> std::same_as<bool>;
};

/// @brief Random-access byte sink
/// @details The encoder resizes the sink to the final file size once, then
/// writes regions inside [0, size).
template <typename T>
concept RawWriter = requires(T writer, std::size_t offset, std::size_t size) {
    typename T::Region;
    requires WriteRegion<typename T::Region>;
    { writer.write(offset, size) } -> std::same_as<Result<typename T::Region>>;
    { writer.size() } -> std::same_as<Result<std::size_t>>;
    { writer.resize(size) } -> std::same_as<Result<void>>;
    { writer.flush() } -> std::same_as<Result<void>>;
    { writer.is_valid() } -> std::same_as<bool>;
};

} // namespace dmconcept
