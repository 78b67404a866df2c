#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
#include "array.hpp"
#include "tag_tree.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace dmconcept {

/// Names of the conventional tags of a DM image tree
namespace tag_names {
inline constexpr std::string_view ImageList = "ImageList";
inline constexpr std::string_view ImageData = "ImageData";
inline constexpr std::string_view ImageTags = "ImageTags";
inline constexpr std::string_view Name = "Name";
inline constexpr std::string_view Data = "Data";
inline constexpr std::string_view DataType = "DataType";
inline constexpr std::string_view PixelDepth = "PixelDepth";
inline constexpr std::string_view Dimensions = "Dimensions";
inline constexpr std::string_view Calibrations = "Calibrations";
inline constexpr std::string_view Dimension = "Dimension";
inline constexpr std::string_view Brightness = "Brightness";
inline constexpr std::string_view Origin = "Origin";
inline constexpr std::string_view Scale = "Scale";
inline constexpr std::string_view Units = "Units";
inline constexpr std::string_view MetaData = "Meta Data";
inline constexpr std::string_view Format = "Format";
inline constexpr std::string_view Signal = "Signal";
inline constexpr std::string_view IsSequence = "IsSequence";
inline constexpr std::string_view Timestamp = "Timestamp";
inline constexpr std::string_view Timezone = "Timezone";
inline constexpr std::string_view TimezoneOffset = "TimezoneOffset";
inline constexpr std::string_view DataBar = "DataBar";
inline constexpr std::string_view AcquisitionDate = "Acquisition Date";
inline constexpr std::string_view AcquisitionTime = "Acquisition Time";
inline constexpr std::string_view ImageSourceList = "ImageSourceList";
inline constexpr std::string_view DocumentObjectList = "DocumentObjectList";
inline constexpr std::string_view ImageBehavior = "Image Behavior";
inline constexpr std::string_view InImageMode = "InImageMode";
} // namespace tag_names

/// Values of the "Meta Data/Format" tag that mark spectra
inline constexpr std::string_view kFormatSpectrum = "Spectrum";
inline constexpr std::string_view kFormatSpectrumImage = "Spectrum image";
inline constexpr std::string_view kSignalEELS = "EELS";

/// @brief Reordering between the stored payload and the array
/// @details The payload is viewed as a rows x cols element matrix and
/// transposed. Moving a channel axis from first to last position is
/// rows = channels, cols = pixels.
struct PayloadTranspose {
    uint64_t rows = 0;
    uint64_t cols = 0;

    bool operator==(const PayloadTranspose&) const = default;
};

/// @brief An image located in a tag tree
/// @note `data` points into the tree passed to extract_image() and is only
/// valid while that tree lives.
struct ExtractedImage {
    ArrayMetadata metadata;
    std::vector<uint64_t> stored_shape;           ///< Outermost first, as stored
    std::optional<PayloadTranspose> transpose;    ///< Applied to the stored payload to get the array
    const TagArray* data = nullptr;

    /// Array shape, outermost first
    [[nodiscard]] std::vector<uint64_t> shape() const { return metadata.shape(); }

    [[nodiscard]] uint64_t byte_size() const noexcept { return metadata.byte_size(); }
};

/// @brief Locate the primary image of a DM tag tree and interpret its metadata
/// @details The primary image is the last entry of the root ImageList.
/// Axes are classified from the rank, "Meta Data/Format" and
/// "Meta Data/IsSequence"; calibrations, timestamp, timezone and title are
/// read from their conventional tags. The Timestamp, Timezone and
/// TimezoneOffset tags are removed from the returned properties.
/// @return UnrecognizedLayout when a required tag is missing or inconsistent
[[nodiscard]] Result<ExtractedImage> extract_image(const TagGroup& root) noexcept;

/// @brief Build the array of an extracted image whose payload is inline
/// @return UnrecognizedLayout if the payload was left in the source
[[nodiscard]] Result<NDArray> materialize_array(const ExtractedImage& image) noexcept;

/// @brief Element layout used to store `type` in the Data array
[[nodiscard]] ElementLayout storage_layout(DataType type);

} // namespace dmconcept

#define DMCONCEPT_TAG_EXTRACTION_HEADER
#include "impl/tag_extraction_impl.hpp"
