#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "array.hpp"
#include "tag_extraction.hpp"
#include "tag_tree.hpp"
#include "types/result.hpp"

namespace dmconcept {

/// @brief How an array is laid out in the file
/// @details Spectra are stored channel-first: a (H, W, E) spectrum image is
/// stored as (E, H, W) and a (N, E) collection or sequence of spectra as
/// (E, 1, N). Everything else is stored as is.
struct StoredLayout {
    std::vector<uint64_t> stored_shape;            ///< Outermost first
    std::vector<Calibration> stored_calibrations;  ///< One per stored axis
    std::optional<PayloadTranspose> transpose;     ///< Applied to the array payload to get the stored payload
    bool sliced = false;                           ///< Stored with an extra unit axis
};

/// @brief Compute the stored layout of an array described by `metadata`
/// @return InvalidMetadata if the axis kinds are not ordered Sequence, Collection, Datum
[[nodiscard]] Result<StoredLayout> plan_stored_layout(const ArrayMetadata& metadata) noexcept;

/// @brief Build the complete DM tag tree of one image
/// @param metadata Axes, calibrations, timestamp and vendor tags of the image
/// @param payload The stored payload (already reordered per plan_stored_layout()),
///        inline or as a region of the pixel source
/// @details Root entries are written in the order ImageList, DataBar (when
/// timestamped), ImageSourceList, DocumentObjectList, Image Behavior,
/// InImageMode. "Meta Data/Format", "Meta Data/IsSequence" and the
/// timestamp tags of the properties are replaced by values derived from the
/// metadata.
/// @return InvalidMetadata if the payload size does not match the metadata
[[nodiscard]] Result<TagGroup> build_image_tree(const ArrayMetadata& metadata, PayloadRef payload) noexcept;

} // namespace dmconcept

#define DMCONCEPT_TREE_BUILDER_HEADER
#include "impl/tree_builder_impl.hpp"
