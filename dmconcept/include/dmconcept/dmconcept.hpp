#pragma once

/// Main header for the DigitalMicrograph (DM3/DM4) codec
///
/// This library reads and writes DM tag files as calibrated N-dimensional
/// arrays, and gives access to the raw tag tree.
///
/// Key features:
/// - No exceptions: uses Result<T> for error handling
/// - DM3 and DM4 share one codec, parameterized by a width policy
/// - Any byte source or sink through the RawReader / RawWriter concepts
/// - Chunked streaming of payloads too large to hold in memory
///
/// Example usage:
/// ```cpp
/// #include <dmconcept/dmconcept.hpp>
///
/// using namespace dmconcept;
///
/// StreamFileReader reader("image.dm3");
/// if (!reader.is_valid()) {
///     // Handle error
/// }
///
/// auto decoded = decode(reader);
/// if (decoded.is_ok()) {
///     const auto& metadata = decoded.value().metadata;
///     auto pixel = decoded.value().array.at<float>(0);
///
///     StreamFileWriter writer("copy.dm4");
///     auto written = encode(decoded.value().array, metadata, writer, DmVersion::DM4);
/// }
/// ```

#include "types/result.hpp"
#include "types.hpp"
#include "reader_base.hpp"
#include "readers/reader_buffer.hpp"
#include "readers/reader_stream.hpp"
#include "log.hpp"
#include "array.hpp"
#include "tag_tree.hpp"
#include "tree_codec.hpp"
#include "dm_reader.hpp"
#include "dm_writer.hpp"
