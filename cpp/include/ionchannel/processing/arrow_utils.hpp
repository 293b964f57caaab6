/**
 * Arrow Utilities - zero-copy views of trace buffers for Arrow Compute
 */

#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/compute/api.h>
#endif

namespace ionchannel {
namespace arrow_utils {

/// Below this many samples the Arrow call overhead is not worth it
constexpr size_t ARROW_THRESHOLD = 10000;

#ifdef HAVE_ARROW

/**
 * Wrap a double buffer as an Arrow array (zero-copy!)
 *
 * CRITICAL: The underlying storage MUST stay alive while the array is used!
 */
inline std::shared_ptr<arrow::DoubleArray> wrap_span_as_arrow(
    std::span<const double> data
) {
    auto buffer = arrow::Buffer::Wrap(
        reinterpret_cast<const uint8_t*>(data.data()),
        data.size() * sizeof(double)
    );

    auto array_data = arrow::ArrayData::Make(
        arrow::float64(),
        static_cast<int64_t>(data.size()),
        {nullptr, buffer},          // Buffers: [null_bitmap, data]
        0                           // null_count
    );

    return std::make_shared<arrow::DoubleArray>(array_data);
}

/// Wrap a vector as an Arrow array (zero-copy, same lifetime rule)
inline std::shared_ptr<arrow::DoubleArray> wrap_vector_as_arrow(
    const std::vector<double>& data
) {
    return wrap_span_as_arrow(std::span<const double>(data.data(), data.size()));
}

/// Check if Arrow is available at runtime
inline bool is_arrow_available() {
    return true;
}

#else  // HAVE_ARROW not defined

inline bool is_arrow_available() {
    return false;
}

#endif  // HAVE_ARROW

}  // namespace arrow_utils
}  // namespace ionchannel
