#pragma once

// DEFLATE compression/decompression for stored objects.
//
// Object files hold raw DEFLATE (no zlib/gzip header) of the canonical
// form. Decompression is bounded to guard against corrupt or hostile
// files.
//
// Internal header — not installed.

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <zlib.h>

namespace score_history::storage {

// Upper bound on a decompressed object.
inline constexpr std::size_t max_object_size = std::size_t{16} * 1024 * 1024;

// Compress text using raw DEFLATE.
inline auto deflate_compress(std::string_view input) -> std::optional<std::string> {
    if (input.empty()) return std::string{};

    auto stream = z_stream{};
    // windowBits = -15 for raw deflate (negative = no header)
    auto ret = ::deflateInit2(&stream, Z_BEST_SPEED, Z_DEFLATED,
                              -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::string(bound, '\0');

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// Decompress raw DEFLATE data, or nullopt if the data is corrupt or
// would exceed max_output_size.
inline auto deflate_decompress(std::string_view input,
                               std::size_t max_output_size = max_object_size)
    -> std::optional<std::string> {

    if (input.empty()) return std::string{};

    auto output_size = std::min(input.size() * 4 + 64, max_output_size);
    auto output = std::string(output_size, '\0');

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output_size);

    auto ret = ::inflateInit2(&stream, -15);
    if (ret != Z_OK) return std::nullopt;

    ret = ::inflate(&stream, Z_FINISH);

    // Grow the buffer until the stream ends or the limit is reached
    while ((ret == Z_BUF_ERROR || ret == Z_OK) && output_size < max_output_size) {
        // Output space left over means the input ran out (truncated data)
        if (stream.avail_out != 0) break;
        auto written = stream.total_out;
        output_size = std::min(output_size * 2, max_output_size);
        output.resize(output_size);
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + written);
        stream.avail_out = static_cast<uInt>(output_size - written);
        ret = ::inflate(&stream, Z_FINISH);
    }

    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

}  // namespace score_history::storage
