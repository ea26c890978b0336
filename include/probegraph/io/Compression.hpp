#pragma once

#include <string>
#include <string_view>

namespace probegraph::io {

// Compression applied to an archive member, chosen by its name suffix:
// ".zz" is a zlib stream, ".lz4" an LZ4 frame.
enum class Codec { None, Zlib, Lz4 };

Codec codec_for_name(std::string_view name);

// Member name without its compression suffix ("a.cube.zz" -> "a.cube").
std::string_view strip_codec_suffix(std::string_view name);

const char* codec_name(Codec codec);

// False for Lz4 when built without liblz4.
bool codec_available(Codec codec);

// Throws std::runtime_error naming `source` on corrupt or truncated input,
// or when the codec is not available.
std::string decompress(Codec codec, std::string_view data, const std::string& source);

std::string compress(Codec codec, std::string_view data);

} // namespace probegraph::io
