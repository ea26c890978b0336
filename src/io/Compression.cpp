#include "probegraph/io/Compression.hpp"

#include <cstddef>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include <zlib.h>

#if PROBEGRAPH_HAS_LZ4
#include <lz4frame.h>
#endif

namespace probegraph::io {

namespace {

constexpr std::size_t kChunk = 1 << 16;

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::runtime_error codec_error(const char* codec, const std::string& source, const std::string& what) {
  return std::runtime_error(std::string(codec) + "[" + source + "]: " + what);
}

struct InflateStream {
  z_stream zs{};
  InflateStream() {
    if (inflateInit(&zs) != Z_OK) throw std::runtime_error("zlib: inflateInit failed");
  }
  ~InflateStream() { inflateEnd(&zs); }
  InflateStream(const InflateStream&) = delete;
  InflateStream& operator=(const InflateStream&) = delete;
};

std::string zlib_decompress(std::string_view data, const std::string& source) {
  if (data.size() > std::numeric_limits<uInt>::max()) throw codec_error("zlib", source, "member too large");
  InflateStream s;
  s.zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  s.zs.avail_in = static_cast<uInt>(data.size());

  std::string out;
  char buf[kChunk];
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    s.zs.next_out = reinterpret_cast<Bytef*>(buf);
    s.zs.avail_out = static_cast<uInt>(kChunk);
    rc = inflate(&s.zs, Z_NO_FLUSH);
    if (rc == Z_BUF_ERROR) throw codec_error("zlib", source, "truncated stream");
    if (rc != Z_OK && rc != Z_STREAM_END) {
      throw codec_error("zlib", source, s.zs.msg ? s.zs.msg : "corrupt stream");
    }
    out.append(buf, kChunk - s.zs.avail_out);
    if (rc == Z_OK && s.zs.avail_in == 0 && s.zs.avail_out != 0) {
      throw codec_error("zlib", source, "truncated stream");
    }
  }
  return out;
}

std::string zlib_compress(std::string_view data) {
  if (data.size() > std::numeric_limits<uLong>::max()) throw std::runtime_error("zlib: input too large");
  uLongf cap = compressBound(static_cast<uLong>(data.size()));
  std::string out(cap, '\0');
  const int rc = compress2(reinterpret_cast<Bytef*>(out.data()), &cap,
                           reinterpret_cast<const Bytef*>(data.data()), static_cast<uLong>(data.size()),
                           Z_DEFAULT_COMPRESSION);
  if (rc != Z_OK) throw std::runtime_error("zlib: compress2 failed with code " + std::to_string(rc));
  out.resize(cap);
  return out;
}

#if PROBEGRAPH_HAS_LZ4
struct DctxDeleter {
  void operator()(LZ4F_dctx* ctx) const { LZ4F_freeDecompressionContext(ctx); }
};

std::string lz4_decompress(std::string_view data, const std::string& source) {
  LZ4F_dctx* raw = nullptr;
  const std::size_t rc = LZ4F_createDecompressionContext(&raw, LZ4F_VERSION);
  if (LZ4F_isError(rc)) throw codec_error("lz4", source, LZ4F_getErrorName(rc));
  std::unique_ptr<LZ4F_dctx, DctxDeleter> ctx(raw);

  std::string out;
  char buf[kChunk];
  const char* src = data.data();
  std::size_t remaining = data.size();
  // LZ4F_decompress returns 0 once the frame is complete.
  std::size_t hint = 1;
  while (hint != 0) {
    std::size_t dst_size = kChunk;
    std::size_t src_size = remaining;
    hint = LZ4F_decompress(ctx.get(), buf, &dst_size, src, &src_size, nullptr);
    if (LZ4F_isError(hint)) throw codec_error("lz4", source, LZ4F_getErrorName(hint));
    out.append(buf, dst_size);
    src += src_size;
    remaining -= src_size;
    if (hint != 0 && remaining == 0 && dst_size == 0) throw codec_error("lz4", source, "truncated frame");
  }
  return out;
}

std::string lz4_compress(std::string_view data) {
  std::string out(LZ4F_compressFrameBound(data.size(), nullptr), '\0');
  const std::size_t n = LZ4F_compressFrame(out.data(), out.size(), data.data(), data.size(), nullptr);
  if (LZ4F_isError(n)) throw std::runtime_error(std::string("lz4: ") + LZ4F_getErrorName(n));
  out.resize(n);
  return out;
}
#endif

std::runtime_error lz4_missing(const std::string& source) {
  return codec_error("lz4", source, "probegraph was built without liblz4");
}

} // namespace

Codec codec_for_name(std::string_view name) {
  if (ends_with(name, ".zz")) return Codec::Zlib;
  if (ends_with(name, ".lz4")) return Codec::Lz4;
  return Codec::None;
}

std::string_view strip_codec_suffix(std::string_view name) {
  switch (codec_for_name(name)) {
    case Codec::Zlib: return name.substr(0, name.size() - 3);
    case Codec::Lz4: return name.substr(0, name.size() - 4);
    case Codec::None: break;
  }
  return name;
}

const char* codec_name(Codec codec) {
  switch (codec) {
    case Codec::Zlib: return "zlib";
    case Codec::Lz4: return "lz4";
    case Codec::None: break;
  }
  return "none";
}

bool codec_available(Codec codec) {
#if PROBEGRAPH_HAS_LZ4
  (void)codec;
  return true;
#else
  return codec != Codec::Lz4;
#endif
}

std::string decompress(Codec codec, std::string_view data, const std::string& source) {
  switch (codec) {
    case Codec::Zlib: return zlib_decompress(data, source);
    case Codec::Lz4:
#if PROBEGRAPH_HAS_LZ4
      return lz4_decompress(data, source);
#else
      throw lz4_missing(source);
#endif
    case Codec::None: break;
  }
  return std::string(data);
}

std::string compress(Codec codec, std::string_view data) {
  switch (codec) {
    case Codec::Zlib: return zlib_compress(data);
    case Codec::Lz4:
#if PROBEGRAPH_HAS_LZ4
      return lz4_compress(data);
#else
      throw lz4_missing("compress");
#endif
    case Codec::None: break;
  }
  return std::string(data);
}

} // namespace probegraph::io
