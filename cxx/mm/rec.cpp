#include "rec.hpp"

#include "errors.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>

namespace mm {

RecFile::RecFile(std::filesystem::path const &path)
  : name_{path.string()}
  , file_{path, std::ios::binary}
{
  if (!file_) { throw Log::Failure("REC", "Could not open {}", name_); }
  std::error_code ec;
  auto const      sz = std::filesystem::file_size(path, ec);
  if (ec) { throw Log::Failure("REC", "Could not determine size of {}: {}", name_, ec.message()); }
  size_ = static_cast<Index>(sz);
  Log::Print("REC", "Opened {} ({} bytes)", name_, size_);
}

auto RecFile::name() const -> std::string { return name_; }
auto RecFile::size() const -> Index { return size_; }

void RecFile::read(Index const offset, Index const bytes, char *dst) const
{
  if (offset < 0 || offset + bytes > size_) { throw TruncatedDataError(name_, offset + bytes, size_); }
  std::scoped_lock lock(mutex_);
  file_.seekg(offset);
  file_.read(dst, bytes);
  if (!file_) {
    file_.clear();
    throw Log::Failure("REC", "Failed to read {} bytes at offset {} from {}", bytes, offset, name_);
  }
}

RecBuffer::RecBuffer(std::string const &name, std::vector<char> bytes)
  : name_{name}
  , bytes_{std::move(bytes)}
{
}

auto RecBuffer::name() const -> std::string { return name_; }
auto RecBuffer::size() const -> Index { return bytes_.size(); }

void RecBuffer::read(Index const offset, Index const bytes, char *dst) const
{
  if (offset < 0 || offset + bytes > size()) { throw TruncatedDataError(name_, offset + bytes, size()); }
  std::memcpy(dst, bytes_.data() + offset, bytes);
}

namespace {
uint32_t const exactFloat = 1U << 24; // Largest run of integers a float holds exactly

template <int Bytes> auto Sample(unsigned char const *p) -> uint32_t
{
  uint32_t v = 0;
  for (int ib = 0; ib < Bytes; ib++) {
    v |= static_cast<uint32_t>(p[ib]) << (8 * ib);
  }
  return v;
}

// Returns the largest raw sample
template <int Bytes> auto Decode(std::vector<unsigned char> const &raw, Re2 &slab) -> uint32_t
{
  Index const rows = slab.dimension(0);
  Index const cols = slab.dimension(1);
  uint32_t    mx = 0;
  for (Index ir = 0; ir < rows; ir++) {
    for (Index ic = 0; ic < cols; ic++) {
      auto const v = Sample<Bytes>(raw.data() + (ir * cols + ic) * Bytes);
      mx = std::max(mx, v);
      slab(ir, ic) = static_cast<float>(v);
    }
  }
  return mx;
}
} // namespace

auto ReadSlab(RecSource const &rec, ParameterRecord const &r) -> Re2
{
  std::vector<unsigned char> raw(r.bytes);
  rec.read(r.offset, r.bytes, reinterpret_cast<char *>(raw.data()));
  Re2 slab(r.rows, r.cols);
  switch (r.bits) {
  case 8: Decode<1>(raw, slab); break;
  case 16: Decode<2>(raw, slab); break;
  case 32:
    if (auto const mx = Decode<4>(raw, slab); mx > exactFloat) {
      Log::Warn("REC", "Record {} has sample {} beyond float precision, values are rounded", r.record, mx);
    }
    break;
  default: throw Log::Failure("REC", "Record {} has unsupported sample width {}", r.record, r.bits);
  }
  return slab;
}

} // namespace mm
