#include "assemble.hpp"

#include "log/debug.hpp"
#include "log/log.hpp"
#include "sys/threads.hpp"

#include <exception>
#include <limits>
#include <set>

namespace mm {

void AxisMap::insert(Index const raw) { map_.emplace(raw, -1); }

void AxisMap::freeze()
{
  Index p = 0;
  for (auto &kv : map_) {
    kv.second = p++;
  }
}

auto AxisMap::position(Index const raw) const -> Index
{
  auto const p = map_.find(raw);
  if (p == map_.end()) { throw Log::Failure("Assemble", "Index {} is not on this axis", raw); }
  return p->second;
}

auto AxisMap::size() const -> Index { return map_.size(); }

auto AxisMap::labels() const -> std::vector<Index>
{
  std::vector<Index> l;
  for (auto const &kv : map_) {
    l.push_back(kv.first);
  }
  return l;
}

auto AssembleType(ParameterModel const &model, ImageType const type, RecSource const &rec, Warnings &warnings)
  -> std::optional<ImageArray>
{
  auto const                   name = ImageTypeName(type);
  std::vector<ParameterRecord> records;
  for (auto const &r : model.records()) {
    if (r.type == type) { records.push_back(r); }
  }

  auto const res = model.resolution(type);
  if (!res) {
    Surface(Warning::Kind::DroppedImageType,
            Log::Failure("Assemble", "Dropped {} images, {} records have no common resolution", name, records.size()),
            warnings);
    return std::nullopt;
  }

  std::vector<ParameterRecord> kept;
  std::set<std::array<Index, 4>> seen;
  for (auto const &r : records) {
    std::array<Index, 4> const tuple{r.slice, r.echo, r.dynamic, r.phase};
    if (r.rows != (*res)[0] || r.cols != (*res)[1]) {
      Surface(Warning::Kind::InconsistentGeometry, InconsistentGeometryError(r.record, Sz2{r.rows, r.cols}, *res), warnings);
    } else if (!seen.insert(tuple).second) {
      Surface(Warning::Kind::DuplicateRecord,
              Log::Failure("Assemble", "Record {} repeats slice {} echo {} dynamic {} phase {} of {} images", r.record,
                           r.slice, r.echo, r.dynamic, r.phase, name),
              warnings);
    } else {
      kept.push_back(r);
    }
  }

  std::array<AxisMap, 4> maps;
  for (auto const &r : kept) {
    maps[0].insert(r.slice);
    maps[1].insert(r.echo);
    maps[2].insert(r.dynamic);
    maps[3].insert(r.phase);
  }
  for (auto &m : maps) {
    m.freeze();
  }

  Index const rows = (*res)[0], cols = (*res)[1];
  ImageArray  img;
  img.type = type;
  img.data.resize(Sz6{rows, cols, maps[0].size(), maps[1].size(), maps[2].size(), maps[3].size()});
  img.data.setConstant(std::numeric_limits<float>::quiet_NaN());
  img.source.resize(Sz4{maps[0].size(), maps[1].size(), maps[2].size(), maps[3].size()});
  img.source.setConstant(-1);
  for (Index ii = 0; ii < 4; ii++) {
    img.labels[ii] = maps[ii].labels();
  }

  for (auto const &r : kept) {
    Index const is = maps[0].position(r.slice);
    Index const ie = maps[1].position(r.echo);
    Index const id = maps[2].position(r.dynamic);
    Index const ip = maps[3].position(r.phase);
    img.data.slice(Sz6{0, 0, is, ie, id, ip}, Sz6{rows, cols, 1, 1, 1, 1}) = ReadSlab(rec, r).reshape(Sz6{rows, cols, 1, 1, 1, 1});
    img.source(is, ie, id, ip) = r.record;
  }

  Index const missing = img.source.size() - img.filled();
  if (missing > 0) {
    Surface(Warning::Kind::IrregularGrid,
            Log::Failure("Assemble", "{} of {} {} slabs were not acquired and are NaN", missing, img.source.size(), name),
            warnings);
  }
  Log::Print("Assemble", "{} images {} from {} records", name, img.data.dimensions(), kept.size());
  return img;
}

auto Assemble(ParameterModel const &model, RecSource const &rec) -> Assembly
{
  auto const t0 = Log::Now();
  if (rec.size() < model.requiredBytes()) { throw TruncatedDataError(rec.name(), model.requiredBytes(), rec.size()); }
  if (auto const declared = model.declaredBytes(); declared && rec.size() != *declared) {
    Log::Warn("Assemble", "{} holds {} bytes but the header rows describe {}", rec.name(), rec.size(), *declared);
  }

  auto const                             types = model.imageTypes();
  Index const                            nT = types.size();
  std::vector<std::optional<ImageArray>> results(nT);
  std::vector<Warnings>                  warnings(nT);
  std::vector<std::exception_ptr>        errors(nT);
  Threads::ChunkFor(
    [&](Index const lo, Index const hi) {
      for (Index it = lo; it < hi; it++) {
        try {
          results[it] = AssembleType(model, types[it], rec, warnings[it]);
        } catch (...) {
          errors[it] = std::current_exception(); // Rethrown on the calling thread
        }
      }
    },
    nT);

  Assembly a;
  for (Index it = 0; it < nT; it++) {
    if (errors[it]) { std::rethrow_exception(errors[it]); }
    a.warnings.insert(a.warnings.end(), warnings[it].begin(), warnings[it].end());
    if (results[it]) {
      if (Log::IsDebugging()) {
        Log::Tensor(results[it]->name(), ToArray(results[it]->data.dimensions()), results[it]->data.data(), results[it]->axes);
      }
      a.images.push_back(std::move(*results[it]));
    }
  }
  Log::Print("Assemble", "{} image types assembled. Took {}", a.images.size(), Log::ToNow(t0));
  return a;
}

} // namespace mm
