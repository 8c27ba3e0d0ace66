#include "writer.hpp"

#include "../log/log.hpp"
#include "../par/record.hpp"
#include "../types.hpp"

#include <hdf5.h>
#include <hdf5_hl.h>

namespace mm {
namespace HD5 {

namespace {
Index deflate = 2;

auto StringType() -> hid_t
{
  hid_t const tid = H5Tcopy(H5T_C_S1);
  H5Tset_size(tid, H5T_VARIABLE);
  H5Tset_cset(tid, H5T_CSET_UTF8);
  return tid;
}
} // namespace

void SetDeflate(Index d) { deflate = d; }

Writer::Writer(std::string const &fname)
{
  Init();
  handle_ = H5Fcreate(fname.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  if (handle_ < 0) {
    throw Log::Failure("HD5", "Could not open file {} for writing because: {}", fname, GetError());
  } else {
    Log::Print("HD5", "Opened {} for writing id {}", fname, handle_);
  }
}

Writer::~Writer()
{
  H5Fclose(handle_);
  Log::Debug("HD5", "Closed id {}", handle_);
}

void Writer::writeStrings(std::string const &label, std::vector<std::string> const &strings)
{
  hsize_t     dim[1] = {strings.size()};
  auto const  space = H5Screate_simple(1, dim, NULL);
  hid_t const tid = StringType();
  std::vector<char const *> ptrs(strings.size());
  for (size_t ii = 0; ii < strings.size(); ii++) {
    ptrs[ii] = strings[ii].c_str();
  }
  hid_t const dset = H5Dcreate(handle_, label.c_str(), tid, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not create string dataset {}: {}", label, GetError()); }
  CheckedCall(H5Dwrite(dset, tid, H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data()), fmt::format("writing strings {}", label));
  CheckedCall(H5Dclose(dset), "closing dataset");
  CheckedCall(H5Sclose(space), "closing space");
  CheckedCall(H5Tclose(tid), "closing string type");
}

void Writer::createGroup(std::string const &label)
{
  auto const group = H5Gcreate(handle_, label.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group < 0) { throw Log::Failure("HD5", "Could not create group {}: {}", label, GetError()); }
  CheckedCall(H5Gclose(group), fmt::format("closing group {}", label));
  Log::Debug("HD5", "Created group {}", label);
}

template <> void Writer::writeStruct(std::string const &lbl, std::vector<ParameterRecord> const &records) const
{
  hid_t const rec_id = RecordType();
  hsize_t     dims[1] = {records.size()};
  auto const  space = H5Screate_simple(1, dims, NULL);
  hid_t const dset = H5Dcreate(handle_, lbl.c_str(), rec_id, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not create record table in file {}: {}", handle_, GetError()); }
  if (records.size()) {
    CheckedCall(H5Dwrite(dset, rec_id, H5S_ALL, H5S_ALL, H5P_DEFAULT, records.data()), "writing record table");
  }
  CheckedCall(H5Sclose(space), "closing space");
  CheckedCall(H5Dclose(dset), "closing record table");
  CheckedCall(H5Tclose(rec_id), "closing record type");
  Log::Debug("HD5", "Wrote {} records", records.size());
}

bool Writer::exists(std::string const &name) const { return HD5::Exists(handle_, name); }

void Writer::flush() { CheckedCall(H5Fflush(handle_, H5F_SCOPE_GLOBAL), "flushing file"); }

template <typename Scalar, size_t N>
void Writer::writeTensor(std::string const &name, Shape<N> const &shape, Scalar const *data, DNames<N> const &labels)
{
  for (size_t ii = 0; ii < N; ii++) {
    if (shape[ii] == 0) { throw Log::Failure("HD5", "Tensor {} had a zero dimension. Dims: {}", name, shape); }
  }

  hsize_t ds_dims[N], chunk_dims[N];
  // HD5=row-major, Eigen=col-major, so need to reverse the dimensions
  std::copy_n(shape.rbegin(), N, ds_dims);
  std::copy_n(ds_dims, N, chunk_dims);
  // Try to stop chunk dimension going over 4 gig
  Index sizeInBytes = Product(shape) * sizeof(Scalar);
  Index dimToShrink = 0;
  while (sizeInBytes >= (1L << 32L)) {
    if (chunk_dims[dimToShrink] > 1) {
      chunk_dims[dimToShrink] /= 2;
      sizeInBytes /= 2;
    }
    dimToShrink = (dimToShrink + 1) % N;
  }

  auto const space = H5Screate_simple(N, ds_dims, NULL);
  auto const plist = H5Pcreate(H5P_DATASET_CREATE);
  CheckedCall(H5Pset_chunk(plist, N, chunk_dims), "setting chunk");
  if (deflate > 0) { CheckedCall(H5Pset_deflate(plist, deflate), "setting deflate"); }

  hid_t const tid = type<Scalar>();
  hid_t const dset = H5Dcreate(handle_, name.c_str(), tid, space, H5P_DEFAULT, plist, H5P_DEFAULT);
  if (dset < 0) {
    throw Log::Failure("HD5", "Could not create tensor {}. Dims {}. Error {}", name, fmt::join(shape, ","), GetError());
  }
  auto l = labels.rbegin();
  for (size_t ii = 0; ii < N; ii++) {
    CheckedCall(H5DSset_label(dset, ii, l->c_str()), fmt::format("dataset {} dimension {} label {}", name, ii, *l));
    l++;
  }
  CheckedCall(H5Dwrite(dset, tid, H5S_ALL, H5S_ALL, H5P_DEFAULT, data), "Writing data");
  CheckedCall(H5Pclose(plist), "closing plist");
  CheckedCall(H5Sclose(space), "closing space");
  CheckedCall(H5Dclose(dset), "closing dataset");

  Log::Debug("HD5", "Wrote tensor {}", name);
}

template void Writer::writeTensor<float, 6>(std::string const &, Shape<6> const &, float const *, DNames<6> const &);
template void Writer::writeTensor<Index, 4>(std::string const &, Shape<4> const &, Index const *, DNames<4> const &);

namespace {
void WriteAttr(hid_t const handle, std::string const &obj, std::string const &attr, hid_t const tid, hsize_t const n, void const *data)
{
  hsize_t const sz[1] = {n};
  auto const    space = H5Screate_simple(1, sz, NULL);
  auto const    attrH = H5Acreate_by_name(handle, obj.c_str(), attr.c_str(), tid, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (attrH < 0) { throw Log::Failure("HD5", "Could not create attribute {} on {}: {}", attr, obj, GetError()); }
  CheckedCall(H5Awrite(attrH, tid, data), fmt::format("writing attribute {} to {}", attr, obj));
  CheckedCall(H5Aclose(attrH), "closing attribute");
  CheckedCall(H5Sclose(space), "closing space");
}
} // namespace

void Writer::writeAttribute(std::string const &obj, std::string const &attr, std::string const &val)
{
  writeAttribute(obj, attr, std::vector<std::string>{val});
}

void Writer::writeAttribute(std::string const &obj, std::string const &attr, char const *val)
{
  writeAttribute(obj, attr, std::string(val));
}

void Writer::writeAttribute(std::string const &obj, std::string const &attr, std::vector<std::string> const &val)
{
  hid_t const               tid = StringType();
  std::vector<char const *> ptrs(val.size());
  for (size_t ii = 0; ii < val.size(); ii++) {
    ptrs[ii] = val[ii].c_str();
  }
  WriteAttr(handle_, obj, attr, tid, val.size(), ptrs.data());
  CheckedCall(H5Tclose(tid), "closing string type");
}

template <typename T> void Writer::writeAttribute(std::string const &obj, std::string const &attr, T const val)
{
  WriteAttr(handle_, obj, attr, type<T>(), 1, &val);
}

template <typename T> void Writer::writeAttribute(std::string const &obj, std::string const &attr, std::vector<T> const &val)
{
  if (val.empty()) { throw Log::Failure("HD5", "Attribute {} on {} was empty", attr, obj); }
  WriteAttr(handle_, obj, attr, type<T>(), val.size(), val.data());
}

template void Writer::writeAttribute<Index>(std::string const &, std::string const &, Index const);
template void Writer::writeAttribute<float>(std::string const &, std::string const &, float const);
template void Writer::writeAttribute<Index>(std::string const &, std::string const &, std::vector<Index> const &);
template void Writer::writeAttribute<float>(std::string const &, std::string const &, std::vector<float> const &);

} // namespace HD5
} // namespace mm
