#include "reader.hpp"

#include "../log/log.hpp"
#include "../par/record.hpp"
#include "../types.hpp"

#include <filesystem>
#include <hdf5.h>
#include <hdf5_hl.h>

namespace mm {
namespace HD5 {

namespace {
auto StringType() -> hid_t
{
  hid_t const tid = H5Tcopy(H5T_C_S1);
  H5Tset_size(tid, H5T_VARIABLE);
  H5Tset_cset(tid, H5T_CSET_UTF8);
  return tid;
}

auto OpenAttr(hid_t const handle, std::string const &obj, std::string const &attr) -> hid_t
{
  auto const attrH = H5Aopen_by_name(handle, obj.c_str(), attr.c_str(), H5P_DEFAULT, H5P_DEFAULT);
  if (attrH < 0) { throw Log::Failure("HD5", "Could not open attribute {} on {}", attr, obj); }
  return attrH;
}

auto AttrLength(hid_t const attrH) -> hsize_t
{
  hid_t const space = H5Aget_space(attrH);
  auto const  n = H5Sget_simple_extent_npoints(space);
  H5Sclose(space);
  return n;
}
} // namespace

Reader::Reader(std::string const &fname)
{
  if (!std::filesystem::exists(fname)) { throw Log::Failure("HD5", "File does not exist: {}", fname); }
  Init();
  handle_ = H5Fopen(fname.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (handle_ < 0) { throw Log::Failure("HD5", "Failed to open {}", fname); }
  Log::Print("HD5", "Opened {} for reading id {}", fname, handle_);
}

Reader::~Reader()
{
  H5Fclose(handle_);
  Log::Debug("HD5", "Closed id {}", handle_);
}

auto Reader::groups(std::string const &id) const -> std::vector<std::string>
{
  if (id == "") {
    return ListGroups(handle_);
  } else {
    hid_t const grp = H5Gopen(handle_, id.c_str(), H5P_DEFAULT);
    if (grp < 0) { throw Log::Failure("HD5", "Could not open group {}", id); }
    auto const l = ListGroups(grp);
    H5Gclose(grp);
    return l;
  }
}

auto Reader::dimensions(std::string const &label) const -> std::vector<Index>
{
  hid_t dset = H5Dopen(handle_, label.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor {}", label); }

  hid_t                ds = H5Dget_space(dset);
  int const            ND = H5Sget_simple_extent_ndims(ds);
  std::vector<hsize_t> hdims(ND);
  H5Sget_simple_extent_dims(ds, hdims.data(), NULL);
  std::vector<Index> dims(ND);
  for (int ii = 0; ii < ND; ii++) {
    dims[ii] = hdims[ii];
  }
  std::reverse(dims.begin(), dims.end()); // HD5=row-major, Eigen=col-major
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close dataset");
  return dims;
}

auto Reader::listNames(std::string const &name) const -> std::vector<std::string>
{
  hid_t ds = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (ds < 0) { throw Log::Failure("HD5", "Could not open tensor '{}'", name); }
  hid_t                    dspace = H5Dget_space(ds);
  int const                ndims = H5Sget_simple_extent_ndims(dspace);
  std::vector<std::string> names(ndims);
  char                     buffer[64] = {0};
  for (Index ii = 0; ii < ndims; ii++) {
    std::fill_n(buffer, sizeof(buffer), 0);
    H5DSget_label(ds, ii, buffer, sizeof(buffer));
    names[ii] = std::string(buffer);
  }
  std::reverse(names.begin(), names.end());
  CheckedCall(H5Sclose(dspace), "Could not close dataspace");
  CheckedCall(H5Dclose(ds), "Could not close dataset");
  return names;
}

template <typename T> auto Reader::readTensor(std::string const &name) const -> T
{
  constexpr auto ND = T::NumDimensions;
  using Scalar = typename T::Scalar;
  hid_t dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor '{}'", name); }
  hid_t      ds = H5Dget_space(dset);
  auto const rank = H5Sget_simple_extent_ndims(ds);
  if (rank != ND) { throw Log::Failure("HD5", "Tensor {} has rank {} expected {}", name, rank, ND); }

  std::array<hsize_t, ND> dims;
  H5Sget_simple_extent_dims(ds, dims.data(), NULL);
  typename Eigen::Tensor<Scalar, ND>::Dimensions tDims;
  std::copy_n(dims.begin(), ND, tDims.begin());
  std::reverse(tDims.begin(), tDims.end()); // HD5=row-major, Eigen=col-major
  Eigen::Tensor<Scalar, ND> tensor(tDims);
  herr_t                    ret_value = H5Dread(dset, type<Scalar>(), ds, H5S_ALL, H5P_DATASET_XFER_DEFAULT, tensor.data());
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close dataset");
  if (ret_value < 0) {
    throw Log::Failure("HD5", "Error reading tensor {} code {}", name, ret_value);
  } else {
    Log::Debug("HD5", "Read tensor {} shape {}", name, tDims);
  }
  return tensor;
}

template auto Reader::readTensor<Re6>(std::string const &) const -> Re6;
template auto Reader::readTensor<I4>(std::string const &) const -> I4;

auto Reader::readStrings(std::string const &name) const -> std::vector<std::string>
{
  hid_t dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open dataset '{}'", name); }
  hid_t      ds = H5Dget_space(dset);
  auto const rank = H5Sget_simple_extent_ndims(ds);
  if (rank != 1) { throw Log::Failure("HD5", "String {} has rank {} on disk, must be 1", name, rank); }
  std::array<hsize_t, 1> dims;
  H5Sget_simple_extent_dims(ds, dims.data(), NULL);
  hid_t const         tid = StringType();
  std::vector<char *> rdata(dims[0]);
  CheckedCall(H5Dread(dset, tid, ds, H5S_ALL, H5P_DATASET_XFER_DEFAULT, rdata.data()), "Could not read strings");
  std::vector<std::string> const strings(rdata.begin(), rdata.end());
  CheckedCall(H5Dvlen_reclaim(tid, ds, H5P_DEFAULT, rdata.data()), "Could not reclaim strings");
  CheckedCall(H5Tclose(tid), "Could not close string type");
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close string dataset");
  Log::Debug("HD5", "Read strings {}", name);
  return strings;
}

template <> auto Reader::readStruct<std::vector<ParameterRecord>>(std::string const &id) const -> std::vector<ParameterRecord>
{
  hid_t const rec_id = RecordType();
  hid_t const dset = H5Dopen(handle_, id.c_str(), H5P_DEFAULT);
  CheckRecordType(dset);
  hid_t const space = H5Dget_space(dset);
  auto const  n = H5Sget_simple_extent_npoints(space);
  std::vector<ParameterRecord> records(n);
  if (n > 0) {
    CheckedCall(H5Dread(dset, rec_id, space, H5S_ALL, H5P_DATASET_XFER_DEFAULT, records.data()), "Could not read records");
  }
  CheckedCall(H5Sclose(space), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close record dataset");
  CheckedCall(H5Tclose(rec_id), "Could not close record type");
  return records;
}

auto Reader::exists(std::string const &label) const -> bool { return Exists(handle_, label); }

auto Reader::exists(std::string const &obj, std::string const &attr) const -> bool
{
  return H5Aexists_by_name(handle_, obj.c_str(), attr.c_str(), H5P_DEFAULT) > 0;
}

auto Reader::readAttributeString(std::string const &obj, std::string const &attr) const -> std::string
{
  auto const strings = readAttributeStrings(obj, attr);
  if (strings.size() != 1) { throw Log::Failure("HD5", "Attribute {} on {} holds {} strings", attr, obj, strings.size()); }
  return strings.front();
}

auto Reader::readAttributeStrings(std::string const &obj, std::string const &attr) const -> std::vector<std::string>
{
  auto const          attrH = OpenAttr(handle_, obj, attr);
  hid_t const         tid = StringType();
  auto const          n = AttrLength(attrH);
  std::vector<char *> rdata(n);
  CheckedCall(H5Aread(attrH, tid, rdata.data()), fmt::format("reading attribute {} from {}", attr, obj));
  std::vector<std::string> const strings(rdata.begin(), rdata.end());
  hsize_t const                  sz[1] = {n};
  hid_t const                    space = H5Screate_simple(1, sz, NULL);
  CheckedCall(H5Dvlen_reclaim(tid, space, H5P_DEFAULT, rdata.data()), "reclaiming strings");
  CheckedCall(H5Sclose(space), "closing space");
  CheckedCall(H5Tclose(tid), "closing string type");
  CheckedCall(H5Aclose(attrH), "closing attribute");
  return strings;
}

auto Reader::readAttributeFloat(std::string const &obj, std::string const &attr) const -> float
{
  float      val;
  auto const attrH = OpenAttr(handle_, obj, attr);
  CheckedCall(H5Aread(attrH, H5T_NATIVE_FLOAT, &val), fmt::format("reading attribute {} from {}", attr, obj));
  CheckedCall(H5Aclose(attrH), "closing attribute");
  return val;
}

auto Reader::readAttributeInt(std::string const &obj, std::string const &attr) const -> Index
{
  Index      val;
  auto const attrH = OpenAttr(handle_, obj, attr);
  CheckedCall(H5Aread(attrH, H5T_NATIVE_LONG, &val), fmt::format("reading attribute {} from {}", attr, obj));
  CheckedCall(H5Aclose(attrH), "closing attribute");
  return val;
}

auto Reader::readAttributeInts(std::string const &obj, std::string const &attr) const -> std::vector<Index>
{
  auto const         attrH = OpenAttr(handle_, obj, attr);
  std::vector<Index> vals(AttrLength(attrH));
  CheckedCall(H5Aread(attrH, H5T_NATIVE_LONG, vals.data()), fmt::format("reading attribute {} from {}", attr, obj));
  CheckedCall(H5Aclose(attrH), "closing attribute");
  return vals;
}

} // namespace HD5
} // namespace mm
