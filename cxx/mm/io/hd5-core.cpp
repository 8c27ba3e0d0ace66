#include "hd5-core.hpp"

#include "../log/log.hpp"
#include "../par/record.hpp"

#include <hdf5.h>

namespace mm {
namespace HD5 {

template <> hid_t type_impl(type_tag<Index>) { return H5T_NATIVE_LONG; }

template <> hid_t type_impl(type_tag<float>) { return H5T_NATIVE_FLOAT; }

template <> hid_t type_impl(type_tag<double>) { return H5T_NATIVE_DOUBLE; }

void Init()
{
  static bool NeedsInit = true;

  if (NeedsInit) {
    auto err = H5open();
    err = H5Eset_auto(H5E_DEFAULT, nullptr, nullptr);
    if (err < 0) { throw Log::Failure("HD5", "Could not initialise HDF5, code: {}", err); }
    NeedsInit = false;
    Log::Debug("HD5", "Initialised HDF5");
  }
}

// Saves the error at the top (bottom) of the stack in the supplied string
herr_t ErrorWalker(unsigned n, const H5E_error2_t *err_desc, void *data)
{
  std::string *str = (std::string *)data;
  if (n == 0) { *str = fmt::format("{}", err_desc->desc); }
  return 0;
}

std::string GetError()
{
  std::string error_string;
  H5Ewalk(H5Eget_current_stack(), H5E_WALK_UPWARD, &ErrorWalker, (void *)&error_string);
  return error_string;
}

void CheckedCall(herr_t status, std::string const &msg)
{
  if (status < 0) { throw Log::Failure("HD5", "Error {}. Status {}. Error: {}", msg, status, GetError()); }
}

hid_t RecordType()
{
  hid_t   rec_id = H5Tcreate(H5T_COMPOUND, sizeof(ParameterRecord));
  hsize_t sz2[1] = {2};
  hid_t   float2_id = H5Tarray_create(H5T_NATIVE_FLOAT, 1, sz2);
  hsize_t sz3[1] = {3};
  hid_t   float3_id = H5Tarray_create(H5T_NATIVE_FLOAT, 1, sz3);
  auto    insert = [rec_id](char const *name, size_t const offset, hid_t const tid) {
    CheckedCall(H5Tinsert(rec_id, name, offset, tid), fmt::format("inserting {} field", name));
  };
  insert("record", HOFFSET(ParameterRecord, record), H5T_NATIVE_LONG);
  insert("slice", HOFFSET(ParameterRecord, slice), H5T_NATIVE_LONG);
  insert("echo", HOFFSET(ParameterRecord, echo), H5T_NATIVE_LONG);
  insert("dynamic", HOFFSET(ParameterRecord, dynamic), H5T_NATIVE_LONG);
  insert("cardiac_phase", HOFFSET(ParameterRecord, phase), H5T_NATIVE_LONG);
  insert("image_type", HOFFSET(ParameterRecord, type), H5T_NATIVE_LONG);
  insert("sequence", HOFFSET(ParameterRecord, sequence), H5T_NATIVE_LONG);
  insert("index_in_rec", HOFFSET(ParameterRecord, indexInRec), H5T_NATIVE_LONG);
  insert("pixel_bits", HOFFSET(ParameterRecord, bits), H5T_NATIVE_LONG);
  insert("scan_percentage", HOFFSET(ParameterRecord, scanPercentage), H5T_NATIVE_LONG);
  insert("rows", HOFFSET(ParameterRecord, rows), H5T_NATIVE_LONG);
  insert("columns", HOFFSET(ParameterRecord, cols), H5T_NATIVE_LONG);
  insert("rescale_intercept", HOFFSET(ParameterRecord, rescaleIntercept), H5T_NATIVE_FLOAT);
  insert("rescale_slope", HOFFSET(ParameterRecord, rescaleSlope), H5T_NATIVE_FLOAT);
  insert("scale_slope", HOFFSET(ParameterRecord, scaleSlope), H5T_NATIVE_FLOAT);
  insert("window_center", HOFFSET(ParameterRecord, windowCenter), H5T_NATIVE_FLOAT);
  insert("window_width", HOFFSET(ParameterRecord, windowWidth), H5T_NATIVE_FLOAT);
  insert("angulation", HOFFSET(ParameterRecord, angulation), float3_id);
  insert("offcentre", HOFFSET(ParameterRecord, offcentre), float3_id);
  insert("slice_thickness", HOFFSET(ParameterRecord, sliceThickness), H5T_NATIVE_FLOAT);
  insert("slice_gap", HOFFSET(ParameterRecord, sliceGap), H5T_NATIVE_FLOAT);
  insert("display_orientation", HOFFSET(ParameterRecord, displayOrientation), H5T_NATIVE_LONG);
  insert("slice_orientation", HOFFSET(ParameterRecord, sliceOrientation), H5T_NATIVE_LONG);
  insert("fmri_status", HOFFSET(ParameterRecord, fmriStatus), H5T_NATIVE_LONG);
  insert("image_type_ed_es", HOFFSET(ParameterRecord, edEs), H5T_NATIVE_LONG);
  insert("pixel_spacing", HOFFSET(ParameterRecord, spacing), float2_id);
  insert("echo_time", HOFFSET(ParameterRecord, echoTime), H5T_NATIVE_FLOAT);
  insert("dynamic_time", HOFFSET(ParameterRecord, dynamicTime), H5T_NATIVE_FLOAT);
  insert("trigger_time", HOFFSET(ParameterRecord, triggerTime), H5T_NATIVE_FLOAT);
  insert("b_factor", HOFFSET(ParameterRecord, bFactor), H5T_NATIVE_FLOAT);
  insert("averages", HOFFSET(ParameterRecord, averages), H5T_NATIVE_LONG);
  insert("flip_angle", HOFFSET(ParameterRecord, flipAngle), H5T_NATIVE_FLOAT);
  insert("cardiac_frequency", HOFFSET(ParameterRecord, cardiacFrequency), H5T_NATIVE_LONG);
  insert("min_rr", HOFFSET(ParameterRecord, minRR), H5T_NATIVE_LONG);
  insert("max_rr", HOFFSET(ParameterRecord, maxRR), H5T_NATIVE_LONG);
  insert("turbo_factor", HOFFSET(ParameterRecord, turboFactor), H5T_NATIVE_LONG);
  insert("inversion_delay", HOFFSET(ParameterRecord, inversionDelay), H5T_NATIVE_FLOAT);
  insert("b_value_number", HOFFSET(ParameterRecord, bValueNumber), H5T_NATIVE_LONG);
  insert("gradient_number", HOFFSET(ParameterRecord, gradientNumber), H5T_NATIVE_LONG);
  insert("contrast_type", HOFFSET(ParameterRecord, contrastType), H5T_NATIVE_LONG);
  insert("anisotropy_type", HOFFSET(ParameterRecord, anisotropyType), H5T_NATIVE_LONG);
  insert("diffusion", HOFFSET(ParameterRecord, diffusion), float3_id);
  insert("label_type", HOFFSET(ParameterRecord, labelType), H5T_NATIVE_LONG);
  insert("offset", HOFFSET(ParameterRecord, offset), H5T_NATIVE_LONG);
  insert("bytes", HOFFSET(ParameterRecord, bytes), H5T_NATIVE_LONG);
  CheckedCall(H5Tclose(float2_id), "closing float2 type");
  CheckedCall(H5Tclose(float3_id), "closing float3 type");
  return rec_id;
}

void CheckRecordType(hid_t handle)
{
  // Re-ordered and extra fields are okay. Missing is not
  std::vector<std::string> const names{"record", "slice", "echo", "dynamic", "cardiac_phase", "image_type", "rows", "columns",
                                       "rescale_intercept", "rescale_slope", "scale_slope"};

  if (handle < 0) { throw Log::Failure("HD5", "Record table does not exist"); }
  auto const dtype = H5Dget_type(handle);
  size_t     n_members = H5Tget_nmembers(dtype);
  for (auto const &check_name : names) {
    bool found = false;
    for (size_t ii = 0; ii < n_members; ii++) {
      char *const       member = H5Tget_member_name(dtype, ii);
      std::string const member_name(member);
      H5free_memory(member);
      if (member_name == check_name) {
        found = true;
        break;
      }
    }
    if (!found) {
      H5Tclose(dtype);
      throw Log::Failure("HD5", "Field {} not found in record table", check_name);
    }
  }
  H5Tclose(dtype);
}

auto Exists(hid_t const parent, std::string const &name) -> bool
{
  // H5Lexists does not accept intermediate links that are missing, so walk the path
  std::string::size_type pos = 0;
  while ((pos = name.find('/', pos + 1)) != std::string::npos) {
    if (H5Lexists(parent, name.substr(0, pos).c_str(), H5P_DEFAULT) <= 0) { return false; }
  }
  return (H5Lexists(parent, name.c_str(), H5P_DEFAULT) > 0);
}

herr_t AddName(hid_t, const char *name, const H5L_info_t *, void *opdata)
{
  auto names = reinterpret_cast<std::vector<std::string> *>(opdata);
  names->push_back(name);
  return 0;
}

namespace {
auto ListType(Handle h, H5O_type_t const type) -> std::vector<std::string>
{
  std::vector<std::string> names;
  CheckedCall(H5Literate(h, H5_INDEX_NAME, H5_ITER_INC, NULL, AddName, &names), "listing objects");

  std::erase_if(names, [h, type](std::string const &name) {
    H5O_info_t info;
    H5Oget_info_by_name2(h, name.c_str(), &info, H5O_INFO_BASIC, H5P_DEFAULT);
    return info.type != type;
  });

  return names;
}
} // namespace

std::vector<std::string> ListGroups(Handle h) { return ListType(h, H5O_TYPE_GROUP); }

} // namespace HD5
} // namespace mm
