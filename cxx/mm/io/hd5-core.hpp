#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace mm {
namespace HD5 {

using Handle = int64_t;
using Index = long int;

template <typename T> struct type_tag
{
};

template <size_t N> using Shape = std::array<Index, N>;

template <typename T> Handle type_impl(type_tag<T>);

template <typename T> Handle type() { return type_impl(type_tag<T>{}); }

void                     Init();
Handle                   RecordType();
void                     CheckRecordType(Handle h);
auto                     Exists(Handle const h, std::string const &name) -> bool;
void                     CheckedCall(int status, std::string const &msg);
std::string              GetError();
std::vector<std::string> ListGroups(Handle h); // Groups

namespace Keys {
std::string const Data = "data";
std::string const Header = "header";
std::string const HeaderKeys = "header/keys";
std::string const HeaderValues = "header/values";
std::string const Log = "log";
std::string const Records = "records";
std::string const Source = "source";
} // namespace Keys

namespace Attrs {
std::string const Axes = "axes";
std::string const Unit = "unit";
std::string const Rescaled = "rescaled";
std::string const SliceLabels = "slice_labels";
std::string const EchoLabels = "echo_labels";
std::string const DynamicLabels = "dynamic_labels";
std::string const PhaseLabels = "phase_labels";
} // namespace Attrs

// Horrible hack due to DSizes shenanigans
template <size_t N> struct DNames : std::array<std::string, N>
{
};

namespace Dims {
DNames<6> const Image = {"row", "column", "slice", "echo", "dynamic", "cardiac_phase"};
DNames<4> const Slabs = {"slice", "echo", "dynamic", "cardiac_phase"};
} // namespace Dims

} // namespace HD5
} // namespace mm
