#pragma once

#include "hd5-core.hpp"

#include <string>

namespace mm {
namespace HD5 {

/*
 * Reads tensors, strings and attributes back out of an exported container.
 */
struct Reader
{
  Reader(Reader const &) = delete;
  Reader(std::string const &fname);
  ~Reader();

  auto groups(std::string const &id = "") const -> std::vector<std::string>;               // List all groups
  auto exists(std::string const &label) const -> bool;                                     // Does a data-set exist?
  auto exists(std::string const &obj, std::string const &attr) const -> bool;              // Check an attribute exists
  auto dimensions(std::string const &label = Keys::Data) const -> std::vector<Index>;      // Get Tensor dimensions
  auto listNames(std::string const &label = Keys::Data) const -> std::vector<std::string>; // Get dimension names

  auto readStrings(std::string const &label) const -> std::vector<std::string>;

  template <typename T> auto readStruct(std::string const &) const -> T; // Read an arbitrary struct

  auto readAttributeString(std::string const &obj, std::string const &attr) const -> std::string;
  auto readAttributeStrings(std::string const &obj, std::string const &attr) const -> std::vector<std::string>;
  auto readAttributeFloat(std::string const &obj, std::string const &attr) const -> float;
  auto readAttributeInt(std::string const &obj, std::string const &attr) const -> Index;
  auto readAttributeInts(std::string const &obj, std::string const &attr) const -> std::vector<Index>;

  template <typename T> auto readTensor(std::string const &label = Keys::Data) const -> T;

protected:
  Handle handle_;
};

} // namespace HD5
} // namespace mm
