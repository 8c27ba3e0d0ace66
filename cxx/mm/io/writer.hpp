#pragma once

#include "hd5-core.hpp"

#include <string>
#include <vector>

namespace mm {
namespace HD5 {

void SetDeflate(Index const d); //! Set the global compression (deflate) level

struct Writer
{
  Writer(Writer const &) = delete;
  Writer(std::string const &fname);
  ~Writer();
  void writeStrings(std::string const &label, std::vector<std::string> const &strings);
  void createGroup(std::string const &label);

  template <typename T> void writeStruct(std::string const &lbl, T const &s) const;

  template <typename Scalar, size_t N> void
  writeTensor(std::string const &label, Shape<N> const &shape, Scalar const *data, DNames<N> const &dims);

  // An object of "/" attaches the attribute to the file root
  void writeAttribute(std::string const &object, std::string const &attribute, std::string const &val);
  void writeAttribute(std::string const &object, std::string const &attribute, char const *val);
  void writeAttribute(std::string const &object, std::string const &attribute, std::vector<std::string> const &val);
  template <typename T> void writeAttribute(std::string const &object, std::string const &attribute, T const val);
  template <typename T>
  void writeAttribute(std::string const &object, std::string const &attribute, std::vector<T> const &val);

  void flush();
  bool exists(std::string const &name) const;

private:
  Handle handle_;
};

} // namespace HD5
} // namespace mm
