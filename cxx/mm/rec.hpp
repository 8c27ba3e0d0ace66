#pragma once

#include "par/record.hpp"
#include "types.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mm {

/*
 * Random-access view of REC pixel data. read() may be called from several threads at once.
 */
struct RecSource
{
  using Ptr = std::shared_ptr<RecSource>;

  virtual ~RecSource() {}
  virtual auto name() const -> std::string = 0;
  virtual auto size() const -> Index = 0;
  virtual void read(Index const offset, Index const bytes, char *dst) const = 0;
};

struct RecFile final : RecSource
{
  RecFile(std::filesystem::path const &path);

  auto name() const -> std::string final;
  auto size() const -> Index final;
  void read(Index const offset, Index const bytes, char *dst) const final;

private:
  std::string           name_;
  Index                 size_;
  mutable std::ifstream file_;
  mutable std::mutex    mutex_;
};

struct RecBuffer final : RecSource
{
  RecBuffer(std::string const &name, std::vector<char> bytes);

  auto name() const -> std::string final;
  auto size() const -> Index final;
  void read(Index const offset, Index const bytes, char *dst) const final;

private:
  std::string       name_;
  std::vector<char> bytes_;
};

/*
 * Decode one slab of unsigned little-endian samples into a rows x cols array. Samples are stored
 * as float, so 32-bit samples above 2^24 are rounded to the nearest float and logged.
 */
auto ReadSlab(RecSource const &rec, ParameterRecord const &r) -> Re2;

} // namespace mm
