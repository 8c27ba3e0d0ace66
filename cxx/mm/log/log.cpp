#include "log.hpp"

#include "debug.hpp"
#include "fmt/chrono.h"

#include <mutex>
#include <stdio.h>

namespace mm {
namespace Log {

namespace {
Display                  displayLevel = Display::None;
std::mutex               logMutex;
std::vector<std::string> savedEntries;

auto TheTime() -> std::string
{
  auto const t = std::time(nullptr);
  return fmt::format("{:%H:%M:%S}", fmt::localtime(t));
}
} // namespace

void SetDisplayLevel(Display const l) { displayLevel = l; }

auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string
{
  return fmt::format("[{}] [{:<8}] {}", TheTime(), category, fmt::vformat(fmt, args));
}

void SaveEntry(std::string const &s, fmt::text_style const style, Display const level)
{
  std::scoped_lock lock(logMutex);
  savedEntries.push_back(s);
  if (displayLevel >= level) { fmt::print(stderr, style, "{}\n", s); }
}

auto Saved() -> std::vector<std::string> const & { return savedEntries; }

void End()
{
  EndDebugging();
  displayLevel = Display::None;
}

Time Now() { return std::chrono::high_resolution_clock::now(); }

std::string ToNow(Log::Time const t1)
{
  using ms = std::chrono::milliseconds;
  auto const t2 = std::chrono::high_resolution_clock::now();
  auto const diff = std::chrono::duration_cast<ms>(t2 - t1).count();
  auto const mins = diff / (60 * 1000);
  auto const secs = diff % (60 * 1000) / 1000;
  auto const millis = diff % 1000;
  if (mins > 0) {
    return fmt::format("{} minute{} {} second{}", mins, mins > 1 ? "s" : "", secs, secs > 1 ? "s" : "");
  } else if (secs > 0) {
    return fmt::format("{}.{:03d} seconds", secs, millis);
  } else {
    return fmt::format("{} millisecond{}", diff, diff > 1 ? "s" : "");
  }
}

} // namespace Log
} // namespace mm
