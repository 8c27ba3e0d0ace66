#include "threads.hpp"

#include "../log/log.hpp"

#include <memory>
#include <thread>

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <unsupported/Eigen/CXX11/Tensor>
#include <unsupported/Eigen/CXX11/ThreadPool>

namespace {
std::unique_ptr<Eigen::ThreadPool> gp = nullptr;
} // namespace

namespace mm {
namespace Threads {

auto GlobalPool() -> Eigen::ThreadPool *
{
  if (gp == nullptr) {
    auto const nt = std::max(std::thread::hardware_concurrency(), 1U);
    Log::Debug("Thread", "Creating default thread pool with {} threads", nt);
    gp = std::make_unique<Eigen::ThreadPool>(nt);
  }
  return gp.get();
}

auto GlobalThreadCount() -> Index { return GlobalPool()->NumThreads(); }

void SetGlobalThreadCount(Index nt)
{
  if (nt < 1) { nt = std::max(std::thread::hardware_concurrency(), 1U); }
  Log::Debug("Thread", "Creating thread pool with {} threads", nt);
  gp = std::make_unique<Eigen::ThreadPool>(nt);
}

} // namespace Threads
} // namespace mm
