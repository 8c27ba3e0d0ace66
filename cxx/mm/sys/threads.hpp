#pragma once

#include "../types.hpp"

#include <algorithm>
#include <vector>

namespace mm {

namespace Threads {

auto GlobalPool() -> Eigen::ThreadPool *;

auto GlobalThreadCount() -> Index;
void SetGlobalThreadCount(Index n_threads);

template <typename F> void ChunkFor(F const &f, Index const sz)
{
  Index const nT = GlobalThreadCount();
  if (sz == 0) {
    return;
  } else {
    Index const    den = sz / nT;
    Index const    rem = sz % nT;
    Index const    nC = std::min<Index>(sz, nT);
    Eigen::Barrier barrier(nC);
    for (Index it = 0; it < nC; it++) {
      Index const lo = it * den + std::min(it, rem);
      Index const hi = (it + 1) * den + std::min(it + 1, rem);
      GlobalPool()->Schedule([&barrier, f, lo, hi] {
        f(lo, hi);
        barrier.Notify();
      });
    }
    barrier.Wait();
  }
}

} // namespace Threads
} // namespace mm
