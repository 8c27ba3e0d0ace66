#pragma once

// Intellisense gives false positives with Eigen+ARM
#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

#include <array>
#include <cassert>
#include <functional>
#include <numeric>

using Index = Eigen::Index;

namespace mm {

using I4 = Eigen::Tensor<Index, 4>;

template <int N> using ReN = Eigen::Tensor<float, N>;
using Re2 = ReN<2>;
using Re6 = ReN<6>;

template <int Rank> using Sz = typename Eigen::DSizes<Index, Rank>;
using Sz2 = Sz<2>;
using Sz4 = Sz<4>;
using Sz6 = Sz<6>;

/*
 * DSizes has int instead of size_t
 */
template <int N> auto ToArray(Sz<N> const &sz) -> std::array<Index, N>
{
  std::array<Index, N> a;
  std::copy(sz.begin(), sz.end(), a.begin());
  return a;
}

template <size_t N> Index Product(std::array<Index, N> const &indices)
{
  return std::accumulate(indices.begin(), indices.end(), 1L, std::multiplies<Index>());
}

} // namespace mm
