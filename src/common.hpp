#pragma once

#include <Kokkos_Core.hpp>
#include <Kokkos_SIMD.hpp>
#include <cmath>
#include <string>
#include <utility>

#ifdef THICKADV_USE_CALIPER
#include <caliper/cali.h>
#endif

namespace thickadv {

using Real = double;
using Int = int;

KOKKOS_INLINE_FUNCTION constexpr Real operator""_fp(long double x) { return x; }

#ifdef THICKADV_NO_SIMD
#define THICKADV_SIMD_PRAGMA
constexpr Int vector_length = 1;
#else
#define THICKADV_SIMD_PRAGMA _Pragma("omp simd")
constexpr Int vector_length = Kokkos::Experimental::native_simd<Real>::size();
#endif

#ifdef THICKADV_KOKKOS_SIMD
using Vec = Kokkos::Experimental::native_simd<Real>;
using VecTag = Kokkos::Experimental::element_aligned_tag;
#endif

constexpr Real pi = M_PI;

#define THICKADV_SCOPE(a, b) const auto &a = b

using Kokkos::create_mirror_view;
using Kokkos::deep_copy;
using Kokkos::parallel_for;
using Kokkos::parallel_reduce;

using ExecSpace = Kokkos::DefaultExecutionSpace;
using HostExecSpace = Kokkos::DefaultHostExecutionSpace;
constexpr bool exec_is_gpu =
    !Kokkos::SpaceAccessibility<ExecSpace, Kokkos::HostSpace>::accessible;

using MemSpace = ExecSpace::memory_space;
using HostMemSpace = HostExecSpace::memory_space;
using Layout = Kokkos::LayoutRight;

using RangePolicy = Kokkos::RangePolicy<ExecSpace>;

template <Int N>
using MDRangePolicy = Kokkos::MDRangePolicy<
    ExecSpace, Kokkos::Rank<N, Kokkos::Iterate::Right, Kokkos::Iterate::Right>>;

using Real1d = Kokkos::View<Real *, Layout, MemSpace>;
using Real2d = Kokkos::View<Real **, Layout, MemSpace>;

using RealConst1d = Kokkos::View<Real const *, Layout, MemSpace>;
using RealConst2d = Kokkos::View<Real const **, Layout, MemSpace>;

using Int1d = Kokkos::View<Int *, Layout, MemSpace>;
using Int2d = Kokkos::View<Int **, Layout, MemSpace>;

using IntConst1d = Kokkos::View<Int const *, Layout, MemSpace>;
using IntConst2d = Kokkos::View<Int const **, Layout, MemSpace>;

template <Int N> struct DefaultTile;

template <> struct DefaultTile<1> {
  static constexpr Int value[] = {64};
};

template <> struct DefaultTile<2> {
  static constexpr Int value[] = {1, 64};
};

template <Int N, class F>
inline void
thickadv_parallel_for(const std::string &label, Int const (&upper_bounds)[N],
                      const F &f, Int const (&tile)[N] = DefaultTile<N>::value) {
  if constexpr (N == 1) {
    const auto policy = RangePolicy(0, upper_bounds[0]);
    parallel_for(label, policy, f);
  } else {
    const Int lower_bounds[N] = {0};
    const auto policy = MDRangePolicy<N>(lower_bounds, upper_bounds, tile);
    parallel_for(label, policy, f);
  }
}

template <Int N, class F, class R>
inline void
thickadv_parallel_reduce(const std::string &label, Int const (&upper_bounds)[N],
                         const F &f, R &&reducer,
                         Int const (&tile)[N] = DefaultTile<N>::value) {
  if constexpr (N == 1) {
    const auto policy = RangePolicy(0, upper_bounds[0]);
    parallel_reduce(label, policy, f, std::forward<R>(reducer));
  } else {
    const Int lower_bounds[N] = {0};
    const auto policy = MDRangePolicy<N>(lower_bounds, upper_bounds, tile);
    parallel_reduce(label, policy, f, std::forward<R>(reducer));
  }
}

#ifdef THICKADV_USE_CALIPER
inline void timer_start(char const *label) {
  if constexpr (exec_is_gpu) {
    Kokkos::fence();
  }
  cali_begin_region(label);
}

inline void timer_stop(char const *label) {
  if constexpr (exec_is_gpu) {
    Kokkos::fence();
  }
  cali_end_region(label);
}
#else
inline void timer_start(char const *label) {}
inline void timer_stop(char const *label) {}
#endif

} // namespace thickadv
