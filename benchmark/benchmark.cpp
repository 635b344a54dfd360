#include <chrono>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <thickadv.hpp>

using namespace thickadv;

struct DoubleVortex {
  Real m_g = 9.80616;
  Real m_lx = 5000000;
  Real m_ly = 5000000 * std::sqrt(3) / 2;
  Real m_coriolis = 0.00006147;
  Real m_h0 = 750;
  Real m_ox = 0.1;
  Real m_oy = 0.1;
  Real m_sigmax = 3. / 40. * m_lx;
  Real m_sigmay = 3. / 40. * m_ly;
  Real m_dh = 75;
  Real m_xc1 = (0.5 - m_ox) * m_lx;
  Real m_yc1 = (0.5 - m_oy) * m_ly;
  Real m_xc2 = (0.5 + m_ox) * m_lx;
  Real m_yc2 = (0.5 + m_oy) * m_ly;

  KOKKOS_INLINE_FUNCTION Real h(Real x, Real y) const {
    using std::exp;
    using std::sin;

    Real xprime1 = m_lx / (pi * m_sigmax) * sin(pi / m_lx * (x - m_xc1));
    Real yprime1 = m_ly / (pi * m_sigmay) * sin(pi / m_ly * (y - m_yc1));
    Real xprime2 = m_lx / (pi * m_sigmax) * sin(pi / m_lx * (x - m_xc2));
    Real yprime2 = m_ly / (pi * m_sigmay) * sin(pi / m_ly * (y - m_yc2));

    return m_h0 - m_dh * (exp(-0.5 * (xprime1 * xprime1 + yprime1 * yprime1)) +
                          exp(-0.5 * (xprime2 * xprime2 + yprime2 * yprime2)) -
                          4. * pi * m_sigmax * m_sigmay / m_lx / m_ly);
  }

  // geostrophic velocity of the two vortices
  KOKKOS_INLINE_FUNCTION void v(Real x, Real y, Real &vx, Real &vy) const {
    using std::exp;
    using std::sin;

    Real xprime1 = m_lx / (pi * m_sigmax) * sin(pi / m_lx * (x - m_xc1));
    Real yprime1 = m_ly / (pi * m_sigmay) * sin(pi / m_ly * (y - m_yc1));
    Real xprime2 = m_lx / (pi * m_sigmax) * sin(pi / m_lx * (x - m_xc2));
    Real yprime2 = m_ly / (pi * m_sigmay) * sin(pi / m_ly * (y - m_yc2));
    Real xprimeprime1 =
        m_lx / (2.0 * pi * m_sigmax) * sin(2.0 * pi / m_lx * (x - m_xc1));
    Real xprimeprime2 =
        m_lx / (2.0 * pi * m_sigmax) * sin(2.0 * pi / m_lx * (x - m_xc2));
    Real yprimeprime1 =
        m_ly / (2.0 * pi * m_sigmay) * sin(2.0 * pi / m_ly * (y - m_yc1));
    Real yprimeprime2 =
        m_ly / (2.0 * pi * m_sigmay) * sin(2.0 * pi / m_ly * (y - m_yc2));

    Real gauss1 = exp(-0.5 * (xprime1 * xprime1 + yprime1 * yprime1));
    Real gauss2 = exp(-0.5 * (xprime2 * xprime2 + yprime2 * yprime2));
    Real amp = m_g * m_dh / m_coriolis;

    vx = -amp / m_sigmay * (yprimeprime1 * gauss1 + yprimeprime2 * gauss2);
    vy = amp / m_sigmax * (xprimeprime1 * gauss1 + xprimeprime2 * gauss2);
  }
};

void run(Int nx, Int nlevels, Int nsteps, const ThicknessParams &params) {
  DoubleVortex double_vortex;

  Real dc = double_vortex.m_lx / nx;
  Int ny = nx;
  auto mesh = std::make_unique<PlanarHexagonalMesh>(nx, ny, dc, nlevels);

  ThicknessTendency tendency(mesh.get(), params);
  ThicknessState state(mesh.get());

  auto &vn_edge = state.m_vn_edge;
  auto &h_edge = state.m_h_edge;
  THICKADV_SCOPE(x_edge, mesh->m_x_edge);
  THICKADV_SCOPE(y_edge, mesh->m_y_edge);
  THICKADV_SCOPE(angle_edge, mesh->m_angle_edge);
  parallel_for(
      "init_vn_and_h",
      MDRangePolicy<2>({0, 0}, {mesh->m_nedges, mesh->m_nlayers}),
      KOKKOS_LAMBDA(Int iedge, Int k) {
        Real x = x_edge(iedge);
        Real y = y_edge(iedge);
        Real nx = std::cos(angle_edge(iedge));
        Real ny = std::sin(angle_edge(iedge));
        Real vx, vy;
        double_vortex.v(x, y, vx, vy);
        vn_edge(iedge, k) = nx * vx + ny * vy;
        h_edge(iedge, k) = double_vortex.h(x, y);
      });

  timer_start("thickness_advection");

  Kokkos::fence();
  auto ts = std::chrono::steady_clock::now();
  for (Int step = 0; step < nsteps; ++step) {
    deep_copy(state.m_h_tend_cell, 0);
    const auto err = tendency.compute_h_tendency(state);
    if (err != ErrorCode::success) {
      throw std::runtime_error(std::string("Thickness advection failed: ") +
                               to_string(err));
    }
  }
  Kokkos::fence();
  auto te = std::chrono::steady_clock::now();
  auto time_loop_second = std::chrono::duration<double>(te - ts).count();

  timer_stop("thickness_advection");

  spdlog::info("{} cells x {} levels, {} steps in {} s", mesh->m_ncells,
               nlevels, nsteps, time_loop_second);
  spdlog::info("Mass tendency integral at level 0: {}",
               mass_tendency_integral(mesh.get(), state.m_h_tend_cell, 0));
}

int main(int argc, char *argv[]) {
  Kokkos::initialize();

  Int nx = argc > 1 ? std::stoi(argv[1]) : 64;
  Int nlevels = argc > 2 ? std::stoi(argv[2]) : 64;
  Int nsteps = argc > 3 ? std::stoi(argv[3]) : 10;

  ThicknessParams params;
  if (argc > 4) {
    params = read_thickness_params(std::string(argv[4]));
  }

  run(nx, nlevels, nsteps, params);

  Kokkos::finalize();
}
