// Copyright (C) 2024 Mark van de Ruit, Delft University of Technology.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include <paintmix/core/nlopt.hpp>
#include <paintmix/core/ranges.hpp>
#include <fmt/core.h>
#include <limits>
#include <stdexcept>

namespace pmx {
  namespace detail {
    // Function wrapper to encapsulate pointers in mapped eigen vectors, then to pass
    // these to a constraint or objective function capture
    constexpr auto func_wrapper = [](uint n, const double *x, double *g, void *data) -> double {
      // Only pass on gradient if present, not all algorithms require or provide gradient
      auto x_ = eig::Map<const eig::VectorXd>(x, n);
      auto g_ = g
              ? eig::Map<eig::VectorXd>(g, n)
              : eig::Map<eig::VectorXd>(nullptr, 0);
      return static_cast<NLOptInfo::Capture *>(data)->operator()(x_, g_);
    };
  } // namespace detail

  NLOptResult solve(NLOptInfo &info) {
    pmx_trace();

    nlopt::opt opt(info.algo, info.n);

    // Specify objective function
    if (info.form == NLOptForm::eMinimize) {
      opt.set_min_objective(detail::func_wrapper, &info.objective);
    } else {
      opt.set_max_objective(detail::func_wrapper, &info.objective);
    }

    // Add equality/inequality constraints
    for (auto &cstr : info.eq_constraints)
      opt.add_equality_constraint(detail::func_wrapper, &cstr.f, cstr.tol);
    for (auto &cstr : info.nq_constraints)
      opt.add_inequality_constraint(detail::func_wrapper, &cstr.f, cstr.tol);

    // Specify optional upper/lower bounds
    std::vector<double> upper(range_iter(info.upper));
    std::vector<double> lower(range_iter(info.lower));
    if (!upper.empty())
      opt.set_upper_bounds(upper);
    if (!lower.empty())
      opt.set_lower_bounds(lower);

    // Specify optional stopping criteria and tolerances
    if (info.rel_xpar_tol) opt.set_xtol_rel(*info.rel_xpar_tol);
    if (info.max_time)     opt.set_maxtime(*info.max_time);
    if (info.max_iters)    opt.set_maxeval(*info.max_iters);
    if (info.stopval)      opt.set_stopval(*info.stopval);

    // Placeholder for 'x' because the library enforces std::vector
    std::vector<double> x(info.n, 0.0);
    if (info.x_init.size())
      rng::copy(info.x_init, x.begin());

    // Run optimization; on early termination the last iterate stands as the result
    NLOptResult result = { .objective = std::numeric_limits<double>::infinity(),
                           .code      = nlopt::FAILURE };
    try {
      result.code = opt.optimize(x, result.objective);
    } catch (const nlopt::roundoff_limited &e) {
      result.code = nlopt::ROUNDOFF_LIMITED;
    } catch (const nlopt::forced_stop &e) {
      result.code = nlopt::FORCED_STOP;
    } catch (const std::invalid_argument &e) {
      fmt::print(stderr, "nlopt: {}\n", e.what());
      result.code = nlopt::INVALID_ARGS;
    } catch (const std::runtime_error &e) {
      fmt::print(stderr, "nlopt: {}\n", e.what());
      result.code = nlopt::FAILURE;
    }

    // Copy over solution to return value
    result.x.resize(info.n);
    rng::copy(x, result.x.begin());
    return result;
  }
} // namespace pmx
