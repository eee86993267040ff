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

#pragma once

#include <paintmix/core/math.hpp>
#include <paintmix/core/utility.hpp>
#include <nlopt.hpp>
#include <functional>
#include <optional>
#include <vector>

namespace pmx {
  using NLOptAlgo = nlopt::algorithm;

  // NLOpt optimization direction; shorthand for negated objective function
  enum class NLOptForm {
    eMinimize, // Minimize objective function
    eMaximize  // Maximize objective function by minimizing negative
  };

  struct NLOptInfo {
    using Capture = std::function<
      double (eig::Map<const eig::VectorXd>, eig::Map<eig::VectorXd>)
    >;

    struct Constraint {
      Capture f;
      double  tol = 0.0;
    };

    uint      n;                           // Output dimensionality
    NLOptAlgo algo = NLOptAlgo::LD_SLSQP;  // Employed algorithm
    NLOptForm form = NLOptForm::eMinimize; // Minimize/maximize?

    // Function arguments
    Capture                 objective;      // Minimization/maximization objective
    std::vector<Constraint> eq_constraints; // Equality constraints:  f(x) == 0
    std::vector<Constraint> nq_constraints; // Inequality constraint: f(x) <= 0

    // Vector arguments
    eig::VectorXd x_init; // Initial best guess for x
    eig::VectorXd upper;  // Upper bounds to solution
    eig::VectorXd lower;  // Lower bounds to solution

    // Miscellany
    std::optional<double> stopval;
    std::optional<uint>   max_iters;
    std::optional<double> max_time;
    std::optional<double> rel_xpar_tol; // 1e-4
  };

  // Return value for solve(NLOptInfo)
  struct NLOptResult {
    eig::VectorXd x;         // Result value
    double        objective; // Last objective value
    nlopt::result code;      // Optional return codes; 1 == success
  };

  // Generate program and run optimization
  NLOptResult solve(NLOptInfo &info);

  // Solver functions
  namespace detail {
    // Describes f(x) = a * x - b with corresponding gradient
    inline
    auto func_dot(const eig::VectorXd &a, double b) -> NLOptInfo::Capture {
      return [a, b](eig::Map<const eig::VectorXd> x, eig::Map<eig::VectorXd> g) {
        // g(x) = a
        if (g.data())
          g = a;

        // f(x) = ax - b
        return a.dot(x) - b;
      };
    }

    // Wraps a gradient-free f(x) with a central-difference gradient of step size h
    inline
    auto func_central_diff(std::function<double (const eig::VectorXd &)> f, double h = 1e-5) -> NLOptInfo::Capture {
      return [f = std::move(f), h](eig::Map<const eig::VectorXd> x, eig::Map<eig::VectorXd> g) {
        eig::VectorXd x_ = x;
        if (g.data()) {
          for (eig::Index i = 0; i < x_.size(); ++i) {
            double xi = x_[i];
            x_[i] = xi + h; double f_hi = f(x_);
            x_[i] = xi - h; double f_lo = f(x_);
            x_[i] = xi;
            g[i] = (f_hi - f_lo) / (2.0 * h);
          }
        }
        return f(x_);
      };
    }
  } // namespace detail
} // namespace pmx
