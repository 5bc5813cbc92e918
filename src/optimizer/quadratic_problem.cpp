/**
 * @file quadratic_problem.cpp
 * @brief Validation of quadratic programming problems
 */

#include "optimizer/quadratic_problem.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        // ============================================================================
        // QuadraticProblem Implementation
        // ============================================================================

        void QuadraticProblem::validate() const
        {
            const Eigen::Index n = q.size();

            if (n == 0)
            {
                throw std::invalid_argument("Problem dimension is zero");
            }

            // Check P matrix
            if (P.rows() != n || P.cols() != n)
            {
                throw std::invalid_argument("P matrix dimensions do not match q vector");
            }

            if (!P.allFinite())
            {
                throw std::invalid_argument("P matrix contains NaN or Inf");
            }

            // Check q vector
            if (!q.allFinite())
            {
                throw std::invalid_argument("q vector contains NaN or Inf");
            }

            // Check equality constraints
            if (A_eq.rows() > 0)
            {
                if (A_eq.cols() != n)
                {
                    throw std::invalid_argument("A_eq columns do not match problem dimension");
                }
                if (b_eq.size() != A_eq.rows())
                {
                    throw std::invalid_argument("b_eq size does not match A_eq rows");
                }
                if (!A_eq.allFinite() || !b_eq.allFinite())
                {
                    throw std::invalid_argument("Equality constraints contain NaN or Inf");
                }
            }

            // Check bounds; infinite values mean "unbounded", NaN is rejected
            if (lower_bounds.size() != n || upper_bounds.size() != n)
            {
                throw std::invalid_argument("Bounds size does not match problem dimension");
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (std::isnan(lower_bounds(i)) || std::isnan(upper_bounds(i)))
                {
                    throw std::invalid_argument("Bounds contain NaN");
                }
                if (lower_bounds(i) > upper_bounds(i))
                {
                    throw std::invalid_argument(
                        "Lower bound exceeds upper bound for variable " + std::to_string(i));
                }
            }
        }

        // ============================================================================
        // QuadraticResult Implementation
        // ============================================================================

        QuadraticResult::QuadraticResult()
            : objective_value(0.0),
              primal_residual(0.0),
              success(false),
              infeasible(false),
              iterations(0)
        {
        }

    } // namespace optimizer
} // namespace allocation
