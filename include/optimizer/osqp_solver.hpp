/**
 * @file osqp_solver.hpp
 * @brief OSQP-based quadratic programming solver
 *
 * Wraps the OSQP library for the QP subproblems of the SQP solver.
 * OSQP (Operator Splitting Quadratic Program) is a robust first-order
 * solver with solution polishing and infeasibility detection.
 *
 * Problem formulation:
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   A_eq x = b_eq    (equality constraints)
 *                lb <= x <= ub     (box constraints)
 *
 * Performance: Typically converges in 10-100 iterations for portfolio problems.
 */

#pragma once

#include "optimizer/quadratic_problem.hpp"
#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class OSQPSolver
         * @brief Quadratic programming solver using OSQP library
         *
         * Features:
         * - Equality and box constraints (infinite bounds allowed)
         * - Returns equality multipliers for the SQP merit function
         * - Reports primal infeasibility separately from non-convergence
         *
         * Usage Example:
         * @code
         * OSQPSolver solver;
         * QuadraticProblem problem = ...;
         * QuadraticResult result = solver.solve(problem);
         *
         * if (result.success) {
         *     std::cout << "Step: " << result.solution.transpose() << "\n";
         * }
         * @endcode
         *
         * Thread Safety: Each solve owns its OSQP workspace, so concurrent
         * solves on separate threads are safe.
         */
        class OSQPSolver
        {
        public:
            /**
             * @brief Constructor
             * @param options Solver configuration
             */
            explicit OSQPSolver(const QuadraticSolverOptions &options = QuadraticSolverOptions());

            /**
             * @brief Solve quadratic programming problem
             * @param problem QP problem specification
             * @return Solution with status, multipliers and iteration count
             * @throws std::invalid_argument if problem is ill-formed
             */
            QuadraticResult solve(const QuadraticProblem &problem) const;

        private:
            QuadraticSolverOptions options_; ///< Solver configuration

            /**
             * @brief Convert Eigen dense matrix to OSQP sparse CSC format
             * @param dense Dense matrix (Eigen)
             * @param data Output: non-zero values
             * @param indices Output: row indices
             * @param indptr Output: column pointers
             * @param upper_triangular_only Only store upper triangle (for symmetric matrices)
             */
            static void convert_to_csc(
                const Eigen::MatrixXd &dense,
                std::vector<OSQPFloat> &data,
                std::vector<OSQPInt> &indices,
                std::vector<OSQPInt> &indptr,
                bool upper_triangular_only = false);

            /**
             * @brief Build constraint matrix for OSQP
             * @return Number of constraint rows (m)
             *
             * Constructs constraint matrix as:
             *   A = [A_eq; I]
             *   l = [b_eq; lb]
             *   u = [b_eq; ub]
             * with infinite bounds clamped to +/- OSQP_INFTY.
             */
            static OSQPInt build_constraint_matrix(
                const QuadraticProblem &problem,
                std::vector<OSQPFloat> &A_data,
                std::vector<OSQPInt> &A_indices,
                std::vector<OSQPInt> &A_indptr,
                std::vector<OSQPFloat> &l,
                std::vector<OSQPFloat> &u);
        };

    } // namespace optimizer
} // namespace allocation
