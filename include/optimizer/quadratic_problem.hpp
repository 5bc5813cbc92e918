/**
 * @file quadratic_problem.hpp
 * @brief Quadratic programming problem and result structures
 *
 * Describes the convex QP subproblems produced by the SQP solver:
 *
 * Minimize:     (1/2) * x^T * P * x + q^T * x
 * Subject to:   A_eq * x = b_eq      (equality constraints)
 *               l <= x <= u          (box constraints, may be infinite)
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct QuadraticProblem
         * @brief Quadratic programming problem specification
         */
        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N), positive definite
            Eigen::VectorXd q; ///< Linear term (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix (M x N)
            Eigen::VectorXd b_eq; ///< Equality constraint values (M x 1)

            Eigen::VectorXd lower_bounds; ///< Lower bounds (-inf allowed)
            Eigen::VectorXd upper_bounds; ///< Upper bounds (+inf allowed)

            /**
             * @brief Validate problem specification
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @struct QuadraticSolverOptions
         * @brief Options for the QP backend
         */
        struct QuadraticSolverOptions
        {
            int max_iterations = 40000; ///< Maximum ADMM iterations
            double tolerance = 1e-10;   ///< Absolute and relative tolerance
            bool polishing = true;      ///< Refine the active set at the end
            bool verbose = false;       ///< Print backend progress
        };

        /**
         * @struct QuadraticResult
         * @brief Result from the QP backend
         */
        struct QuadraticResult
        {
            Eigen::VectorXd solution;       ///< Primal solution (N x 1)
            Eigen::VectorXd equality_duals; ///< Multipliers of A_eq rows (M x 1)
            double objective_value;         ///< Final objective value
            double primal_residual;         ///< Constraint residual at solution
            bool success;                   ///< Solved to requested accuracy
            bool infeasible;                ///< Constraints proven infeasible
            int iterations;                 ///< Number of iterations
            std::string message;            ///< Backend status text

            /**
             * @brief Default constructor
             */
            QuadraticResult();
        };

    } // namespace optimizer
} // namespace allocation
