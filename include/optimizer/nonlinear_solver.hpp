/**
 * @file nonlinear_solver.hpp
 * @brief Constrained nonlinear minimization over portfolio weights
 *
 * Solves problems of the form:
 *
 * Minimize:     f(w)
 * Subject to:   h_k(w) = 0           (nonlinear equality constraints)
 *               l <= w <= u          (box [0, 1] or unbounded)
 *
 * Every portfolio objective is expressed as a NonlinearProblem and handed
 * to a ConstrainedNonlinearSolver, which keeps the formulations independent
 * of the solving strategy.
 */

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        using ObjectiveFunction = std::function<double(const Eigen::VectorXd &)>;
        using GradientFunction = std::function<Eigen::VectorXd(const Eigen::VectorXd &)>;

        /**
         * @enum BoundsPolicy
         * @brief Per-weight bounds
         */
        enum class BoundsPolicy
        {
            LONG_ONLY, ///< 0 <= w_i <= 1 (no short selling)
            UNBOUNDED  ///< Short selling allowed
        };

        /**
         * @struct EqualityConstraint
         * @brief Constraint function required to be zero at the solution
         */
        struct EqualityConstraint
        {
            std::string name;          ///< Label used in diagnostics
            ObjectiveFunction function; ///< h(w)
            GradientFunction gradient;  ///< Optional analytic gradient of h
        };

        /**
         * @struct NonlinearProblem
         * @brief Objective, constraints, bounds and starting point
         */
        struct NonlinearProblem
        {
            int dimension = 0;                                 ///< Number of weights
            ObjectiveFunction objective;                       ///< f(w)
            GradientFunction gradient;                         ///< Optional analytic gradient of f
            std::vector<EqualityConstraint> equality_constraints; ///< h_k(w) = 0
            BoundsPolicy bounds = BoundsPolicy::LONG_ONLY;     ///< Bounds policy
            Eigen::VectorXd initial_guess;                     ///< Empty means uniform 1/n

            /**
             * @brief Build a problem with the budget constraint sum(w) = 1
             * @param dimension Number of assets
             * @param objective Function to minimize
             * @param bounds Bounds policy
             */
            static NonlinearProblem budget_constrained(
                int dimension,
                ObjectiveFunction objective,
                BoundsPolicy bounds = BoundsPolicy::LONG_ONLY);

            /**
             * @brief Append the linear constraint coefficients^T * w = target
             */
            void add_linear_equality(
                const std::string &name,
                const Eigen::VectorXd &coefficients,
                double target);

            /**
             * @brief Lower bounds implied by the bounds policy
             */
            Eigen::VectorXd lower_bounds() const;

            /**
             * @brief Upper bounds implied by the bounds policy
             */
            Eigen::VectorXd upper_bounds() const;

            /**
             * @brief Initial guess, or uniform 1/n when none is given
             */
            Eigen::VectorXd starting_point() const;

            /**
             * @brief Validate problem specification
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @struct NonlinearSolverOptions
         * @brief Options for constrained nonlinear solvers
         */
        struct NonlinearSolverOptions
        {
            int max_iterations = 200;            ///< Outer iteration budget
            double tolerance = 1e-8;             ///< Step size (inf-norm) at convergence
            double kkt_tolerance = 1e-8;         ///< Projected Lagrangian gradient at convergence
            double function_tolerance = 1e-14;   ///< Relative objective change at convergence
            double constraint_tolerance = 1e-9;  ///< Max |h_k(w)| at convergence
            double finite_difference_step = 0.0; ///< 0 selects a scaled step per coordinate
            double max_time_seconds = 0.0;       ///< Wall-clock cap per solve, 0 = none
            bool verbose = false;                ///< Print per-iteration trace

            /**
             * @brief Validate options
             * @throws std::invalid_argument if any option is out of range
             */
            void validate() const;

            /**
             * @brief Create from JSON configuration
             */
            static NonlinearSolverOptions from_json(const nlohmann::json &j);

            /**
             * @brief Convert to JSON
             */
            nlohmann::json to_json() const;
        };

        /**
         * @struct SolverResult
         * @brief Result of a constrained nonlinear solve
         *
         * solution is empty unless converged is true.
         */
        struct SolverResult
        {
            Eigen::VectorXd solution;    ///< Optimal weights (empty on failure)
            double objective_value;      ///< Objective at the last iterate
            double constraint_violation; ///< Max |h_k| at the last iterate
            bool converged;              ///< Convergence criterion met
            int iterations;              ///< Outer iterations performed
            std::string message;         ///< Diagnostic text

            /**
             * @brief Default constructor
             */
            SolverResult();
        };

        /**
         * @class ConstrainedNonlinearSolver
         * @brief Abstract base class for constrained nonlinear solvers
         *
         * Contract:
         * - Non-convergence is reported through SolverResult::converged and
         *   never thrown.
         * - Results are deterministic for fixed inputs.
         * - Exceptions raised by the objective (DegenerateInputError,
         *   NumericError) propagate to the caller.
         */
        class ConstrainedNonlinearSolver
        {
        public:
            virtual ~ConstrainedNonlinearSolver() = default;

            /**
             * @brief Minimize the problem objective
             * @param problem Problem specification
             * @return Solver result
             * @throws std::invalid_argument if the problem is ill-formed
             */
            virtual SolverResult minimize(const NonlinearProblem &problem) const = 0;

            /**
             * @brief Get solver name
             */
            virtual std::string get_name() const = 0;
        };

    } // namespace optimizer
} // namespace allocation
