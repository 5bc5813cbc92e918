/**
 * @file nonlinear_solver.cpp
 * @brief Implementation of nonlinear problem structures
 */

#include "optimizer/nonlinear_solver.hpp"
#include <limits>
#include <stdexcept>
#include <utility>

namespace allocation
{
    namespace optimizer
    {

        // ============================================================================
        // NonlinearProblem Implementation
        // ============================================================================

        NonlinearProblem NonlinearProblem::budget_constrained(
            int dimension,
            ObjectiveFunction objective,
            BoundsPolicy bounds)
        {
            NonlinearProblem problem;
            problem.dimension = dimension;
            problem.objective = std::move(objective);
            problem.bounds = bounds;

            if (dimension > 0)
            {
                problem.add_linear_equality("budget", Eigen::VectorXd::Ones(dimension), 1.0);
            }

            return problem;
        }

        void NonlinearProblem::add_linear_equality(
            const std::string &name,
            const Eigen::VectorXd &coefficients,
            double target)
        {
            EqualityConstraint constraint;
            constraint.name = name;
            constraint.function = [coefficients, target](const Eigen::VectorXd &w)
            {
                return coefficients.dot(w) - target;
            };
            constraint.gradient = [coefficients](const Eigen::VectorXd &)
            {
                return coefficients;
            };
            equality_constraints.push_back(std::move(constraint));
        }

        Eigen::VectorXd NonlinearProblem::lower_bounds() const
        {
            if (bounds == BoundsPolicy::LONG_ONLY)
            {
                return Eigen::VectorXd::Zero(dimension);
            }
            return Eigen::VectorXd::Constant(dimension, -std::numeric_limits<double>::infinity());
        }

        Eigen::VectorXd NonlinearProblem::upper_bounds() const
        {
            if (bounds == BoundsPolicy::LONG_ONLY)
            {
                return Eigen::VectorXd::Ones(dimension);
            }
            return Eigen::VectorXd::Constant(dimension, std::numeric_limits<double>::infinity());
        }

        Eigen::VectorXd NonlinearProblem::starting_point() const
        {
            if (initial_guess.size() > 0)
            {
                return initial_guess;
            }
            return Eigen::VectorXd::Constant(dimension, 1.0 / dimension);
        }

        void NonlinearProblem::validate() const
        {
            if (dimension <= 0)
            {
                throw std::invalid_argument(
                    "Problem dimension must be positive, got: " + std::to_string(dimension));
            }

            if (!objective)
            {
                throw std::invalid_argument("Problem has no objective function");
            }

            for (const auto &constraint : equality_constraints)
            {
                if (!constraint.function)
                {
                    throw std::invalid_argument(
                        "Equality constraint '" + constraint.name + "' has no function");
                }
            }

            if (equality_constraints.size() > static_cast<size_t>(dimension))
            {
                throw std::invalid_argument(
                    "More equality constraints (" + std::to_string(equality_constraints.size()) +
                    ") than variables (" + std::to_string(dimension) + ")");
            }

            if (initial_guess.size() > 0)
            {
                if (initial_guess.size() != dimension)
                {
                    throw std::invalid_argument(
                        "Initial guess size (" + std::to_string(initial_guess.size()) +
                        ") does not match problem dimension (" + std::to_string(dimension) + ")");
                }
                if (!initial_guess.allFinite())
                {
                    throw std::invalid_argument("Initial guess contains NaN or Inf");
                }
            }
        }

        // ============================================================================
        // NonlinearSolverOptions Implementation
        // ============================================================================

        void NonlinearSolverOptions::validate() const
        {
            if (max_iterations <= 0)
            {
                throw std::invalid_argument(
                    "max_iterations must be positive, got: " + std::to_string(max_iterations));
            }

            if (tolerance <= 0.0 || kkt_tolerance <= 0.0 || function_tolerance <= 0.0)
            {
                throw std::invalid_argument("Convergence tolerances must be positive");
            }

            // Budget invariant needs at least 1e-6 accuracy on constraints
            if (constraint_tolerance <= 0.0 || constraint_tolerance > 1e-6)
            {
                throw std::invalid_argument(
                    "constraint_tolerance must be in (0, 1e-6], got: " +
                    std::to_string(constraint_tolerance));
            }

            if (finite_difference_step < 0.0)
            {
                throw std::invalid_argument(
                    "finite_difference_step must be non-negative, got: " +
                    std::to_string(finite_difference_step));
            }

            if (max_time_seconds < 0.0)
            {
                throw std::invalid_argument(
                    "max_time_seconds must be non-negative, got: " +
                    std::to_string(max_time_seconds));
            }
        }

        NonlinearSolverOptions NonlinearSolverOptions::from_json(const nlohmann::json &j)
        {
            NonlinearSolverOptions options;

            options.max_iterations = j.value("max_iterations", options.max_iterations);
            options.tolerance = j.value("tolerance", options.tolerance);
            options.kkt_tolerance = j.value("kkt_tolerance", options.kkt_tolerance);
            options.function_tolerance = j.value("function_tolerance", options.function_tolerance);
            options.constraint_tolerance = j.value("constraint_tolerance", options.constraint_tolerance);
            options.finite_difference_step = j.value("finite_difference_step", options.finite_difference_step);
            options.max_time_seconds = j.value("max_time_seconds", options.max_time_seconds);
            options.verbose = j.value("verbose", options.verbose);

            options.validate();
            return options;
        }

        nlohmann::json NonlinearSolverOptions::to_json() const
        {
            return nlohmann::json{
                {"max_iterations", max_iterations},
                {"tolerance", tolerance},
                {"kkt_tolerance", kkt_tolerance},
                {"function_tolerance", function_tolerance},
                {"constraint_tolerance", constraint_tolerance},
                {"finite_difference_step", finite_difference_step},
                {"max_time_seconds", max_time_seconds},
                {"verbose", verbose}};
        }

        // ============================================================================
        // SolverResult Implementation
        // ============================================================================

        SolverResult::SolverResult()
            : objective_value(0.0),
              constraint_violation(0.0),
              converged(false),
              iterations(0)
        {
        }

    } // namespace optimizer
} // namespace allocation
