/**
 * @file optimizer_interface.cpp
 * @brief Implementation of optimizer interface and common structures
 */

#include "optimizer/optimizer_interface.hpp"
#include "optimizer/optimization_errors.hpp"
#include "optimizer/portfolio_math.hpp"
#include "optimizer/sqp_solver.hpp"
#include <cmath>
#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            // Same tolerance as a target return that counts as attained
            constexpr double kSingleAssetTolerance = 1e-6;
        } // namespace

        // ============================================================================
        // OptimizationConstraints Implementation
        // ============================================================================

        void OptimizationConstraints::validate() const
        {
            if (initial_weights.size() > 0 && !initial_weights.allFinite())
            {
                throw std::invalid_argument("initial_weights contain NaN or Inf values");
            }
        }

        BoundsPolicy OptimizationConstraints::bounds_policy() const
        {
            return long_only ? BoundsPolicy::LONG_ONLY : BoundsPolicy::UNBOUNDED;
        }

        OptimizationConstraints OptimizationConstraints::from_json(const nlohmann::json &j)
        {
            OptimizationConstraints constraints;

            constraints.long_only = j.value("long_only", true);

            if (j.contains("initial_weights"))
            {
                std::vector<double> w = j.at("initial_weights").get<std::vector<double>>();
                constraints.initial_weights = Eigen::Map<const Eigen::VectorXd>(
                    w.data(), static_cast<Eigen::Index>(w.size()));
            }

            constraints.validate();
            return constraints;
        }

        // ============================================================================
        // OptimizationResult Implementation
        // ============================================================================

        OptimizationResult::OptimizationResult()
            : expected_return(0.0),
              volatility(0.0),
              sharpe_ratio(0.0),
              diversification_ratio(0.0),
              success(false),
              iterations(0),
              objective_value(0.0)
        {
        }

        const Eigen::VectorXd &OptimizationResult::checked_weights() const
        {
            if (!success || weights.size() == 0)
            {
                throw OptimizationFailedError(message.empty() ? "no solution" : message);
            }
            return weights;
        }

        // ============================================================================
        // OptimizerInterface Implementation
        // ============================================================================

        OptimizerInterface::OptimizerInterface()
            : solver_(std::make_shared<SqpSolver>()),
              analytic_gradients_(false)
        {
        }

        void OptimizerInterface::set_solver(std::shared_ptr<const ConstrainedNonlinearSolver> solver)
        {
            if (!solver)
            {
                throw std::invalid_argument("Solver must not be null");
            }
            solver_ = std::move(solver);
        }

        void OptimizerInterface::set_solver_options(const NonlinearSolverOptions &options)
        {
            solver_ = std::make_shared<SqpSolver>(options);
            solver_options_ = options;
        }

        void OptimizerInterface::validate_inputs(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance)
        {
            // Check dimensions
            if (expected_returns.size() == 0)
            {
                throw std::invalid_argument("Expected returns vector is empty");
            }

            if (covariance.rows() == 0 || covariance.cols() == 0)
            {
                throw std::invalid_argument("Covariance matrix is empty");
            }

            // Check consistency
            if (expected_returns.size() != covariance.rows() ||
                expected_returns.size() != covariance.cols())
            {
                throw std::invalid_argument(
                    "Dimension mismatch: expected returns size (" +
                    std::to_string(expected_returns.size()) +
                    ") does not match covariance dimensions (" +
                    std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()) + ")");
            }

            // Check for NaN or Inf
            if (!expected_returns.allFinite())
            {
                throw std::invalid_argument(
                    "Expected returns contain NaN or Inf values");
            }

            if (!covariance.allFinite())
            {
                throw std::invalid_argument(
                    "Covariance matrix contains NaN or Inf values");
            }

            // Check symmetry of covariance
            double asymmetry = (covariance - covariance.transpose()).cwiseAbs().maxCoeff();
            if (asymmetry > 1e-8)
            {
                throw std::invalid_argument(
                    "Covariance matrix is not symmetric (max asymmetry: " +
                    std::to_string(asymmetry) + ")");
            }

            // Variances
            for (Eigen::Index i = 0; i < covariance.rows(); ++i)
            {
                const double variance = covariance(i, i);
                if (variance < 0.0)
                {
                    throw NumericError(
                        "Asset " + std::to_string(i) + " has negative variance: " +
                        std::to_string(variance));
                }
                if (variance <= kMinVolatility * kMinVolatility)
                {
                    throw DegenerateInputError(
                        "Asset " + std::to_string(i) + " has zero variance");
                }
            }

            // Check positive semi-definiteness (via eigenvalues)
            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance, Eigen::EigenvaluesOnly);
            const Eigen::VectorXd &eigenvalues = solver.eigenvalues();
            const double scale = std::max(1.0, eigenvalues.cwiseAbs().maxCoeff());
            const double min_eigenvalue = eigenvalues.minCoeff();
            if (min_eigenvalue < -1e-8 * scale)
            {
                throw NumericError(
                    "Covariance matrix is not positive semi-definite (min eigenvalue: " +
                    std::to_string(min_eigenvalue) + ")");
            }
        }

        NonlinearProblem OptimizerInterface::make_problem(
            int num_assets,
            ObjectiveFunction objective,
            const OptimizationConstraints &constraints)
        {
            constraints.validate();

            NonlinearProblem problem = NonlinearProblem::budget_constrained(
                num_assets, std::move(objective), constraints.bounds_policy());

            if (constraints.initial_weights.size() > 0)
            {
                if (constraints.initial_weights.size() != num_assets)
                {
                    throw std::invalid_argument(
                        "initial_weights size (" + std::to_string(constraints.initial_weights.size()) +
                        ") does not match number of assets (" + std::to_string(num_assets) + ")");
                }
                problem.initial_guess = constraints.initial_weights;
            }

            return problem;
        }

        OptimizationResult OptimizerInterface::run_solver(
            const NonlinearProblem &problem,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double risk_free_rate) const
        {
            if (problem.dimension == 1)
            {
                return single_asset_result(problem, expected_returns, covariance, risk_free_rate);
            }

            const SolverResult solved = solver_->minimize(problem);

            if (!solved.converged)
            {
                OptimizationResult result;
                result.success = false;
                result.message = get_name() + " did not converge: " + solved.message;
                result.iterations = solved.iterations;
                result.objective_value = solved.objective_value;
                return result;
            }

            OptimizationResult result = calculate_statistics(
                solved.solution, expected_returns, covariance, risk_free_rate);
            result.message = result.message.empty()
                                 ? solved.message
                                 : solved.message + " (" + result.message + ")";
            result.iterations = solved.iterations;
            result.objective_value = solved.objective_value;
            return result;
        }

        OptimizationResult OptimizerInterface::single_asset_result(
            const NonlinearProblem &problem,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double risk_free_rate) const
        {
            const Eigen::VectorXd weights = Eigen::VectorXd::Ones(1);

            for (const auto &constraint : problem.equality_constraints)
            {
                const double residual = constraint.function(weights);
                if (!(std::abs(residual) <= kSingleAssetTolerance))
                {
                    OptimizationResult result;
                    result.message = get_name() + " has no feasible single-asset portfolio: " +
                                     constraint.name + " constraint violated by " +
                                     std::to_string(residual);
                    return result;
                }
            }

            OptimizationResult result = calculate_statistics(
                weights, expected_returns, covariance, risk_free_rate);
            result.objective_value = problem.objective(weights);
            result.message = result.message.empty()
                                 ? "Single asset: weight fixed by the budget"
                                 : "Single asset: weight fixed by the budget (" + result.message + ")";
            return result;
        }

        OptimizationResult OptimizerInterface::calculate_statistics(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double risk_free_rate)
        {
            OptimizationResult result;
            result.weights = weights;
            result.success = true;

            result.expected_return = portfolio_return(weights, expected_returns);
            result.volatility = portfolio_volatility(weights, covariance);

            if (result.volatility >= kMinVolatility)
            {
                result.sharpe_ratio = (result.expected_return - risk_free_rate) / result.volatility;
                result.risk_contributions = relative_risk_contribution(weights, covariance);
                result.diversification_ratio = diversification_ratio(
                    weights, asset_volatilities(covariance), covariance);
            }
            else
            {
                result.sharpe_ratio = std::numeric_limits<double>::quiet_NaN();
                result.diversification_ratio = std::numeric_limits<double>::quiet_NaN();
                result.message = "Portfolio volatility is zero; Sharpe and diversification ratios are undefined";
            }

            result.objective_value = portfolio_variance(weights, covariance);

            return result;
        }

    } // namespace optimizer
} // namespace allocation
