/**
 * @file optimizer_interface.hpp
 * @brief Abstract interface for portfolio optimization methods
 *
 * Provides a common interface for the portfolio allocation criteria
 * (minimum variance, maximum Sharpe, risk parity, maximum diversification).
 * Each optimizer formulates its objective as a NonlinearProblem and
 * delegates the numerics to a ConstrainedNonlinearSolver.
 *
 * Thread Safety: optimize() is const; one optimizer may be shared by
 * several threads as long as it is not reconfigured concurrently.
 */

#pragma once

#include "optimizer/nonlinear_solver.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct OptimizationConstraints
         * @brief Container for portfolio constraints
         *
         * The budget constraint sum(w) = 1 is always enforced.
         */
        struct OptimizationConstraints
        {
            bool long_only = true;          ///< Box [0, 1] on every weight, otherwise shorting allowed
            Eigen::VectorXd initial_weights; ///< Optional starting point (empty = uniform 1/n)

            /**
             * @brief Validate constraints
             * @throws std::invalid_argument if constraints are inconsistent
             */
            void validate() const;

            /**
             * @brief Bounds policy for the nonlinear solver
             */
            BoundsPolicy bounds_policy() const;

            /**
             * @brief Create from JSON configuration
             */
            static OptimizationConstraints from_json(const nlohmann::json &j);
        };

        /**
         * @struct OptimizationResult
         * @brief Container for optimization results
         *
         * weights is empty when success is false.
         */
        struct OptimizationResult
        {
            Eigen::VectorXd weights;            ///< Optimal portfolio weights
            double expected_return;             ///< Portfolio expected return
            double volatility;                  ///< Portfolio volatility
            double sharpe_ratio;                ///< Sharpe ratio
            double diversification_ratio;       ///< (w^T * sigma) / portfolio volatility
            Eigen::VectorXd risk_contributions; ///< Fraction of total risk per asset
            bool success;                       ///< Optimization succeeded
            std::string message;                ///< Status message
            int iterations;                     ///< Number of iterations
            double objective_value;             ///< Final objective value

            /**
             * @brief Default constructor
             */
            OptimizationResult();

            /**
             * @brief Weights of a successful optimization
             * @throws OptimizationFailedError if the optimization failed
             */
            const Eigen::VectorXd &checked_weights() const;
        };

        /**
         * @class OptimizerInterface
         * @brief Abstract base class for portfolio optimizers
         *
         * Defines the interface for portfolio optimization. Concrete
         * implementations are mean-variance, risk parity and maximum
         * diversification.
         *
         * Usage Example:
         * @code
         * auto optimizer = std::make_unique<MeanVarianceOptimizer>();
         * auto result = optimizer->optimize(returns, covariance, constraints);
         * const Eigen::VectorXd &w = result.checked_weights();
         * @endcode
         */
        class OptimizerInterface
        {
        public:
            /**
             * @brief Constructor, uses an SqpSolver with default options
             */
            OptimizerInterface();

            virtual ~OptimizerInterface() = default;

            /**
             * @brief Optimize portfolio weights
             * @param expected_returns Expected returns for each asset (N x 1)
             * @param covariance Covariance matrix (N x N)
             * @param constraints Portfolio constraints
             * @return OptimizationResult structure (success = false if the
             *         solver did not converge)
             * @throws std::invalid_argument if inputs are invalid
             * @throws DegenerateInputError if an asset or the portfolio has zero variance
             * @throws NumericError if the covariance is not positive semi-definite
             */
            virtual OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints = OptimizationConstraints()) const = 0;

            /**
             * @brief Get optimizer name
             * @return String identifier for the optimizer type
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Get optimizer parameters as JSON
             * @return JSON object with optimizer configuration
             */
            virtual nlohmann::json get_parameters() const = 0;

            /**
             * @brief Replace the solving strategy
             * @throws std::invalid_argument if solver is null
             */
            void set_solver(std::shared_ptr<const ConstrainedNonlinearSolver> solver);

            /**
             * @brief Use an SqpSolver configured with the given options
             * @throws std::invalid_argument if options are invalid
             */
            void set_solver_options(const NonlinearSolverOptions &options);

            /**
             * @brief Options of the most recent set_solver_options call
             */
            const NonlinearSolverOptions &get_solver_options() const { return solver_options_; }

            /**
             * @brief Supply closed-form gradients instead of finite differences
             */
            void set_analytic_gradients(bool enabled) { analytic_gradients_ = enabled; }

            bool uses_analytic_gradients() const { return analytic_gradients_; }

            /**
             * @brief Validate input data
             * @param expected_returns Expected returns vector
             * @param covariance Covariance matrix
             * @throws std::invalid_argument on empty, mismatched, non-finite
             *         or asymmetric inputs
             * @throws DegenerateInputError if an asset has zero variance
             * @throws NumericError if the covariance is not positive semi-definite
             */
            static void validate_inputs(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance);

            /**
             * @brief Calculate portfolio statistics
             * @param weights Portfolio weights
             * @param expected_returns Expected returns
             * @param covariance Covariance matrix
             * @param risk_free_rate Risk-free rate for Sharpe
             * @return Result structure with calculated statistics
             *
             * Below kMinVolatility the Sharpe and diversification ratios are
             * undefined: both are NaN, risk_contributions is empty and the
             * message says so.
             */
            static OptimizationResult calculate_statistics(
                const Eigen::VectorXd &weights,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                double risk_free_rate = 0.0);

        protected:
            std::shared_ptr<const ConstrainedNonlinearSolver> solver_; ///< Solving strategy
            NonlinearSolverOptions solver_options_;                    ///< Options given to the default solver
            bool analytic_gradients_;                                  ///< Closed-form gradients enabled

            /**
             * @brief Budget-constrained problem honouring the constraints
             * @throws std::invalid_argument if initial_weights has the wrong size
             */
            static NonlinearProblem make_problem(
                int num_assets,
                ObjectiveFunction objective,
                const OptimizationConstraints &constraints);

            /**
             * @brief Run the solver and turn its output into a result
             *
             * Non-convergence yields success = false with the solver message
             * and no weights. Single-asset problems skip the solver.
             */
            OptimizationResult run_solver(
                const NonlinearProblem &problem,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                double risk_free_rate = 0.0) const;

            /**
             * @brief The budget fixes a single asset at w = (1)
             *
             * Fails when another equality constraint does not hold there
             * to within 1e-6.
             */
            OptimizationResult single_asset_result(
                const NonlinearProblem &problem,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                double risk_free_rate) const;
        };

    } // namespace optimizer
} // namespace allocation
