/**
 * @file mean_variance_optimizer.hpp
 * @brief Mean-variance portfolio optimizer (Markowitz)
 *
 * Implements the classical Markowitz portfolios as constrained nonlinear
 * problems. Supports three objective functions:
 * - Minimum variance (minimize portfolio volatility)
 * - Maximum Sharpe ratio (tangency portfolio)
 * - Minimum volatility for a target return (efficient frontier point)
 *
 * Mathematical Formulation (MAX_SHARPE):
 *
 * Minimize:     -(mu^T * w - r_f) / sqrt(w^T * Sigma * w)
 * Subject to:   sum(w_i) = 1
 *               0 <= w_i <= 1     (long-only)
 *
 * where:
 * - w: portfolio weights
 * - Sigma: covariance matrix
 * - mu: expected returns
 * - r_f: risk-free rate
 *
 * TARGET_RETURN adds the equality mu^T * w = target.
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"

namespace allocation
{
    namespace optimizer
    {

        /**
         * @enum ObjectiveType
         * @brief Type of optimization objective
         */
        enum class ObjectiveType
        {
            MIN_VARIANCE, ///< Minimize volatility only
            MAX_SHARPE,   ///< Maximize Sharpe ratio
            TARGET_RETURN ///< Target return with min volatility
        };

        /**
         * @class MeanVarianceOptimizer
         * @brief Markowitz mean-variance portfolio optimizer
         *
         * Key Features:
         * - Multiple objective functions
         * - Long-only or long-short
         * - Optional closed-form gradients
         *
         * Usage Example:
         * @code
         * MeanVarianceOptimizer optimizer(ObjectiveType::MAX_SHARPE, 0.02);
         *
         * OptimizationConstraints constraints;
         * constraints.long_only = true;
         *
         * auto result = optimizer.optimize(returns, covariance, constraints);
         * std::cout << "Sharpe: " << result.sharpe_ratio << "\n";
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class MeanVarianceOptimizer : public OptimizerInterface
        {
        public:
            /**
             * @brief Construct mean-variance optimizer
             * @param objective Optimization objective type
             * @param risk_free_rate Risk-free rate for Sharpe ratio
             * @throws std::invalid_argument if risk_free_rate is not finite
             */
            explicit MeanVarianceOptimizer(
                ObjectiveType objective = ObjectiveType::MAX_SHARPE,
                double risk_free_rate = 0.0);

            /**
             * @brief Destructor
             */
            ~MeanVarianceOptimizer() override = default;

            /**
             * @brief Optimize portfolio weights
             * @param expected_returns Expected returns (N x 1)
             * @param covariance Covariance matrix (N x N)
             * @param constraints Portfolio constraints
             * @return Optimization result
             * @throws std::invalid_argument if inputs invalid or the target
             *         return is missing for TARGET_RETURN
             * @throws DegenerateInputError on zero portfolio volatility
             */
            OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints = OptimizationConstraints()) const override;

            /**
             * @brief Get optimizer name
             * @return "MeanVarianceOptimizer"
             */
            std::string get_name() const override;

            /**
             * @brief Get parameters as JSON
             */
            nlohmann::json get_parameters() const override;

            /**
             * @brief Set target return
             * @param target_return Target portfolio return
             * @throws std::invalid_argument if target_return is not finite
             *
             * Used for TARGET_RETURN objective.
             */
            void set_target_return(double target_return);

            /**
             * @brief Get target return
             */
            double get_target_return() const { return target_return_; }

            /**
             * @brief Get objective type
             */
            ObjectiveType get_objective() const { return objective_; }

            /**
             * @brief Get risk-free rate
             */
            double get_risk_free_rate() const { return risk_free_rate_; }

        private:
            ObjectiveType objective_; ///< Optimization objective
            double risk_free_rate_;   ///< Risk-free rate
            double target_return_;    ///< Target return
            bool has_target_return_;  ///< set_target_return was called

            /**
             * @brief Optimize for minimum volatility
             */
            OptimizationResult optimize_min_variance(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            /**
             * @brief Optimize for maximum Sharpe ratio
             */
            OptimizationResult optimize_max_sharpe(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            /**
             * @brief Optimize for target return
             */
            OptimizationResult optimize_target_return(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            /**
             * @brief Validate optimizer parameters
             */
            void validate_parameters() const;
        };

    } // namespace optimizer
} // namespace allocation
