/**
 * @file max_diversification_optimizer.hpp
 * @brief Maximum diversification portfolio optimizer
 *
 * Mathematical Formulation:
 *
 * Maximize:     DR(w) = (w^T * sigma) / sqrt(w^T * Sigma * w)
 * Subject to:   sum(w_i) = 1
 *               0 <= w_i <= 1     (long-only)
 *
 * where sigma_i = sqrt(Sigma_ii) are the standalone asset volatilities.
 * For long-only weights DR >= 1, with equality only when all assets are
 * perfectly correlated.
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class MaxDiversificationOptimizer
         * @brief Maximizes the diversification ratio
         *
         * The achieved ratio is reported in
         * OptimizationResult::diversification_ratio.
         */
        class MaxDiversificationOptimizer : public OptimizerInterface
        {
        public:
            MaxDiversificationOptimizer() = default;
            ~MaxDiversificationOptimizer() override = default;

            /**
             * @brief Optimize portfolio weights
             * @throws std::invalid_argument if inputs invalid
             * @throws DegenerateInputError on zero portfolio volatility
             */
            OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints = OptimizationConstraints()) const override;

            /**
             * @brief Get optimizer name
             * @return "MaxDiversificationOptimizer"
             */
            std::string get_name() const override;

            nlohmann::json get_parameters() const override;
        };

    } // namespace optimizer
} // namespace allocation
