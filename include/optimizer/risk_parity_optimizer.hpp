/**
 * @file risk_parity_optimizer.hpp
 * @brief Risk parity (equal risk contribution) portfolio optimizer
 *
 * Finds weights whose share of total portfolio risk matches a risk budget.
 *
 * Mathematical Formulation:
 *
 * Minimize:     sum_i (p_i(w) - b_i)^2
 * Subject to:   sum(w_i) = 1
 *               0 <= w_i <= 1     (long-only)
 *
 * where:
 * - p_i(w) = w_i * (Sigma * w)_i / (w^T * Sigma * w)   (fraction of total risk)
 * - b: risk budget (non-negative, sums to one; uniform 1/n by default)
 *
 * With the uniform budget every asset contributes the same risk (ERC).
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class RiskParityOptimizer
         * @brief Risk budgeting optimizer
         *
         * Usage Example:
         * @code
         * RiskParityOptimizer optimizer;   // equal risk contribution
         * auto result = optimizer.optimize(returns, covariance);
         * const Eigen::VectorXd &w = result.checked_weights();
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class RiskParityOptimizer : public OptimizerInterface
        {
        public:
            /**
             * @brief Construct risk parity optimizer
             * @param risk_budget Target risk shares (empty = uniform 1/n)
             * @throws std::invalid_argument if the budget is negative or
             *         does not sum to one
             */
            explicit RiskParityOptimizer(const Eigen::VectorXd &risk_budget = Eigen::VectorXd());

            /**
             * @brief Destructor
             */
            ~RiskParityOptimizer() override = default;

            /**
             * @brief Optimize portfolio weights
             * @throws std::invalid_argument if inputs invalid or the budget
             *         size does not match the number of assets
             * @throws DegenerateInputError on zero portfolio volatility
             */
            OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints = OptimizationConstraints()) const override;

            /**
             * @brief Get optimizer name
             * @return "RiskParityOptimizer"
             */
            std::string get_name() const override;

            /**
             * @brief Get parameters as JSON
             */
            nlohmann::json get_parameters() const override;

            /**
             * @brief Set risk budget
             * @throws std::invalid_argument if the budget is invalid
             */
            void set_risk_budget(const Eigen::VectorXd &risk_budget);

            /**
             * @brief Configured risk budget (empty = uniform)
             */
            const Eigen::VectorXd &get_risk_budget() const { return risk_budget_; }

            /**
             * @brief Validate a risk budget
             * @param risk_budget Budget to check
             * @param num_assets Expected size, or 0 to skip the size check
             * @throws std::invalid_argument if the budget is invalid
             */
            static void validate_risk_budget(const Eigen::VectorXd &risk_budget, int num_assets = 0);

        private:
            Eigen::VectorXd risk_budget_; ///< Target risk shares
        };

    } // namespace optimizer
} // namespace allocation
