/**
 * @file optimizer_factory.hpp
 * @brief Factory for creating portfolio optimizers from configuration
 *
 * Allows configuration-driven selection of the allocation criterion.
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "type": "risk_parity",
 *   "risk_budget": [0.5, 0.25, 0.25],
 *   "analytic_gradients": true,
 *   "solver": { "max_iterations": 300 }
 * }
 * @endcode
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct OptimizerConfig
         * @brief Configuration parameters for optimizer creation
         *
         * Unused parameters are ignored based on the optimizer type.
         */
        struct OptimizerConfig
        {
            /**
             * @brief Type of optimizer
             *
             * Supported values:
             * - "min_variance" or "mvp": MeanVarianceOptimizer (MIN_VARIANCE)
             * - "max_sharpe" or "tangency": MeanVarianceOptimizer (MAX_SHARPE)
             * - "risk_parity" or "erc": RiskParityOptimizer
             * - "max_diversification": MaxDiversificationOptimizer
             *
             * Case-insensitive matching is used.
             */
            std::string type;

            /**
             * @brief Annual risk-free rate
             *
             * Used by: max_sharpe (objective) and min_variance (reported Sharpe)
             */
            double risk_free_rate = 0.0;

            /**
             * @brief Target risk shares, empty for equal risk contribution
             *
             * Used by: risk_parity
             */
            std::vector<double> risk_budget;

            /**
             * @brief Closed-form gradients instead of finite differences
             */
            bool analytic_gradients = false;

            /**
             * @brief Options for the SQP solver
             */
            NonlinearSolverOptions solver;

            /**
             * @brief Create configuration from JSON
             * @throws std::invalid_argument if 'type' is missing
             * @throws nlohmann::json::exception if JSON is malformed
             */
            static OptimizerConfig from_json(const nlohmann::json &j);

            /**
             * @brief Convert configuration to JSON
             */
            nlohmann::json to_json() const;
        };

        /**
         * @class OptimizerFactory
         * @brief Factory for creating optimizer instances
         *
         * Usage Pattern:
         * @code
         * auto config = OptimizerConfig::from_json(json_obj);
         * auto optimizer = OptimizerFactory::create(config);
         * auto result = optimizer->optimize(returns, covariance, constraints);
         * @endcode
         */
        class OptimizerFactory
        {
        public:
            /**
             * @brief Create optimizer from configuration
             * @param config Configuration structure
             * @return Unique pointer to created optimizer
             * @throws std::invalid_argument if type is unknown or parameters are invalid
             */
            static std::unique_ptr<OptimizerInterface> create(const OptimizerConfig &config);

            /**
             * @brief Create optimizer from type string and JSON parameters
             */
            static std::unique_ptr<OptimizerInterface> create(
                const std::string &type,
                const nlohmann::json &params = nlohmann::json::object());

            /**
             * @brief Get list of supported optimizer types
             */
            static std::vector<std::string> get_supported_types();

        private:
            /**
             * @brief Lowercase a type string
             */
            static std::string normalize_type(const std::string &type);
        };

    } // namespace optimizer
} // namespace allocation
