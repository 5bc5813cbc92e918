/**
 * @file optimizer_factory.cpp
 * @brief Implementation of optimizer factory
 */

#include "optimizer/optimizer_factory.hpp"
#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/risk_parity_optimizer.hpp"
#include "optimizer/max_diversification_optimizer.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        // OptimizerConfig implementation
        OptimizerConfig OptimizerConfig::from_json(const nlohmann::json &doc)
        {
            OptimizerConfig config;

            // Type (required)
            if (!doc.contains("type") || !doc["type"].is_string())
            {
                throw std::invalid_argument("Optimizer configuration must specify 'type'");
            }

            config.type = doc["type"].get<std::string>();

            config.risk_free_rate = doc.value("risk_free_rate", 0.0);
            config.analytic_gradients = doc.value("analytic_gradients", false);

            if (doc.contains("risk_budget"))
            {
                config.risk_budget = doc["risk_budget"].get<std::vector<double>>();
            }

            if (doc.contains("solver"))
            {
                config.solver = NonlinearSolverOptions::from_json(doc["solver"]);
            }

            return config;
        }

        nlohmann::json OptimizerConfig::to_json() const
        {
            return nlohmann::json{
                {"type", type},
                {"risk_free_rate", risk_free_rate},
                {"risk_budget", risk_budget},
                {"analytic_gradients", analytic_gradients},
                {"solver", solver.to_json()}};
        }

        // OptimizerFactory implementation
        std::string OptimizerFactory::normalize_type(const std::string &type)
        {
            std::string normalized = type;

            // Convert to lowercase
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            return normalized;
        }

        std::unique_ptr<OptimizerInterface> OptimizerFactory::create(const OptimizerConfig &config)
        {
            std::string type = normalize_type(config.type);

            std::unique_ptr<OptimizerInterface> optimizer;

            if (type == "min_variance" || type == "mvp")
            {
                optimizer = std::make_unique<MeanVarianceOptimizer>(
                    ObjectiveType::MIN_VARIANCE, config.risk_free_rate);
            }
            else if (type == "max_sharpe" || type == "tangency")
            {
                optimizer = std::make_unique<MeanVarianceOptimizer>(
                    ObjectiveType::MAX_SHARPE, config.risk_free_rate);
            }
            else if (type == "risk_parity" || type == "erc")
            {
                Eigen::VectorXd budget;
                if (!config.risk_budget.empty())
                {
                    budget = Eigen::Map<const Eigen::VectorXd>(
                        config.risk_budget.data(),
                        static_cast<Eigen::Index>(config.risk_budget.size()));
                }
                optimizer = std::make_unique<RiskParityOptimizer>(budget);
            }
            else if (type == "max_diversification")
            {
                optimizer = std::make_unique<MaxDiversificationOptimizer>();
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown optimizer type: '" + config.type + "'. "
                    "Valid options: min_variance, max_sharpe, risk_parity, max_diversification");
            }

            optimizer->set_solver_options(config.solver);
            optimizer->set_analytic_gradients(config.analytic_gradients);

            return optimizer;
        }

        std::unique_ptr<OptimizerInterface> OptimizerFactory::create(
            const std::string &type,
            const nlohmann::json &params)
        {
            // Create config from JSON
            nlohmann::json config_json = params;
            config_json["type"] = type;

            OptimizerConfig config = OptimizerConfig::from_json(config_json);
            return create(config);
        }

        std::vector<std::string> OptimizerFactory::get_supported_types()
        {
            return {
                "min_variance",
                "mvp",
                "max_sharpe",
                "tangency",
                "risk_parity",
                "erc",
                "max_diversification"};
        }

    } // namespace optimizer
} // namespace allocation
