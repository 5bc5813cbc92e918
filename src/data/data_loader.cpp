/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include <cmath>
#include <fstream>
#include <set>
#include <stdexcept>

namespace allocation
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    AssetStatistics AssetStatistics::from_json(const nlohmann::json &j)
    {
        AssetStatistics stats;

        if (!j.contains("expected_returns") || !j.contains("covariance"))
        {
            throw std::invalid_argument(
                "Asset section must contain 'expected_returns' and 'covariance'");
        }

        stats.expected_returns = DataLoader::parse_vector(j["expected_returns"], "expected_returns");
        stats.covariance = DataLoader::parse_matrix(j["covariance"], "covariance");
        stats.periods_per_year = j.value("periods_per_year", 1.0);

        const size_t n = static_cast<size_t>(stats.expected_returns.size());

        if (stats.covariance.rows() != stats.expected_returns.size() ||
            stats.covariance.cols() != stats.expected_returns.size())
        {
            throw std::invalid_argument(
                "Covariance must be " + std::to_string(n) + "x" + std::to_string(n) +
                " to match expected_returns, got " + std::to_string(stats.covariance.rows()) +
                "x" + std::to_string(stats.covariance.cols()));
        }

        if (!(stats.periods_per_year > 0.0) || !std::isfinite(stats.periods_per_year))
        {
            throw std::invalid_argument(
                "periods_per_year must be positive, got: " + std::to_string(stats.periods_per_year));
        }

        if (j.contains("names"))
        {
            stats.names = j["names"].get<std::vector<std::string>>();
            if (stats.names.size() != n)
            {
                throw std::invalid_argument(
                    "Got " + std::to_string(stats.names.size()) + " asset names for " +
                    std::to_string(n) + " assets");
            }

            std::set<std::string> unique(stats.names.begin(), stats.names.end());
            if (unique.size() != stats.names.size())
            {
                throw std::invalid_argument("Asset names must be unique");
            }
        }
        else
        {
            for (size_t i = 0; i < n; ++i)
            {
                stats.names.push_back("Asset" + std::to_string(i + 1));
            }
        }

        // Per-period statistics to annual
        stats.expected_returns *= stats.periods_per_year;
        stats.covariance *= stats.periods_per_year;

        return stats;
    }

    OptimizerSettings OptimizerSettings::from_json(const nlohmann::json &j)
    {
        OptimizerSettings settings;
        settings.strategies = j.value("strategies", std::vector<std::string>{
                                                        "min_variance", "max_sharpe",
                                                        "risk_parity", "max_diversification"});
        settings.risk_free_rate = j.value("risk_free_rate", 0.02);
        settings.long_only = j.value("long_only", true);
        settings.risk_budget = j.value("risk_budget", std::vector<double>{});
        settings.analytic_gradients = j.value("analytic_gradients", false);

        if (j.contains("solver"))
        {
            settings.solver = optimizer::NonlinearSolverOptions::from_json(j["solver"]);
        }

        if (!std::isfinite(settings.risk_free_rate))
        {
            throw std::invalid_argument("risk_free_rate must be finite");
        }

        return settings;
    }

    optimizer::OptimizerConfig OptimizerSettings::make_config(const std::string &strategy) const
    {
        optimizer::OptimizerConfig config;
        config.type = strategy;
        config.risk_free_rate = risk_free_rate;
        config.risk_budget = risk_budget;
        config.analytic_gradients = analytic_gradients;
        config.solver = solver;
        return config;
    }

    optimizer::OptimizationConstraints OptimizerSettings::make_constraints() const
    {
        optimizer::OptimizationConstraints constraints;
        constraints.long_only = long_only;
        return constraints;
    }

    FrontierConfig FrontierConfig::from_json(const nlohmann::json &j)
    {
        FrontierConfig config;
        config.num_points = j.value("num_points", 50);
        config.target_returns = j.value("target_returns", std::vector<double>{});
        config.parallel = j.value("parallel", false);

        if (config.num_points < 1)
        {
            throw std::invalid_argument(
                "frontier.num_points must be at least 1, got: " + std::to_string(config.num_points));
        }

        return config;
    }

    PortfolioConfig PortfolioConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // Configuration Loading
    // ===========================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    PortfolioConfig DataLoader::load_config(const std::string &config_path)
    {
        return parse_config(load_json(config_path));
    }

    PortfolioConfig DataLoader::parse_config(const nlohmann::json &j)
    {
        PortfolioConfig config;

        if (!j.is_object() || !j.contains("assets"))
        {
            throw std::invalid_argument("Configuration must contain an 'assets' section");
        }

        try
        {
            config.assets = AssetStatistics::from_json(j["assets"]);

            if (j.contains("optimizer"))
            {
                config.optimizer = OptimizerSettings::from_json(j["optimizer"]);
            }
            else
            {
                config.optimizer = OptimizerSettings::from_json(nlohmann::json::object());
            }

            if (j.contains("frontier"))
            {
                config.frontier = FrontierConfig::from_json(j["frontier"]);
                config.has_frontier = true;
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("Invalid configuration: " + std::string(e.what()));
        }

        return config;
    }

    // ===========================
    // JSON Helpers
    // ===========================

    Eigen::VectorXd DataLoader::parse_vector(const nlohmann::json &j, const std::string &field)
    {
        if (!j.is_array() || j.empty())
        {
            throw std::invalid_argument("'" + field + "' must be a non-empty array of numbers");
        }

        Eigen::VectorXd values(static_cast<Eigen::Index>(j.size()));
        for (size_t i = 0; i < j.size(); ++i)
        {
            if (!j[i].is_number())
            {
                throw std::invalid_argument(
                    "'" + field + "' entry " + std::to_string(i) + " is not a number");
            }
            values(static_cast<Eigen::Index>(i)) = j[i].get<double>();
        }
        return values;
    }

    Eigen::MatrixXd DataLoader::parse_matrix(const nlohmann::json &j, const std::string &field)
    {
        if (!j.is_array() || j.empty())
        {
            throw std::invalid_argument("'" + field + "' must be a non-empty array of rows");
        }

        const size_t rows = j.size();
        const size_t cols = j[0].is_array() ? j[0].size() : 0;

        Eigen::MatrixXd matrix(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
        for (size_t r = 0; r < rows; ++r)
        {
            if (!j[r].is_array() || j[r].size() != cols || cols == 0)
            {
                throw std::invalid_argument(
                    "'" + field + "' row " + std::to_string(r) + " must have " +
                    std::to_string(cols) + " entries");
            }

            matrix.row(static_cast<Eigen::Index>(r)) =
                parse_vector(j[r], field + "[" + std::to_string(r) + "]").transpose();
        }
        return matrix;
    }

} // namespace allocation
