/**
 * @file data_loader.hpp
 * @brief Configuration loading and parsing utilities
 *
 * Loads the asset statistics and optimizer settings consumed by the
 * command-line driver from a JSON file.
 */

#ifndef ALLOCATION_DATA_LOADER_HPP
#define ALLOCATION_DATA_LOADER_HPP

#include "optimizer/nonlinear_solver.hpp"
#include "optimizer/optimizer_factory.hpp"
#include "optimizer/optimizer_interface.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>


namespace allocation {

/**
 * @struct AssetStatistics
 * @brief Asset universe with annualized expected returns and covariance
 *
 * Statistics given per period are scaled to annual figures by
 * periods_per_year (mu * k, Sigma * k).
 */
struct AssetStatistics {
    std::vector<std::string> names;            ///< Asset names, in matrix order
    Eigen::VectorXd expected_returns;          ///< Annualized expected returns
    Eigen::MatrixXd covariance;                ///< Annualized covariance matrix
    double periods_per_year = 1.0;             ///< Scaling applied on load

    /**
     * @brief Load from JSON object
     * @throws std::invalid_argument if fields are missing or inconsistent
     */
    static AssetStatistics from_json(const nlohmann::json& j);

    /**
     * @brief Number of assets
     */
    size_t num_assets() const { return names.size(); }
};

/**
 * @struct OptimizerSettings
 * @brief Strategies to run and their shared parameters
 */
struct OptimizerSettings {
    std::vector<std::string> strategies;       ///< Optimizer types, run in order
    double risk_free_rate = 0.02;              ///< Annual risk-free rate
    bool long_only = true;                     ///< Constraint: no short positions
    std::vector<double> risk_budget;           ///< Risk parity budget (empty = uniform)
    bool analytic_gradients = false;           ///< Closed-form gradients
    optimizer::NonlinearSolverOptions solver;  ///< SQP options

    static OptimizerSettings from_json(const nlohmann::json& j);

    /**
     * @brief Factory configuration for one strategy
     */
    optimizer::OptimizerConfig make_config(const std::string& strategy) const;

    /**
     * @brief Portfolio constraints implied by the settings
     */
    optimizer::OptimizationConstraints make_constraints() const;
};

/**
 * @struct FrontierConfig
 * @brief Configuration for the efficient frontier sweep
 */
struct FrontierConfig {
    int num_points = 50;                       ///< Grid size between MVP and tangency
    std::vector<double> target_returns;        ///< Explicit grid (overrides num_points)
    bool parallel = false;                     ///< Solve points concurrently

    static FrontierConfig from_json(const nlohmann::json& j);
};

/**
 * @struct PortfolioConfig
 * @brief Complete allocation configuration
 */
struct PortfolioConfig {
    AssetStatistics assets;
    OptimizerSettings optimizer;
    FrontierConfig frontier;
    bool has_frontier = false;                 ///< "frontier" section present

    /**
     * @brief Load complete configuration from JSON file
     */
    static PortfolioConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Loads and parses configuration documents
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    /**
     * @brief Load JSON configuration file
     * @param filepath Path to JSON config file
     * @return JSON object
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete portfolio configuration
     * @param config_path Path to config JSON file
     * @return PortfolioConfig struct
     * @throws std::runtime_error if the file cannot be read
     * @throws std::invalid_argument if the content is invalid
     */
    static PortfolioConfig load_config(const std::string& config_path);

    /**
     * @brief Parse a complete portfolio configuration document
     * @throws std::invalid_argument if the content is invalid
     */
    static PortfolioConfig parse_config(const nlohmann::json& j);

    /**
     * @brief Parse a JSON array of numbers
     * @throws std::invalid_argument if not an array of numbers
     */
    static Eigen::VectorXd parse_vector(const nlohmann::json& j, const std::string& field);

    /**
     * @brief Parse a JSON array of equally sized rows
     * @throws std::invalid_argument if not a rectangular array of numbers
     */
    static Eigen::MatrixXd parse_matrix(const nlohmann::json& j, const std::string& field);
};

} // namespace allocation

#endif // ALLOCATION_DATA_LOADER_HPP
