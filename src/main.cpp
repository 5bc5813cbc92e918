/**
 * @file main.cpp
 * @brief Main entry point for the Portfolio Allocation Engine
 *
 * Command-line application that loads asset statistics, runs the
 * configured allocation strategies, and optionally traces the efficient
 * frontier.
 */

#include "data/data_loader.hpp"
#include "optimizer/optimizer_factory.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "optimizer/portfolio_math.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace allocation;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Portfolio Allocation Engine v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --frontier            Compute efficient frontier\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/allocation_config.json --verbose\n"
              << "  " << program_name << " --config data/config/allocation_config.json --frontier\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Portfolio Allocation Engine v1.0.0                      \n"
              << "       Minimum Variance / Max Sharpe / Risk Parity / Max DR    \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir = "results";
    bool compute_frontier = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--frontier")
            {
                args.compute_frontier = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief Risk parity and max diversification failures abort the run
 */
bool is_hard_failure_strategy(const std::string &strategy)
{
    std::string normalized = strategy;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                   { return std::tolower(c); });
    return normalized == "risk_parity" || normalized == "erc" ||
           normalized == "max_diversification";
}

/**
 * @brief Print optimization result
 */
void print_optimization_result(
    const std::string &title,
    const optimizer::OptimizationResult &result,
    const std::vector<std::string> &names)
{
    std::cout << "\n"
              << title << "\n";
    std::cout << std::string(60, '-') << "\n";

    if (!result.success)
    {
        std::cout << "Optimization failed: " << result.message << "\n";
        return;
    }

    std::cout << "Status: SUCCESS\n";
    std::cout << "Message: " << result.message << "\n";
    std::cout << "Iterations: " << result.iterations << "\n\n";

    std::cout << "Portfolio Statistics (annualized):\n";
    std::cout << "  Expected Return:  " << std::fixed << std::setprecision(2)
              << result.expected_return * 100 << "%\n";
    std::cout << "  Volatility:       " << result.volatility * 100 << "%\n";
    std::cout << "  Sharpe Ratio:     " << std::setprecision(3)
              << result.sharpe_ratio << "\n";
    std::cout << "  Diversification:  " << result.diversification_ratio << "\n\n";

    std::cout << "Asset Weights:                Risk Share:\n";

    // Sort by weight for better display
    std::vector<std::pair<double, size_t>> sorted_weights;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (std::abs(result.weights(i)) > 1e-4)
        {
            sorted_weights.push_back({result.weights(i), i});
        }
    }
    std::sort(sorted_weights.begin(), sorted_weights.end(),
              [](const auto &a, const auto &b)
              { return a.first > b.first; });

    for (const auto &pair : sorted_weights)
    {
        std::cout << "  " << std::setw(12) << std::left << names[pair.second] << std::right
                  << ": " << std::setw(8) << std::fixed << std::setprecision(2)
                  << pair.first * 100 << "%";
        if (result.risk_contributions.size() == result.weights.size())
        {
            std::cout << "        " << std::setw(8)
                      << result.risk_contributions(pair.second) * 100 << "%";
        }
        std::cout << "\n";
    }

    std::cout << std::string(60, '-') << "\n";
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);
        const auto &assets = config.assets;

        // --verbose also turns on the per-iteration solver trace
        if (args.verbose)
        {
            config.optimizer.solver.verbose = true;
        }

        std::cout << "  - Loaded " << assets.num_assets() << " assets" << std::endl;

        if (args.verbose)
        {
            std::cout << "  - Strategies: ";
            for (const auto &strategy : config.optimizer.strategies)
            {
                std::cout << strategy << " ";
            }
            std::cout << "\n  - Risk-free rate: " << config.optimizer.risk_free_rate << "\n";
            std::cout << "  - Periods per year: " << assets.periods_per_year << "\n";
            std::cout << "  - Long only: " << (config.optimizer.long_only ? "Yes" : "No") << "\n";
        }

        // ====================================================================
        // 2. Validate Asset Statistics
        // ====================================================================
        std::cout << "[2/4] Validating asset statistics..." << std::endl;

        optimizer::OptimizerInterface::validate_inputs(assets.expected_returns, assets.covariance);

        if (args.verbose)
        {
            const Eigen::VectorXd vols = optimizer::asset_volatilities(assets.covariance);

            std::cout << "\n  Asset Statistics (annualized):\n";
            std::cout << "  " << std::string(50, '-') << "\n";
            std::cout << "  " << std::setw(12) << "Asset"
                      << std::setw(12) << "Mean Ret"
                      << std::setw(12) << "Volatility" << "\n";
            std::cout << "  " << std::string(50, '-') << "\n";

            for (size_t i = 0; i < assets.num_assets(); ++i)
            {
                std::cout << "  " << std::setw(12) << assets.names[i]
                          << std::setw(11) << std::fixed << std::setprecision(4)
                          << assets.expected_returns(i) * 100 << "%"
                          << std::setw(11) << vols(i) * 100 << "%\n";
            }
            std::cout << "  " << std::string(50, '-') << "\n";
        }

        // ====================================================================
        // 3. Portfolio Optimization
        // ====================================================================
        std::cout << "[3/4] Running portfolio optimization..." << std::endl;

        const optimizer::OptimizationConstraints constraints = config.optimizer.make_constraints();

        for (const auto &strategy : config.optimizer.strategies)
        {
            std::cout << "\n  Computing " << strategy << " portfolio...\n";

            auto optimizer_instance = optimizer::OptimizerFactory::create(
                config.optimizer.make_config(strategy));

            auto result = optimizer_instance->optimize(
                assets.expected_returns, assets.covariance, constraints);

            print_optimization_result(
                optimizer_instance->get_name() + " (" + strategy + ")",
                result,
                assets.names);

            if (is_hard_failure_strategy(strategy))
            {
                // Throws OptimizationFailedError on failure
                result.checked_weights();
            }
        }

        // ====================================================================
        // 4. Efficient Frontier (Optional)
        // ====================================================================
        if (args.compute_frontier || config.has_frontier)
        {
            std::cout << "\n[4/4] Computing efficient frontier..." << std::endl;

            optimizer::EfficientFrontier frontier;
            frontier.set_num_points(config.frontier.num_points);
            frontier.set_target_returns(config.frontier.target_returns);
            frontier.set_parallel(config.frontier.parallel);
            frontier.set_solver_options(config.optimizer.solver);
            frontier.set_analytic_gradients(config.optimizer.analytic_gradients);

            if (args.verbose)
            {
                std::cout << "  - Computing "
                          << (config.frontier.target_returns.empty()
                                  ? static_cast<size_t>(config.frontier.num_points)
                                  : config.frontier.target_returns.size())
                          << " frontier points"
                          << (config.frontier.parallel ? " in parallel" : "") << "...\n";
            }

            auto frontier_result = frontier.compute(
                assets.expected_returns,
                assets.covariance,
                constraints,
                config.optimizer.risk_free_rate);

            if (frontier_result.success)
            {
                frontier_result.print_summary();

                // Export to CSV
                std::filesystem::create_directories(args.output_dir);
                std::string frontier_file = args.output_dir + "/efficient_frontier.csv";
                frontier_result.export_to_csv(frontier_file);
                std::cout << "\n  Frontier data exported to: " << frontier_file << "\n";
            }
            else
            {
                std::cerr << "Warning: Frontier computation failed: "
                          << frontier_result.message << "\n";
            }
        }
        else
        {
            std::cout << "\n[4/4] Skipping efficient frontier (use --frontier to enable)\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Optimization completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    // Print banner
    print_banner();

    // Run optimization
    return run(args);
}
