/**
 * @file efficient_frontier.cpp
 * @brief Implementation of efficient frontier computation
 */

#include "optimizer/efficient_frontier.hpp"
#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/optimization_errors.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <limits>
#include <thread>

namespace allocation
{
    namespace optimizer
    {

        // ============================================================================
        // FrontierPoint Implementation
        // ============================================================================

        FrontierPoint::FrontierPoint()
            : target_return(0.0)
        {
        }

        FrontierPoint::FrontierPoint(double target, const OptimizationResult &result)
            : target_return(target)
        {
            if (result.success)
            {
                volatility = result.volatility;
                weights = result.weights;
            }
        }

        // ============================================================================
        // EfficientFrontierResult Implementation
        // ============================================================================

        EfficientFrontierResult::EfficientFrontierResult()
            : success(false)
        {
        }

        bool EfficientFrontierResult::is_valid() const
        {
            return success && num_valid_points() > 0;
        }

        size_t EfficientFrontierResult::num_valid_points() const
        {
            return static_cast<size_t>(std::count_if(
                points.begin(), points.end(),
                [](const FrontierPoint &point)
                { return point.is_valid(); }));
        }

        void EfficientFrontierResult::print_summary() const
        {
            std::cout << "\n=== Efficient Frontier Summary ===\n";
            std::cout << "Status: " << (success ? "SUCCESS" : "FAILED") << "\n";
            std::cout << "Message: " << message << "\n";
            std::cout << "Total points: " << points.size() << "\n";
            std::cout << "Valid points: " << num_valid_points() << "\n";
            std::cout << std::string(60, '-') << "\n";

            if (min_variance_portfolio.success)
            {
                std::cout << "\nMinimum Variance Portfolio:\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                          << min_variance_portfolio.expected_return * 100 << "%\n";
                std::cout << "  Volatility:       "
                          << min_variance_portfolio.volatility * 100 << "%\n";
                std::cout << "  Sharpe Ratio:     " << std::setprecision(3)
                          << min_variance_portfolio.sharpe_ratio << "\n";
            }

            if (max_sharpe_portfolio.success)
            {
                std::cout << "\nMaximum Sharpe Ratio Portfolio:\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                          << max_sharpe_portfolio.expected_return * 100 << "%\n";
                std::cout << "  Volatility:       "
                          << max_sharpe_portfolio.volatility * 100 << "%\n";
                std::cout << "  Sharpe Ratio:     " << std::setprecision(3)
                          << max_sharpe_portfolio.sharpe_ratio << "\n";
            }

            if (num_valid_points() > 0)
            {
                std::cout << "\nFrontier Range:\n";

                double min_vol = std::numeric_limits<double>::max();
                double max_vol = -std::numeric_limits<double>::max();
                double min_ret = std::numeric_limits<double>::max();
                double max_ret = -std::numeric_limits<double>::max();

                for (const auto &point : points)
                {
                    if (point.is_valid())
                    {
                        min_vol = std::min(min_vol, *point.volatility);
                        max_vol = std::max(max_vol, *point.volatility);
                        min_ret = std::min(min_ret, point.target_return);
                        max_ret = std::max(max_ret, point.target_return);
                    }
                }

                std::cout << "  Return range:     " << std::fixed << std::setprecision(4)
                          << min_ret * 100 << "% to " << max_ret * 100 << "%\n";
                std::cout << "  Volatility range: "
                          << min_vol * 100 << "% to " << max_vol * 100 << "%\n";
            }

            std::cout << "================================\n"
                      << std::endl;
        }

        void EfficientFrontierResult::export_to_csv(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            // Write header
            file << "target_return,volatility,is_valid\n";

            // Write frontier points
            for (const auto &point : points)
            {
                file << std::fixed << std::setprecision(8) << point.target_return << ",";
                if (point.volatility)
                {
                    file << *point.volatility;
                }
                file << "," << (point.is_valid() ? "1" : "0") << "\n";
            }

            file.close();
        }

        // ============================================================================
        // EfficientFrontier Implementation
        // ============================================================================

        EfficientFrontier::EfficientFrontier()
            : num_points_(50),
              parallel_(false),
              analytic_gradients_(false)
        {
        }

        void EfficientFrontier::set_num_points(int num_points)
        {
            if (num_points < 1)
            {
                throw std::invalid_argument(
                    "Number of points must be at least 1, got: " +
                    std::to_string(num_points));
            }
            num_points_ = num_points;
        }

        void EfficientFrontier::set_target_returns(const std::vector<double> &target_returns)
        {
            for (double target : target_returns)
            {
                if (!std::isfinite(target))
                {
                    throw std::invalid_argument("Target returns must be finite");
                }
            }
            target_returns_ = target_returns;
        }

        void EfficientFrontier::set_solver_options(const NonlinearSolverOptions &options)
        {
            options.validate();
            solver_options_ = options;
        }

        std::vector<double> EfficientFrontier::linspace(double start, double stop, int num_points)
        {
            if (num_points < 1)
            {
                throw std::invalid_argument(
                    "Number of points must be at least 1, got: " +
                    std::to_string(num_points));
            }

            std::vector<double> grid;
            grid.reserve(num_points);

            if (num_points == 1)
            {
                grid.push_back(start);
                return grid;
            }

            const double step = (stop - start) / (num_points - 1);
            for (int i = 0; i < num_points - 1; ++i)
            {
                grid.push_back(start + i * step);
            }
            grid.push_back(stop);

            return grid;
        }

        EfficientFrontierResult EfficientFrontier::compute(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            double risk_free_rate) const
        {
            OptimizerInterface::validate_inputs(expected_returns, covariance);
            constraints.validate();

            EfficientFrontierResult result;

            // Anchor portfolios
            MeanVarianceOptimizer min_variance(ObjectiveType::MIN_VARIANCE, risk_free_rate);
            min_variance.set_solver_options(solver_options_);
            min_variance.set_analytic_gradients(analytic_gradients_);
            result.min_variance_portfolio = min_variance.optimize(expected_returns, covariance, constraints);

            MeanVarianceOptimizer max_sharpe(ObjectiveType::MAX_SHARPE, risk_free_rate);
            max_sharpe.set_solver_options(solver_options_);
            max_sharpe.set_analytic_gradients(analytic_gradients_);
            result.max_sharpe_portfolio = max_sharpe.optimize(expected_returns, covariance, constraints);

            std::vector<double> grid = target_returns_;
            if (grid.empty())
            {
                if (!result.min_variance_portfolio.success)
                {
                    result.message = "Minimum variance portfolio failed: " + result.min_variance_portfolio.message;
                    return result;
                }
                if (!result.max_sharpe_portfolio.success)
                {
                    result.message = "Maximum Sharpe portfolio failed: " + result.max_sharpe_portfolio.message;
                    return result;
                }

                grid = linspace(result.min_variance_portfolio.expected_return,
                                result.max_sharpe_portfolio.expected_return,
                                num_points_);
            }

            result.points = solve_grid(grid, expected_returns, covariance, constraints);

            result.success = true;
            result.message = "Efficient frontier computed: " +
                             std::to_string(result.num_valid_points()) + " of " +
                             std::to_string(result.points.size()) + " points solved";

            return result;
        }

        std::vector<FrontierPoint> EfficientFrontier::solve_grid(
            const std::vector<double> &grid,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            std::vector<FrontierPoint> points(grid.size());

            if (!parallel_ || grid.size() < 2)
            {
                for (size_t i = 0; i < grid.size(); ++i)
                {
                    points[i] = solve_point(grid[i], expected_returns, covariance, constraints);
                }
                return points;
            }

            // Batches of at most hardware_concurrency tasks; each result goes
            // to the slot of its target so the output keeps grid order
            const size_t batch_size = std::max<size_t>(1, std::thread::hardware_concurrency());

            for (size_t begin = 0; begin < grid.size(); begin += batch_size)
            {
                const size_t end = std::min(grid.size(), begin + batch_size);

                std::vector<std::future<FrontierPoint>> tasks;
                tasks.reserve(end - begin);
                for (size_t i = begin; i < end; ++i)
                {
                    tasks.push_back(std::async(
                        std::launch::async,
                        [this, target = grid[i], &expected_returns, &covariance, &constraints]()
                        {
                            return solve_point(target, expected_returns, covariance, constraints);
                        }));
                }

                for (size_t i = begin; i < end; ++i)
                {
                    points[i] = tasks[i - begin].get();
                }
            }

            return points;
        }

        FrontierPoint EfficientFrontier::solve_point(
            double target_return,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            MeanVarianceOptimizer optimizer(ObjectiveType::TARGET_RETURN);
            optimizer.set_solver_options(solver_options_);
            optimizer.set_analytic_gradients(analytic_gradients_);
            optimizer.set_target_return(target_return);

            try
            {
                return FrontierPoint(target_return,
                                     optimizer.optimize(expected_returns, covariance, constraints));
            }
            catch (const DegenerateInputError &e)
            {
                // A zero-volatility portfolio at this target; the point is missing
                if (solver_options_.verbose)
                {
                    std::cerr << "Warning: frontier target " << target_return
                              << " skipped: " << e.what() << "\n";
                }
                return FrontierPoint(target_return, OptimizationResult());
            }
        }

    } // namespace optimizer
} // namespace allocation
