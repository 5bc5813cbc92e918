/**
 * @file efficient_frontier.hpp
 * @brief Efficient frontier computation for portfolio optimization
 *
 * Computes the Markowitz efficient frontier by solving one minimum
 * volatility problem per target return.
 *
 * Mathematical Background:
 *
 *     For each target return r_target:
 *         Minimize: sqrt(w^T * Sigma * w)
 *         Subject to: mu^T * w = r_target
 *                     sum(w) = 1
 *                     0 <= w <= 1     (long-only)
 *
 * By default the targets are evenly spaced between the return of the
 * minimum variance portfolio and the return of the maximum Sharpe
 * portfolio. Every point starts from the uniform portfolio; there is no
 * warm start from the neighbouring point.
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"
#include <optional>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct FrontierPoint
         * @brief Single point on the efficient frontier
         */
        struct FrontierPoint
        {
            double target_return;              ///< Requested portfolio return
            std::optional<double> volatility;  ///< Minimum volatility, empty if the solve failed
            Eigen::VectorXd weights;           ///< Portfolio weights (empty if the solve failed)

            /**
             * @brief Default constructor
             */
            FrontierPoint();

            /**
             * @brief Construct from optimization result
             */
            FrontierPoint(double target, const OptimizationResult &result);

            /**
             * @brief Point successfully computed
             */
            bool is_valid() const { return volatility.has_value(); }
        };

        /**
         * @struct EfficientFrontierResult
         * @brief Complete efficient frontier data
         *
         * points follow the order of the target return grid.
         */
        struct EfficientFrontierResult
        {
            std::vector<FrontierPoint> points;         ///< Frontier points
            OptimizationResult min_variance_portfolio; ///< Minimum variance portfolio
            OptimizationResult max_sharpe_portfolio;   ///< Maximum Sharpe ratio portfolio
            bool success;                              ///< Computation succeeded
            std::string message;                       ///< Status message

            /**
             * @brief Default constructor
             */
            EfficientFrontierResult();

            /**
             * @brief Check if result is valid
             */
            bool is_valid() const;

            /**
             * @brief Get number of valid points
             */
            size_t num_valid_points() const;

            /**
             * @brief Print summary statistics
             */
            void print_summary() const;

            /**
             * @brief Export frontier data to CSV
             * @param filepath Path to output file
             * @throws std::runtime_error if the file cannot be written
             *
             * Columns: target_return,volatility,is_valid. Missing
             * volatilities are written as empty fields.
             */
            void export_to_csv(const std::string &filepath) const;
        };

        /**
         * @class EfficientFrontier
         * @brief Computes the efficient frontier
         *
         * Key Features:
         * - Automatic target return range from the MVP and tangency portfolios
         * - Explicit target return grids
         * - Optional parallel evaluation with results in grid order
         * - Data export capabilities
         *
         * Usage Example:
         * @code
         * EfficientFrontier frontier;
         * frontier.set_num_points(20);
         *
         * OptimizationConstraints constraints;
         * constraints.long_only = true;
         *
         * auto result = frontier.compute(
         *     expected_returns,
         *     covariance,
         *     constraints,
         *     0.02  // risk-free rate
         * );
         *
         * result.print_summary();
         * result.export_to_csv("frontier.csv");
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class EfficientFrontier
        {
        public:
            /**
             * @brief Constructor
             */
            EfficientFrontier();

            /**
             * @brief Destructor
             */
            ~EfficientFrontier() = default;

            /**
             * @brief Compute efficient frontier
             * @param expected_returns Expected returns for each asset
             * @param covariance Covariance matrix
             * @param constraints Portfolio constraints (bounds policy applies to
             *        the anchor portfolios and every grid point)
             * @param risk_free_rate Risk-free rate for the tangency portfolio
             * @return Efficient frontier result; success = false with no
             *         points if an anchor portfolio needed for the grid fails
             * @throws std::invalid_argument if inputs are invalid
             * @throws DegenerateInputError if an asset has zero variance
             * @throws NumericError if the covariance is not positive semi-definite
             */
            EfficientFrontierResult compute(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints = OptimizationConstraints(),
                double risk_free_rate = 0.0) const;

            // ===== Configuration Methods =====

            /**
             * @brief Set number of points on frontier
             * @param num_points Number of points
             * @throws std::invalid_argument if num_points < 1
             */
            void set_num_points(int num_points);

            /**
             * @brief Use an explicit target return grid instead of the
             *        MVP to tangency range (empty restores the default)
             * @throws std::invalid_argument if a target is not finite
             */
            void set_target_returns(const std::vector<double> &target_returns);

            /**
             * @brief Solve grid points on worker threads
             */
            void set_parallel(bool enable) { parallel_ = enable; }

            /**
             * @brief Solver options for every solve of the sweep
             * @throws std::invalid_argument if options are invalid
             */
            void set_solver_options(const NonlinearSolverOptions &options);

            /**
             * @brief Use closed-form gradients in every solve of the sweep
             */
            void set_analytic_gradients(bool enable) { analytic_gradients_ = enable; }

            // ===== Getters =====

            /**
             * @brief Get number of frontier points
             */
            int get_num_points() const { return num_points_; }

            const std::vector<double> &get_target_returns() const { return target_returns_; }

            bool is_parallel() const { return parallel_; }

            /**
             * @brief num_points values from start to stop inclusive
             *
             * One point yields just start.
             */
            static std::vector<double> linspace(double start, double stop, int num_points);

        private:
            int num_points_;                      ///< Number of points on frontier
            std::vector<double> target_returns_;  ///< Explicit grid (empty = automatic)
            bool parallel_;                       ///< Solve points concurrently
            bool analytic_gradients_;             ///< Closed-form gradients enabled
            NonlinearSolverOptions solver_options_; ///< Options for every solve

            /**
             * @brief Solve one grid point
             */
            FrontierPoint solve_point(
                double target_return,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            /**
             * @brief Solve every grid point, in order
             */
            std::vector<FrontierPoint> solve_grid(
                const std::vector<double> &grid,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;
        };

    } // namespace optimizer
} // namespace allocation
