/**
 * @file max_diversification_optimizer.cpp
 * @brief Implementation of maximum diversification optimizer
 */

#include "optimizer/max_diversification_optimizer.hpp"
#include "optimizer/optimization_errors.hpp"
#include "optimizer/portfolio_math.hpp"

namespace allocation
{
    namespace optimizer
    {

        std::string MaxDiversificationOptimizer::get_name() const
        {
            return "MaxDiversificationOptimizer";
        }

        nlohmann::json MaxDiversificationOptimizer::get_parameters() const
        {
            nlohmann::json params;
            params["optimizer_type"] = "MaxDiversification";
            params["analytic_gradients"] = analytic_gradients_;
            params["solver"] = solver_options_.to_json();
            return params;
        }

        OptimizationResult MaxDiversificationOptimizer::optimize(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            validate_inputs(expected_returns, covariance);
            constraints.validate();

            const int n = static_cast<int>(expected_returns.size());
            const Eigen::VectorXd volatilities = asset_volatilities(covariance);

            NonlinearProblem problem = make_problem(
                n,
                [&covariance, volatilities](const Eigen::VectorXd &w)
                {
                    return -diversification_ratio(w, volatilities, covariance);
                },
                constraints);

            if (analytic_gradients_)
            {
                // d(DR)/dw = sigma / sigma_p - (w^T sigma) * Sigma * w / sigma_p^3
                problem.gradient = [&covariance, volatilities](const Eigen::VectorXd &w)
                {
                    const double vol = portfolio_volatility(w, covariance);
                    if (vol < kMinVolatility)
                    {
                        throw DegenerateInputError("Portfolio volatility is zero");
                    }
                    const double weighted_vol = w.dot(volatilities);
                    const Eigen::VectorXd sigma_w = marginal_risk_contribution(w, covariance);
                    return Eigen::VectorXd(-(volatilities / vol - weighted_vol * sigma_w / (vol * vol * vol)));
                };
            }

            return run_solver(problem, expected_returns, covariance);
        }

    } // namespace optimizer
} // namespace allocation
