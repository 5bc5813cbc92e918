/**
 * @file risk_parity_optimizer.cpp
 * @brief Implementation of risk parity portfolio optimizer
 */

#include "optimizer/risk_parity_optimizer.hpp"
#include "optimizer/optimization_errors.hpp"
#include "optimizer/portfolio_math.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        RiskParityOptimizer::RiskParityOptimizer(const Eigen::VectorXd &risk_budget)
        {
            set_risk_budget(risk_budget);
        }

        std::string RiskParityOptimizer::get_name() const
        {
            return "RiskParityOptimizer";
        }

        nlohmann::json RiskParityOptimizer::get_parameters() const
        {
            nlohmann::json params;
            params["optimizer_type"] = "RiskParity";
            params["analytic_gradients"] = analytic_gradients_;
            params["solver"] = solver_options_.to_json();

            if (risk_budget_.size() > 0)
            {
                params["risk_budget"] = std::vector<double>(
                    risk_budget_.data(), risk_budget_.data() + risk_budget_.size());
            }
            else
            {
                params["risk_budget"] = "uniform";
            }

            return params;
        }

        void RiskParityOptimizer::set_risk_budget(const Eigen::VectorXd &risk_budget)
        {
            if (risk_budget.size() > 0)
            {
                validate_risk_budget(risk_budget);
            }
            risk_budget_ = risk_budget;
        }

        void RiskParityOptimizer::validate_risk_budget(const Eigen::VectorXd &risk_budget, int num_assets)
        {
            if (risk_budget.size() == 0)
            {
                throw std::invalid_argument("Risk budget is empty");
            }

            if (num_assets > 0 && risk_budget.size() != num_assets)
            {
                throw std::invalid_argument(
                    "Risk budget size (" + std::to_string(risk_budget.size()) +
                    ") does not match number of assets (" + std::to_string(num_assets) + ")");
            }

            if (!risk_budget.allFinite())
            {
                throw std::invalid_argument("Risk budget contains NaN or Inf values");
            }

            if (risk_budget.minCoeff() < 0.0)
            {
                throw std::invalid_argument(
                    "Risk budget must be non-negative, min entry: " +
                    std::to_string(risk_budget.minCoeff()));
            }

            const double total = risk_budget.sum();
            if (std::abs(total - 1.0) > 1e-6)
            {
                throw std::invalid_argument(
                    "Risk budget must sum to 1, got: " + std::to_string(total));
            }
        }

        OptimizationResult RiskParityOptimizer::optimize(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            validate_inputs(expected_returns, covariance);
            constraints.validate();

            const int n = static_cast<int>(expected_returns.size());

            Eigen::VectorXd budget;
            if (risk_budget_.size() > 0)
            {
                validate_risk_budget(risk_budget_, n);
                budget = risk_budget_;
            }
            else
            {
                budget = Eigen::VectorXd::Constant(n, 1.0 / n);
            }

            NonlinearProblem problem = make_problem(
                n,
                [&covariance, budget](const Eigen::VectorXd &w)
                {
                    return (relative_risk_contribution(w, covariance) - budget).squaredNorm();
                },
                constraints);

            if (analytic_gradients_)
            {
                // With m = Sigma w, V = w^T m, p = w .* m / V and e = p - b:
                // grad = 2 * [(e .* m + Sigma (e .* w)) / V - 2 m (e^T p) / V]
                problem.gradient = [&covariance, budget](const Eigen::VectorXd &w)
                {
                    const double variance = portfolio_variance(w, covariance);
                    if (variance < kMinVolatility * kMinVolatility)
                    {
                        throw DegenerateInputError("Portfolio volatility is zero");
                    }

                    const Eigen::VectorXd m = marginal_risk_contribution(w, covariance);
                    const Eigen::VectorXd p = w.cwiseProduct(m) / variance;
                    const Eigen::VectorXd e = p - budget;

                    const Eigen::VectorXd direct = e.cwiseProduct(m) + covariance * e.cwiseProduct(w);
                    return Eigen::VectorXd(2.0 * (direct / variance - 2.0 * e.dot(p) * m / variance));
                };
            }

            return run_solver(problem, expected_returns, covariance);
        }

    } // namespace optimizer
} // namespace allocation
