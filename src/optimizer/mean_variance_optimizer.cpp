/**
 * @file mean_variance_optimizer.cpp
 * @brief Implementation of mean-variance portfolio optimizer
 */

#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/optimization_errors.hpp"
#include "optimizer/portfolio_math.hpp"
#include <stdexcept>
#include <cmath>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            double checked_volatility(const Eigen::VectorXd &w, const Eigen::MatrixXd &covariance)
            {
                const double vol = portfolio_volatility(w, covariance);
                if (vol < kMinVolatility)
                {
                    throw DegenerateInputError("Portfolio volatility is zero");
                }
                return vol;
            }
        } // namespace

        MeanVarianceOptimizer::MeanVarianceOptimizer(
            ObjectiveType objective,
            double risk_free_rate)
            : objective_(objective),
              risk_free_rate_(risk_free_rate),
              target_return_(0.0),
              has_target_return_(false)
        {
            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument(
                    "Risk-free rate must be finite, got: " +
                    std::to_string(risk_free_rate));
            }
        }

        std::string MeanVarianceOptimizer::get_name() const
        {
            return "MeanVarianceOptimizer";
        }

        nlohmann::json MeanVarianceOptimizer::get_parameters() const
        {
            nlohmann::json params;
            params["optimizer_type"] = "MeanVariance";
            params["risk_free_rate"] = risk_free_rate_;
            params["analytic_gradients"] = analytic_gradients_;
            params["solver"] = solver_options_.to_json();

            std::string obj_str;
            switch (objective_)
            {
            case ObjectiveType::MIN_VARIANCE:
                obj_str = "MIN_VARIANCE";
                break;
            case ObjectiveType::MAX_SHARPE:
                obj_str = "MAX_SHARPE";
                break;
            case ObjectiveType::TARGET_RETURN:
                obj_str = "TARGET_RETURN";
                params["target_return"] = target_return_;
                break;
            }
            params["objective"] = obj_str;

            return params;
        }

        void MeanVarianceOptimizer::set_target_return(double target_return)
        {
            if (!std::isfinite(target_return))
            {
                throw std::invalid_argument("Target return must be finite");
            }
            target_return_ = target_return;
            has_target_return_ = true;
        }

        void MeanVarianceOptimizer::validate_parameters() const
        {
            if (objective_ == ObjectiveType::TARGET_RETURN && !has_target_return_)
            {
                throw std::invalid_argument(
                    "Target return must be set for TARGET_RETURN objective");
            }
        }

        OptimizationResult MeanVarianceOptimizer::optimize(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            // Validate inputs
            validate_inputs(expected_returns, covariance);
            constraints.validate();
            validate_parameters();

            // Route to appropriate optimizer based on objective
            switch (objective_)
            {
            case ObjectiveType::MIN_VARIANCE:
                return optimize_min_variance(expected_returns, covariance, constraints);

            case ObjectiveType::MAX_SHARPE:
                return optimize_max_sharpe(expected_returns, covariance, constraints);

            case ObjectiveType::TARGET_RETURN:
                return optimize_target_return(expected_returns, covariance, constraints);

            default:
                throw std::invalid_argument("Unknown objective type");
            }
        }

        OptimizationResult MeanVarianceOptimizer::optimize_min_variance(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            const int n = static_cast<int>(expected_returns.size());

            NonlinearProblem problem = make_problem(
                n,
                [&covariance](const Eigen::VectorXd &w)
                {
                    return portfolio_volatility(w, covariance);
                },
                constraints);

            if (analytic_gradients_)
            {
                // d(sigma_p)/dw = Sigma * w / sigma_p
                problem.gradient = [&covariance](const Eigen::VectorXd &w)
                {
                    const double vol = checked_volatility(w, covariance);
                    return Eigen::VectorXd(marginal_risk_contribution(w, covariance) / vol);
                };
            }

            return run_solver(problem, expected_returns, covariance, risk_free_rate_);
        }

        OptimizationResult MeanVarianceOptimizer::optimize_max_sharpe(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            const int n = static_cast<int>(expected_returns.size());
            const double rf = risk_free_rate_;

            NonlinearProblem problem = make_problem(
                n,
                [&expected_returns, &covariance, rf](const Eigen::VectorXd &w)
                {
                    return -sharpe_ratio(w, expected_returns, covariance, rf);
                },
                constraints);

            if (analytic_gradients_)
            {
                // d(S)/dw = mu / sigma_p - (mu^T w - r_f) * Sigma * w / sigma_p^3
                problem.gradient = [&expected_returns, &covariance, rf](const Eigen::VectorXd &w)
                {
                    const double vol = checked_volatility(w, covariance);
                    const double excess = portfolio_return(w, expected_returns) - rf;
                    const Eigen::VectorXd sigma_w = marginal_risk_contribution(w, covariance);
                    return Eigen::VectorXd(-(expected_returns / vol - excess * sigma_w / (vol * vol * vol)));
                };
            }

            return run_solver(problem, expected_returns, covariance, risk_free_rate_);
        }

        OptimizationResult MeanVarianceOptimizer::optimize_target_return(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            const int n = static_cast<int>(expected_returns.size());

            NonlinearProblem problem = make_problem(
                n,
                [&covariance](const Eigen::VectorXd &w)
                {
                    return portfolio_volatility(w, covariance);
                },
                constraints);

            problem.add_linear_equality("target_return", expected_returns, target_return_);

            if (analytic_gradients_)
            {
                problem.gradient = [&covariance](const Eigen::VectorXd &w)
                {
                    const double vol = checked_volatility(w, covariance);
                    return Eigen::VectorXd(marginal_risk_contribution(w, covariance) / vol);
                };
            }

            OptimizationResult result = run_solver(problem, expected_returns, covariance, risk_free_rate_);

            if (result.success &&
                std::abs(result.expected_return - target_return_) > 1e-6)
            {
                result = OptimizationResult();
                result.message = "Target return " + std::to_string(target_return_) + " not attained";
            }

            return result;
        }

    } // namespace optimizer
} // namespace allocation
