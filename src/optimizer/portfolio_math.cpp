/**
 * @file portfolio_math.cpp
 * @brief Implementation of portfolio risk and return primitives
 */

#include "optimizer/portfolio_math.hpp"
#include <cmath>
#include <algorithm>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            void check_dimensions(
                const Eigen::VectorXd &weights,
                const Eigen::MatrixXd &covariance)
            {
                if (covariance.rows() != weights.size() || covariance.cols() != weights.size())
                {
                    throw std::invalid_argument(
                        "Weights size (" + std::to_string(weights.size()) +
                        ") does not match covariance dimensions (" +
                        std::to_string(covariance.rows()) + "x" +
                        std::to_string(covariance.cols()) + ")");
                }
            }

            double checked_volatility(
                const Eigen::VectorXd &weights,
                const Eigen::MatrixXd &covariance,
                const char *quantity)
            {
                double volatility = portfolio_volatility(weights, covariance);
                if (volatility < kMinVolatility)
                {
                    throw DegenerateInputError(
                        std::string(quantity) + " undefined for portfolio volatility " +
                        std::to_string(volatility));
                }
                return volatility;
            }
        } // namespace

        double portfolio_return(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &expected_returns)
        {
            if (weights.size() != expected_returns.size())
            {
                throw std::invalid_argument(
                    "Weights size (" + std::to_string(weights.size()) +
                    ") does not match expected returns size (" +
                    std::to_string(expected_returns.size()) + ")");
            }
            return weights.dot(expected_returns);
        }

        double portfolio_variance(
            const Eigen::VectorXd &weights,
            const Eigen::MatrixXd &covariance)
        {
            check_dimensions(weights, covariance);
            return weights.dot(covariance * weights);
        }

        double portfolio_volatility(
            const Eigen::VectorXd &weights,
            const Eigen::MatrixXd &covariance)
        {
            double variance = portfolio_variance(weights, covariance);

            if (variance < 0.0)
            {
                // Round-off scale of the quadratic form
                Eigen::VectorXd abs_weights = weights.cwiseAbs();
                double scale = abs_weights.dot(covariance.cwiseAbs() * abs_weights);

                if (variance < -kNegativeVarianceTolerance * std::max(1.0, scale))
                {
                    throw NumericError(
                        "negative portfolio variance " + std::to_string(variance) +
                        "; covariance matrix is not positive semi-definite");
                }
                return 0.0;
            }

            return std::sqrt(variance);
        }

        Eigen::VectorXd marginal_risk_contribution(
            const Eigen::VectorXd &weights,
            const Eigen::MatrixXd &covariance)
        {
            check_dimensions(weights, covariance);
            return covariance * weights;
        }

        Eigen::VectorXd risk_contribution(
            const Eigen::VectorXd &weights,
            const Eigen::MatrixXd &covariance)
        {
            double volatility = checked_volatility(weights, covariance, "Risk contribution");
            return weights.cwiseProduct(covariance * weights) / volatility;
        }

        Eigen::VectorXd relative_risk_contribution(
            const Eigen::VectorXd &weights,
            const Eigen::MatrixXd &covariance)
        {
            double volatility = checked_volatility(weights, covariance, "Relative risk contribution");
            return weights.cwiseProduct(covariance * weights) / (volatility * volatility);
        }

        Eigen::VectorXd asset_volatilities(const Eigen::MatrixXd &covariance)
        {
            Eigen::VectorXd variances = covariance.diagonal();

            for (Eigen::Index i = 0; i < variances.size(); ++i)
            {
                if (variances(i) < 0.0)
                {
                    throw NumericError(
                        "negative variance " + std::to_string(variances(i)) +
                        " for asset " + std::to_string(i));
                }
            }

            return variances.cwiseSqrt();
        }

        double sharpe_ratio(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double risk_free_rate)
        {
            double volatility = checked_volatility(weights, covariance, "Sharpe ratio");
            return (portfolio_return(weights, expected_returns) - risk_free_rate) / volatility;
        }

        double diversification_ratio(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &volatilities,
            const Eigen::MatrixXd &covariance)
        {
            if (volatilities.size() != weights.size())
            {
                throw std::invalid_argument(
                    "Volatilities size (" + std::to_string(volatilities.size()) +
                    ") does not match weights size (" + std::to_string(weights.size()) + ")");
            }

            double volatility = checked_volatility(weights, covariance, "Diversification ratio");
            return weights.dot(volatilities) / volatility;
        }

    } // namespace optimizer
} // namespace allocation
