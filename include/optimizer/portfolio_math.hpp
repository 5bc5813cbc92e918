/**
 * @file portfolio_math.hpp
 * @brief Portfolio risk and return primitives shared by every objective
 *
 * All functions are pure and operate on borrowed Eigen data:
 * - w: portfolio weights (N x 1)
 * - mu: expected returns (N x 1)
 * - Sigma: covariance matrix (N x N)
 *
 * Ratios that divide by portfolio volatility check the denominator
 * against kMinVolatility first and throw DegenerateInputError instead
 * of producing NaN or Inf.
 */

#pragma once

#include "optimizer/optimization_errors.hpp"
#include <Eigen/Dense>

namespace allocation
{
    namespace optimizer
    {

        /// Volatility below which ratios over volatility are undefined
        constexpr double kMinVolatility = 1e-10;

        /// Relative tolerance on a negative variance before it is an error
        constexpr double kNegativeVarianceTolerance = 1e-10;

        /**
         * @brief Portfolio expected return w^T * mu
         */
        double portfolio_return(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &expected_returns);

        /**
         * @brief Portfolio variance w^T * Sigma * w (may be slightly negative)
         */
        double portfolio_variance(
            const Eigen::VectorXd &weights,
            const Eigen::MatrixXd &covariance);

        /**
         * @brief Portfolio volatility sqrt(w^T * Sigma * w)
         * @throws NumericError if the variance is negative beyond round-off,
         *         which means Sigma is not positive semi-definite
         */
        double portfolio_volatility(
            const Eigen::VectorXd &weights,
            const Eigen::MatrixXd &covariance);

        /**
         * @brief Marginal risk vector Sigma * w
         */
        Eigen::VectorXd marginal_risk_contribution(
            const Eigen::VectorXd &weights,
            const Eigen::MatrixXd &covariance);

        /**
         * @brief Risk contribution w_i * (Sigma * w)_i / sigma_p
         *
         * Components sum to the portfolio volatility.
         *
         * @throws DegenerateInputError if sigma_p < kMinVolatility
         */
        Eigen::VectorXd risk_contribution(
            const Eigen::VectorXd &weights,
            const Eigen::MatrixXd &covariance);

        /**
         * @brief Fraction of total risk w_i * (Sigma * w)_i / (w^T * Sigma * w)
         *
         * Components sum to one, which makes them directly comparable to a
         * risk budget.
         *
         * @throws DegenerateInputError if sigma_p < kMinVolatility
         */
        Eigen::VectorXd relative_risk_contribution(
            const Eigen::VectorXd &weights,
            const Eigen::MatrixXd &covariance);

        /**
         * @brief Standalone asset volatilities sqrt(diag(Sigma))
         * @throws NumericError if a diagonal entry is negative
         */
        Eigen::VectorXd asset_volatilities(const Eigen::MatrixXd &covariance);

        /**
         * @brief Sharpe ratio (w^T * mu - rf) / sigma_p
         * @throws DegenerateInputError if sigma_p < kMinVolatility
         */
        double sharpe_ratio(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double risk_free_rate);

        /**
         * @brief Diversification ratio (w^T * sigma) / sigma_p
         * @param weights Portfolio weights
         * @param volatilities Standalone asset volatilities
         * @param covariance Covariance matrix
         * @throws DegenerateInputError if sigma_p < kMinVolatility
         */
        double diversification_ratio(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &volatilities,
            const Eigen::MatrixXd &covariance);

    } // namespace optimizer
} // namespace allocation
