/**
 * @file test_mean_variance_optimizer.cpp
 * @brief Unit tests for minimum variance, tangency and target return portfolios
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cmath>
#include <limits>
#include <vector>

#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/optimization_errors.hpp"
#include "optimizer/portfolio_math.hpp"

using namespace allocation::optimizer;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

class OptimizerTestFixture
{
protected:
    // Uncorrelated three asset case with closed-form answers
    Eigen::VectorXd returns_3asset_;
    Eigen::MatrixXd cov_3asset_;

    // Highly correlated pair where the unconstrained MVP shorts asset 2
    Eigen::VectorXd returns_short_;
    Eigen::MatrixXd cov_short_;

    // Equicorrelated universe, MVP is uniform
    Eigen::VectorXd returns_10asset_;
    Eigen::MatrixXd cov_10asset_;

    OptimizerTestFixture()
    {
        returns_3asset_ = Eigen::VectorXd(3);
        returns_3asset_ << 0.08, 0.12, 0.10;

        cov_3asset_ = Eigen::MatrixXd::Zero(3, 3);
        cov_3asset_.diagonal() << 0.04, 0.09, 0.06;

        returns_short_ = Eigen::VectorXd(2);
        returns_short_ << 0.06, 0.09;

        cov_short_ = Eigen::MatrixXd(2, 2);
        cov_short_ << 0.04, 0.05,
                      0.05, 0.09;

        returns_10asset_ = Eigen::VectorXd(10);
        returns_10asset_ << 0.10, 0.08, 0.12, 0.09, 0.11,
                            0.07, 0.13, 0.08, 0.10, 0.09;

        cov_10asset_ = Eigen::MatrixXd::Constant(10, 10, 0.3 * 0.04);
        cov_10asset_.diagonal().setConstant(0.04);
    }

    static Eigen::VectorXd inverse_variance_weights(const Eigen::MatrixXd &cov)
    {
        Eigen::VectorXd w = cov.diagonal().cwiseInverse();
        return w / w.sum();
    }
};

// ============================================================================
// Minimum Variance
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "Minimum variance closed forms", "[MeanVariance][MinVariance]")
{
    MeanVarianceOptimizer optimizer(ObjectiveType::MIN_VARIANCE, 0.02);

    SECTION("Two identical uncorrelated assets split evenly")
    {
        Eigen::VectorXd mu(2);
        mu << 0.05, 0.10;
        Eigen::MatrixXd cov = Eigen::MatrixXd::Identity(2, 2) * 0.04;

        auto result = optimizer.optimize(mu, cov);
        REQUIRE(result.success);
        REQUIRE_THAT(result.weights(0), WithinAbs(0.5, 1e-5));
        REQUIRE_THAT(result.weights(1), WithinAbs(0.5, 1e-5));
    }

    SECTION("Uncorrelated assets give inverse-variance weights")
    {
        auto result = optimizer.optimize(returns_3asset_, cov_3asset_);
        REQUIRE(result.success);

        Eigen::VectorXd expected = inverse_variance_weights(cov_3asset_);
        REQUIRE_THAT(expected(0), WithinAbs(0.4737, 1e-4));
        for (int i = 0; i < 3; ++i)
        {
            REQUIRE_THAT(result.weights(i), WithinAbs(expected(i), 1e-4));
        }
        REQUIRE_THAT(result.volatility,
                     WithinAbs(std::sqrt(1.0 / cov_3asset_.diagonal().cwiseInverse().sum()), 1e-6));
    }

    SECTION("Equicorrelated universe gives uniform weights")
    {
        auto result = optimizer.optimize(returns_10asset_, cov_10asset_);
        REQUIRE(result.success);
        for (int i = 0; i < 10; ++i)
        {
            REQUIRE_THAT(result.weights(i), WithinAbs(0.1, 1e-4));
        }
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Minimum variance bounds policy", "[MeanVariance][MinVariance]")
{
    MeanVarianceOptimizer optimizer(ObjectiveType::MIN_VARIANCE);

    SECTION("Long-only pins the second asset at zero")
    {
        auto result = optimizer.optimize(returns_short_, cov_short_);
        REQUIRE(result.success);
        REQUIRE_THAT(result.weights(0), WithinAbs(1.0, 1e-5));
        REQUIRE_THAT(result.weights(1), WithinAbs(0.0, 1e-5));
        REQUIRE(result.weights.minCoeff() >= -1e-8);
    }

    SECTION("Short selling reaches the unconstrained solution")
    {
        OptimizationConstraints constraints;
        constraints.long_only = false;

        auto result = optimizer.optimize(returns_short_, cov_short_, constraints);
        REQUIRE(result.success);
        REQUIRE_THAT(result.weights(0), WithinAbs(4.0 / 3.0, 1e-4));
        REQUIRE_THAT(result.weights(1), WithinAbs(-1.0 / 3.0, 1e-4));
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-6));
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Minimum variance beats feasible portfolios", "[MeanVariance][MinVariance]")
{
    MeanVarianceOptimizer optimizer(ObjectiveType::MIN_VARIANCE);
    auto result = optimizer.optimize(returns_3asset_, cov_3asset_);
    REQUIRE(result.success);

    std::vector<Eigen::Vector3d> candidates = {
        Eigen::Vector3d(1.0 / 3.0, 1.0 / 3.0, 1.0 / 3.0),
        Eigen::Vector3d(1.0, 0.0, 0.0),
        Eigen::Vector3d(0.0, 0.0, 1.0),
        Eigen::Vector3d(0.5, 0.1, 0.4),
        Eigen::Vector3d(0.45, 0.25, 0.30)};

    for (const auto &candidate : candidates)
    {
        Eigen::VectorXd w = candidate;
        REQUIRE(result.volatility <= portfolio_volatility(w, cov_3asset_) + 1e-6);
    }
}

// ============================================================================
// Maximum Sharpe
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "Tangency portfolio", "[MeanVariance][MaxSharpe]")
{
    MeanVarianceOptimizer optimizer(ObjectiveType::MAX_SHARPE, 0.02);

    SECTION("Uncorrelated assets match Sigma^-1 (mu - rf)")
    {
        auto result = optimizer.optimize(returns_3asset_, cov_3asset_);
        REQUIRE(result.success);

        Eigen::VectorXd expected = (returns_3asset_.array() - 0.02).matrix()
                                       .cwiseQuotient(cov_3asset_.diagonal());
        expected /= expected.sum();

        REQUIRE_THAT(expected(0), WithinAbs(0.3803, 1e-4));
        for (int i = 0; i < 3; ++i)
        {
            REQUIRE_THAT(result.weights(i), WithinAbs(expected(i), 1e-4));
        }
        REQUIRE_THAT(result.sharpe_ratio,
                     WithinAbs(sharpe_ratio(expected, returns_3asset_, cov_3asset_, 0.02), 1e-6));
    }

    SECTION("Sharpe ratio is at least that of the minimum variance portfolio")
    {
        MeanVarianceOptimizer min_variance(ObjectiveType::MIN_VARIANCE, 0.02);
        auto mvp = min_variance.optimize(returns_10asset_, cov_10asset_);
        auto tangency = optimizer.optimize(returns_10asset_, cov_10asset_);

        REQUIRE(mvp.success);
        REQUIRE(tangency.success);
        REQUIRE(tangency.sharpe_ratio >= mvp.sharpe_ratio - 1e-8);
    }

    SECTION("Risk-free rate must be finite")
    {
        REQUIRE_THROWS_AS(MeanVarianceOptimizer(ObjectiveType::MAX_SHARPE,
                                                std::numeric_limits<double>::infinity()),
                          std::invalid_argument);
    }
}

// ============================================================================
// Target Return
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "Target return portfolios", "[MeanVariance][TargetReturn]")
{
    MeanVarianceOptimizer optimizer(ObjectiveType::TARGET_RETURN);

    SECTION("Target must be set")
    {
        REQUIRE_THROWS_AS(optimizer.optimize(returns_3asset_, cov_3asset_), std::invalid_argument);
    }

    SECTION("Attained target")
    {
        optimizer.set_target_return(0.105);
        auto result = optimizer.optimize(returns_3asset_, cov_3asset_);
        REQUIRE(result.success);
        REQUIRE_THAT(result.expected_return, WithinAbs(0.105, 1e-6));
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-6));
    }

    SECTION("Target above every asset is infeasible when long-only")
    {
        optimizer.set_target_return(0.50);
        auto result = optimizer.optimize(returns_3asset_, cov_3asset_);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.weights.size() == 0);
        REQUIRE_THROWS_AS(result.checked_weights(), OptimizationFailedError);
    }

    SECTION("Non-finite target is rejected")
    {
        REQUIRE_THROWS_AS(optimizer.set_target_return(std::nan("")), std::invalid_argument);
    }
}

// ============================================================================
// Invariants
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "Budget and bounds hold for every objective", "[MeanVariance][Invariants]")
{
    const std::vector<ObjectiveType> objectives = {ObjectiveType::MIN_VARIANCE, ObjectiveType::MAX_SHARPE};

    for (ObjectiveType objective : objectives)
    {
        MeanVarianceOptimizer optimizer(objective, 0.02);
        auto result = optimizer.optimize(returns_10asset_, cov_10asset_);

        REQUIRE(result.success);
        REQUIRE(result.weights.size() == 10);
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-6));
        REQUIRE(result.weights.minCoeff() >= -1e-8);
        REQUIRE(result.weights.maxCoeff() <= 1.0 + 1e-8);
        REQUIRE_THAT(result.risk_contributions.sum(), WithinAbs(1.0, 1e-9));
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Repeated solves are identical", "[MeanVariance][Determinism]")
{
    for (ObjectiveType objective : {ObjectiveType::MIN_VARIANCE, ObjectiveType::MAX_SHARPE})
    {
        MeanVarianceOptimizer optimizer(objective, 0.02);
        auto first = optimizer.optimize(returns_10asset_, cov_10asset_);
        auto second = optimizer.optimize(returns_10asset_, cov_10asset_);

        REQUIRE(first.success);
        REQUIRE(second.success);
        REQUIRE((first.weights - second.weights).cwiseAbs().maxCoeff() == 0.0);
        REQUIRE(first.iterations == second.iterations);
        REQUIRE(first.objective_value == second.objective_value);
    }
}

// ============================================================================
// Single Asset
// ============================================================================

TEST_CASE("Single asset portfolios", "[MeanVariance][SingleAsset]")
{
    Eigen::VectorXd mu(1);
    mu << 0.07;
    Eigen::MatrixXd cov(1, 1);
    cov << 0.04;

    SECTION("Minimum variance and tangency hold the whole budget")
    {
        for (ObjectiveType objective : {ObjectiveType::MIN_VARIANCE, ObjectiveType::MAX_SHARPE})
        {
            MeanVarianceOptimizer optimizer(objective, 0.02);
            auto result = optimizer.optimize(mu, cov);

            REQUIRE(result.success);
            REQUIRE(result.weights.size() == 1);
            REQUIRE_THAT(result.weights(0), WithinAbs(1.0, 1e-12));
            REQUIRE_THAT(result.volatility, WithinAbs(0.2, 1e-12));
            REQUIRE_THAT(result.sharpe_ratio, WithinAbs(0.25, 1e-12));
            REQUIRE_THAT(result.diversification_ratio, WithinAbs(1.0, 1e-12));
            REQUIRE_THAT(result.risk_contributions(0), WithinAbs(1.0, 1e-12));
        }
    }

    SECTION("Short sales allowed")
    {
        MeanVarianceOptimizer optimizer(ObjectiveType::MIN_VARIANCE, 0.02);
        OptimizationConstraints constraints;
        constraints.long_only = false;

        auto result = optimizer.optimize(mu, cov, constraints);
        REQUIRE(result.success);
        REQUIRE_THAT(result.weights(0), WithinAbs(1.0, 1e-12));
    }

    SECTION("Target equal to the asset return")
    {
        MeanVarianceOptimizer optimizer(ObjectiveType::TARGET_RETURN);
        optimizer.set_target_return(0.07);

        auto result = optimizer.optimize(mu, cov);
        REQUIRE(result.success);
        REQUIRE_THAT(result.expected_return, WithinAbs(0.07, 1e-12));
        REQUIRE_THAT(result.volatility, WithinAbs(0.2, 1e-12));
    }

    SECTION("Any other target is unattainable")
    {
        MeanVarianceOptimizer optimizer(ObjectiveType::TARGET_RETURN);
        optimizer.set_target_return(0.09);

        OptimizationResult result;
        REQUIRE_NOTHROW(result = optimizer.optimize(mu, cov));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.weights.size() == 0);
        REQUIRE_THAT(result.message, ContainsSubstring("target_return"));
        REQUIRE_THROWS_AS(result.checked_weights(), OptimizationFailedError);
    }

    SECTION("Initial weights must still match")
    {
        MeanVarianceOptimizer optimizer(ObjectiveType::MIN_VARIANCE);
        OptimizationConstraints constraints;
        constraints.initial_weights = Eigen::VectorXd::Constant(2, 0.5);
        REQUIRE_THROWS_AS(optimizer.optimize(mu, cov, constraints), std::invalid_argument);
    }
}

// ============================================================================
// Statistics
// ============================================================================

TEST_CASE("Zero-volatility portfolio statistics", "[MeanVariance][Statistics]")
{
    // Perfectly negatively correlated pair, the 50/50 mix is riskless
    Eigen::VectorXd mu(2);
    mu << 0.05, 0.07;
    Eigen::MatrixXd cov(2, 2);
    cov << 0.25, -0.25,
           -0.25, 0.25;
    Eigen::VectorXd w = Eigen::VectorXd::Constant(2, 0.5);

    auto stats = OptimizerInterface::calculate_statistics(w, mu, cov, 0.02);

    REQUIRE(stats.success);
    REQUIRE(stats.volatility == 0.0);
    REQUIRE_THAT(stats.expected_return, WithinAbs(0.06, 1e-12));
    REQUIRE(std::isnan(stats.sharpe_ratio));
    REQUIRE(std::isnan(stats.diversification_ratio));
    REQUIRE(stats.risk_contributions.size() == 0);
    REQUIRE_THAT(stats.message, ContainsSubstring("volatility is zero"));

    SECTION("Ordinary portfolios carry no such note")
    {
        Eigen::MatrixXd diag = Eigen::MatrixXd::Identity(2, 2) * 0.04;
        auto ordinary = OptimizerInterface::calculate_statistics(w, mu, diag, 0.02);
        REQUIRE(ordinary.message.empty());
        REQUIRE(std::isfinite(ordinary.sharpe_ratio));
        REQUIRE(std::isfinite(ordinary.diversification_ratio));
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Analytic gradients agree with finite differences", "[MeanVariance][Gradients]")
{
    for (ObjectiveType objective : {ObjectiveType::MIN_VARIANCE, ObjectiveType::MAX_SHARPE})
    {
        MeanVarianceOptimizer numeric(objective, 0.02);
        MeanVarianceOptimizer analytic(objective, 0.02);
        analytic.set_analytic_gradients(true);
        REQUIRE(analytic.uses_analytic_gradients());

        auto a = numeric.optimize(returns_3asset_, cov_3asset_);
        auto b = analytic.optimize(returns_3asset_, cov_3asset_);

        REQUIRE(a.success);
        REQUIRE(b.success);
        REQUIRE((a.weights - b.weights).cwiseAbs().maxCoeff() < 1e-5);
    }
}

// ============================================================================
// Input Validation and Failure Reporting
// ============================================================================

TEST_CASE_METHOD(OptimizerTestFixture, "Input errors are classified", "[MeanVariance][Errors]")
{
    MeanVarianceOptimizer optimizer(ObjectiveType::MIN_VARIANCE);

    SECTION("Dimension mismatch")
    {
        Eigen::VectorXd mu = Eigen::VectorXd::Constant(2, 0.1);
        REQUIRE_THROWS_AS(optimizer.optimize(mu, cov_3asset_), std::invalid_argument);
    }

    SECTION("Empty inputs")
    {
        REQUIRE_THROWS_AS(optimizer.optimize(Eigen::VectorXd(), Eigen::MatrixXd()), std::invalid_argument);
    }

    SECTION("NaN in expected returns")
    {
        Eigen::VectorXd mu = returns_3asset_;
        mu(1) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(optimizer.optimize(mu, cov_3asset_), std::invalid_argument);
    }

    SECTION("Asymmetric covariance")
    {
        Eigen::MatrixXd cov = cov_3asset_;
        cov(0, 1) = 0.01;
        REQUIRE_THROWS_AS(optimizer.optimize(returns_3asset_, cov), std::invalid_argument);
    }

    SECTION("Zero-variance asset is degenerate")
    {
        Eigen::MatrixXd cov = cov_3asset_;
        cov(2, 2) = 0.0;
        REQUIRE_THROWS_AS(optimizer.optimize(returns_3asset_, cov), DegenerateInputError);
    }

    SECTION("Indefinite covariance is a numeric error")
    {
        Eigen::MatrixXd cov(2, 2);
        cov << 0.01, 0.05,
               0.05, 0.01;
        Eigen::VectorXd mu = Eigen::VectorXd::Constant(2, 0.1);
        REQUIRE_THROWS_AS(optimizer.optimize(mu, cov), NumericError);
    }

    SECTION("Initial weights of the wrong size")
    {
        OptimizationConstraints constraints;
        constraints.initial_weights = Eigen::VectorXd::Constant(2, 0.5);
        REQUIRE_THROWS_AS(optimizer.optimize(returns_3asset_, cov_3asset_, constraints),
                          std::invalid_argument);
    }
}

TEST_CASE_METHOD(OptimizerTestFixture, "Solver budgets produce failed results", "[MeanVariance][Failure]")
{
    MeanVarianceOptimizer optimizer(ObjectiveType::MAX_SHARPE, 0.02);

    SECTION("Iteration limit")
    {
        NonlinearSolverOptions options;
        options.max_iterations = 1;
        optimizer.set_solver_options(options);

        OptimizationResult result;
        REQUIRE_NOTHROW(result = optimizer.optimize(returns_3asset_, cov_3asset_));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.weights.size() == 0);
        REQUIRE_THAT(result.message, ContainsSubstring("did not converge"));
        REQUIRE_THROWS_AS(result.checked_weights(), OptimizationFailedError);
    }

    SECTION("Time limit")
    {
        NonlinearSolverOptions options;
        options.max_time_seconds = 1e-12;
        optimizer.set_solver_options(options);

        auto result = optimizer.optimize(returns_3asset_, cov_3asset_);
        REQUIRE_FALSE(result.success);
        REQUIRE_THAT(result.message, ContainsSubstring("Time limit"));
    }

    SECTION("Null solver is rejected")
    {
        REQUIRE_THROWS_AS(optimizer.set_solver(nullptr), std::invalid_argument);
    }
}

TEST_CASE("MeanVarianceOptimizer parameters", "[MeanVariance][Parameters]")
{
    MeanVarianceOptimizer optimizer(ObjectiveType::TARGET_RETURN, 0.01);
    optimizer.set_target_return(0.07);

    auto params = optimizer.get_parameters();
    REQUIRE(params["objective"] == "TARGET_RETURN");
    REQUIRE(params["target_return"].get<double>() == 0.07);
    REQUIRE(params["risk_free_rate"].get<double>() == 0.01);
    REQUIRE(params.contains("solver"));
    REQUIRE(optimizer.get_name() == "MeanVarianceOptimizer");
}
