/**
 * @file test_sqp_solver.cpp
 * @brief Unit tests for the OSQP wrapper and the SQP solver
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cmath>
#include <limits>

#include "optimizer/osqp_solver.hpp"
#include "optimizer/sqp_solver.hpp"

using namespace allocation::optimizer;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

// ============================================================================
// QP Subproblem Backend
// ============================================================================

TEST_CASE("OSQPSolver equality and box constrained QP", "[OSQPSolver]")
{
    // minimize 1/2 |x|^2 - (1, 2)^T x  s.t.  x0 + x1 = 1,  0 <= x <= 1
    QuadraticProblem qp;
    qp.P = Eigen::MatrixXd::Identity(2, 2);
    qp.q = Eigen::VectorXd(2);
    qp.q << -1.0, -2.0;
    qp.A_eq = Eigen::MatrixXd::Ones(1, 2);
    qp.b_eq = Eigen::VectorXd::Ones(1);
    qp.lower_bounds = Eigen::VectorXd::Zero(2);
    qp.upper_bounds = Eigen::VectorXd::Ones(2);

    allocation::optimizer::OSQPSolver solver;

    SECTION("Solution")
    {
        QuadraticResult result = solver.solve(qp);
        REQUIRE(result.success);
        REQUIRE_FALSE(result.infeasible);
        REQUIRE_THAT(result.solution(0), WithinAbs(0.0, 1e-6));
        REQUIRE_THAT(result.solution(1), WithinAbs(1.0, 1e-6));
        REQUIRE(result.equality_duals.size() == 1);
    }

    SECTION("Infinite bounds")
    {
        qp.lower_bounds = Eigen::VectorXd::Constant(2, -std::numeric_limits<double>::infinity());
        qp.upper_bounds = Eigen::VectorXd::Constant(2, std::numeric_limits<double>::infinity());

        QuadraticResult result = solver.solve(qp);
        REQUIRE(result.success);
        REQUIRE_THAT(result.solution(0), WithinAbs(0.0, 1e-6));
        REQUIRE_THAT(result.solution(1), WithinAbs(1.0, 1e-6));
    }

    SECTION("Infeasible constraints are reported")
    {
        qp.b_eq(0) = 3.0;
        QuadraticResult result = solver.solve(qp);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.infeasible);
    }

    SECTION("Malformed problem throws")
    {
        qp.lower_bounds = Eigen::VectorXd::Zero(3);
        REQUIRE_THROWS_AS(solver.solve(qp), std::invalid_argument);
    }
}

// ============================================================================
// Problem and Options
// ============================================================================

TEST_CASE("NonlinearProblem construction", "[SqpSolver][Problem]")
{
    auto problem = NonlinearProblem::budget_constrained(
        4, [](const Eigen::VectorXd &x)
        { return x.squaredNorm(); });

    REQUIRE(problem.dimension == 4);
    REQUIRE(problem.equality_constraints.size() == 1);
    REQUIRE(problem.equality_constraints[0].name == "budget");

    SECTION("Uniform starting point")
    {
        Eigen::VectorXd x0 = problem.starting_point();
        REQUIRE(x0.size() == 4);
        REQUIRE_THAT(x0(2), WithinAbs(0.25, 1e-15));
    }

    SECTION("Bounds policy")
    {
        REQUIRE_THAT(problem.lower_bounds()(0), WithinAbs(0.0, 1e-15));
        REQUIRE_THAT(problem.upper_bounds()(0), WithinAbs(1.0, 1e-15));

        problem.bounds = BoundsPolicy::UNBOUNDED;
        REQUIRE(std::isinf(problem.lower_bounds()(0)));
        REQUIRE(std::isinf(problem.upper_bounds()(0)));
    }

    SECTION("Initial guess of the wrong size is rejected")
    {
        problem.initial_guess = Eigen::VectorXd::Ones(3);
        REQUIRE_THROWS_AS(problem.validate(), std::invalid_argument);
    }

    SECTION("Missing objective is rejected")
    {
        problem.objective = nullptr;
        REQUIRE_THROWS_AS(problem.validate(), std::invalid_argument);
    }
}

TEST_CASE("NonlinearSolverOptions validation", "[SqpSolver][Options]")
{
    NonlinearSolverOptions options;
    REQUIRE_NOTHROW(options.validate());

    SECTION("Non-positive iteration budget")
    {
        options.max_iterations = 0;
        REQUIRE_THROWS_AS(SqpSolver(options), std::invalid_argument);
    }

    SECTION("Constraint tolerance looser than 1e-6")
    {
        options.constraint_tolerance = 1e-4;
        REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
    }

    SECTION("JSON round trip keeps values")
    {
        nlohmann::json j = {{"max_iterations", 50}, {"tolerance", 1e-7}, {"verbose", false}};
        NonlinearSolverOptions parsed = NonlinearSolverOptions::from_json(j);
        REQUIRE(parsed.max_iterations == 50);
        REQUIRE_THAT(parsed.tolerance, WithinAbs(1e-7, 1e-20));
        REQUIRE_THAT(parsed.constraint_tolerance, WithinAbs(1e-9, 1e-20));
        REQUIRE(parsed.to_json()["max_iterations"] == 50);
    }
}

// ============================================================================
// SQP Convergence
// ============================================================================

TEST_CASE("SqpSolver projection onto the budget hyperplane", "[SqpSolver][Convergence]")
{
    Eigen::VectorXd target(3);
    target << 0.6, 0.3, 0.3;

    auto problem = NonlinearProblem::budget_constrained(
        3,
        [target](const Eigen::VectorXd &x)
        { return (x - target).squaredNorm(); },
        BoundsPolicy::UNBOUNDED);

    SqpSolver solver;
    SolverResult result = solver.minimize(problem);

    REQUIRE(result.converged);
    REQUIRE(result.solution.size() == 3);
    REQUIRE_THAT(result.solution(0), WithinAbs(0.6 - 0.2 / 3.0, 1e-6));
    REQUIRE_THAT(result.solution(1), WithinAbs(0.3 - 0.2 / 3.0, 1e-6));
    REQUIRE_THAT(result.solution.sum(), WithinAbs(1.0, 1e-9));
    REQUIRE(result.constraint_violation <= 1e-9);
}

TEST_CASE("SqpSolver projection onto the simplex", "[SqpSolver][Convergence]")
{
    Eigen::VectorXd target(3);
    target << 1.2, 0.1, -0.3;

    auto problem = NonlinearProblem::budget_constrained(
        3,
        [target](const Eigen::VectorXd &x)
        { return (x - target).squaredNorm(); });

    SECTION("Finite-difference gradient")
    {
        SolverResult result = SqpSolver().minimize(problem);
        REQUIRE(result.converged);
        REQUIRE_THAT(result.solution(0), WithinAbs(1.0, 1e-6));
        REQUIRE_THAT(result.solution(1), WithinAbs(0.0, 1e-6));
        REQUIRE_THAT(result.solution(2), WithinAbs(0.0, 1e-6));
        REQUIRE(result.solution.minCoeff() >= -1e-8);
    }

    SECTION("Analytic gradient")
    {
        problem.gradient = [target](const Eigen::VectorXd &x)
        {
            return Eigen::VectorXd(2.0 * (x - target));
        };
        SolverResult result = SqpSolver().minimize(problem);
        REQUIRE(result.converged);
        REQUIRE_THAT(result.solution(0), WithinAbs(1.0, 1e-6));
    }
}

TEST_CASE("SqpSolver nonlinear equality constraint", "[SqpSolver][Convergence]")
{
    // minimize x0 + x1 on the unit circle
    NonlinearProblem problem;
    problem.dimension = 2;
    problem.bounds = BoundsPolicy::UNBOUNDED;
    problem.objective = [](const Eigen::VectorXd &x)
    { return x(0) + x(1); };

    EqualityConstraint circle;
    circle.name = "unit_circle";
    circle.function = [](const Eigen::VectorXd &x)
    { return x.squaredNorm() - 1.0; };
    problem.equality_constraints.push_back(circle);

    problem.initial_guess = Eigen::VectorXd(2);
    problem.initial_guess << -0.6, -0.8;

    SolverResult result = SqpSolver().minimize(problem);

    REQUIRE(result.converged);
    REQUIRE_THAT(result.solution(0), WithinAbs(-1.0 / std::sqrt(2.0), 1e-5));
    REQUIRE_THAT(result.solution(1), WithinAbs(-1.0 / std::sqrt(2.0), 1e-5));
    REQUIRE_THAT(result.objective_value, WithinAbs(-std::sqrt(2.0), 1e-8));
}

// ============================================================================
// Non-convergence Reporting
// ============================================================================

TEST_CASE("SqpSolver reports non-convergence without throwing", "[SqpSolver][Failure]")
{
    Eigen::VectorXd target(3);
    target << 0.9, 0.05, 0.05;

    auto problem = NonlinearProblem::budget_constrained(
        3,
        [target](const Eigen::VectorXd &x)
        { return std::pow((x - target).squaredNorm(), 2) + (x - target).squaredNorm(); });

    SECTION("Iteration limit")
    {
        NonlinearSolverOptions options;
        options.max_iterations = 1;

        SolverResult result;
        REQUIRE_NOTHROW(result = SqpSolver(options).minimize(problem));
        REQUIRE_FALSE(result.converged);
        REQUIRE(result.solution.size() == 0);
        REQUIRE(result.iterations == 1);
        REQUIRE_THAT(result.message, ContainsSubstring("Iteration limit"));
    }

    SECTION("Wall-clock limit")
    {
        NonlinearSolverOptions options;
        options.max_time_seconds = 1e-12;

        SolverResult result = SqpSolver(options).minimize(problem);
        REQUIRE_FALSE(result.converged);
        REQUIRE(result.solution.size() == 0);
        REQUIRE_THAT(result.message, ContainsSubstring("Time limit"));
    }

    SECTION("Infeasible linearized constraints")
    {
        // sum(x) = 1 and sum(x) = 2 cannot hold together
        problem.add_linear_equality("second_budget", Eigen::VectorXd::Ones(3), 2.0);

        SolverResult result = SqpSolver().minimize(problem);
        REQUIRE_FALSE(result.converged);
        REQUIRE(result.solution.size() == 0);
        REQUIRE_FALSE(result.message.empty());
    }

    SECTION("Non-finite objective at the start")
    {
        problem.objective = [](const Eigen::VectorXd &)
        { return std::numeric_limits<double>::quiet_NaN(); };

        SolverResult result = SqpSolver().minimize(problem);
        REQUIRE_FALSE(result.converged);
        REQUIRE(result.solution.size() == 0);
    }
}

TEST_CASE("SqpSolver is deterministic", "[SqpSolver][Determinism]")
{
    Eigen::MatrixXd cov(3, 3);
    cov << 0.04, 0.01, 0.0,
           0.01, 0.09, 0.02,
           0.0, 0.02, 0.06;

    auto problem = NonlinearProblem::budget_constrained(
        3,
        [cov](const Eigen::VectorXd &x)
        { return std::sqrt(x.dot(cov * x)); });

    SqpSolver solver;
    SolverResult first = solver.minimize(problem);
    SolverResult second = solver.minimize(problem);

    REQUIRE(first.converged);
    REQUIRE(second.converged);
    REQUIRE(first.iterations == second.iterations);
    REQUIRE((first.solution - second.solution).cwiseAbs().maxCoeff() == 0.0);
}
