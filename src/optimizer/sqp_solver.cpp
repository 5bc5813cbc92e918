/**
 * @file sqp_solver.cpp
 * @brief Implementation of the SQP solver
 */

#include "optimizer/sqp_solver.hpp"
#include "optimizer/finite_difference.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            constexpr int kMaxBacktracks = 30;
            constexpr double kArmijo = 1e-4;
            constexpr double kActiveBoundTolerance = 1e-10;
            constexpr double kMinCurvatureStep = 1e-12;

            // MAX_ITER results from OSQP are still usable steps when the
            // linearized constraints hold to this accuracy
            constexpr double kInexactStepResidual = 1e-6;

            double max_abs(const Eigen::VectorXd &v)
            {
                return v.size() == 0 ? 0.0 : v.lpNorm<Eigen::Infinity>();
            }
        } // namespace

        SqpSolver::SqpSolver(const NonlinearSolverOptions &options)
            : options_(options)
        {
            options_.validate();
        }

        std::string SqpSolver::get_name() const
        {
            return "SqpSolver";
        }

        // ============================================================================
        // Main Iteration
        // ============================================================================

        SolverResult SqpSolver::minimize(const NonlinearProblem &problem) const
        {
            problem.validate();

            const int n = problem.dimension;
            const int m = static_cast<int>(problem.equality_constraints.size());
            const Eigen::VectorXd lower = problem.lower_bounds();
            const Eigen::VectorXd upper = problem.upper_bounds();

            const auto start_time = std::chrono::steady_clock::now();

            SolverResult result;

            Eigen::VectorXd x = project_onto_bounds(problem.starting_point(), lower, upper);
            double f = problem.objective(x);
            if (!std::isfinite(f))
            {
                result.message = "Objective is not finite at the starting point";
                return result;
            }

            Eigen::VectorXd g = objective_gradient(problem, x);
            Eigen::VectorXd c = constraint_values(problem, x);
            Eigen::MatrixXd J = constraint_jacobian(problem, x);
            if (!g.allFinite() || !c.allFinite() || !J.allFinite())
            {
                result.message = "Derivatives are not finite at the starting point";
                return result;
            }

            Eigen::MatrixXd B = Eigen::MatrixXd::Identity(n, n);
            Eigen::VectorXd lambda = Eigen::VectorXd::Zero(m);
            double penalty = 0.0;
            bool hessian_was_reset = false;
            int iteration = 0;

            if (options_.verbose)
            {
                std::cout << "SQP: n = " << n << ", equality constraints = " << m << "\n";
            }

            while (iteration < options_.max_iterations)
            {
                if (options_.max_time_seconds > 0.0)
                {
                    const std::chrono::duration<double> elapsed =
                        std::chrono::steady_clock::now() - start_time;
                    if (elapsed.count() > options_.max_time_seconds)
                    {
                        std::ostringstream oss;
                        oss << "Time limit of " << options_.max_time_seconds
                            << " s reached after " << iteration << " iterations";
                        result.message = oss.str();
                        break;
                    }
                }

                ++iteration;
                const double violation = max_abs(c);

                // QP subproblem in the step d
                QuadraticProblem subproblem;
                subproblem.P = B;
                subproblem.q = g;
                subproblem.A_eq = J;
                subproblem.b_eq = -c;
                subproblem.lower_bounds = lower - x;
                subproblem.upper_bounds = upper - x;

                const QuadraticResult step = qp_solver_.solve(subproblem);

                const bool usable_step =
                    step.success ||
                    (!step.infeasible &&
                     step.solution.size() == n &&
                     step.solution.allFinite() &&
                     step.primal_residual <= kInexactStepResidual);

                if (!usable_step)
                {
                    result.message = step.infeasible
                                         ? "Linearized constraints are infeasible (" + step.message + ")"
                                         : "QP subproblem failed (" + step.message + ")";
                    break;
                }

                // OSQP satisfies bounds only to its tolerance
                const Eigen::VectorXd d = project_onto_bounds(x + step.solution, lower, upper) - x;
                if (step.equality_duals.size() == m)
                {
                    lambda = step.equality_duals;
                }

                const double step_norm = max_abs(d);
                const double stationarity = kkt_residual(g, J, x, lower, upper);

                if (options_.verbose)
                {
                    std::cout << "  iter " << std::setw(4) << iteration
                              << "  f = " << std::setprecision(12) << f
                              << "  |h| = " << std::setprecision(3) << violation
                              << "  |d| = " << step_norm
                              << "  kkt = " << stationarity << "\n";
                }

                if (violation <= options_.constraint_tolerance &&
                    (step_norm <= options_.tolerance || stationarity <= options_.kkt_tolerance))
                {
                    result.converged = true;
                    result.message = "Optimization terminated successfully";
                    break;
                }

                // l1 merit function; the penalty must dominate the multipliers
                const double lambda_max = max_abs(lambda);
                penalty = std::max(penalty, 2.0 * lambda_max);

                const double c_norm = c.lpNorm<1>();
                const double merit = f + penalty * c_norm;
                const double slope = std::min(g.dot(d) - penalty * c_norm, 0.0);
                const double slack = 4.0 * std::numeric_limits<double>::epsilon() *
                                     std::max(1.0, std::abs(merit));

                double alpha = 1.0;
                bool accepted = false;
                Eigen::VectorXd x_new;
                Eigen::VectorXd c_new;
                double f_new = f;

                for (int k = 0; k < kMaxBacktracks; ++k)
                {
                    x_new = project_onto_bounds(x + alpha * d, lower, upper);
                    f_new = problem.objective(x_new);
                    c_new = constraint_values(problem, x_new);

                    const double merit_new = f_new + penalty * c_new.lpNorm<1>();
                    if (std::isfinite(merit_new) &&
                        merit_new <= merit + kArmijo * alpha * slope + slack)
                    {
                        accepted = true;
                        break;
                    }
                    alpha *= 0.5;
                }

                if (!accepted)
                {
                    if (!hessian_was_reset)
                    {
                        if (options_.verbose)
                        {
                            std::cout << "  line search failed, resetting Hessian approximation\n";
                        }
                        B.setIdentity();
                        hessian_was_reset = true;
                        continue;
                    }
                    result.message = "Line search failed to reduce the merit function";
                    break;
                }
                hessian_was_reset = false;

                const Eigen::VectorXd g_new = objective_gradient(problem, x_new);
                const Eigen::MatrixXd J_new = constraint_jacobian(problem, x_new);
                if (!g_new.allFinite() || !J_new.allFinite())
                {
                    result.message = "Derivatives are not finite at iteration " + std::to_string(iteration);
                    break;
                }

                const Eigen::VectorXd s = x_new - x;
                Eigen::VectorXd y = g_new - g;
                if (m > 0)
                {
                    y += (J_new - J).transpose() * lambda;
                }
                update_hessian(B, s, y);

                const double f_change = std::abs(f_new - f);

                x = x_new;
                f = f_new;
                g = g_new;
                c = c_new;
                J = J_new;

                // Full steps that no longer move the objective
                if (alpha == 1.0 &&
                    max_abs(c) <= options_.constraint_tolerance &&
                    f_change <= options_.function_tolerance * std::max(1.0, std::abs(f)) &&
                    max_abs(s) <= std::sqrt(options_.tolerance))
                {
                    result.converged = true;
                    result.message = "Objective change below tolerance";
                    break;
                }
            }

            if (!result.converged && result.message.empty())
            {
                result.message = "Iteration limit reached (" + std::to_string(options_.max_iterations) + ")";
            }

            result.iterations = iteration;
            result.objective_value = f;
            result.constraint_violation = max_abs(c);
            if (result.converged)
            {
                result.solution = x;
            }

            if (options_.verbose)
            {
                std::cout << "SQP: " << result.message << " (" << iteration << " iterations)\n";
            }

            return result;
        }

        // ============================================================================
        // Derivatives
        // ============================================================================

        Eigen::VectorXd SqpSolver::objective_gradient(
            const NonlinearProblem &problem,
            const Eigen::VectorXd &x) const
        {
            if (problem.gradient)
            {
                return problem.gradient(x);
            }
            return central_difference_gradient(problem.objective, x, options_.finite_difference_step);
        }

        Eigen::VectorXd SqpSolver::constraint_values(
            const NonlinearProblem &problem,
            const Eigen::VectorXd &x) const
        {
            Eigen::VectorXd values(problem.equality_constraints.size());
            for (size_t k = 0; k < problem.equality_constraints.size(); ++k)
            {
                values(k) = problem.equality_constraints[k].function(x);
            }
            return values;
        }

        Eigen::MatrixXd SqpSolver::constraint_jacobian(
            const NonlinearProblem &problem,
            const Eigen::VectorXd &x) const
        {
            Eigen::MatrixXd jacobian(problem.equality_constraints.size(), x.size());
            for (size_t k = 0; k < problem.equality_constraints.size(); ++k)
            {
                const EqualityConstraint &constraint = problem.equality_constraints[k];
                if (constraint.gradient)
                {
                    jacobian.row(k) = constraint.gradient(x).transpose();
                }
                else
                {
                    jacobian.row(k) = central_difference_gradient(
                                          constraint.function, x, options_.finite_difference_step)
                                          .transpose();
                }
            }
            return jacobian;
        }

        // ============================================================================
        // Optimality and Curvature
        // ============================================================================

        double SqpSolver::kkt_residual(
            const Eigen::VectorXd &gradient,
            const Eigen::MatrixXd &jacobian,
            const Eigen::VectorXd &x,
            const Eigen::VectorXd &lower,
            const Eigen::VectorXd &upper)
        {
            const Eigen::Index n = x.size();
            const Eigen::Index m = jacobian.rows();

            std::vector<Eigen::Index> free_indices;
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const bool at_lower = x(i) - lower(i) <= kActiveBoundTolerance;
                const bool at_upper = upper(i) - x(i) <= kActiveBoundTolerance;
                if (!at_lower && !at_upper)
                {
                    free_indices.push_back(i);
                }
            }

            Eigen::VectorXd lambda = Eigen::VectorXd::Zero(m);
            if (m > 0 && !free_indices.empty())
            {
                const Eigen::Index n_free = static_cast<Eigen::Index>(free_indices.size());
                Eigen::MatrixXd J_free(n_free, m);
                Eigen::VectorXd g_free(n_free);
                for (Eigen::Index k = 0; k < n_free; ++k)
                {
                    J_free.row(k) = jacobian.col(free_indices[k]).transpose();
                    g_free(k) = gradient(free_indices[k]);
                }
                lambda = J_free.colPivHouseholderQr().solve(-g_free);
            }

            Eigen::VectorXd lagrangian_gradient = gradient;
            if (m > 0)
            {
                lagrangian_gradient += jacobian.transpose() * lambda;
            }

            double residual = 0.0;
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const double r = lagrangian_gradient(i);
                double violation = std::abs(r);
                if (x(i) - lower(i) <= kActiveBoundTolerance)
                {
                    violation = std::max(0.0, -r);
                }
                else if (upper(i) - x(i) <= kActiveBoundTolerance)
                {
                    violation = std::max(0.0, r);
                }
                residual = std::max(residual, violation);
            }

            return residual;
        }

        void SqpSolver::update_hessian(
            Eigen::MatrixXd &hessian,
            const Eigen::VectorXd &s,
            const Eigen::VectorXd &y)
        {
            if (max_abs(s) < kMinCurvatureStep)
            {
                return;
            }

            const Eigen::VectorXd Bs = hessian * s;
            const double sBs = s.dot(Bs);
            if (sBs <= 0.0)
            {
                return;
            }

            // Powell damping keeps s^T r >= 0.2 s^T B s
            const double sy = s.dot(y);
            double theta = 1.0;
            if (sy < 0.2 * sBs)
            {
                theta = 0.8 * sBs / (sBs - sy);
            }

            const Eigen::VectorXd r = theta * y + (1.0 - theta) * Bs;
            const double sr = s.dot(r);
            if (sr <= 0.0)
            {
                return;
            }

            hessian += (r * r.transpose()) / sr - (Bs * Bs.transpose()) / sBs;
            hessian = 0.5 * (hessian + hessian.transpose()).eval();
        }

        Eigen::VectorXd SqpSolver::project_onto_bounds(
            const Eigen::VectorXd &x,
            const Eigen::VectorXd &lower,
            const Eigen::VectorXd &upper)
        {
            return x.cwiseMax(lower).cwiseMin(upper);
        }

    } // namespace optimizer
} // namespace allocation
