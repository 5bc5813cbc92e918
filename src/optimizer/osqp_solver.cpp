/**
 * @file osqp_solver.cpp
 * @brief Implementation of OSQP solver wrapper
 */

#include "optimizer/osqp_solver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            struct WorkspaceDeleter
            {
                void operator()(::OSQPSolver *work) const
                {
                    osqp_cleanup(work);
                }
            };

            using Workspace = std::unique_ptr<::OSQPSolver, WorkspaceDeleter>;

            OSQPFloat clamp_bound(double value)
            {
                return static_cast<OSQPFloat>(std::max(-OSQP_INFTY, std::min(OSQP_INFTY, value)));
            }
        } // namespace

        OSQPSolver::OSQPSolver(const QuadraticSolverOptions &options)
            : options_(options)
        {
        }

        void OSQPSolver::convert_to_csc(
            const Eigen::MatrixXd &dense,
            std::vector<OSQPFloat> &data,
            std::vector<OSQPInt> &indices,
            std::vector<OSQPInt> &indptr,
            bool upper_triangular_only)
        {
            const Eigen::Index rows = dense.rows();
            const Eigen::Index cols = dense.cols();

            data.clear();
            indices.clear();
            indptr.clear();
            indptr.reserve(cols + 1);

            indptr.push_back(0);

            // Iterate over columns (CSC format)
            for (Eigen::Index j = 0; j < cols; ++j)
            {
                Eigen::Index row_limit = upper_triangular_only ? (j + 1) : rows;

                for (Eigen::Index i = 0; i < row_limit; ++i)
                {
                    double val = dense(i, j);
                    if (std::abs(val) > 1e-14) // Skip near-zero values
                    {
                        data.push_back(val);
                        indices.push_back(static_cast<OSQPInt>(i));
                    }
                }
                indptr.push_back(static_cast<OSQPInt>(data.size()));
            }
        }

        OSQPInt OSQPSolver::build_constraint_matrix(
            const QuadraticProblem &problem,
            std::vector<OSQPFloat> &A_data,
            std::vector<OSQPInt> &A_indices,
            std::vector<OSQPInt> &A_indptr,
            std::vector<OSQPFloat> &l,
            std::vector<OSQPFloat> &u)
        {
            const Eigen::Index n = problem.q.size();
            const Eigen::Index n_eq = problem.A_eq.rows();
            const Eigen::Index m = n_eq + n;

            A_data.clear();
            A_indices.clear();
            A_indptr.clear();
            l.resize(m);
            u.resize(m);

            A_indptr.push_back(0);

            // Build constraint matrix column by column (CSC format)
            for (Eigen::Index j = 0; j < n; ++j)
            {
                // 1. Equality constraints: A_eq * x = b_eq
                for (Eigen::Index i = 0; i < n_eq; ++i)
                {
                    double val = problem.A_eq(i, j);
                    if (std::abs(val) > 1e-14)
                    {
                        A_data.push_back(val);
                        A_indices.push_back(static_cast<OSQPInt>(i));
                    }
                }

                // 2. Bound row for x_j: lb_j <= x_j <= ub_j
                A_data.push_back(1.0);
                A_indices.push_back(static_cast<OSQPInt>(n_eq + j));

                A_indptr.push_back(static_cast<OSQPInt>(A_data.size()));
            }

            // Equality constraints: l = u = b_eq
            for (Eigen::Index i = 0; i < n_eq; ++i)
            {
                l[i] = problem.b_eq(i);
                u[i] = problem.b_eq(i);
            }

            // Box constraints
            for (Eigen::Index i = 0; i < n; ++i)
            {
                l[n_eq + i] = clamp_bound(problem.lower_bounds(i));
                u[n_eq + i] = clamp_bound(problem.upper_bounds(i));
            }

            return static_cast<OSQPInt>(m);
        }

        QuadraticResult OSQPSolver::solve(const QuadraticProblem &problem) const
        {
            problem.validate();

            QuadraticResult result;
            const Eigen::Index n = problem.q.size();
            const Eigen::Index n_eq = problem.A_eq.rows();

            // Convert P matrix to CSC format
            std::vector<OSQPFloat> P_data;
            std::vector<OSQPInt> P_indices;
            std::vector<OSQPInt> P_indptr;
            convert_to_csc(problem.P, P_data, P_indices, P_indptr, true);

            // Linear term q
            std::vector<OSQPFloat> q(problem.q.data(), problem.q.data() + n);

            // Build constraint matrix A and bounds l, u
            std::vector<OSQPFloat> A_data;
            std::vector<OSQPInt> A_indices;
            std::vector<OSQPInt> A_indptr;
            std::vector<OSQPFloat> l;
            std::vector<OSQPFloat> u;

            OSQPInt m = build_constraint_matrix(problem, A_data, A_indices, A_indptr, l, u);

            OSQPCscMatrix P_csc{};
            P_csc.m = static_cast<OSQPInt>(n);
            P_csc.n = static_cast<OSQPInt>(n);
            P_csc.p = P_indptr.data();
            P_csc.i = P_indices.data();
            P_csc.x = P_data.data();
            P_csc.nzmax = static_cast<OSQPInt>(P_data.size());
            P_csc.nz = -1; // -1 means CSC format (not triplet)

            OSQPCscMatrix A_csc{};
            A_csc.m = m;
            A_csc.n = static_cast<OSQPInt>(n);
            A_csc.p = A_indptr.data();
            A_csc.i = A_indices.data();
            A_csc.x = A_data.data();
            A_csc.nzmax = static_cast<OSQPInt>(A_data.size());
            A_csc.nz = -1;

            // Configure OSQP settings
            OSQPSettings settings;
            osqp_set_default_settings(&settings);
            settings.verbose = options_.verbose ? 1 : 0;
            settings.eps_abs = options_.tolerance;
            settings.eps_rel = options_.tolerance;
            settings.max_iter = options_.max_iterations;
            settings.polishing = options_.polishing ? 1 : 0;

            // Setup OSQP workspace (use :: to disambiguate from our class)
            ::OSQPSolver *raw_work = nullptr;
            OSQPInt exit_flag = osqp_setup(&raw_work, &P_csc, q.data(), &A_csc,
                                           l.data(), u.data(), m,
                                           static_cast<OSQPInt>(n), &settings);
            Workspace work(raw_work);

            if (exit_flag != 0 || !work)
            {
                result.success = false;
                result.message = "OSQP setup failed (exit flag " + std::to_string(exit_flag) + ")";
                return result;
            }

            osqp_solve(work.get());

            const OSQPInt status = work->info->status_val;
            result.iterations = static_cast<int>(work->info->iter);
            result.objective_value = work->info->obj_val;
            result.primal_residual = work->info->prim_res;
            result.message = work->info->status;

            if (status == OSQP_PRIMAL_INFEASIBLE || status == OSQP_PRIMAL_INFEASIBLE_INACCURATE)
            {
                result.success = false;
                result.infeasible = true;
                return result;
            }

            if (status == OSQP_DUAL_INFEASIBLE || status == OSQP_DUAL_INFEASIBLE_INACCURATE ||
                status == OSQP_NON_CVX)
            {
                result.success = false;
                return result;
            }

            // Extract solution (also kept for MAX_ITER so callers can inspect it)
            result.solution = Eigen::Map<const Eigen::VectorXd>(work->solution->x, n);
            result.equality_duals = Eigen::Map<const Eigen::VectorXd>(work->solution->y, n_eq);

            result.success = (status == OSQP_SOLVED || status == OSQP_SOLVED_INACCURATE) &&
                             result.solution.allFinite();

            if (options_.verbose)
            {
                std::cout << "OSQP: " << result.message << " after "
                          << result.iterations << " iterations\n";
            }

            return result;
        }

    } // namespace optimizer
} // namespace allocation
