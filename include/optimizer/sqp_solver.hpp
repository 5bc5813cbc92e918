/**
 * @file sqp_solver.hpp
 * @brief Sequential quadratic programming solver
 *
 * Local solver for smooth objectives with nonlinear equality constraints
 * and box bounds. Each iteration:
 *
 * 1. Linearizes the constraints at the current iterate x
 * 2. Solves the QP subproblem with OSQP
 *        minimize    (1/2) d^T B d + g^T d
 *        subject to  J d = -h(x)
 *                    l - x <= d <= u - x
 * 3. Backtracks along d on the l1 merit function f + rho * ||h||_1
 * 4. Updates B with a damped (Powell) BFGS step on the Lagrangian gradient
 *
 * Gradients come from central finite differences unless the problem
 * supplies analytic ones.
 *
 * Convergence: constraint violation below constraint_tolerance and either
 * the QP step or the projected KKT residual below its tolerance.
 */

#pragma once

#include "optimizer/nonlinear_solver.hpp"
#include "optimizer/osqp_solver.hpp"

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class SqpSolver
         * @brief SQP implementation of ConstrainedNonlinearSolver
         *
         * Usage Example:
         * @code
         * auto problem = NonlinearProblem::budget_constrained(
         *     n, [&](const Eigen::VectorXd &w) { return portfolio_volatility(w, cov); });
         *
         * SqpSolver solver;
         * SolverResult result = solver.minimize(problem);
         * if (result.converged) {
         *     std::cout << result.solution.transpose() << "\n";
         * }
         * @endcode
         *
         * Thread Safety: minimize() is const and keeps all state on the
         * stack, so one instance may serve several threads.
         */
        class SqpSolver : public ConstrainedNonlinearSolver
        {
        public:
            /**
             * @brief Constructor
             * @param options Solver options
             * @throws std::invalid_argument if options are invalid
             */
            explicit SqpSolver(const NonlinearSolverOptions &options = NonlinearSolverOptions());

            /**
             * @brief Destructor
             */
            ~SqpSolver() override = default;

            SolverResult minimize(const NonlinearProblem &problem) const override;

            /**
             * @brief Get solver name
             * @return "SqpSolver"
             */
            std::string get_name() const override;

        private:
            NonlinearSolverOptions options_; ///< Solver configuration
            OSQPSolver qp_solver_;           ///< QP subproblem backend

            Eigen::VectorXd objective_gradient(
                const NonlinearProblem &problem,
                const Eigen::VectorXd &x) const;

            Eigen::VectorXd constraint_values(
                const NonlinearProblem &problem,
                const Eigen::VectorXd &x) const;

            Eigen::MatrixXd constraint_jacobian(
                const NonlinearProblem &problem,
                const Eigen::VectorXd &x) const;

            /**
             * @brief Projected Lagrangian gradient (inf-norm)
             *
             * Multipliers are fitted by least squares on the variables that
             * are away from their bounds; variables at a bound only count
             * when the gradient points into the feasible box.
             */
            static double kkt_residual(
                const Eigen::VectorXd &gradient,
                const Eigen::MatrixXd &jacobian,
                const Eigen::VectorXd &x,
                const Eigen::VectorXd &lower,
                const Eigen::VectorXd &upper);

            /**
             * @brief Damped BFGS update keeping B positive definite
             */
            static void update_hessian(
                Eigen::MatrixXd &hessian,
                const Eigen::VectorXd &s,
                const Eigen::VectorXd &y);

            static Eigen::VectorXd project_onto_bounds(
                const Eigen::VectorXd &x,
                const Eigen::VectorXd &lower,
                const Eigen::VectorXd &upper);
        };

    } // namespace optimizer
} // namespace allocation
