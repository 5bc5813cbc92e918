/**
 * @file finite_difference.hpp
 * @brief Numerical derivatives for objectives without analytic gradients
 *
 * Uses central differences. With step h_i = eps^(1/3) * max(1, |x_i|)
 * the truncation and round-off errors are balanced, giving roughly
 * 10 significant digits for smooth portfolio objectives.
 */

#pragma once

#include <Eigen/Dense>
#include <functional>

namespace allocation
{
    namespace optimizer
    {

        using ScalarFunction = std::function<double(const Eigen::VectorXd &)>;

        /**
         * @brief Default central-difference step for coordinate value x
         */
        double default_difference_step(double x);

        /**
         * @brief Central-difference gradient of f at x
         * @param f Scalar function
         * @param x Evaluation point
         * @param step Fixed step size, or 0 for the scaled default
         * @return Gradient estimate (N x 1)
         */
        Eigen::VectorXd central_difference_gradient(
            const ScalarFunction &f,
            const Eigen::VectorXd &x,
            double step = 0.0);

    } // namespace optimizer
} // namespace allocation
