/**
 * @file finite_difference.cpp
 * @brief Implementation of central-difference gradients
 */

#include "optimizer/finite_difference.hpp"
#include <cmath>
#include <algorithm>
#include <limits>

namespace allocation
{
    namespace optimizer
    {

        double default_difference_step(double x)
        {
            static const double base = std::cbrt(std::numeric_limits<double>::epsilon());
            return base * std::max(1.0, std::abs(x));
        }

        Eigen::VectorXd central_difference_gradient(
            const ScalarFunction &f,
            const Eigen::VectorXd &x,
            double step)
        {
            const Eigen::Index n = x.size();
            Eigen::VectorXd gradient(n);
            Eigen::VectorXd probe = x;

            for (Eigen::Index i = 0; i < n; ++i)
            {
                double h = (step > 0.0) ? step : default_difference_step(x(i));

                // Use the exactly representable step actually taken
                probe(i) = x(i) + h;
                double forward_h = probe(i) - x(i);
                double f_plus = f(probe);

                probe(i) = x(i) - h;
                double backward_h = x(i) - probe(i);
                double f_minus = f(probe);

                probe(i) = x(i);
                gradient(i) = (f_plus - f_minus) / (forward_h + backward_h);
            }

            return gradient;
        }

    } // namespace optimizer
} // namespace allocation
