/**
 * @file optimization_errors.hpp
 * @brief Error kinds raised by the optimization engine
 *
 * Malformed arguments (dimension mismatch, NaN, asymmetric covariance)
 * are reported with std::invalid_argument like elsewhere in the code.
 * The types below cover conditions specific to portfolio optimization.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class OptimizationFailedError
         * @brief Nonlinear solve did not reach a feasible stationary point
         *
         * Carries the solver diagnostic. Recoverable: callers may retry with
         * another initial guess, relax bounds, or report it.
         */
        class OptimizationFailedError : public std::runtime_error
        {
        public:
            explicit OptimizationFailedError(const std::string &message)
                : std::runtime_error("Optimization failed: " + message)
            {
            }
        };

        /**
         * @class DegenerateInputError
         * @brief Portfolio volatility is numerically zero
         *
         * Sharpe ratio, diversification ratio and risk contributions are
         * undefined for such inputs. Also raised when an asset has zero variance.
         */
        class DegenerateInputError : public std::runtime_error
        {
        public:
            explicit DegenerateInputError(const std::string &message)
                : std::runtime_error("Degenerate input: " + message)
            {
            }
        };

        /**
         * @class NumericError
         * @brief Covariance matrix violates positive semi-definiteness
         */
        class NumericError : public std::runtime_error
        {
        public:
            explicit NumericError(const std::string &message)
                : std::runtime_error("Numeric error: " + message)
            {
            }
        };

    } // namespace optimizer
} // namespace allocation
