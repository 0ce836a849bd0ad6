/**
 * @file sample_covariance.hpp
 * @brief Classical sample covariance estimator
 *
 * Implements the standard sample covariance matrix estimation with
 * Bessel's correction (divide by n-1). Missing observations
 * (NaN) are handled pairwise: each entry uses only the dates on which
 * both assets have a return.
 *
 * Formula (complete data):
 *     Cov = (1/(n-1)) * (X - mean(X))^T * (X - mean(X))
 */

#pragma once

#include <Eigen/Dense>

namespace frontier
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Sample covariance matrix estimator
         *
         * Computes the classical sample covariance matrix from historical returns,
         * matching the pandas/NumPy default normalization (n-1).
         *
         * Properties:
         * - Unbiased estimator
         * - Exactly symmetric output
         * - Positive semi-definite for complete data; pairwise estimates on
         *   gappy data may lose this property
         *
         * Usage Example:
         * @code
         * SampleCovariance estimator;
         * Eigen::MatrixXd cov = estimator.estimate_covariance(returns);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class SampleCovariance
        {
        public:
            SampleCovariance() = default;
            ~SampleCovariance() = default;

            /**
             * @brief Estimate covariance matrix
             * @param returns Matrix of returns (T x N: observations x assets), NaN = missing
             * @return Covariance matrix (N x N)
             * @throws std::invalid_argument if returns has no columns
             * @throws InsufficientDataError if any pair of assets shares fewer
             *         than 2 observations
             *
             * Time complexity: O(N^2 * T)
             */
            Eigen::MatrixXd estimate_covariance(const Eigen::MatrixXd &returns) const;

        private:
            /**
             * @brief Covariance over rows where both columns are defined
             */
            static double pairwise_covariance(const Eigen::MatrixXd &returns, int a, int b);

            /**
             * @brief Enforce exact symmetry: (M + M^T) / 2
             */
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace frontier
