/**
 * @file sample_covariance.cpp
 * @brief Implementation of sample covariance estimator
 */

#include "risk/sample_covariance.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace frontier
{
    namespace risk
    {

        Eigen::MatrixXd SampleCovariance::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            if (returns.cols() == 0)
            {
                throw std::invalid_argument("Returns matrix must have at least one asset column");
            }

            const int n_obs = returns.rows();
            const int n_assets = returns.cols();

            if (n_obs < 2)
            {
                throw InsufficientDataError(
                    "At least 2 return observations are required for covariance estimation, received: " +
                    std::to_string(n_obs));
            }

            if (returns.allFinite())
            {
                // Complete data: center each column and form X^T * X
                Eigen::RowVectorXd means = returns.colwise().mean();
                Eigen::MatrixXd centered = returns.rowwise() - means;
                Eigen::MatrixXd covariance = centered.transpose() * centered;

                covariance /= static_cast<double>(n_obs - 1);

                return ensure_symmetric(covariance);
            }

            // Gappy data: estimate each entry from pairwise-complete rows
            Eigen::MatrixXd covariance(n_assets, n_assets);
            for (int a = 0; a < n_assets; ++a)
            {
                for (int b = a; b < n_assets; ++b)
                {
                    double value = pairwise_covariance(returns, a, b);
                    covariance(a, b) = value;
                    covariance(b, a) = value;
                }
            }

            return covariance;
        }

        double SampleCovariance::pairwise_covariance(const Eigen::MatrixXd &returns, int a, int b)
        {
            double sum_a = 0.0;
            double sum_b = 0.0;
            int count = 0;

            for (int i = 0; i < returns.rows(); ++i)
            {
                if (std::isnan(returns(i, a)) || std::isnan(returns(i, b)))
                    continue;
                sum_a += returns(i, a);
                sum_b += returns(i, b);
                ++count;
            }

            if (count < 2)
            {
                throw InsufficientDataError(
                    "Assets " + std::to_string(a) + " and " + std::to_string(b) +
                    " share only " + std::to_string(count) +
                    " return observation(s); at least 2 are required");
            }

            const double mean_a = sum_a / count;
            const double mean_b = sum_b / count;

            double cross = 0.0;
            for (int i = 0; i < returns.rows(); ++i)
            {
                if (std::isnan(returns(i, a)) || std::isnan(returns(i, b)))
                    continue;
                cross += (returns(i, a) - mean_a) * (returns(i, b) - mean_b);
            }

            return cross / static_cast<double>(count - 1);
        }

        Eigen::MatrixXd SampleCovariance::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }

    } // namespace risk
} // namespace frontier
