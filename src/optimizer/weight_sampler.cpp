/**
 * @file weight_sampler.cpp
 * @brief Implementation of the three-asset weight grid
 */

#include "optimizer/weight_sampler.hpp"
#include <stdexcept>
#include <string>

namespace frontier
{
    namespace optimizer
    {

        WeightSampler::WeightSampler(int num_steps) : num_steps_(0)
        {
            set_num_steps(num_steps);
        }

        void WeightSampler::set_num_steps(int num_steps)
        {
            if (num_steps < 1)
            {
                throw std::invalid_argument(
                    "Number of grid steps must be at least 1, got: " +
                    std::to_string(num_steps));
            }
            num_steps_ = num_steps;
        }

        std::vector<double> WeightSampler::grid() const
        {
            std::vector<double> values(num_steps_, 0.0);
            if (num_steps_ == 1)
            {
                return values;
            }

            const double step = 1.0 / static_cast<double>(num_steps_ - 1);
            for (int i = 0; i < num_steps_; ++i)
            {
                values[i] = static_cast<double>(i) * step;
            }
            values[num_steps_ - 1] = 1.0;

            return values;
        }

        Eigen::MatrixXd WeightSampler::generate() const
        {
            const std::vector<double> axis = grid();

            std::vector<Eigen::Vector3d> accepted;
            accepted.reserve(max_samples());

            for (double w1 : axis)
            {
                for (double w2 : axis)
                {
                    double w3 = 1.0 - w1 - w2;

                    // Infeasible: would need a negative third weight
                    if (w3 < -NEGATIVE_TOLERANCE)
                        continue;

                    if (w3 < 0.0)
                        w3 = 0.0;

                    const double total = w1 + w2 + w3;
                    if (total == 0.0)
                        continue;

                    accepted.push_back(Eigen::Vector3d(w1, w2, w3) / total);
                }
            }

            Eigen::MatrixXd weights(accepted.size(), NUM_ASSETS);
            for (size_t i = 0; i < accepted.size(); ++i)
            {
                weights.row(i) = accepted[i].transpose();
            }

            return weights;
        }

    } // namespace optimizer
} // namespace frontier
