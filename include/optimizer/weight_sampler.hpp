/**
 * @file weight_sampler.hpp
 * @brief Brute-force grid of long-only, fully invested three-asset weights
 *
 * Enumerates candidate portfolios on a regular grid instead of solving a
 * quadratic program:
 *
 *     For w1 in linspace(0, 1, num_steps):
 *         For w2 in linspace(0, 1, num_steps):
 *             w3 = 1 - w1 - w2
 *             discard if w3 < -1e-9, clamp to 0 if slightly negative
 *             emit (w1, w2, w3) / (w1 + w2 + w3)
 *
 * The grid yields at most num_steps^2 vectors; with the default of 101
 * steps the feasible triangle holds 5151 of them. Vectors that coincide on
 * the boundary are kept so that row indices stay a pure function of the
 * grid position.
 */

#pragma once

#include <Eigen/Dense>
#include <vector>

namespace frontier
{
    namespace optimizer
    {

        /**
         * @class WeightSampler
         * @brief Enumerates weight vectors on a uniform simplex grid
         *
         * Usage Example:
         * @code
         * WeightSampler sampler(101);
         * Eigen::MatrixXd weights = sampler.generate();  // rows x 3
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class WeightSampler
        {
        public:
            static constexpr int NUM_ASSETS = 3;               ///< Assets covered by the grid
            static constexpr double NEGATIVE_TOLERANCE = 1e-9; ///< Largest w3 deficit clamped to 0

            /**
             * @brief Constructor
             * @param num_steps Grid points per axis in [0, 1], endpoints included
             * @throws std::invalid_argument if num_steps < 1
             */
            explicit WeightSampler(int num_steps = 101);

            ~WeightSampler() = default;

            /**
             * @brief Generate all accepted weight vectors
             * @return Matrix of weights (accepted candidates x 3), w1-major order
             */
            Eigen::MatrixXd generate() const;

            /**
             * @brief Axis values, equivalent to linspace(0, 1, num_steps)
             */
            std::vector<double> grid() const;

            /**
             * @brief Set grid resolution
             * @throws std::invalid_argument if num_steps < 1
             */
            void set_num_steps(int num_steps);

            int get_num_steps() const { return num_steps_; }

            /**
             * @brief Upper bound on generated vectors (num_steps^2)
             */
            size_t max_samples() const
            {
                return static_cast<size_t>(num_steps_) * static_cast<size_t>(num_steps_);
            }

        private:
            int num_steps_; ///< Grid points per axis
        };

    } // namespace optimizer
} // namespace frontier
