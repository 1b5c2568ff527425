//////////////////////////////////////////////////////////////////////////////////////
//
// (C) The Qsv contributors 2026. All rights reserved.
//
// Qsv is a dense state-vector simulation of qubit registers, with unitary gate
// composition over arbitrary qubit positions and Born-rule measurement with
// wavefunction collapse.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

#pragma once

#include "statevector.hpp"

#include <map>
#include <random>
#include <vector>

namespace Qsv {

/**
 * Born-rule sampling and collapse over a StateVector.
 *
 * Outcomes for a list of positions are encoded as an integer "assignment" whose most significant bit is the value read
 * at positions[0], matching the register's own bit order. The random source is an explicit, seedable generator; two
 * samplers sharing one generator draw from one stream.
 */
class MeasurementSampler {
protected:
    qsv_rand_gen_ptr rand_generator;
    std::uniform_real_distribution<real1_f> rand_distribution;

public:
    /// With no generator given, a new one is made and seeded from the system entropy pool (or clock).
    MeasurementSampler(qsv_rand_gen_ptr rgp = nullptr);

    void SetRandomSeed(uint32_t seed) { rand_generator->seed(seed); }
    qsv_rand_gen_ptr GetRandGen() { return rand_generator; }

    /** Generate a random real number between 0 and 1 */
    real1_f Rand() { return rand_distribution(*rand_generator); }

    /**
     * Probability of every assignment of "positions", with no collapse. The result has 2^positions.size() entries.
     */
    static std::vector<real1> ProbMaskAll(const StateVector& sv, const std::vector<bitLenInt>& positions);

    /// Probability that "position" reads 1
    static real1_f Prob(const StateVector& sv, bitLenInt position);

    /**
     * Sample one assignment of "positions", then collapse "sv" onto it: amplitudes inconsistent with the outcome are
     * zeroed and the rest divided by the square root of the outcome's probability. Throws MeasurementSamplingError if
     * no outcome carries probability mass.
     */
    bitCapInt Measure(StateVector& sv, const std::vector<bitLenInt>& positions);

    /**
     * Draw "shots" independent samples of "positions" from an unchanging copy of the state, and histogram them by
     * assignment.
     */
    std::map<bitCapInt, int> MultiShot(const StateVector& sv, const std::vector<bitLenInt>& positions, unsigned shots);

    /// Expand an assignment to one bool per position, in the same order as the positions
    static std::vector<bool> AssignmentToBits(const bitCapInt& assignment, bitLenInt length);

protected:
    /// Index of the sampled outcome from a discrete distribution, skipping entries at or below FP_NORM_EPSILON
    bitCapIntOcl Draw(const std::vector<real1>& probs);
};

} // namespace Qsv
