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

#include "common/parallel_for.hpp"
#include "qgate.hpp"
#include "qsampler.hpp"
#include "qubit.hpp"

#include <map>
#include <vector>

namespace Qsv {

/**
 * A coherent n-qubit system, built once from an ordered list of qubits and holding one 2^n amplitude vector.
 *
 * Position i is the i-th qubit passed to Create(), and position 0 is the most significant bit of every basis index.
 * The qubit count never changes. Gate application mutates the state unitarily; measurement collapses it. A position
 * that has been measured reads as classical until a gate touches it again.
 *
 * A Register has a single writer. Nothing here locks.
 */
class Register : public ParallelFor {
protected:
    bitLenInt qubitCount;
    StateVector state;
    MeasurementSampler sampler;
    std::vector<bool> classical;
    real1_f normEpsilon;
    real1_f driftTolerance;

    Register(StateVector&& sv, qsv_rand_gen_ptr rgp);

public:
    /**
     * Tensor the qubits together, in order. Throws EmptyRegisterError for an empty list, and std::invalid_argument
     * for more than QSV_MAX_QUBITS qubits.
     */
    static Register Create(const std::vector<Qubit>& qubits, qsv_rand_gen_ptr rgp = nullptr);

    bitLenInt GetQubitCount() const { return qubitCount; }
    bitCapInt GetMaxQPower() const { return pow2(qubitCount); }

    /**
     * Apply "gate" to "positions", where positions[i] receives the gate's i-th qubit (controls first).
     *
     * The product is computed into a fresh buffer. If the result's norm is off by more than the drift tolerance,
     * NormalizationDriftError is thrown and this register is left as it was; smaller drift is renormalized away.
     */
    Register& ApplyGate(const Gate& gate, const std::vector<bitLenInt>& positions);

    /// Measure the listed positions jointly, collapsing the state. Results are in the order of "positions".
    std::vector<bool> Measure(const std::vector<bitLenInt>& positions);

    /// Measure a single position
    bool M(bitLenInt position) { return Measure(std::vector<bitLenInt>{ position })[0U]; }

    /// One joint sample over every position, position 0 first
    std::vector<bool> MeasureAll();

    /// Histogram of "shots" samples over "positions", leaving the state untouched
    std::map<bitCapInt, int> MultiShot(const std::vector<bitLenInt>& positions, unsigned shots)
    {
        return sampler.MultiShot(state, positions, shots);
    }

    /// A copy of the current amplitudes
    StateVector GetStateVector() const { return state; }
    std::vector<real1> GetProbs() const { return state.GetProbs(); }
    /// Lazy view; it reads the live state, so it reflects later gates and measurements.
    StateVector::ProbabilityView Probabilities() const { return state.Probabilities(); }

    /// Probability of reading 1 at "position", without collapse
    real1_f Prob(bitLenInt position) const;
    /// Probability of the full basis state "index"
    real1_f ProbAll(bitCapInt index) const;
    complex GetAmplitude(bitCapInt index) const;

    bool IsClassical(bitLenInt position) const;

    void SetRandomSeed(uint32_t seed) { sampler.SetRandomSeed(seed); }

    /**
     * Override the tolerances ApplyGate() checks the norm against. Drift above normEps is renormalized; drift above
     * driftTol is an error. The defaults come from QSV_NORM_EPSILON and QSV_DRIFT_TOLERANCE.
     */
    void SetNormalizationTolerances(real1_f normEps, real1_f driftTol)
    {
        if ((normEps < ZERO_R1_F) || (driftTol < normEps)) {
            throw std::invalid_argument("Register::SetNormalizationTolerances() requires 0 <= normEps <= driftTol!");
        }
        normEpsilon = normEps;
        driftTolerance = driftTol;
    }
};

} // namespace Qsv
