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

namespace Qsv {

class Gate;

/**
 * A single-qubit pure state, alpha|0> + beta|1>.
 *
 * Qubits are immutable values. They are the building blocks a Register is composed from, and can also be driven by
 * single-qubit gates on their own.
 */
class Qubit {
protected:
    StateVector state;

    Qubit(StateVector&& sv)
        : state(std::move(sv))
    {
    }

public:
    /// Throws InvalidStateError unless |alpha|^2 + |beta|^2 is 1 to within the normalization epsilon.
    static Qubit Create(const complex& alpha, const complex& beta);

    /**
     * The basis state |bit>, optionally followed by a rotation RY(theta) about the Y axis, so that FromBit(false, t)
     * is cos(t/2)|0> + sin(t/2)|1>.
     */
    static Qubit FromBit(bool bit, real1_f theta = ZERO_R1_F);

    complex Alpha() const { return state.read(0U); }
    complex Beta() const { return state.read(1U); }

    const StateVector& GetStateVector() const { return state; }
    StateVector::ProbabilityView Probabilities() const { return state.Probabilities(); }

    /// Probability of reading 1
    real1_f Prob() const { return (real1_f)norm(Beta()); }

    /// Two-qubit (or longer) product state, with this qubit in position 0
    StateVector Tensor(const Qubit& other) const { return state.Tensor(other.state); }
    StateVector Tensor(const StateVector& other) const { return state.Tensor(other); }

    /// The qubit that results from applying a single-qubit gate; this one is unchanged.
    Qubit Apply(const Gate& gate) const;

    std::string ToString() const { return state.ToString(); }
};

std::ostream& operator<<(std::ostream& os, const Qubit& q);

} // namespace Qsv
