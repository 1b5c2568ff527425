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

#include "qubit.hpp"
#include "qerrors.hpp"
#include "qgate.hpp"

#include <cmath>

namespace Qsv {

Qubit Qubit::Create(const complex& alpha, const complex& beta)
{
    const real1_f nrm = (real1_f)(norm(alpha) + norm(beta));
    if (std::abs(nrm - ONE_R1_F) > _qsv_norm_epsilon) {
        throw InvalidStateError("Qubit::Create() requires |alpha|^2 + |beta|^2 == 1!");
    }

    return Qubit(StateVector(std::vector<complex>{ alpha, beta }, false));
}

Qubit Qubit::FromBit(bool bit, real1_f theta)
{
    const real1 cosine = (real1)std::cos(theta / 2);
    const real1 sine = (real1)std::sin(theta / 2);

    // RY(theta) applied to |0> or |1>
    if (bit) {
        return Qubit(StateVector(std::vector<complex>{ complex(-sine, ZERO_R1), complex(cosine, ZERO_R1) }, false));
    }

    return Qubit(StateVector(std::vector<complex>{ complex(cosine, ZERO_R1), complex(sine, ZERO_R1) }, false));
}

Qubit Qubit::Apply(const Gate& gate) const
{
    if (gate.GetArity() != 1U) {
        throw DimensionMismatchError("Qubit::Apply() requires a single-qubit gate!");
    }

    return Qubit(gate.Apply(state));
}

std::ostream& operator<<(std::ostream& os, const Qubit& q) { return os << q.ToString(); }

} // namespace Qsv
