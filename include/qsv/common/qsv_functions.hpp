//////////////////////////////////////////////////////////////////////////////////////
//
// (C) The Qsv contributors 2026. All rights reserved.
// Portions adapted from Qrack, (C) Daniel Strano and the Qrack contributors 2017-2023.
//
// Qsv is a dense state-vector simulation of qubit registers, with unitary gate
// composition over arbitrary qubit positions and Born-rule measurement with
// wavefunction collapse.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

#pragma once

#include "qerrors.hpp"
#include "qsv_types.hpp"

#include <cstdlib>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace Qsv {

inline bitLenInt log2Ocl(bitCapIntOcl n)
{
    bitLenInt pow = 0U;
    bitCapIntOcl p = n >> 1U;
    while (p) {
        p >>= 1U;
        ++pow;
    }
    return pow;
}

inline bitCapInt pow2(const bitLenInt& p) { return ONE_BCI << p; }
inline bitCapIntOcl pow2Ocl(const bitLenInt& p) { return (bitCapIntOcl)1U << p; }
inline bool isPowerOfTwoOcl(const bitCapIntOcl& x) { return x && !(x & (x - 1U)); }

/**
 * Basis index bit for a qubit position. Position 0 is the most significant bit, so that the basis index of a
 * register reads left to right in the same order as the tensor product q0 x q1 x ... x q(n-1).
 */
inline bitCapIntOcl posPowOcl(const bitLenInt& position, const bitLenInt& qubitCount)
{
    return pow2Ocl(qubitCount - 1U - position);
}

inline void ThrowIfQbIdArrayIsBad(
    const std::vector<bitLenInt>& positions, const bitLenInt& qubitCount, std::string message)
{
    std::set<bitLenInt> dupes;
    for (size_t i = 0U; i < positions.size(); ++i) {
        if (positions[i] >= qubitCount) {
            throw DimensionMismatchError(message);
        }

        if (dupes.find(positions[i]) == dupes.end()) {
            dupes.insert(positions[i]);
        } else {
            throw DimensionMismatchError(message + " (Found duplicate qubit indices!)");
        }
    }
}

/// Widths are checked as int, before they are narrowed to bitLenInt or used as a shift.
inline void ThrowIfQubitCountIsBad(const int& qubits, std::string message)
{
    if ((qubits < 1) || (qubits > QSV_MAX_QUBITS)) {
        throw DimensionMismatchError(message);
    }
}

#if ENABLE_ENV_VARS
const real1_f _qsv_norm_epsilon = getenv("QSV_NORM_EPSILON")
    ? (real1_f)std::stod(std::string(getenv("QSV_NORM_EPSILON")))
    : (real1_f)QSV_DEFAULT_NORM_EPSILON;
const real1_f _qsv_drift_tolerance = getenv("QSV_DRIFT_TOLERANCE")
    ? (real1_f)std::stod(std::string(getenv("QSV_DRIFT_TOLERANCE")))
    : (real1_f)QSV_DEFAULT_DRIFT_TOLERANCE;
const bitLenInt PSTRIDEPOW_DEFAULT =
    (bitLenInt)(getenv("QSV_PSTRIDEPOW") ? std::stoi(std::string(getenv("QSV_PSTRIDEPOW"))) : PSTRIDEPOW);
const bool _qsv_verbose = getenv("QSV_VERBOSE") && (std::string(getenv("QSV_VERBOSE")) != "0");
#else
const real1_f _qsv_norm_epsilon = (real1_f)QSV_DEFAULT_NORM_EPSILON;
const real1_f _qsv_drift_tolerance = (real1_f)QSV_DEFAULT_DRIFT_TOLERANCE;
const bitLenInt PSTRIDEPOW_DEFAULT = PSTRIDEPOW;
const bool _qsv_verbose = false;
#endif
} // namespace Qsv
