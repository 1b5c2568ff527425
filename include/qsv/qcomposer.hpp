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

#include "qgate.hpp"

#include <vector>

namespace Qsv {

/**
 * Expansion of k-qubit gates to full register operators.
 *
 * The Composer holds no state. Every call builds a fresh 2^n x 2^n dense matrix, so memory and time are O(4^n) in the
 * register width n; registers are capped at QSV_MAX_QUBITS accordingly.
 */
class Composer {
public:
    /**
     * The full-register operator for "gate" acting on "positions" of a register of qubitCount qubits.
     *
     * positions[i] is the register position that plays the role of the gate's i-th qubit (controls first, for
     * controlled gates). Throws DimensionMismatchError if the position count differs from the gate arity, or if
     * any position is out of range or repeated.
     */
    static QMatrix ExpandGate(const Gate& gate, const std::vector<bitLenInt>& positions, bitLenInt qubitCount);

    /// I_(2^start) (x) op (x) I_(2^(qubitCount - start - k)), for a k-qubit "op"
    static QMatrix ExpandContiguous(const QMatrix& op, bitLenInt start, bitLenInt qubitCount);

    /**
     * Basis index map for moving "positions" to the front of the register, in the given order, with all other
     * positions following in ascending order. Entry x is the index that basis state x is relabeled to.
     */
    static std::vector<bitCapIntOcl> PositionPermutation(
        const std::vector<bitLenInt>& positions, bitLenInt qubitCount);

    /**
     * P^-1 * op * P, where P relabels basis states by "perm". With op = G (x) I and perm from PositionPermutation(),
     * this is G acting on the permuted positions.
     */
    static QMatrix Conjugate(const QMatrix& op, const std::vector<bitCapIntOcl>& perm);

    /**
     * The block-diagonal operator I (+) U for "controlCount" controls over the target matrix U: identity on every basis
     * state with some control at 0, U where all controls read 1. Controls are the leading (most significant) qubits.
     */
    static QMatrix ControlledBlock(const QMatrix& target, bitLenInt controlCount);
};

} // namespace Qsv
