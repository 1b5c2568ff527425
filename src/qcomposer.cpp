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

#include "qcomposer.hpp"
#include "qerrors.hpp"

namespace Qsv {

QMatrix Composer::ExpandGate(const Gate& gate, const std::vector<bitLenInt>& positions, bitLenInt qubitCount)
{
    if (positions.size() != gate.GetArity()) {
        throw DimensionMismatchError("Composer::ExpandGate() position count does not match the arity of gate " +
            gate.GetName() + "!");
    }
    ThrowIfQbIdArrayIsBad(
        positions, qubitCount, "Composer::ExpandGate() positions must be within allocated qubit bounds!");

    const bitLenInt k = gate.GetArity();

    bool isContiguous = true;
    for (bitLenInt i = 1U; i < k; ++i) {
        if (positions[i] != (positions[0U] + i)) {
            isContiguous = false;
            break;
        }
    }

    if (isContiguous) {
        return ExpandContiguous(gate.GetMatrix(), positions[0U], qubitCount);
    }

    return Conjugate(ExpandContiguous(gate.GetMatrix(), 0U, qubitCount), PositionPermutation(positions, qubitCount));
}

QMatrix Composer::ExpandContiguous(const QMatrix& op, bitLenInt start, bitLenInt qubitCount)
{
    const bitLenInt k = log2Ocl(op.GetDimension());
    if ((start + k) > qubitCount) {
        throw DimensionMismatchError("Composer::ExpandContiguous() operator does not fit in the register!");
    }

    QMatrix toRet = QMatrix::Identity(pow2Ocl(start)).Kron(op);

    return toRet.Kron(QMatrix::Identity(pow2Ocl(qubitCount - start - k)));
}

std::vector<bitCapIntOcl> Composer::PositionPermutation(
    const std::vector<bitLenInt>& positions, bitLenInt qubitCount)
{
    ThrowIfQbIdArrayIsBad(
        positions, qubitCount, "Composer::PositionPermutation() positions must be within allocated qubit bounds!");

    // order[j] is the original position that lands at position j.
    std::vector<bitLenInt> order(positions);
    std::vector<bool> isMoved(qubitCount, false);
    for (size_t i = 0U; i < positions.size(); ++i) {
        isMoved[positions[i]] = true;
    }
    for (bitLenInt q = 0U; q < qubitCount; ++q) {
        if (!isMoved[q]) {
            order.push_back(q);
        }
    }

    const bitCapIntOcl maxQPower = pow2Ocl(qubitCount);
    std::vector<bitCapIntOcl> perm(maxQPower);
    for (bitCapIntOcl x = 0U; x < maxQPower; ++x) {
        bitCapIntOcl y = 0U;
        for (bitLenInt j = 0U; j < qubitCount; ++j) {
            if (x & posPowOcl(order[j], qubitCount)) {
                y |= posPowOcl(j, qubitCount);
            }
        }
        perm[x] = y;
    }

    return perm;
}

QMatrix Composer::Conjugate(const QMatrix& op, const std::vector<bitCapIntOcl>& perm)
{
    const bitCapIntOcl dim = op.GetDimension();
    if (perm.size() != dim) {
        throw DimensionMismatchError("Composer::Conjugate() permutation size does not match operator dimension!");
    }

    QMatrix toRet(dim);
    for (bitCapIntOcl row = 0U; row < dim; ++row) {
        for (bitCapIntOcl col = 0U; col < dim; ++col) {
            toRet(row, col) = op(perm[row], perm[col]);
        }
    }

    return toRet;
}

QMatrix Composer::ControlledBlock(const QMatrix& target, bitLenInt controlCount)
{
    const bitCapIntOcl targetDim = target.GetDimension();

    return QMatrix::DirectSum((pow2Ocl(controlCount) - 1U) * targetDim, target);
}

} // namespace Qsv
