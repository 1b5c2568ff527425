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

#include "qgate.hpp"
#include "qcomposer.hpp"
#include "qerrors.hpp"

#include <cmath>
#include <sstream>

namespace Qsv {

Gate::Gate(GateKind k, const std::string& n, const QMatrix& target, bitLenInt controls, bool hasP, real1_f p)
    : kind(k)
    , name(n)
    , arity(0U)
    , controlCount(controls)
    , hasParam(hasP)
    , param(p)
{
    const bitCapIntOcl targetDim = target.GetDimension();
    if ((targetDim < 2U) || !isPowerOfTwoOcl(targetDim)) {
        throw DimensionMismatchError("Gate " + name + " matrix dimension must be a power of two, at least 2!");
    }
    const int width = (int)log2Ocl(targetDim) + (int)controlCount;
    ThrowIfQubitCountIsBad(width, "Gate " + name + " spans more qubits than QSV_MAX_QUBITS!");
    arity = (bitLenInt)width;

    targetMtrx = std::make_shared<QMatrix>(target);
    if (controlCount) {
        mtrx = std::make_shared<QMatrix>(Composer::ControlledBlock(target, controlCount));
    } else {
        mtrx = targetMtrx;
    }

    if (!mtrx->IsUnitary(_qsv_norm_epsilon)) {
        throw NonUnitaryGateError("Gate " + name + " matrix is not unitary!");
    }
}

Gate Gate::Identity(bitLenInt qubits)
{
    ThrowIfQubitCountIsBad(qubits, "Gate::Identity() qubit count must be between 1 and QSV_MAX_QUBITS!");

    return Gate(GATE_IDENTITY, "I", QMatrix::Identity(pow2Ocl(qubits)));
}

Gate Gate::X() { return Gate(GATE_X, "X", QMatrix{ ZERO_CMPLX, ONE_CMPLX, ONE_CMPLX, ZERO_CMPLX }); }

Gate Gate::Y() { return Gate(GATE_Y, "Y", QMatrix{ ZERO_CMPLX, -I_CMPLX, I_CMPLX, ZERO_CMPLX }); }

Gate Gate::Z() { return Gate(GATE_Z, "Z", QMatrix{ ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, -ONE_CMPLX }); }

Gate Gate::H()
{
    const complex h = complex(SQRT1_2_R1, ZERO_R1);
    return Gate(GATE_H, "H", QMatrix{ h, h, h, -h });
}

Gate Gate::SqrtNot()
{
    const complex p = complex(ONE_R1 / 2, ONE_R1 / 2);
    const complex m = complex(ONE_R1 / 2, -ONE_R1 / 2);
    return Gate(GATE_SQRT_NOT, "SqrtNot", QMatrix{ p, m, m, p });
}

Gate Gate::S() { return Gate(GATE_S, "S", QMatrix{ ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, I_CMPLX }); }

Gate Gate::T()
{
    return Gate(GATE_T, "T", QMatrix{ ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, complex(SQRT1_2_R1, SQRT1_2_R1) });
}

Gate Gate::Phase(real1_f angle)
{
    const complex p = std::polar((real1)ONE_R1, (real1)angle);
    return Gate(GATE_PHASE, "Phase", QMatrix{ ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, p }, 0U, true, angle);
}

Gate Gate::RX(real1_f angle)
{
    const real1 cosine = (real1)std::cos(angle / 2);
    const real1 sine = (real1)std::sin(angle / 2);
    return Gate(GATE_RX, "RX",
        QMatrix{ complex(cosine, ZERO_R1), complex(ZERO_R1, -sine), complex(ZERO_R1, -sine), complex(cosine, ZERO_R1) },
        0U, true, angle);
}

Gate Gate::RY(real1_f angle)
{
    const real1 cosine = (real1)std::cos(angle / 2);
    const real1 sine = (real1)std::sin(angle / 2);
    return Gate(GATE_RY, "RY",
        QMatrix{ complex(cosine, ZERO_R1), complex(-sine, ZERO_R1), complex(sine, ZERO_R1), complex(cosine, ZERO_R1) },
        0U, true, angle);
}

Gate Gate::RZ(real1_f angle)
{
    const complex m = std::polar((real1)ONE_R1, (real1)(-angle / 2));
    const complex p = std::polar((real1)ONE_R1, (real1)(angle / 2));
    return Gate(GATE_RZ, "RZ", QMatrix{ m, ZERO_CMPLX, ZERO_CMPLX, p }, 0U, true, angle);
}

Gate Gate::Swap()
{
    QMatrix m(4U);
    m(0U, 0U) = ONE_CMPLX;
    m(1U, 2U) = ONE_CMPLX;
    m(2U, 1U) = ONE_CMPLX;
    m(3U, 3U) = ONE_CMPLX;

    return Gate(GATE_SWAP, "Swap", m);
}

Gate Gate::SqrtSwap()
{
    QMatrix m(4U);
    m(0U, 0U) = ONE_CMPLX;
    m(1U, 1U) = complex(ONE_R1 / 2, ONE_R1 / 2);
    m(1U, 2U) = complex(ONE_R1 / 2, -ONE_R1 / 2);
    m(2U, 1U) = complex(ONE_R1 / 2, -ONE_R1 / 2);
    m(2U, 2U) = complex(ONE_R1 / 2, ONE_R1 / 2);
    m(3U, 3U) = ONE_CMPLX;

    return Gate(GATE_SQRT_SWAP, "SqrtSwap", m);
}

Gate Gate::Ising(real1_f phi)
{
    const complex s = complex(SQRT1_2_R1, ZERO_R1);
    const complex mis = complex(ZERO_R1, -SQRT1_2_R1);

    QMatrix m(4U);
    m(0U, 0U) = s;
    m(0U, 3U) = mis * std::polar((real1)ONE_R1, (real1)phi);
    m(1U, 1U) = s;
    m(1U, 2U) = mis;
    m(2U, 1U) = mis;
    m(2U, 2U) = s;
    m(3U, 0U) = mis * std::polar((real1)ONE_R1, (real1)-phi);
    m(3U, 3U) = s;

    return Gate(GATE_ISING, "Ising", m, 0U, true, phi);
}

Gate Gate::CNOT() { return Gate(GATE_CNOT, "CNOT", X().GetTargetMatrix(), 1U); }

Gate Gate::CZ() { return Gate(GATE_CZ, "CZ", Z().GetTargetMatrix(), 1U); }

Gate Gate::CPhase(real1_f angle)
{
    return Gate(GATE_CPHASE, "CPhase", Phase(angle).GetTargetMatrix(), 1U, true, angle);
}

Gate Gate::Toffoli() { return Gate(GATE_TOFFOLI, "Toffoli", X().GetTargetMatrix(), 2U); }

Gate Gate::Fredkin() { return Gate(GATE_FREDKIN, "Fredkin", Swap().GetTargetMatrix(), 1U); }

Gate Gate::Controlled(const Gate& target, bitLenInt controls)
{
    if (!controls) {
        return target;
    }

    ThrowIfQubitCountIsBad((int)controls + (int)target.arity,
        "Gate::Controlled() " + target.name + " with added controls spans more qubits than QSV_MAX_QUBITS!");

    return Gate(GATE_CONTROLLED, std::string(controls, 'C') + target.name, *(target.targetMtrx),
        controls + target.controlCount, target.hasParam, target.param);
}

Gate Gate::Custom(const QMatrix& matrix, const std::string& n) { return Gate(GATE_CUSTOM, n, matrix); }

Gate Gate::Custom(const QMatrix& matrix, const std::string& n, bitLenInt a)
{
    ThrowIfQubitCountIsBad(a, "Gate::Custom() arity must be between 1 and QSV_MAX_QUBITS!");
    if (matrix.GetDimension() != pow2Ocl(a)) {
        throw DimensionMismatchError("Gate::Custom() matrix dimension does not match the requested arity!");
    }

    return Gate(GATE_CUSTOM, n, matrix);
}

Gate Gate::Custom(const std::vector<std::vector<complex>>& matrix, const std::string& n)
{
    if (matrix.empty()) {
        throw DimensionMismatchError("Gate::Custom() matrix must not be empty!");
    }

    for (size_t i = 0U; i < matrix.size(); ++i) {
        if (matrix[i].size() != matrix.size()) {
            throw DimensionMismatchError("Gate::Custom() matrix must be square!");
        }
    }

    return Gate(GATE_CUSTOM, n, QMatrix(matrix));
}

Gate Gate::Layer(const std::vector<Gate>& gates)
{
    if (gates.empty()) {
        throw DimensionMismatchError("Gate::Layer() requires at least one gate!");
    }

    int width = 0;
    for (size_t i = 0U; i < gates.size(); ++i) {
        width += (int)gates[i].arity;
    }
    ThrowIfQubitCountIsBad(width, "Gate::Layer() spans more qubits than QSV_MAX_QUBITS!");

    Gate toRet = gates[0U];
    for (size_t i = 1U; i < gates.size(); ++i) {
        toRet = toRet.Tensor(gates[i]);
    }

    return toRet;
}

StateVector Gate::Apply(const StateVector& sv) const
{
    const bitCapIntOcl dim = mtrx->GetDimension();
    if (sv.GetMaxQPower() != dim) {
        throw DimensionMismatchError("Gate::Apply() state vector dimension does not match gate " + name + "!");
    }

    std::vector<complex> out(dim);
    for (bitCapIntOcl i = 0U; i < dim; ++i) {
        out[i] = mtrx->RowDot(i, sv.data());
    }

    return StateVector(std::move(out), false);
}

Gate Gate::Adjoint() const
{
    switch (kind) {
    case GATE_IDENTITY:
    case GATE_X:
    case GATE_Y:
    case GATE_Z:
    case GATE_H:
    case GATE_SWAP:
    case GATE_CNOT:
    case GATE_CZ:
    case GATE_TOFFOLI:
    case GATE_FREDKIN:
        return *this;
    case GATE_PHASE:
        return Phase(-param);
    case GATE_RX:
        return RX(-param);
    case GATE_RY:
        return RY(-param);
    case GATE_RZ:
        return RZ(-param);
    case GATE_CPHASE:
        return CPhase(-param);
    default:
        // The adjoint of I (+) U is I (+) U^dagger, so control structure survives.
        return Gate(GATE_CUSTOM, name + "†", targetMtrx->Adjoint(), controlCount);
    }
}

Gate Gate::Power(unsigned power) const
{
    QMatrix toRet = QMatrix::Identity(targetMtrx->GetDimension());
    for (unsigned i = 0U; i < power; ++i) {
        toRet = toRet * (*targetMtrx);
    }

    std::ostringstream oss;
    oss << name << "^" << power;

    return Gate(GATE_CUSTOM, oss.str(), toRet, controlCount);
}

Gate Gate::Tensor(const Gate& right) const
{
    ThrowIfQubitCountIsBad((int)arity + (int)right.arity,
        "Gate::Tensor() " + name + "⊗" + right.name + " spans more qubits than QSV_MAX_QUBITS!");

    return Gate(GATE_CUSTOM, name + "⊗" + right.name, mtrx->Kron(*(right.mtrx)));
}

} // namespace Qsv
