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

#include "common/qmatrix.hpp"
#include "statevector.hpp"

#include <string>
#include <vector>

namespace Qsv {

/**
 * Closed set of gate variants. Every catalog factory produces its own tag; GATE_CUSTOM covers user-supplied matrices
 * and everything derived from gate algebra (adjoints of non-self-inverse gates, powers, tensor products and layers).
 */
enum GateKind {
    GATE_IDENTITY = 0,
    GATE_X,
    GATE_Y,
    GATE_Z,
    GATE_H,
    GATE_SQRT_NOT,
    GATE_S,
    GATE_T,
    GATE_PHASE,
    GATE_RX,
    GATE_RY,
    GATE_RZ,
    GATE_SWAP,
    GATE_SQRT_SWAP,
    GATE_ISING,
    GATE_CNOT,
    GATE_CZ,
    GATE_CPHASE,
    GATE_TOFFOLI,
    GATE_FREDKIN,
    GATE_CONTROLLED,
    GATE_CUSTOM
};

/**
 * An immutable unitary operator on k qubits, k >= 1.
 *
 * A gate with controlCount c > 0 acts on c control positions followed by (k - c) target positions. Its matrix is
 * block structured: identity wherever any control reads 0, and the target matrix on the subspace where every control
 * reads 1. Both matrices are built and checked for unitarity once, in the constructor; a Gate cannot be observed in a
 * non-unitary state.
 */
class Gate {
protected:
    GateKind kind;
    std::string name;
    bitLenInt arity;
    bitLenInt controlCount;
    bool hasParam;
    real1_f param;
    QMatrixConstPtr targetMtrx;
    QMatrixConstPtr mtrx;

    Gate(GateKind k, const std::string& n, const QMatrix& target, bitLenInt controls = 0U, bool hasP = false,
        real1_f p = ZERO_R1_F);

public:
    /** @name Catalog */
    ///@{
    static Gate Identity(bitLenInt qubits = 1U);
    /// Pauli X, the quantum NOT
    static Gate X();
    static Gate Y();
    static Gate Z();
    static Gate H();
    /// Square root of NOT, 1/2 [[1+i, 1-i], [1-i, 1+i]]
    static Gate SqrtNot();
    /// diag(1, i)
    static Gate S();
    /// diag(1, e^(i pi/4)), the "pi/8" gate
    static Gate T();
    /// diag(1, e^(i angle))
    static Gate Phase(real1_f angle);
    static Gate RX(real1_f angle);
    static Gate RY(real1_f angle);
    static Gate RZ(real1_f angle);
    static Gate Swap();
    static Gate SqrtSwap();
    static Gate Ising(real1_f phi);
    static Gate CNOT();
    static Gate CZ();
    /// Controlled diag(1, e^(i angle)); the default angle gives diag(1, 1, 1, i).
    static Gate CPhase(real1_f angle = (real1_f)(PI_R1 / 2));
    static Gate Toffoli();
    /// Controlled swap
    static Gate Fredkin();
    ///@}

    /** Add controlCount control positions in front of "target". */
    static Gate Controlled(const Gate& target, bitLenInt controlCount = 1U);

    /**
     * Wrap an arbitrary square matrix. Throws DimensionMismatchError unless the dimension is a power of two, at
     * least 2, and NonUnitaryGateError if M * M^dagger differs from identity by more than the normalization epsilon.
     */
    static Gate Custom(const QMatrix& matrix, const std::string& name = "U");
    /// As above, also checking that the matrix spans "arity" qubits.
    static Gate Custom(const QMatrix& matrix, const std::string& name, bitLenInt arity);
    static Gate Custom(const std::vector<std::vector<complex>>& matrix, const std::string& name = "U");

    /** Gates acting side by side on consecutive positions, the first gate on the lowest positions. */
    static Gate Layer(const std::vector<Gate>& gates);

    GateKind GetKind() const { return kind; }
    const std::string& GetName() const { return name; }
    bitLenInt GetArity() const { return arity; }
    bitLenInt GetControlCount() const { return controlCount; }
    bitLenInt GetTargetCount() const { return arity - controlCount; }
    bool IsControlled() const { return controlCount != 0U; }
    bool HasParameter() const { return hasParam; }
    real1_f GetParameter() const { return param; }

    /// The full 2^k x 2^k operator
    const QMatrix& GetMatrix() const { return *mtrx; }
    /// Shared ownership of the full operator, which outlives this Gate
    QMatrixConstPtr GetMatrixPtr() const { return mtrx; }
    /// The operator on the target positions alone; the same as GetMatrix() for uncontrolled gates
    const QMatrix& GetTargetMatrix() const { return *targetMtrx; }

    /// M * v, without modifying v. The dimensions must agree.
    StateVector Apply(const StateVector& sv) const;

    /// The inverse gate, M^dagger
    Gate Adjoint() const;
    /// This gate applied "power" times in succession. Power(0) is the identity on the same positions.
    Gate Power(unsigned power) const;
    /// This gate on the leading positions, "right" on the positions after them
    Gate Tensor(const Gate& right) const;
};

} // namespace Qsv
