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
 * An editable, ordered list of gates acting side by side on consecutive positions.
 *
 * Gate 0 occupies the lowest positions. The combined width never exceeds QSV_MAX_QUBITS; an edit that would break
 * this throws DimensionMismatchError and leaves the layer unchanged.
 */
class GateLayer {
protected:
    std::vector<Gate> gates;

    void ThrowIfIndexIsBad(size_t nth, size_t bound, const std::string& method) const;

public:
    GateLayer() {}
    GateLayer(const std::vector<Gate>& g);

    size_t size() const { return gates.size(); }
    bool empty() const { return gates.empty(); }
    const std::vector<Gate>& GetGates() const { return gates; }
    /// Sum of the arities of every gate in the layer
    bitLenInt GetArity() const;

    const Gate& GetNthGate(size_t nth) const;
    /// Insert "g" so that it becomes the nth gate; nth may equal size() to append.
    void InsertGate(const Gate& g, size_t nth);
    void DeleteGate(size_t nth);

    /// The whole layer as one uncontrolled gate
    Gate ToGate() const { return Gate::Layer(gates); }
    /// Kronecker product of the gate matrices, gate 0 as the most significant factor
    QMatrix GetLayerMatrix() const { return ToGate().GetMatrix(); }
};

} // namespace Qsv
