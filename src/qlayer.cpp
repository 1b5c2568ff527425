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

#include "qlayer.hpp"
#include "qerrors.hpp"

namespace Qsv {

GateLayer::GateLayer(const std::vector<Gate>& g)
    : gates(g)
{
    if (gates.empty()) {
        return;
    }

    int width = 0;
    for (size_t i = 0U; i < gates.size(); ++i) {
        width += (int)gates[i].GetArity();
    }
    ThrowIfQubitCountIsBad(width, "GateLayer() spans more qubits than QSV_MAX_QUBITS!");
}

bitLenInt GateLayer::GetArity() const
{
    bitLenInt toRet = 0U;
    for (size_t i = 0U; i < gates.size(); ++i) {
        toRet += gates[i].GetArity();
    }

    return toRet;
}

void GateLayer::ThrowIfIndexIsBad(size_t nth, size_t bound, const std::string& method) const
{
    if (nth >= bound) {
        throw std::invalid_argument("GateLayer::" + method + "() index parameter must be within the layer!");
    }
}

const Gate& GateLayer::GetNthGate(size_t nth) const
{
    ThrowIfIndexIsBad(nth, gates.size(), "GetNthGate");

    return gates[nth];
}

void GateLayer::InsertGate(const Gate& g, size_t nth)
{
    ThrowIfIndexIsBad(nth, gates.size() + 1U, "InsertGate");
    ThrowIfQubitCountIsBad((int)GetArity() + (int)g.GetArity(),
        "GateLayer::InsertGate() would span more qubits than QSV_MAX_QUBITS!");

    gates.insert(gates.begin() + nth, g);
}

void GateLayer::DeleteGate(size_t nth)
{
    ThrowIfIndexIsBad(nth, gates.size(), "DeleteGate");

    gates.erase(gates.begin() + nth);
}

} // namespace Qsv
