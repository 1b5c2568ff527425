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

#include "qregister.hpp"
#include "qcomposer.hpp"
#include "qerrors.hpp"

#include <cmath>
#include <iostream>

namespace Qsv {

Register::Register(StateVector&& sv, qsv_rand_gen_ptr rgp)
    : qubitCount(sv.GetQubitCount())
    , state(std::move(sv))
    , sampler(rgp)
    , classical(qubitCount, false)
    , normEpsilon(_qsv_norm_epsilon)
    , driftTolerance(_qsv_drift_tolerance)
{
}

Register Register::Create(const std::vector<Qubit>& qubits, qsv_rand_gen_ptr rgp)
{
    if (qubits.empty()) {
        throw EmptyRegisterError("Register::Create() requires at least one qubit!");
    }

    if (qubits.size() > QSV_MAX_QUBITS) {
        throw std::invalid_argument("Register::Create() qubit count exceeds QSV_MAX_QUBITS!");
    }

    StateVector sv = qubits[0U].GetStateVector();
    for (size_t i = 1U; i < qubits.size(); ++i) {
        sv = sv.Tensor(qubits[i].GetStateVector());
    }

    return Register(std::move(sv), rgp);
}

Register& Register::ApplyGate(const Gate& gate, const std::vector<bitLenInt>& positions)
{
    const QMatrix op = Composer::ExpandGate(gate, positions, qubitCount);

    const bitCapIntOcl maxQPower = state.GetMaxQPower();
    std::vector<complex> out(maxQPower);
    const complex* in = state.data();
    par_for(0U, maxQPower, [&](const bitCapIntOcl& lcv, const unsigned& cpu) { out[lcv] = op.RowDot(lcv, in); });

    StateVector nStateVec(std::move(out), false);
    const real1_f nrm = par_norm(nStateVec);
    const real1_f drift = std::abs(nrm - ONE_R1_F);
    if (drift > driftTolerance) {
        throw NormalizationDriftError("Register::ApplyGate() norm drifted past tolerance after gate " +
            gate.GetName() + "!");
    }

    if (drift > normEpsilon) {
        if (_qsv_verbose) {
            std::cerr << "Register::ApplyGate() renormalizing after gate " << gate.GetName() << ", drift " << drift
                      << std::endl;
        }
        nStateVec.NormalizeState(nrm);
    }

    state.swap(nStateVec);

    for (size_t i = 0U; i < positions.size(); ++i) {
        classical[positions[i]] = false;
    }

    return *this;
}

std::vector<bool> Register::Measure(const std::vector<bitLenInt>& positions)
{
    const bitCapInt result = sampler.Measure(state, positions);

    for (size_t i = 0U; i < positions.size(); ++i) {
        classical[positions[i]] = true;
    }

    return MeasurementSampler::AssignmentToBits(result, positions.size());
}

std::vector<bool> Register::MeasureAll()
{
    std::vector<bitLenInt> positions(qubitCount);
    for (bitLenInt i = 0U; i < qubitCount; ++i) {
        positions[i] = i;
    }

    return Measure(positions);
}

real1_f Register::Prob(bitLenInt position) const
{
    if (position >= qubitCount) {
        throw DimensionMismatchError("Register::Prob position parameter must be within allocated qubit bounds!");
    }

    return MeasurementSampler::Prob(state, position);
}

real1_f Register::ProbAll(bitCapInt index) const { return (real1_f)norm(GetAmplitude(index)); }

complex Register::GetAmplitude(bitCapInt index) const
{
    if (index >= GetMaxQPower()) {
        throw DimensionMismatchError("Register::GetAmplitude index parameter must be within the basis dimension!");
    }

    return state.read((bitCapIntOcl)index);
}

bool Register::IsClassical(bitLenInt position) const
{
    if (position >= qubitCount) {
        throw DimensionMismatchError("Register::IsClassical position parameter must be within allocated qubit bounds!");
    }

    return classical[position];
}

} // namespace Qsv
