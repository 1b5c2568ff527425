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

#include "statevector.hpp"
#include "qerrors.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace Qsv {

StateVector::StateVector(bitLenInt qbCount)
    : qubitCount(qbCount)
{
    if (!qubitCount) {
        throw DimensionMismatchError("StateVector must span at least one qubit!");
    }

    amplitudes.resize(pow2Ocl(qubitCount), ZERO_CMPLX);
    amplitudes[0U] = ONE_CMPLX;
}

StateVector::StateVector(const std::vector<complex>& amps, bool doNormCheck)
    : StateVector(std::vector<complex>(amps), doNormCheck)
{
}

StateVector::StateVector(std::vector<complex>&& amps, bool doNormCheck)
    : qubitCount(0U)
    , amplitudes(std::move(amps))
{
    if ((amplitudes.size() < 2U) || !isPowerOfTwoOcl(amplitudes.size())) {
        throw DimensionMismatchError("StateVector amplitude count must be a power of two, at least 2!");
    }
    qubitCount = log2Ocl(amplitudes.size());

    if (doNormCheck && !IsNormalized(_qsv_norm_epsilon)) {
        std::ostringstream oss;
        oss << "StateVector amplitudes must have unit norm! (Sum of squared magnitudes was " << SumSqr() << ")";
        throw InvalidStateError(oss.str());
    }
}

void StateVector::get_probs(real1* outArray) const
{
    for (bitCapIntOcl i = 0U; i < amplitudes.size(); ++i) {
        outArray[i] = norm(amplitudes[i]);
    }
}

std::vector<real1> StateVector::GetProbs() const
{
    std::vector<real1> toRet(amplitudes.size());
    get_probs(toRet.data());

    return toRet;
}

real1_f StateVector::SumSqr() const
{
    real1_f nrm = ZERO_R1_F;
    for (bitCapIntOcl i = 0U; i < amplitudes.size(); ++i) {
        nrm += (real1_f)norm(amplitudes[i]);
    }

    return nrm;
}

bool StateVector::IsNormalized(real1_f tol) const { return std::abs(SumSqr() - ONE_R1_F) <= tol; }

StateVector StateVector::Tensor(const StateVector& right) const
{
    const bitCapIntOcl rightPower = right.GetMaxQPower();
    std::vector<complex> toRet(amplitudes.size() * rightPower);
    for (bitCapIntOcl i = 0U; i < amplitudes.size(); ++i) {
        for (bitCapIntOcl j = 0U; j < rightPower; ++j) {
            toRet[i * rightPower + j] = amplitudes[i] * right.amplitudes[j];
        }
    }

    return StateVector(std::move(toRet), false);
}

void StateVector::ApplyM(const bitCapIntOcl& regMask, const bitCapIntOcl& result, const complex& nrm)
{
    for (bitCapIntOcl i = 0U; i < amplitudes.size(); ++i) {
        amplitudes[i] = ((i & regMask) == result) ? (nrm * amplitudes[i]) : ZERO_CMPLX;
    }
}

void StateVector::NormalizeState(real1_f nrm)
{
    if (nrm <= ZERO_R1_F) {
        nrm = SumSqr();
    }
    if (nrm <= ZERO_R1_F) {
        throw std::runtime_error("StateVector::NormalizeState() called on a zero vector!");
    }

    const real1 scale = (real1)(ONE_R1_F / std::sqrt(nrm));
    for (bitCapIntOcl i = 0U; i < amplitudes.size(); ++i) {
        amplitudes[i] *= scale;
    }
}

void StateVector::swap(StateVector& other)
{
    if (qubitCount != other.qubitCount) {
        throw DimensionMismatchError("StateVector::swap() requires equal qubit counts!");
    }

    amplitudes.swap(other.amplitudes);
}

real1_f StateVector::MaxDeviation(const StateVector& other) const
{
    if (qubitCount != other.qubitCount) {
        throw DimensionMismatchError("StateVector::MaxDeviation() requires equal qubit counts!");
    }

    real1_f toRet = ZERO_R1_F;
    for (bitCapIntOcl i = 0U; i < amplitudes.size(); ++i) {
        const real1_f d = (real1_f)std::abs(amplitudes[i] - other.amplitudes[i]);
        if (d > toRet) {
            toRet = d;
        }
    }

    return toRet;
}

std::string ComplexToString(const complex& c)
{
    // Avoid printing "-0.0000" for tiny negative rounding residue.
    const real1 re = (std::abs(real(c)) < (real1)5e-5) ? ZERO_R1 : real(c);
    const real1 im = (std::abs(imag(c)) < (real1)5e-5) ? ZERO_R1 : imag(c);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << "(" << re << std::showpos << im << std::noshowpos << "i)";

    return oss.str();
}

std::string StateVector::ToString() const
{
    std::ostringstream oss;
    oss << "|Ψ> = ";
    for (bitCapIntOcl i = 0U; i < amplitudes.size(); ++i) {
        if (i) {
            oss << " + ";
        }
        oss << ComplexToString(amplitudes[i]) << "|";
        for (bitLenInt q = 0U; q < qubitCount; ++q) {
            oss << ((i & posPowOcl(q, qubitCount)) ? "1" : "0");
        }
        oss << ">";
    }

    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const StateVector& sv) { return os << sv.ToString(); }

} // namespace Qsv
