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

#include "common/qsv_functions.hpp"

#include <algorithm>
#include <iterator>
#include <ostream>
#include <string>
#include <vector>

namespace Qsv {

/**
 * The amplitude container for an n-qubit pure state, with 2^n entries.
 *
 * Entry i is the amplitude of the basis state whose binary expansion is i, read with qubit position 0 as the most
 * significant bit. Index 0 is always |00...0>. A StateVector is a value: copies are deep, and the only in-place
 * mutations are collapse (ApplyM), renormalization, and wholesale exchange with another vector of the same size.
 */
class StateVector {
protected:
    bitLenInt qubitCount;
    std::vector<complex> amplitudes;

public:
    /**
     * Restartable, lazily evaluated sequence of |amplitude|^2 over basis indices.
     *
     * Nothing is computed until an iterator is dereferenced, and every call to begin() starts a fresh pass. The view
     * reads through to its StateVector, which must outlive it.
     */
    class ProbabilityView {
    protected:
        const StateVector* sv;

    public:
        class const_iterator {
        protected:
            const StateVector* sv;
            bitCapIntOcl i;

        public:
            typedef std::input_iterator_tag iterator_category;
            typedef real1 value_type;
            typedef std::ptrdiff_t difference_type;
            typedef const real1* pointer;
            typedef real1 reference;

            const_iterator(const StateVector* s, bitCapIntOcl idx)
                : sv(s)
                , i(idx)
            {
            }

            real1 operator*() const { return norm(sv->read(i)); }
            const_iterator& operator++()
            {
                ++i;
                return *this;
            }
            const_iterator operator++(int)
            {
                const_iterator toRet = *this;
                ++i;
                return toRet;
            }
            bool operator==(const const_iterator& o) const { return (sv == o.sv) && (i == o.i); }
            bool operator!=(const const_iterator& o) const { return !(*this == o); }
        };

        ProbabilityView(const StateVector* s)
            : sv(s)
        {
        }

        const_iterator begin() const { return const_iterator(sv, 0U); }
        const_iterator end() const { return const_iterator(sv, sv->GetMaxQPower()); }
        bitCapIntOcl size() const { return sv->GetMaxQPower(); }
    };

    /// |00...0> on the given number of qubits
    StateVector(bitLenInt qubitCount);

    /**
     * Wrap a list of amplitudes. The length must be a power of two, at least 2, or DimensionMismatchError is thrown.
     * If doNormCheck is set, a vector whose norm is not 1 to within the normalization epsilon throws
     * InvalidStateError.
     */
    StateVector(const std::vector<complex>& amps, bool doNormCheck = true);
    StateVector(std::vector<complex>&& amps, bool doNormCheck = true);

    bitLenInt GetQubitCount() const { return qubitCount; }
    bitCapIntOcl GetMaxQPower() const { return amplitudes.size(); }

    complex read(const bitCapIntOcl& i) const { return amplitudes[i]; }
    const complex* data() const { return amplitudes.data(); }
    const std::vector<complex>& GetAmplitudes() const { return amplitudes; }
    void copy_out(complex* outArray) const { std::copy(amplitudes.begin(), amplitudes.end(), outArray); }

    ProbabilityView Probabilities() const { return ProbabilityView(this); }
    void get_probs(real1* outArray) const;
    std::vector<real1> GetProbs() const;

    /// Sum of squared magnitudes
    real1_f SumSqr() const;
    bool IsNormalized(real1_f tol) const;

    /**
     * Kronecker product of this state with "right". This state supplies the high (most significant) bits, so its
     * qubits keep their positions and the qubits of "right" follow them.
     */
    StateVector Tensor(const StateVector& right) const;

    /**
     * Zero every amplitude whose bits under regMask differ from "result", and multiply the survivors by nrm.
     * This is the collapse step of measurement.
     */
    void ApplyM(const bitCapIntOcl& regMask, const bitCapIntOcl& result, const complex& nrm);

    /// Divide through by the square root of nrm (or of the current norm, if nrm is not positive).
    void NormalizeState(real1_f nrm = -ONE_R1_F);

    /// Exchange contents with a vector over the same qubit count.
    void swap(StateVector& other);

    bool operator==(const StateVector& other) const { return amplitudes == other.amplitudes; }
    bool operator!=(const StateVector& other) const { return !(*this == other); }

    /// Largest elementwise magnitude of (this - other)
    real1_f MaxDeviation(const StateVector& other) const;

    std::string ToString() const;
};

std::ostream& operator<<(std::ostream& os, const StateVector& sv);

/// "(0.7071-0.7071i)" style, four decimal places
std::string ComplexToString(const complex& c);

} // namespace Qsv
