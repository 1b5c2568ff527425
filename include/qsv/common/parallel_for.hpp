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

#include "qsv_functions.hpp"

namespace Qsv {

class StateVector;

class ParallelFor {
private:
    const bitCapIntOcl pStride;
    unsigned numCores;

public:
    ParallelFor();

    void SetConcurrencyLevel(unsigned num) { numCores = num ? num : 1U; }
    unsigned GetConcurrencyLevel() { return numCores; }
    bitCapIntOcl GetStride() { return pStride; }

    /*
     * Parallelization routines for spreading work across multiple cores.
     */

    /**
     * Iterate through the permutations a maximum of end-begin times, allowing
     * the caller to control the incrementation offset through 'inc'.
     */
    void par_for_inc(const bitCapIntOcl begin, const bitCapIntOcl itemCount, IncrementFunc, ParallelFunc fn);

    /** Call fn once for every numerical value between begin and end. */
    void par_for(const bitCapIntOcl begin, const bitCapIntOcl end, ParallelFunc fn);

    /** Calculate the sum of squared magnitudes of a state vector's amplitudes. */
    real1_f par_norm(const StateVector& stateVec);
};

} // namespace Qsv
