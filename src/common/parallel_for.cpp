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

#include "common/parallel_for.hpp"
#include "statevector.hpp"

#if ENABLE_PTHREAD
#include <atomic>
#include <future>
#include <thread>

#define DECLARE_ATOMIC_BITCAPINT() std::atomic<bitCapIntOcl> idx;
#define ATOMIC_ASYNC(...)                                                                                              \
    std::async(std::launch::async, [__VA_ARGS__]()
#define ATOMIC_INC() i = idx++;
#endif

namespace Qsv {

ParallelFor::ParallelFor()
    : pStride(pow2Ocl(PSTRIDEPOW_DEFAULT))
#if ENABLE_PTHREAD
    , numCores(std::thread::hardware_concurrency())
#else
    , numCores(1U)
#endif
{
    if (!numCores) {
        numCores = 1U;
    }
}

void ParallelFor::par_for(const bitCapIntOcl begin, const bitCapIntOcl end, ParallelFunc fn)
{
    par_for_inc(
        begin, end - begin, [](const bitCapIntOcl& i) { return i; }, fn);
}

#if ENABLE_PTHREAD
void ParallelFor::par_for_inc(
    const bitCapIntOcl begin, const bitCapIntOcl itemCount, IncrementFunc inc, ParallelFunc fn)
{
    const bitCapIntOcl Stride = pStride;
    unsigned threads = (unsigned)(itemCount / pStride);
    if (threads > numCores) {
        threads = numCores;
    }

    if (threads <= 1U) {
        const bitCapIntOcl maxLcv = begin + itemCount;
        for (bitCapIntOcl j = begin; j < maxLcv; ++j) {
            fn(inc(j), 0U);
        }
        return;
    }

    DECLARE_ATOMIC_BITCAPINT();
    idx = 0U;
    std::vector<std::future<void>> futures;
    futures.reserve(threads);
    for (unsigned cpu = 0U; cpu != threads; ++cpu) {
        futures.emplace_back(ATOMIC_ASYNC(cpu, &idx, &begin, &itemCount, &Stride, inc, fn) {
            for (;;) {
                bitCapIntOcl i;
                ATOMIC_INC();
                const bitCapIntOcl l = i * Stride;
                if (l >= itemCount) {
                    break;
                }
                const bitCapIntOcl maxJ = ((l + Stride) < itemCount) ? Stride : (itemCount - l);
                for (bitCapIntOcl j = 0U; j < maxJ; ++j) {
                    fn(inc(begin + j + l), cpu);
                }
            }
        }));
    }

    for (unsigned cpu = 0U; cpu != threads; ++cpu) {
        futures[cpu].get();
    }
}

real1_f ParallelFor::par_norm(const StateVector& stateVec)
{
    const bitCapIntOcl itemCount = stateVec.GetMaxQPower();
    const bitCapIntOcl Stride = pStride;
    unsigned threads = (unsigned)(itemCount / pStride);
    if (threads > numCores) {
        threads = numCores;
    }

    if (threads <= 1U) {
        real1 nrmSqr = ZERO_R1;
        for (bitCapIntOcl j = 0U; j < itemCount; ++j) {
            nrmSqr += norm(stateVec.read(j));
        }

        return (real1_f)nrmSqr;
    }

    DECLARE_ATOMIC_BITCAPINT();
    idx = 0U;
    std::vector<std::future<real1_f>> futures;
    futures.reserve(threads);
    for (unsigned cpu = 0U; cpu != threads; ++cpu) {
        futures.emplace_back(ATOMIC_ASYNC(&idx, &itemCount, &Stride, &stateVec) {
            real1 sqrNorm = ZERO_R1;
            for (;;) {
                bitCapIntOcl i;
                ATOMIC_INC();
                const bitCapIntOcl l = i * Stride;
                if (l >= itemCount) {
                    break;
                }
                const bitCapIntOcl maxJ = ((l + Stride) < itemCount) ? Stride : (itemCount - l);
                for (bitCapIntOcl j = 0U; j < maxJ; ++j) {
                    sqrNorm += norm(stateVec.read(l + j));
                }
            }
            return (real1_f)sqrNorm;
        }));
    }

    real1_f nrmSqr = ZERO_R1_F;
    for (unsigned cpu = 0U; cpu != threads; ++cpu) {
        nrmSqr += futures[cpu].get();
    }

    return nrmSqr;
}
#else
void ParallelFor::par_for_inc(
    const bitCapIntOcl begin, const bitCapIntOcl itemCount, IncrementFunc inc, ParallelFunc fn)
{
    const bitCapIntOcl maxLcv = begin + itemCount;
    for (bitCapIntOcl j = begin; j < maxLcv; ++j) {
        fn(inc(j), 0U);
    }
}

real1_f ParallelFor::par_norm(const StateVector& stateVec)
{
    const bitCapIntOcl itemCount = stateVec.GetMaxQPower();
    real1 nrmSqr = ZERO_R1;
    for (bitCapIntOcl j = 0U; j < itemCount; ++j) {
        nrmSqr += norm(stateVec.read(j));
    }

    return (real1_f)nrmSqr;
}
#endif
} // namespace Qsv
