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

#include "qsampler.hpp"
#include "qerrors.hpp"

#include <cmath>
#include <ctime>
#include <iostream>

#if SEED_DEVRAND
#include <sys/random.h>
#endif

namespace Qsv {

MeasurementSampler::MeasurementSampler(qsv_rand_gen_ptr rgp)
    : rand_generator(rgp)
    , rand_distribution(ZERO_R1_F, ONE_R1_F)
{
    if (rand_generator) {
        return;
    }

    rand_generator = std::make_shared<qsv_rand_gen>();
    uint32_t randomSeed;
#if SEED_DEVRAND
    constexpr int max_devrand_tries = 10;
    int i;
    for (i = 0; i < max_devrand_tries; ++i) {
        if (sizeof(randomSeed) == getrandom(reinterpret_cast<char*>(&randomSeed), sizeof(randomSeed), GRND_RANDOM)) {
            break;
        }
    }
    if (i == max_devrand_tries) {
        throw std::runtime_error("Failed to seed RNG!");
    }
    if (_qsv_verbose) {
        std::cerr << "MeasurementSampler seeded from getrandom()" << std::endl;
    }
#else
    randomSeed = (uint32_t)std::time(0);
    if (_qsv_verbose) {
        std::cerr << "MeasurementSampler seeded from system clock: " << randomSeed << std::endl;
    }
#endif
    SetRandomSeed(randomSeed);
}

std::vector<real1> MeasurementSampler::ProbMaskAll(const StateVector& sv, const std::vector<bitLenInt>& positions)
{
    const bitLenInt qubitCount = sv.GetQubitCount();
    ThrowIfQbIdArrayIsBad(
        positions, qubitCount, "MeasurementSampler positions must be within allocated qubit bounds!");

    const bitLenInt length = positions.size();
    std::vector<bitCapIntOcl> qPowers(length);
    for (bitLenInt p = 0U; p < length; ++p) {
        qPowers[p] = posPowOcl(positions[p], qubitCount);
    }

    std::vector<real1> probs(pow2Ocl(length), ZERO_R1);
    const bitCapIntOcl maxQPower = sv.GetMaxQPower();
    for (bitCapIntOcl i = 0U; i < maxQPower; ++i) {
        bitCapIntOcl assignment = 0U;
        for (bitLenInt p = 0U; p < length; ++p) {
            if (i & qPowers[p]) {
                assignment |= pow2Ocl(length - 1U - p);
            }
        }
        probs[assignment] += norm(sv.read(i));
    }

    return probs;
}

real1_f MeasurementSampler::Prob(const StateVector& sv, bitLenInt position)
{
    return (real1_f)ProbMaskAll(sv, std::vector<bitLenInt>{ position })[1U];
}

bitCapIntOcl MeasurementSampler::Draw(const std::vector<real1>& probs)
{
    const real1_f prob = Rand();
    const bitCapIntOcl lengthPower = probs.size();

    // Outcomes with only rounding residue are never drawn. If the walk runs off the end because the
    // probabilities sum to slightly less than the variate, the last outcome with real mass is taken.
    bitCapIntOcl result = lengthPower;
    bitCapIntOcl lastNonZero = lengthPower;
    real1_f lowerProb = ZERO_R1_F;
    for (bitCapIntOcl lcv = 0U; lcv < lengthPower; ++lcv) {
        if (probs[lcv] <= FP_NORM_EPSILON) {
            continue;
        }
        lastNonZero = lcv;
        lowerProb += (real1_f)probs[lcv];
        if (prob < lowerProb) {
            result = lcv;
            break;
        }
    }

    if (result == lengthPower) {
        result = lastNonZero;
    }

    if (result == lengthPower) {
        throw MeasurementSamplingError("MeasurementSampler found no outcome with nonzero probability!");
    }

    return result;
}

bitCapInt MeasurementSampler::Measure(StateVector& sv, const std::vector<bitLenInt>& positions)
{
    if (positions.empty()) {
        return ZERO_BCI;
    }

    const std::vector<real1> probs = ProbMaskAll(sv, positions);
    const bitCapIntOcl result = Draw(probs);
    const real1_f nrmlzr = (real1_f)probs[result];
    if (nrmlzr <= FP_NORM_EPSILON) {
        throw MeasurementSamplingError("MeasurementSampler drew an outcome with 0 probability!");
    }

    const bitLenInt qubitCount = sv.GetQubitCount();
    const bitLenInt length = positions.size();
    bitCapIntOcl regMask = 0U;
    bitCapIntOcl resultPerm = 0U;
    for (bitLenInt p = 0U; p < length; ++p) {
        const bitCapIntOcl qPower = posPowOcl(positions[p], qubitCount);
        regMask |= qPower;
        if (result & pow2Ocl(length - 1U - p)) {
            resultPerm |= qPower;
        }
    }

    sv.ApplyM(regMask, resultPerm, complex((real1)(ONE_R1_F / std::sqrt(nrmlzr)), ZERO_R1));

    return (bitCapInt)result;
}

std::map<bitCapInt, int> MeasurementSampler::MultiShot(
    const StateVector& sv, const std::vector<bitLenInt>& positions, unsigned shots)
{
    std::map<bitCapInt, int> results;
    if (!shots) {
        return results;
    }

    const std::vector<real1> probs = ProbMaskAll(sv, positions);
    for (unsigned shot = 0U; shot < shots; ++shot) {
        ++(results[(bitCapInt)Draw(probs)]);
    }

    return results;
}

std::vector<bool> MeasurementSampler::AssignmentToBits(const bitCapInt& assignment, bitLenInt length)
{
    std::vector<bool> bits(length);
    for (bitLenInt p = 0U; p < length; ++p) {
        bits[p] = (assignment >> (length - 1U - p)) & 1U;
    }

    return bits;
}

} // namespace Qsv
