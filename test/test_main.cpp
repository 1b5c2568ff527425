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

#define CATCH_CONFIG_RUNNER /* Access to the configuration. */
#include "tests.hpp"

#include <ctime>
#include <iostream>

using namespace Qsv;

unsigned statistical_trials = 10000U;
unsigned thread_count = 0U;

int main(int argc, char* argv[])
{
    Catch::Session session;

    using namespace Catch::clara;

    auto cli = session.cli() |
        Opt(statistical_trials, "trials")["--trials"](
            "number of measurement repetitions in statistical test cases (default: 10000)") |
        Opt(thread_count, "threads")["--threads"](
            "worker threads for parallel loops in each register (default: 0, for hardware concurrency)");

    session.cli(cli);

    /* Set some defaults for convenience. */
    session.configData().useColour = Catch::UseColour::No;
    session.configData().rngSeed = std::time(0);

    /* Parse the command line. */
    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) {
        return returnCode;
    }

    session.config().stream() << "Random Seed: " << session.configData().rngSeed << std::endl;

#if ENABLE_ENV_VARS
    if (getenv("QSV_NORM_EPSILON")) {
        session.config().stream() << "QSV_NORM_EPSILON: " << std::string(getenv("QSV_NORM_EPSILON")) << std::endl;
    }
    if (getenv("QSV_DRIFT_TOLERANCE")) {
        session.config().stream() << "QSV_DRIFT_TOLERANCE: " << std::string(getenv("QSV_DRIFT_TOLERANCE"))
                                  << std::endl;
    }
#endif

    return session.run();
}

QsvTestFixture::QsvTestFixture()
{
    uint32_t rngSeed = Catch::getCurrentContext().getConfig()->rngSeed();

    std::cout << ">>> '" << Catch::getResultCapture().getCurrentTestName() << "':" << std::endl;

    if (rngSeed == 0) {
        rngSeed = std::time(0);
    }

    rng = std::make_shared<qsv_rand_gen>();
    rng->seed(rngSeed);
}

Register QsvTestFixture::MakeRegister(const std::vector<Qubit>& qubits)
{
    Register toRet = Register::Create(qubits, rng);
    if (thread_count) {
        toRet.SetConcurrencyLevel(thread_count);
    }

    return toRet;
}

Register QsvTestFixture::MakeRegister(bitLenInt qubitCount)
{
    return MakeRegister(std::vector<Qubit>(qubitCount, Qubit::FromBit(false)));
}
