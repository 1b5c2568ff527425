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

#include "qregister.hpp"

#include <iomanip>
#include <sstream>
#include <string>

/* A quick-and-dirty epsilon for clamping floating point values. */
#define QSV_TEST_EPSILON 0.5

/*
 * Options shared across test cases. Global because catch doesn't support
 * parameterization.
 */
extern unsigned statistical_trials;
extern unsigned thread_count;

/* Declare the stream-to-probability prior to including catch.hpp. */
namespace Qsv {

inline std::ostream& operator<<(std::ostream& os, const Register& qReg)
{
    os << (int)qReg.GetQubitCount() << "/";
    for (bitLenInt i = 0U; i < qReg.GetQubitCount(); ++i) {
        os << (int)(qReg.Prob(i) > QSV_TEST_EPSILON);
    }

    return os;
}

} // namespace Qsv

#include "catch2/catch.hpp"

/*
 * A fixture that hands every test case its own generator, seeded from the
 * catch session's seed, so a failing run can be replayed with --rng-seed.
 */
class QsvTestFixture {
protected:
    qsv_rand_gen_ptr rng;

    Qsv::Register MakeRegister(const std::vector<Qsv::Qubit>& qubits);
    Qsv::Register MakeRegister(bitLenInt qubitCount);

public:
    QsvTestFixture();
};

/*
 * Matches a register whose most probable reading, position 0 first, is the
 * given bit pattern.
 */
class ProbPattern : public Catch::MatcherBase<Qsv::Register> {
    std::string pattern;

public:
    ProbPattern(const std::string& p)
        : pattern(p)
    {
    }

    virtual bool match(Qsv::Register const& qReg) const override
    {
        if (pattern.size() != qReg.GetQubitCount()) {
            return false;
        }

        for (bitLenInt j = 0U; j < qReg.GetQubitCount(); ++j) {
            /* Consider anything more than a 50% probability as a '1'. */
            const bool bit = qReg.Prob(j) > QSV_TEST_EPSILON;
            if (bit != (pattern[j] == '1')) {
                return false;
            }
        }

        return true;
    }

    virtual std::string describe() const override
    {
        std::ostringstream ss;
        ss << "matches bit pattern " << pattern.size() << "/" << pattern;
        return ss.str();
    }
};

inline ProbPattern HasProbability(const std::string& p) { return ProbPattern(p); }
