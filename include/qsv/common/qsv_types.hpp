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

#define _USE_MATH_DEFINES

#include "config.h"

#include <complex>
#include <functional>
#include <limits>
#include <math.h>
#include <memory>
#include <random>
#include <stdint.h>

#define bitLenInt uint8_t
#define bitCapInt uint64_t
#define bitCapIntOcl uint64_t

namespace Qsv {

#if FPPOW < 6
typedef float real1;
typedef float real1_f;
#else
typedef double real1;
typedef double real1_f;
#endif

typedef std::complex<real1> complex;
const bitCapInt ONE_BCI = 1U;
const bitCapInt ZERO_BCI = 0U;

// Called once per value between begin and end.
typedef std::function<void(const bitCapIntOcl&, const unsigned& cpu)> ParallelFunc;
typedef std::function<bitCapIntOcl(const bitCapIntOcl&)> IncrementFunc;

class QMatrix;
typedef std::shared_ptr<const QMatrix> QMatrixConstPtr;

#define qsv_rand_gen std::mt19937_64
#define qsv_rand_gen_ptr std::shared_ptr<qsv_rand_gen>

#if FPPOW < 6
#define ZERO_R1 0.0f
#define ZERO_R1_F 0.0f
#define ONE_R1 1.0f
#define ONE_R1_F 1.0f
constexpr real1 PI_R1 = (real1)M_PI;
constexpr real1 SQRT1_2_R1 = (real1)M_SQRT1_2;
// Tolerance on |<psi|psi>| - 1 for a state to count as normalized
#define QSV_DEFAULT_NORM_EPSILON 1e-5f
// Past this, accumulated rounding is treated as a fault rather than renormalized away
#define QSV_DEFAULT_DRIFT_TOLERANCE 1e-3f
#else
#define ZERO_R1 0.0
#define ZERO_R1_F 0.0
#define ONE_R1 1.0
#define ONE_R1_F 1.0
#define PI_R1 M_PI
#define SQRT1_2_R1 M_SQRT1_2
// Tolerance on |<psi|psi>| - 1 for a state to count as normalized
#define QSV_DEFAULT_NORM_EPSILON 1e-9
// Past this, accumulated rounding is treated as a fault rather than renormalized away
#define QSV_DEFAULT_DRIFT_TOLERANCE 1e-6
#endif

constexpr complex ONE_CMPLX = complex(ONE_R1, ZERO_R1);
constexpr complex ZERO_CMPLX = complex(ZERO_R1, ZERO_R1);
constexpr complex I_CMPLX = complex(ZERO_R1, ONE_R1);
constexpr real1 FP_NORM_EPSILON = (real1)(std::numeric_limits<real1>::epsilon() / 2);
} // namespace Qsv
