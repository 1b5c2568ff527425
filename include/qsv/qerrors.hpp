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

#include <stdexcept>
#include <string>

namespace Qsv {

/// Amplitudes supplied at construction do not have unit norm.
class InvalidStateError : public std::invalid_argument {
public:
    InvalidStateError(const std::string& message)
        : std::invalid_argument(message)
    {
    }
};

/// A gate matrix failed the M * M^dagger = I check.
class NonUnitaryGateError : public std::invalid_argument {
public:
    NonUnitaryGateError(const std::string& message)
        : std::invalid_argument(message)
    {
    }
};

/// Position count, gate arity, matrix shape, or qubit index disagree.
class DimensionMismatchError : public std::invalid_argument {
public:
    DimensionMismatchError(const std::string& message)
        : std::invalid_argument(message)
    {
    }
};

class EmptyRegisterError : public std::invalid_argument {
public:
    EmptyRegisterError(const std::string& message)
        : std::invalid_argument(message)
    {
    }
};

/// Norm wandered past the safety tolerance; the operation that caused it was not committed.
class NormalizationDriftError : public std::runtime_error {
public:
    NormalizationDriftError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

/// The sampled outcome carried no probability mass to renormalize by.
class MeasurementSamplingError : public std::runtime_error {
public:
    MeasurementSamplingError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

} // namespace Qsv
