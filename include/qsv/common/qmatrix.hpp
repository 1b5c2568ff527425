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

#include "qsv_functions.hpp"

#include <initializer_list>
#include <vector>

namespace Qsv {

/**
 * Square, row-major, dense complex matrix.
 *
 * Element (row, col) lives at row * dim + col. Every operator in the library is materialized as one of these; the
 * dimension of a k-qubit operator is 2^k.
 */
class QMatrix {
protected:
    bitCapIntOcl dim;
    std::vector<complex> mtrx;

public:
    QMatrix()
        : dim(0U)
    {
    }

    /// Zero matrix of the given dimension
    explicit QMatrix(bitCapIntOcl d)
        : dim(d)
        , mtrx(d * d, ZERO_CMPLX)
    {
    }

    QMatrix(bitCapIntOcl d, const complex* m)
        : dim(d)
        , mtrx(m, m + d * d)
    {
    }

    /// Row-major elements; the element count must be a perfect square.
    QMatrix(std::initializer_list<complex> m);

    /// Nested rows; every row must be as long as the row count.
    QMatrix(const std::vector<std::vector<complex>>& rows);

    static QMatrix Identity(bitCapIntOcl d);

    bitCapIntOcl GetDimension() const { return dim; }
    const complex* data() const { return mtrx.data(); }
    complex* data() { return mtrx.data(); }

    complex& operator()(const bitCapIntOcl& row, const bitCapIntOcl& col) { return mtrx[row * dim + col]; }
    const complex& operator()(const bitCapIntOcl& row, const bitCapIntOcl& col) const
    {
        return mtrx[row * dim + col];
    }

    /// Kronecker product, with this matrix as the left (more significant) factor
    QMatrix Kron(const QMatrix& right) const;

    /// Ordinary matrix product, this * right
    QMatrix operator*(const QMatrix& right) const;

    /// Conjugate transpose
    QMatrix Adjoint() const;

    /// Block-diagonal embedding: identity on the leading (dim - target) basis states, "target" on the trailing ones
    static QMatrix DirectSum(bitCapIntOcl identityDim, const QMatrix& target);

    /// Inner product of a row of this matrix against a column vector
    complex RowDot(const bitCapIntOcl& row, const complex* vec) const
    {
        const complex* r = mtrx.data() + row * dim;
        complex toRet = ZERO_CMPLX;
        for (bitCapIntOcl j = 0U; j < dim; ++j) {
            toRet += r[j] * vec[j];
        }
        return toRet;
    }

    /// Largest elementwise magnitude of (this - other)
    real1_f MaxDeviation(const QMatrix& other) const;

    /// True if M * M^dagger is the identity to within tol, elementwise
    bool IsUnitary(real1_f tol) const;
};

} // namespace Qsv
