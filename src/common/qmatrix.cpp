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

#include "common/qmatrix.hpp"

#include <cmath>

namespace Qsv {

QMatrix::QMatrix(std::initializer_list<complex> m)
    : dim((bitCapIntOcl)(std::sqrt((double)m.size()) + 0.5))
    , mtrx(m)
{
    if ((dim * dim) != mtrx.size()) {
        throw std::invalid_argument("QMatrix initializer element count must be a perfect square!");
    }
}

QMatrix::QMatrix(const std::vector<std::vector<complex>>& rows)
    : dim(rows.size())
{
    mtrx.reserve(dim * dim);
    for (size_t i = 0U; i < rows.size(); ++i) {
        if (rows[i].size() != dim) {
            throw std::invalid_argument("QMatrix rows must all be as long as the row count!");
        }
        mtrx.insert(mtrx.end(), rows[i].begin(), rows[i].end());
    }
}

QMatrix QMatrix::Identity(bitCapIntOcl d)
{
    QMatrix toRet(d);
    for (bitCapIntOcl i = 0U; i < d; ++i) {
        toRet(i, i) = ONE_CMPLX;
    }

    return toRet;
}

QMatrix QMatrix::Kron(const QMatrix& right) const
{
    const bitCapIntOcl rDim = right.dim;
    QMatrix toRet(dim * rDim);
    for (bitCapIntOcl i = 0U; i < dim; ++i) {
        for (bitCapIntOcl j = 0U; j < dim; ++j) {
            const complex a = (*this)(i, j);
            if (a == ZERO_CMPLX) {
                continue;
            }
            for (bitCapIntOcl r = 0U; r < rDim; ++r) {
                for (bitCapIntOcl s = 0U; s < rDim; ++s) {
                    toRet(i * rDim + r, j * rDim + s) = a * right(r, s);
                }
            }
        }
    }

    return toRet;
}

QMatrix QMatrix::operator*(const QMatrix& right) const
{
    if (dim != right.dim) {
        throw std::invalid_argument("QMatrix::operator* dimensions do not match!");
    }

    QMatrix toRet(dim);
    for (bitCapIntOcl i = 0U; i < dim; ++i) {
        for (bitCapIntOcl k = 0U; k < dim; ++k) {
            const complex aik = (*this)(i, k);
            if (aik == ZERO_CMPLX) {
                continue;
            }
            for (bitCapIntOcl j = 0U; j < dim; ++j) {
                toRet(i, j) += aik * right(k, j);
            }
        }
    }

    return toRet;
}

QMatrix QMatrix::Adjoint() const
{
    QMatrix toRet(dim);
    for (bitCapIntOcl i = 0U; i < dim; ++i) {
        for (bitCapIntOcl j = 0U; j < dim; ++j) {
            toRet(j, i) = std::conj((*this)(i, j));
        }
    }

    return toRet;
}

QMatrix QMatrix::DirectSum(bitCapIntOcl identityDim, const QMatrix& target)
{
    const bitCapIntOcl tDim = target.GetDimension();
    QMatrix toRet = Identity(identityDim + tDim);
    for (bitCapIntOcl i = 0U; i < tDim; ++i) {
        for (bitCapIntOcl j = 0U; j < tDim; ++j) {
            toRet(identityDim + i, identityDim + j) = target(i, j);
        }
    }

    return toRet;
}

real1_f QMatrix::MaxDeviation(const QMatrix& other) const
{
    if (dim != other.dim) {
        throw std::invalid_argument("QMatrix::MaxDeviation dimensions do not match!");
    }

    real1_f toRet = ZERO_R1_F;
    for (size_t i = 0U; i < mtrx.size(); ++i) {
        const real1_f d = (real1_f)std::abs(mtrx[i] - other.mtrx[i]);
        if (d > toRet) {
            toRet = d;
        }
    }

    return toRet;
}

bool QMatrix::IsUnitary(real1_f tol) const
{
    if (!dim) {
        return false;
    }

    return ((*this) * Adjoint()).MaxDeviation(Identity(dim)) <= tol;
}

} // namespace Qsv
