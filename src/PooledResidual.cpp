#include "clumpfit/PooledResidual.hpp"

namespace clumpfit {

PooledResidual::PooledResidual(std::vector<PooledRow>  rows,
                               const ParameterIndexer& indexer,
                               const ConstraintMap&    constraints)
    : rows_(std::move(rows))
    , indexer_(indexer)
    , map_(constraints)
{}

void PooledResidual::evaluate_full(const Vector& p, Vector& r, Matrix* J) const
{
    const int m = numResiduals();
    r.resize(m);
    if (J) J->setZero(m, indexer_.total());

    for (int i = 0; i < m; ++i) {
        const PooledRow& row = rows_[i];
        const int base = indexer_.session_param(row.session, 0);
        const double a  = p[base + 0], b  = p[base + 1], c  = p[base + 2];
        const double a2 = p[base + 3], b2 = p[base + 4], c2 = p[base + 5];

        const int    ju  = row.unknown >= 0 ? indexer_.unknown(row.unknown) : -1;
        const double ref = ju >= 0 ? p[ju] : row.nominal;

        const double model = a * ref + b * row.d + c
                           + row.t * (a2 * ref + b2 * row.d + c2);
        r[i] = (row.raw - model) / row.w;

        if (!J) continue;
        const double iw = -1.0 / row.w;
        (*J)(i, base + 0) = iw * ref;
        (*J)(i, base + 1) = iw * row.d;
        (*J)(i, base + 2) = iw;
        (*J)(i, base + 3) = iw * row.t * ref;
        (*J)(i, base + 4) = iw * row.t * row.d;
        (*J)(i, base + 5) = iw * row.t;
        if (ju >= 0) (*J)(i, ju) = iw * (a + a2 * row.t);
    }
}

void PooledResidual::operator()(const Vector& u, Vector* residuals, Matrix* jacobian) const
{
    const Vector p = map_.expand(u);
    Vector r;
    if (jacobian) {
        Matrix Jfull;
        evaluate_full(p, r, &Jfull);
        *jacobian = Jfull * map_.M();        // chain rule through the affine map
    } else {
        evaluate_full(p, r, nullptr);
    }
    if (residuals) *residuals = std::move(r);
}

} // namespace clumpfit
