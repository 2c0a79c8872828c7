#pragma once
#include "ConstraintMap.hpp"
#include "ParameterIndexer.hpp"
#include "Types.hpp"
#include <vector>

namespace clumpfit {

/* ------------------------------------------------------------------------- */
/*  One standardized analysis as seen by the pooled fit                      */
/* ------------------------------------------------------------------------- */
struct PooledRow {
    double raw;        // D4xraw
    double d;          // δ4x
    double t;          // time relative to session centre
    double w;          // wD4xraw
    int    session;    // index into ParameterIndexer::sessions()
    int    unknown;    // index into ParameterIndexer::unknowns(), −1 for anchors
    double nominal;    // anchor Δ4x (unused for unknowns)
};

/* ------------------------------------------------------------------------- */
/*  Residual functor for all sessions at once                                */
/*                                                                           */
/*    r = (raw − (a·ref + b·d + c + t·(a2·ref + b2·d + c2))) / w             */
/*                                                                           */
/*  evaluated on the free parameter vector u; the full vector is M·u + k.    */
/* ------------------------------------------------------------------------- */
class PooledResidual {
public:
    PooledResidual(std::vector<PooledRow>  rows,
                   const ParameterIndexer& indexer,
                   const ConstraintMap&    constraints);

    int numResiduals() const { return static_cast<int>(rows_.size()); }

    void operator()(const Vector& u, Vector* residuals, Matrix* jacobian) const;

    /*  residuals and Jacobian with respect to the full parameter vector  */
    void evaluate_full(const Vector& p, Vector& r, Matrix* J) const;

private:
    std::vector<PooledRow>  rows_;
    const ParameterIndexer& indexer_;
    const ConstraintMap&    map_;
};

} // namespace clumpfit
