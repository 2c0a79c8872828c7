#pragma once
#include "Types.hpp"
#include <map>
#include <string>
#include <vector>

namespace clumpfit {

/*  Linear form  Σ coeff·name + constant.                                */
struct LinearExpr {
    std::map<std::string, double> coeffs;
    double constant = 0.0;

    bool is_constant() const { return coeffs.empty(); }
};

/*  Parse  "0.5*D47_A + 0.5*D47_B - 0.1"  and the like.  Accepts numbers,
 *  parameter names, + - * / and parentheses; a product of two
 *  non-constant terms or a division by one throws
 *  ConstraintResolutionError.                                           */
LinearExpr parse_linear_expr(const std::string& text);

/*  Affine map from the free (solver) parameters u to the full parameter
 *  vector:   full = M·u + k.
 *
 *  A parameter is either free, fixed at zero (inactive drift terms), or
 *  tied by a constraint to a linear expression of other parameters.
 *  Constraints are resolved recursively down to free parameters.        */
class ConstraintMap {
public:
    ConstraintMap() = default;
    ConstraintMap(const std::vector<std::string>&         names,
                  const std::vector<bool>&                fixed_zero,
                  const std::map<std::string, std::string>& constraints);

    int n_full() const { return static_cast<int>(names_.size()); }
    int n_free() const { return static_cast<int>(free_.size()); }

    const Matrix& M() const { return M_; }
    const Vector& k() const { return k_; }

    /*  full index of free parameter j                                   */
    int free_index(int j) const { return free_[j]; }
    bool is_free(int i) const { return reduced_[i] >= 0; }
    bool is_constrained(int i) const { return constrained_[i]; }

    Vector expand(const Vector& u) const { return M_ * u + k_; }
    Vector reduce(const Vector& full) const;

    /*  M·Cov_u·Mᵗ                                                        */
    Matrix propagate(const Matrix& cov_u) const { return M_ * cov_u * M_.transpose(); }

private:
    std::vector<std::string> names_;
    std::vector<int>         free_;          // reduced → full
    std::vector<int>         reduced_;       // full → reduced, −1 if not free
    std::vector<bool>        constrained_;
    Matrix M_;
    Vector k_;
};

} // namespace clumpfit
