#pragma once
#include "Types.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>

namespace clumpfit {

/* ---------------------------  user visible bits  --------------------------- */

struct LMSolverOptions {
    int    max_iterations     = 200;
    double gradient_tolerance = 1e-10;   // relative to the initial gradient
    double chi2_tolerance     = 1e-14;   // relative change of χ²
    double chi2_floor         = 1e-28;   // exact fit
    double step_tolerance     = 1e-12;   // relative to 1 + |x|
    double initial_lambda     = 0;       // ≤ 0: 1e-3 × max diag(JᵀJ)
    bool   verbose            = false;
};

struct LMSolverSummary {
    int    iterations   = 0;
    double initial_chi2 = 0.0;
    double final_chi2   = 0.0;
    bool   converged    = false;
    bool   singular     = false;     // JᵀJ rank deficient at the solution
    int    rank         = 0;
    Matrix covariance;               // (JᵀJ)⁻¹ · χ²/max(m − n, 1)
};

/* -------------------  Levenberg–Marquardt driver routine  ------------------ */
/*
 *  func(x, &r, &J) fills the residual vector and its Jacobian.
 *  x is updated in place.
 */
template<typename Functor>
LMSolverSummary
levenberg_marquardt(Functor&&              func,
                    Vector&                x,
                    const LMSolverOptions& opt = {})
{
    LMSolverSummary summ;
    const Eigen::Index n = x.size();

    Vector r;
    Matrix J;
    func(x, &r, &J);

    const Eigen::Index m = r.size();
    double chi2 = r.squaredNorm();
    summ.initial_chi2 = chi2;

    if (n == 0) {
        summ.converged  = true;
        summ.final_chi2 = chi2;
        return summ;
    }

    /* --------------------------------------------------------------- */
    /*  tolerances and initial λ                                       */
    /* --------------------------------------------------------------- */
    Vector g = J.transpose() * r;
    const double gmax0 = g.cwiseAbs().maxCoeff();
    const double gtol  = opt.gradient_tolerance * std::max(gmax0, 1e-300);

    Matrix JTJ = J.transpose() * J;
    double lambda = opt.initial_lambda;
    if (lambda <= 0.0) {
        lambda = 1e-3 * JTJ.diagonal().maxCoeff();
        if (!(lambda > 0.0)) lambda = 1e-3;
    }

    if (opt.verbose)
        std::cout << "[LM] " << n << " free parameters, " << m << " residuals, χ² = "
                  << std::scientific << std::setprecision(6) << chi2 << std::defaultfloat << "\n";

    /* --------------------------------------------------------------- */
    /*  main iteration loop                                            */
    /* --------------------------------------------------------------- */
    for (int it = 0; it < opt.max_iterations; ++it) {
        summ.iterations = it + 1;

        if (chi2 < opt.chi2_floor || g.cwiseAbs().maxCoeff() <= gtol) {
            summ.converged = true;
            break;
        }

        /* ------- (JᵀJ + λ D) Δx = −g   (D = diag(JᵀJ)) --------------- */
        Matrix A = JTJ;
        A.diagonal().array() += lambda * (JTJ.diagonal().array() + 1e-20);
        Vector dx = -A.ldlt().solve(g);

        if (!dx.allFinite()) {
            std::cout << "[LM]  Warning: numerical failure! Inf/NaN in solver. Aborting iteration...\n";
            break;
        }

        const bool small_step =
            (dx.array().abs() <= opt.step_tolerance * (1.0 + x.array().abs())).all();

        Vector x_try = x + dx;
        Vector r_try;
        Matrix J_try;
        func(x_try, &r_try, &J_try);
        const double chi2_try = r_try.squaredNorm();

        /* ------------------- Powell's ρ test ------------------------ */
        Vector tmp = lambda * (JTJ.diagonal().array() * dx.array()).matrix() - g;
        double pred_red = 0.5 * dx.dot(tmp);
        if (pred_red <= 0.0) pred_red = std::numeric_limits<double>::epsilon();
        const double rho = (chi2 - chi2_try) / pred_red;

        if (chi2_try <= chi2) {
            const double rel = (chi2 - chi2_try) / std::max(chi2, 1e-300);
            x.swap(x_try);
            r.swap(r_try);
            J.swap(J_try);
            chi2 = chi2_try;
            g    = J.transpose() * r;
            JTJ  = J.transpose() * J;

            lambda *= std::max(1.0 / 3.0, 1.0 - std::pow(2.0 * rho - 1.0, 3.0));
            lambda  = std::max(lambda, 1e-18);

            if (opt.verbose)
                std::cout << "[LM]  iter " << it
                          << "  ρ="  << std::fixed << std::setprecision(2) << rho
                          << "  χ²=" << std::scientific << std::setprecision(6) << chi2
                          << "  λ="  << std::scientific << std::setprecision(2) << lambda
                          << std::defaultfloat << "  (accepted)\n";

            if (small_step || rel < opt.chi2_tolerance) {
                summ.converged = true;
                break;
            }
        } else {
            lambda *= 2.0;
            if (opt.verbose)
                std::cout << "[LM]  iter " << it
                          << "  χ²=" << std::scientific << std::setprecision(6) << chi2_try
                          << "  λ="  << std::scientific << std::setprecision(2) << lambda
                          << std::defaultfloat << "  (rejected)\n";
            if (small_step) {
                summ.converged = true;
                break;
            }
        }
    }

    summ.final_chi2 = chi2;

    /* ---------------------  propagate uncertainties  ---------------- */
    Eigen::FullPivLU<Matrix> lu(JTJ);
    summ.rank     = static_cast<int>(lu.rank());
    summ.singular = summ.rank < n;
    if (!summ.singular) {
        const double dof = static_cast<double>(std::max<Eigen::Index>(m - n, 1));
        summ.covariance = lu.inverse() * (chi2 / dof);
    } else {
        summ.covariance = Matrix::Constant(n, n, kNaN);
    }

    if (opt.verbose)
        std::cout << "[LM] done after " << summ.iterations << " iterations, χ² = "
                  << std::scientific << std::setprecision(6) << chi2 << std::defaultfloat
                  << (summ.converged ? "" : " (not converged)") << "\n";
    return summ;
}

} // namespace clumpfit
