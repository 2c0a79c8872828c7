#include "utils.hpp"

#include "clumpfit/LevenbergMarquardt.hpp"
#include "clumpfit/PooledResidual.hpp"

namespace clumpfit::test {

    TEST_CASE("004: linear expression parsing", "[004][constraints]") {
        LinearExpr e = parse_linear_expr("0.5*D47_A + 0.5 * D47_B - 0.1");
        CHECK(e.coeffs.size() == 2);
        CHECK(e.coeffs.at("D47_A") == Approx(0.5));
        CHECK(e.coeffs.at("D47_B") == Approx(0.5));
        CHECK(e.constant == Approx(-0.1));

        e = parse_linear_expr("2*(x - 3) + x/4");
        CHECK(e.coeffs.at("x") == Approx(2.25));
        CHECK(e.constant == Approx(-6.0));

        e = parse_linear_expr("-(-y)");
        CHECK(e.coeffs.at("y") == Approx(1.0));

        e = parse_linear_expr("1e-3");
        CHECK(e.is_constant());
        CHECK(e.constant == Approx(0.001));

        CHECK_THROWS_AS(parse_linear_expr("x*y"), ConstraintResolutionError);
        CHECK_THROWS_AS(parse_linear_expr("1/x"), ConstraintResolutionError);
        CHECK_THROWS_AS(parse_linear_expr("x/0"), ConstraintResolutionError);
        CHECK_THROWS_AS(parse_linear_expr("(x + 1"), ConstraintResolutionError);
        CHECK_THROWS_AS(parse_linear_expr("x + "), ConstraintResolutionError);
        CHECK_THROWS_AS(parse_linear_expr("x ^ 2"), ConstraintResolutionError);
    }

    TEST_CASE("004: constraint map resolution", "[004][constraints]") {
        const std::vector<std::string> names { "p", "q", "r" };

        SECTION("fixed and tied parameters") {
            const ConstraintMap map(names, { false, false, true }, { {"q", "p + 0.1"} });
            CHECK(map.n_full() == 3);
            REQUIRE(map.n_free() == 1);
            CHECK(map.free_index(0) == 0);
            CHECK(map.is_free(0));
            CHECK_FALSE(map.is_free(1));
            CHECK(map.is_constrained(1));
            CHECK_FALSE(map.is_constrained(2));

            Vector u(1);
            u << 2.0;
            const Vector full = map.expand(u);
            CHECK(full[0] == Approx(2.0));
            CHECK(full[1] == Approx(2.1));
            CHECK(full[2] == 0.0);
            CHECK(map.reduce(full)[0] == Approx(2.0));

            Matrix cov(1, 1);
            cov << 4.0;
            const Matrix C = map.propagate(cov);
            CHECK(C(0, 0) == Approx(4.0));
            CHECK(C(0, 1) == Approx(4.0));
            CHECK(C(1, 1) == Approx(4.0));
            CHECK(C(2, 2) == 0.0);
        }

        SECTION("chained constraints resolve to free parameters") {
            const ConstraintMap map(names, {}, { {"p", "q + 1"}, {"q", "2*r"} });
            REQUIRE(map.n_free() == 1);
            CHECK(map.free_index(0) == 2);
            Vector u(1);
            u << 1.0;
            const Vector full = map.expand(u);
            CHECK(full[0] == Approx(3.0));
            CHECK(full[1] == Approx(2.0));
            CHECK(full[2] == Approx(1.0));
            CHECK(map.M()(0, 0) == Approx(2.0));
            CHECK(map.k()[0] == Approx(1.0));
        }

        SECTION("resolution errors") {
            CHECK_THROWS_AS(ConstraintMap(names, {}, { {"p", "q"}, {"q", "p"} }), ConstraintResolutionError);
            CHECK_THROWS_AS(ConstraintMap(names, {}, { {"p", "p + 1"} }), ConstraintResolutionError);
            CHECK_THROWS_AS(ConstraintMap(names, {}, { {"z", "p"} }), ConstraintResolutionError);
            CHECK_THROWS_AS(ConstraintMap(names, {}, { {"p", "z + 1"} }), ConstraintResolutionError);
        }
    }

    TEST_CASE("004: parameter names", "[004][constraints]") {
        ParameterIndexer idx;
        idx.build({ "Session-01", "S.2" }, { "ETH-4", "FOO" }, 47);
        CHECK(idx.total() == 14);
        CHECK(idx.n_session_params() == 12);
        CHECK(idx.names()[0] == "a_Session_01");
        CHECK(idx.names()[5] == "c2_Session_01");
        CHECK(idx.names()[7] == "b_S_2");
        CHECK(idx.names()[12] == "D47_ETH_4");
        CHECK(idx.session_param(1, 2) == 8);
        CHECK(idx.unknown(1) == 13);
        CHECK(idx.find("D47_FOO") == 13);
        CHECK_FALSE(idx.find("D48_FOO"));

        /* "A-1" and "A.1" collide once turned into parameter names */
        ParameterIndexer bad;
        CHECK_THROWS_AS(bad.build({ "S1" }, { "A-1", "A.1" }, 47), ConfigurationError);
    }

    TEST_CASE("004: Levenberg-Marquardt on an exponential decay", "[004][solver]") {
        const std::vector<double> x { 0.0, 0.5, 1.0, 1.5, 2.0, 2.5, 3.0 };
        std::vector<double> y;
        for (double xi : x) y.push_back(2.5 * std::exp(-1.3 * xi));

        auto f = [&](const Vector& p, Vector* r, Matrix* J) {
            r->resize(static_cast<Eigen::Index>(x.size()));
            if (J) J->resize(static_cast<Eigen::Index>(x.size()), 2);
            for (std::size_t i = 0; i < x.size(); ++i) {
                const double e = std::exp(p[1] * x[i]);
                (*r)[i] = y[i] - p[0] * e;
                if (J) {
                    (*J)(i, 0) = -e;
                    (*J)(i, 1) = -p[0] * x[i] * e;
                }
            }
        };

        Vector p(2);
        p << 1.0, -0.5;
        const LMSolverSummary s = levenberg_marquardt(f, p);
        CHECK(s.converged);
        CHECK_FALSE(s.singular);
        CHECK(s.rank == 2);
        CHECK(p[0] == Approx(2.5).margin(1e-8));
        CHECK(p[1] == Approx(-1.3).margin(1e-8));
        CHECK(s.final_chi2 < 1e-20);
        CHECK(s.covariance.rows() == 2);
    }

    TEST_CASE("004: pooled residual Jacobian matches finite differences", "[004][solver]") {
        ParameterIndexer idx;
        idx.build({ "S1" }, { "U" }, 47);
        std::vector<bool> fixed(static_cast<std::size_t>(idx.total()), false);
        const ConstraintMap map(idx.names(), fixed, {});

        std::vector<PooledRow> rows {
            { -0.5, 0.0, -1.5, 1.0, 0, -1, 0.0 },
            {  0.1, 5.0, -0.5, 1.0, 0, -1, 0.6 },
            { -0.2,-3.0,  0.5, 2.0, 0, -1, 0.3 },
            {  0.3, 2.0,  1.5, 1.0, 0,  0, kNaN },
        };
        const PooledResidual cost(rows, idx, map);
        CHECK(cost.numResiduals() == 4);

        Vector u(7);
        u << 0.9, 0.01, -0.4, 0.02, -0.003, 0.05, 0.7;
        Vector r;
        Matrix J;
        cost(u, &r, &J);
        REQUIRE(J.rows() == 4);
        REQUIRE(J.cols() == 7);

        const double h = 1e-6;
        for (int j = 0; j < 7; ++j) {
            Vector up = u, um = u;
            up[j] += h;
            um[j] -= h;
            Vector rp, rm;
            cost(up, &rp, nullptr);
            cost(um, &rm, nullptr);
            for (int i = 0; i < 4; ++i)
                CHECK(J(i, j) == Approx((rp[i] - rm[i]) / (2 * h)).margin(1e-7));
        }

        /* residual of the first anchor: raw − (c + t·c2), weight 1 */
        CHECK(r[0] == Approx(-0.5 - (-0.4 - 1.5 * 0.05)).margin(1e-12));
    }

} // namespace clumpfit::test
