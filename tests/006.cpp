#include "utils.hpp"

namespace clumpfit::test {

    TEST_CASE("006: exact recovery with noiseless anchors", "[006][standardize]") {
        const Method method = GENERATE(Method::Pooled, Method::IndepSessions);
        INFO("method = " << to_string(method));

        D4xData data = exact_dataset();
        StandardizationEngine::Options opt;
        opt.method = method;
        const StandardizationResult& res = standardize(data, opt);

        CHECK(res.method == method);
        CHECK(data.standardization_method() == method);

        const Session& s = data.session("S1");
        CHECK(s.a == Approx(1.0).margin(1e-8));
        CHECK(s.b == Approx(0.0).margin(1e-8));
        CHECK(s.c == Approx(-0.5).margin(1e-8));
        CHECK(s.a2 == 0.0);
        CHECK(s.b2 == 0.0);
        CHECK(s.c2 == 0.0);

        CHECK(data.sample("U").D4x == Approx(0.8).margin(1e-8));
        CHECK(res.value("D47_U") == Approx(0.8).margin(1e-8));
        CHECK(res.value("a_S1") == Approx(1.0).margin(1e-8));

        for (const auto& r : data.analyses()) {
            if (r.Sample == "U") continue;
            CHECK(r.D4x == Approx(data.nominal_D4x().at(r.Sample)).margin(1e-8));
        }

        /* 4 analyses, 1 unknown, 3 session parameters */
        CHECK(data.Nf == 0);
        CHECK(res.Nf == 0);
        CHECK(std::isnan(data.t95));

        /* layout: 6 session parameters then the unknown, every one with a covariance row */
        REQUIRE(res.var_names.size() == 7);
        CHECK(res.var_names[0] == "a_S1");
        CHECK(res.var_names[3] == "a2_S1");
        CHECK(res.var_names[6] == "D47_U");
        CHECK(res.covar.rows() == 7);
        CHECK_FALSE(res.varying[3]);
        CHECK(res.varying[6]);
        CHECK(res.covar(3, 3) == 0.0);
    }

    TEST_CASE("006: exact recovery across two sessions", "[006][standardize]") {
        std::vector<Analysis> all = exact_session("S1");
        /* second session: a = 1.1, b = 0.002, c = -0.7 */
        for (Analysis r : exact_session("S2")) {
            const double D = r.Sample == "U" ? 0.8 : exact_config().nominal_D47.at(r.Sample);
            r.D47raw = 1.1 * D + 0.002 * r.d47 - 0.7;
            all.push_back(r);
        }

        const Method method = GENERATE(Method::Pooled, Method::IndepSessions);
        INFO("method = " << to_string(method));

        D4xData data(all, exact_config());
        StandardizationEngine::Options opt;
        opt.method = method;
        standardize(data, opt);

        CHECK(data.session("S2").a == Approx(1.1).margin(1e-8));
        CHECK(data.session("S2").b == Approx(0.002).margin(1e-8));
        CHECK(data.session("S2").c == Approx(-0.7).margin(1e-8));
        CHECK(data.sample("U").D4x == Approx(0.8).margin(1e-8));
        CHECK(data.sample("U").N == 2);
        CHECK(data.Nf == 8 - 1 - 6);

        for (const auto& r : data.analyses())
            CHECK(r.D4x_residual == Approx(0.0).margin(1e-8));

        CHECK(data.session("S1").Na == 3);
        CHECK(data.session("S1").Nu == 1);
    }

    TEST_CASE("006: standardization errors", "[006][standardize][errors]") {
        SECTION("empty dataset") {
            D4xData data(exact_config());
            CHECK_THROWS_AS(standardize(data), InsufficientDataError);
        }

        SECTION("session without anchors") {
            std::vector<Analysis> all = exact_session("S1");
            all.push_back(raw_analysis("U", "S2", 2.0, 0.3));
            all.push_back(raw_analysis("U", "S2", 2.1, 0.31));
            for (Method m : { Method::Pooled, Method::IndepSessions }) {
                INFO("method = " << to_string(m));
                D4xData data(all, exact_config());
                StandardizationEngine::Options opt;
                opt.method = m;
                CHECK_THROWS_AS(standardize(data, opt), InsufficientDataError);
            }
        }

        SECTION("fewer anchors than session parameters") {
            std::vector<Analysis> all {
                raw_analysis("A", "S1", 0.0, -0.5),
                raw_analysis("B", "S1", 5.0,  0.1),
                raw_analysis("U", "S1", 2.0,  0.3),
            };
            for (Method m : { Method::Pooled, Method::IndepSessions }) {
                INFO("method = " << to_string(m));
                D4xData data(all, exact_config());
                StandardizationEngine::Options opt;
                opt.method = m;
                CHECK_THROWS_AS(standardize(data, opt), InsufficientDataError);
            }
        }

        SECTION("constraints with independent sessions") {
            D4xData data = exact_dataset();
            StandardizationEngine::Options opt;
            opt.method = Method::IndepSessions;
            opt.constraints = { {"D47_U", "0.8"} };
            CHECK_THROWS_AS(standardize(data, opt), ConfigurationError);
        }

        SECTION("constraint on a missing parameter") {
            D4xData data = exact_dataset();
            StandardizationEngine::Options opt;
            opt.constraints = { {"D47_NOPE", "D47_U"} };
            CHECK_THROWS_AS(standardize(data, opt), ConstraintResolutionError);
        }

        SECTION("uncrunched analyses") {
            std::vector<Analysis> all = exact_session("S1");
            all[1].D47raw = kNaN;
            D4xData data(all, exact_config());
            CHECK_THROWS_AS(standardize(data), ConfigurationError);
        }

        SECTION("unknown weighted session") {
            D4xData data = exact_dataset();
            StandardizationEngine::Options opt;
            opt.weighted_sessions = { { "S1", "S9" } };
            CHECK_THROWS_AS(standardize(data, opt), ConfigurationError);
        }

        SECTION("non-positive iteration bound") {
            D4xData data = exact_dataset();
            StandardizationEngine::Options opt;
            opt.max_iterations = 0;
            CHECK_THROWS_AS(StandardizationEngine(data, opt), ConfigurationError);
        }
    }

    TEST_CASE("006: timestamps", "[006][standardize]") {
        SECTION("centred index when a TimeTag is missing") {
            std::vector<Analysis> all = exact_session("S1");
            all[0].TimeTag = 100.0;
            D4xData data(all, exact_config());
            assign_timestamps(data);
            CHECK(data.analyses()[0].t == Approx(-1.5));
            CHECK(data.analyses()[1].t == Approx(-0.5));
            CHECK(data.analyses()[3].t == Approx(1.5));
        }

        SECTION("TimeTag minus session mean") {
            std::vector<Analysis> all = exact_session("S1");
            const double tags[] = { 10.0, 20.0, 40.0, 50.0 };
            for (std::size_t i = 0; i < all.size(); ++i) all[i].TimeTag = tags[i];
            D4xData data(all, exact_config());
            assign_timestamps(data);
            CHECK(data.analyses()[0].t == Approx(-20.0));
            CHECK(data.analyses()[2].t == Approx(10.0));
        }
    }

    TEST_CASE("006: drift terms recover a linear trend in time", "[006][standardize][drift]") {
        /* c drifts by 0.01 per unit time within the session */
        std::vector<Analysis> all;
        const char* samples[] = { "A", "B", "C", "U" };
        const double d[]   = { 0.0, 5.0, -3.0, 2.0 };
        const double D[]   = { 0.0, 0.6,  0.3, 0.8 };
        for (int rep = 0; rep < 2; ++rep)
            for (int k = 0; k < 4; ++k)
                all.push_back(raw_analysis(samples[k], "S1", d[k], 0.0));

        for (std::size_t i = 0; i < all.size(); ++i) {
            const double t = static_cast<double>(i) - 3.5;
            all[i].D47raw = D[i % 4] - 0.5 + 0.01 * t;
        }

        const Method method = GENERATE(Method::Pooled, Method::IndepSessions);
        INFO("method = " << to_string(method));

        Config cfg = exact_config();
        SessionSettings st;
        st.wg_drift = true;
        cfg.sessions["S1"] = st;

        D4xData data(all, cfg);
        StandardizationEngine::Options opt;
        opt.method = method;
        standardize(data, opt);

        CHECK(data.session("S1").Np == 4);
        CHECK(data.session("S1").c2 == Approx(0.01).margin(1e-8));
        CHECK(data.session("S1").c == Approx(-0.5).margin(1e-8));
        CHECK(data.sample("U").D4x == Approx(0.8).margin(1e-8));
    }

} // namespace clumpfit::test
