#include "utils.hpp"

namespace clumpfit::test {

    inline D4xData uneven_dataset(Config cfg = {})
    {
        VirtualSession v = eth_session("Session_01", 303, 4, 0.01);
        v.samples[3].N = 1;                 // FOO
        v.samples[4].N = 2;                 // BAR

        VirtualSample baz;
        baz.Sample = "BAZ"; baz.N = 3;
        baz.d13C_VPDB = 1.0; baz.d18O_VPDB = -5.0; baz.D47 = 0.4; baz.D48 = 0.2;
        v.samples.push_back(baz);

        D4xData data(virtual_data(cfg, v), cfg);
        crunch(data);
        return data;
    }

    TEST_CASE("010: sample statistics depend on the number of analyses", "[010][consolidate]") {
        const Method method = GENERATE(Method::Pooled, Method::IndepSessions);
        INFO("method = " << to_string(method));

        D4xData data = uneven_dataset();
        StandardizationEngine::Options opt;
        opt.method = method;
        standardize(data, opt);

        const Sample& foo = data.sample("FOO");
        const Sample& bar = data.sample("BAR");
        const Sample& baz = data.sample("BAZ");

        CHECK(foo.N == 1);
        CHECK_FALSE(foo.SD_D4x);
        CHECK_FALSE(foo.p_Levene);

        CHECK(bar.N == 2);
        REQUIRE(bar.SD_D4x);
        CHECK_FALSE(bar.p_Levene);

        CHECK(baz.N == 3);
        REQUIRE(baz.SD_D4x);
        REQUIRE(baz.p_Levene);
        CHECK(*baz.p_Levene >= 0.0);
        CHECK(*baz.p_Levene <= 1.0);

        /* anchors: nominal values, no standard error */
        CHECK(data.sample("ETH-3").D4x == data.nominal_D4x().at("ETH-3"));
        CHECK(data.sample("ETH-3").SE_D4x == 0.0);

        /* SD is the sample standard deviation of the analyses */
        std::vector<double> D;
        for (std::size_t i : bar.data) D.push_back(data.analyses()[i].D4x);
        CHECK(*bar.SD_D4x == Approx(std::abs(D[0] - D[1]) / std::sqrt(2.0)));

        CHECK(baz.d13C_VPDB  == Approx(1.0).margin(0.01));
        /* CO2 from acid digestion of a carbonate at -5 ‰ VPDB */
        CHECK(baz.d18O_VSMOW == Approx(995.0 * 1.03092 * 1.008129 - 1000.0).margin(0.01));

        for (const char* key : { "r_d13C_VPDB", "r_d18O_VSMOW", "r_D47a", "r_D47u", "r_D47" })
            CHECK(data.repeatability.count(key) == 1);

        const Session& s = data.session("Session_01");
        CHECK(s.Na == 12);
        CHECK(s.Nu == 6);
        CHECK(s.r_D4x == Approx(data.repeatability.at("r_D47")));
    }

    TEST_CASE("010: p_Levene requires the reference sample", "[010][consolidate]") {
        Config cfg;
        cfg.levene_ref_sample = "NOPE";
        D4xData data = uneven_dataset(cfg);
        standardize(data);
        CHECK_FALSE(data.sample("BAZ").p_Levene);
        CHECK(data.sample("BAZ").SD_D4x);
    }

    TEST_CASE("010: anchor repeatability", "[010][consolidate]") {
        D4xData data = uneven_dataset();
        standardize(data);

        /* deviations from the nominal values, one session costing its 3 parameters */
        double chisq = 0.0;
        int    n     = 0;
        for (const auto& r : data.analyses()) {
            if (!data.is_anchor(r.Sample)) continue;
            chisq += std::pow(r.D4x - data.nominal_D4x().at(r.Sample), 2);
            ++n;
        }
        CHECK(n == 12);
        CHECK(data.repeatability.at("r_D47a") == Approx(std::sqrt(chisq / (n - 3))));
        CHECK(compute_r(data, Observable::D4x, SampleClass::Anchors, { "Session_01" })
              == Approx(data.repeatability.at("r_D47a")));

        /* unknowns: deviations from the sample averages, FOO contributes nothing */
        chisq = 0.0;
        for (const char* u : { "BAR", "BAZ" })
            for (std::size_t i : data.sample(u).data)
                chisq += std::pow(data.analyses()[i].D4x - data.sample(u).D4x, 2);
        CHECK(data.repeatability.at("r_D47u") == Approx(std::sqrt(chisq / (1 + 2))));
    }

    TEST_CASE("010: bulk repeatability of the anchors", "[010][consolidate]") {
        D4xData data = uneven_dataset();
        standardize(data);

        /* virtual bulk compositions carry no noise */
        CHECK(data.repeatability.at("r_d13C_VPDB")  == Approx(0.0).margin(1e-6));
        CHECK(data.repeatability.at("r_d18O_VSMOW") == Approx(0.0).margin(1e-6));
    }

    TEST_CASE("010: pooled session parameters are loaded from the covariance", "[010][consolidate]") {
        D4xData data = virtual_dataset(0.01, 6);
        const StandardizationResult& res = standardize(data);

        for (const auto& name : data.session_names()) {
            const Session& s = data.session(name);
            const std::size_t i0 = res.session_index(name, 0);
            CHECK(s.a == res.values[i0]);
            CHECK(s.SE_c == Approx(std::sqrt(res.covar(i0 + 2, i0 + 2))));
            CHECK(s.CM(0, 2) == res.covar(i0, i0 + 2));
            CHECK(s.SE_a2 == 0.0);
        }
    }

    TEST_CASE("010: independent sessions keep one estimate per session", "[010][consolidate]") {
        D4xData data = virtual_dataset(0.01, 6);
        StandardizationEngine::Options opt;
        opt.method = Method::IndepSessions;
        standardize(data, opt);

        const Sample& foo = data.sample("FOO");
        REQUIRE(foo.session_D4x.size() == 2);
        double wsum = 0.0;
        for (const auto& [name, e] : foo.session_D4x) {
            CHECK(e.SE > 0.0);
            wsum += e.weight;
        }
        CHECK(wsum == Approx(1.0));

        const SessionEstimate& e1 = foo.session_D4x.at("Session_01");
        const SessionEstimate& e2 = foo.session_D4x.at("Session_02");
        CHECK(foo.D4x == Approx(e1.weight * e1.D4x + e2.weight * e2.D4x));
        CHECK(foo.SE_D4x < std::min(e1.SE, e2.SE));

        CHECK(data.repeatability.count("sigma_47") == 1);
        CHECK(data.Nf == 60 - 2 - 6);
    }

} // namespace clumpfit::test
