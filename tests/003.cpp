#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace clumpfit::test {

    TEST_CASE("003: defaults", "[003][config]") {
        const Config cfg;
        CHECK(cfg.mass == 47);
        CHECK(cfg.method == Method::Pooled);
        CHECK(cfg.alpha_18O_acid == Approx(1.008129));
        CHECK(cfg.ratios.R18_VPDB == Approx(0.0020052 * 1.03092));
        CHECK(cfg.nominal_D47.at("ETH-3") == Approx(0.6132));
        CHECK(cfg.nominal_D48.at("GU-1") == Approx(-0.419));
        CHECK(cfg.nominal_d18O_VPDB.at("ETH-2") == Approx(-18.69));
        CHECK(cfg.levene_ref_sample == "ETH-3");
        CHECK(&cfg.nominal_D4x() == &cfg.nominal_D47);

        Config c48;
        c48.mass = 48;
        CHECK(&c48.nominal_D4x() == &c48.nominal_D48);
    }

    TEST_CASE("003: enum parsing", "[003][config]") {
        CHECK(parse_method("POOLED") == Method::Pooled);
        CHECK(parse_method("indep_sessions") == Method::IndepSessions);
        CHECK_THROWS_AS(parse_method("bayesian"), ConfigurationError);

        CHECK(parse_bulk_method("none") == BulkMethod::None);
        CHECK(parse_bulk_method("1pt") == BulkMethod::OnePoint);
        CHECK(parse_bulk_method("2PT") == BulkMethod::TwoPoint);
        CHECK_THROWS_AS(parse_bulk_method("3pt"), ConfigurationError);

        CHECK(parse_teq_law("wang") == TeqLaw::Wang);
        CHECK(parse_teq_priority("replace") == TeqPriority::Replace);
        CHECK_THROWS_AS(parse_teq_law("urey"), ConfigurationError);

        CHECK(to_string(Method::IndepSessions) == "indep_sessions");
        CHECK(to_string(BulkMethod::OnePoint) == "1pt");
    }

    TEST_CASE("003: configuration from JSON", "[003][config]") {
        const auto j = nlohmann::json::parse(R"({
            "mass": 48,
            "method": "indep_sessions",
            "Nominal_D48": { "ETH-1": 0.138, "ETH-2": 0.138, "ETH-3": 0.270 },
            "d13C_STANDARDIZATION_METHOD": "1pt",
            "sessions": {
                "S1": { "slope_drift": true },
                "S2": { "d18O_standardization_method": "none" }
            },
            "weighted_sessions": [["S1", "S2"]],
            "D47fromTeq": { "law": "wang", "priority": "old" },
            "max_iterations": 50
        })");

        const Config cfg = config_from_json(j);
        CHECK(cfg.mass == 48);
        CHECK(cfg.method == Method::IndepSessions);
        CHECK(cfg.nominal_D48.size() == 3);
        CHECK(cfg.d13C_method == BulkMethod::OnePoint);
        CHECK(cfg.sessions.at("S1").slope_drift);
        CHECK_FALSE(cfg.sessions.at("S1").wg_drift);
        CHECK(cfg.sessions.at("S1").d13C_method == BulkMethod::OnePoint);
        CHECK(cfg.sessions.at("S1").n_active_params() == 4);
        CHECK(cfg.sessions.at("S2").d18O_method == BulkMethod::None);
        CHECK(cfg.weighted_sessions.size() == 1);
        REQUIRE(cfg.teq);
        CHECK(cfg.teq->law == TeqLaw::Wang);
        CHECK(cfg.teq->priority == TeqPriority::Old);
        CHECK(cfg.max_iterations == 50);

        const Config back = config_from_json(config_to_json(cfg));
        CHECK(back.mass == 48);
        CHECK(back.method == Method::IndepSessions);
        CHECK(back.sessions.at("S1").slope_drift);
    }

    TEST_CASE("003: invalid configurations", "[003][config][errors]") {
        using nlohmann::json;
        CHECK_THROWS_AS(config_from_json(json{ {"mass", 49} }), ConfigurationError);
        CHECK_THROWS_AS(config_from_json(json{ {"ALPHA_18O_ACID_REACTION", 0.0} }), ConfigurationError);
        CHECK_THROWS_AS(config_from_json(json{ {"ALPHA_18O_ACID_REACTION", -1.0} }), ConfigurationError);
        CHECK_THROWS_AS(config_from_json(json{ {"method", "bayesian"} }), ConfigurationError);
        CHECK_THROWS_AS(config_from_json(json{ {"Nominal_D47", "ETH-1"} }), ConfigurationError);
        CHECK_THROWS_AS(config_from_json(json::parse(
                            R"({ "method": "indep_sessions", "constraints": { "D47_FOO": "D47_BAR" } })")),
                        ConfigurationError);
        CHECK_THROWS_AS(load_config("/nonexistent/clumpfit.json"), ConfigurationError);
    }

    TEST_CASE("003: environment expansion in configuration files", "[003][config]") {
        const auto dir = scratch_dir("003");
        ::setenv("CLUMPFIT_TEST_LOG", (dir / "run.log").string().c_str(), 1);
        const auto path = (dir / "cfg.json").string();
        {
            std::ofstream f(path);
            f << R"({ "logfile": "${CLUMPFIT_TEST_LOG}", "verbose": false })";
        }
        const Config cfg = load_config(path);
        CHECK(cfg.logfile == (dir / "run.log").string());

        /* messages go to the log file even when not verbose */
        D4xData data(cfg);
        data.msg("test", "hello");
        std::ifstream f(cfg.logfile);
        std::string all((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        CHECK(all.find("[test]") != std::string::npos);
        CHECK(all.find("hello") != std::string::npos);
    }

} // namespace clumpfit::test
