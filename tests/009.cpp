#include "utils.hpp"

namespace clumpfit::test {

    TEST_CASE("009: equilibrium laws", "[009][teq]") {
        CHECK(fCO2eqD47_Petersen(25.0) == Approx(0.919580851));
        CHECK(fCO2eqD47_Petersen(25.5) == Approx((0.919580851 + 0.914344938) / 2.0));
        CHECK(fCO2eqD47_Petersen(-12.0) == Approx(1.147113572));
        CHECK(fCO2eqD47_Petersen(1000.0) == Approx(0.026583445));

        CHECK(fCO2eqD47_Wang(26.85) == Approx(0.9125));
        CHECK(fCO2eqD47_Wang(21.85) == Approx((0.9665 + 0.9125) / 2.0));

        CHECK(fCO2eqD47(TeqLaw::Petersen, 25.0) == fCO2eqD47_Petersen(25.0));
        CHECK(fCO2eqD47(TeqLaw::Wang, 26.85) == fCO2eqD47_Wang(26.85));

        CHECK_THROWS_AS(fCO2eqD47_Petersen(-20.0), ConfigurationError);
        CHECK_THROWS_AS(fCO2eqD47_Petersen(1001.0), ConfigurationError);
        CHECK_THROWS_AS(fCO2eqD47_Petersen(kNaN), ConfigurationError);
        CHECK_THROWS_AS(fCO2eqD47_Wang(-100.0), ConfigurationError);
    }

    TEST_CASE("009: anchors from equilibration temperatures", "[009][teq]") {
        std::vector<Analysis> all = exact_session("S1");
        all[0].Teq = 25.0;          // A, already an anchor
        all[3].Teq = 1000.0;        // U

        SECTION("new values take priority") {
            D4xData data(all, exact_config());
            D47fromTeq(data);
            CHECK(data.nominal_D4x().at("A") == Approx(0.919580851));
            CHECK(data.nominal_D4x().at("U") == Approx(0.026583445));
            CHECK(data.nominal_D4x().at("B") == 0.6);
            CHECK(data.is_anchor("U"));
            CHECK(data.unknowns().empty());
        }

        SECTION("existing values take priority") {
            TeqOptions opt;
            opt.priority = TeqPriority::Old;
            D4xData data(all, exact_config());
            D47fromTeq(data, opt);
            CHECK(data.nominal_D4x().at("A") == 0.0);
            CHECK(data.nominal_D4x().at("U") == Approx(0.026583445));
        }

        SECTION("equilibrated gases replace every anchor") {
            TeqOptions opt;
            opt.priority = TeqPriority::Replace;
            opt.law      = TeqLaw::Wang;
            all[0].Teq = 26.85;
            D4xData data(all, exact_config());
            D47fromTeq(data, opt);
            CHECK(data.nominal_D4x().size() == 2);
            CHECK(data.nominal_D4x().at("A") == Approx(0.9125));
            CHECK_FALSE(data.is_anchor("B"));
            CHECK(data.unknowns() == std::vector<std::string>{ "B", "C" });
        }
    }

    TEST_CASE("009: inconsistent equilibration temperatures", "[009][teq][errors]") {
        std::vector<Analysis> all = exact_session("S1");
        all.push_back(raw_analysis("U", "S1", 2.0, 0.3));

        SECTION("missing on some analyses") {
            all[3].Teq = 25.0;
            D4xData data(all, exact_config());
            CHECK_THROWS_AS(D47fromTeq(data), ConfigurationError);
        }

        SECTION("different values") {
            all[3].Teq = 25.0;
            all[4].Teq = 30.0;
            D4xData data(all, exact_config());
            CHECK_THROWS_AS(D47fromTeq(data), ConfigurationError);
        }

        SECTION("out of range") {
            all[3].Teq = 2000.0;
            all[4].Teq = 2000.0;
            D4xData data(all, exact_config());
            CHECK_THROWS_AS(D47fromTeq(data), ConfigurationError);
        }

        SECTION("mass 48") {
            Config cfg = exact_config();
            cfg.mass = 48;
            D4xData data(all, cfg);
            CHECK_THROWS_AS(D47fromTeq(data), ConfigurationError);
        }
    }

} // namespace clumpfit::test
