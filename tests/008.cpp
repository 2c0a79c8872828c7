#include "utils.hpp"

namespace clumpfit::test {

    TEST_CASE("008: split then unsplit without refitting", "[008][split]") {
        D4xData data = virtual_dataset(0.01, 6);
        standardize(data);
        const double foo    = data.sample("FOO").D4x;
        const double se_foo = data.sample("FOO").SE_D4x;
        const double bar    = data.sample("BAR").D4x;

        split_samples(data, { "FOO" });
        REQUIRE(data.grouping);
        CHECK(*data.grouping == "by_session");
        CHECK(data.samples().count("FOO__Session_01") == 1);
        CHECK(data.samples().count("FOO__Session_02") == 1);
        CHECK(data.samples().count("FOO") == 0);
        CHECK(data.samples().count("BAR") == 1);

        unsplit_samples(data);
        CHECK_FALSE(data.grouping);
        CHECK(data.samples().count("FOO") == 1);
        CHECK(data.sample("FOO").N == 12);
        CHECK(data.sample("FOO").D4x == Approx(foo));
        CHECK(data.sample("FOO").SE_D4x == Approx(se_foo));
        CHECK(data.sample("BAR").D4x == Approx(bar));
        for (const auto& r : data.analyses())
            CHECK_FALSE(r.Sample_original);
    }

    TEST_CASE("008: split by session, refit, recombine", "[008][split]") {
        D4xData data = virtual_dataset(0.01, 6);

        split_samples(data, {}, "BY_SESSION");
        standardize(data);
        const double foo1 = data.sample("FOO__Session_01").D4x;
        const double foo2 = data.sample("FOO__Session_02").D4x;
        const double se1  = data.sample("FOO__Session_01").SE_D4x;
        const double se2  = data.sample("FOO__Session_02").SE_D4x;
        CHECK(data.unknowns().size() == 4);

        unsplit_samples(data);
        const StandardizationResult& res = data.standardization();
        REQUIRE(res.unknowns.size() == 2);
        CHECK(res.unknowns[0] == "BAR");
        CHECK(res.var_names.back() == "D47_FOO");
        CHECK(res.covar.rows() == static_cast<Eigen::Index>(res.var_names.size()));
        CHECK(res.varying.size() == res.var_names.size());

        const double foo = data.sample("FOO").D4x;
        CHECK(foo >= std::min(foo1, foo2));
        CHECK(foo <= std::max(foo1, foo2));
        CHECK(data.sample("FOO").SE_D4x <= std::min(se1, se2));
        CHECK(data.sample("FOO").D4x == Approx(0.6).margin(0.03));
    }

    TEST_CASE("008: split by UID", "[008][split]") {
        D4xData data = virtual_dataset(0.01, 6);
        split_samples(data, { "BAR" }, "by_uid");
        CHECK(data.unknowns().size() == 1 + 12);

        standardize(data);
        unsplit_samples(data);
        CHECK(data.sample("BAR").D4x == Approx(0.5).margin(0.03));
        CHECK(data.sample("BAR").SE_D4x > 0.0);
    }

    TEST_CASE("008: split errors", "[008][split][errors]") {
        D4xData data = virtual_dataset(0.01, 6);

        CHECK_THROWS_AS(split_samples(data, {}, "by_day"), ConfigurationError);
        CHECK_THROWS_AS(unsplit_samples(data), std::logic_error);

        standardize(data);
        CHECK_THROWS_AS(unsplit_samples(data), std::logic_error);

        StandardizationEngine::Options opt;
        opt.method = Method::IndepSessions;
        split_samples(data);
        standardize(data, opt);
        CHECK_THROWS_AS(unsplit_samples(data), std::logic_error);
    }

} // namespace clumpfit::test
