#include "utils.hpp"

#include <fstream>

namespace clumpfit::test {

    TEST_CASE("002: parameter name form", "[002][io]") {
        CHECK(pf("a.b-c") == "a_b_c");
        CHECK(pf("ETH 1") == "ETH_1");
        CHECK(pf("plain") == "plain");
    }

    TEST_CASE("002: make_csv with custom separators", "[002][io]") {
        const Table x { {"a", "b"}, {"c", "d"} };
        CHECK(make_csv(x, "-", "+") == "a-b+c-d");
        CHECK(make_csv(x) == "a,b\nc,d");
    }

    TEST_CASE("002: separator detection and record parsing", "[002][io][csv]") {
        CHECK(detect_separator("a,b,c\n1,2,3") == ',');
        CHECK(detect_separator("a;b;c\n1;2;3") == ';');
        CHECK(detect_separator("a\tb\tc\n1\t2\t3") == '\t');

        const std::string text =
            "UID ; Session ; Sample ; d45 ; d46 ; d47\n"
            "A01 ; S1 ; ETH-1 ; 5.795 ; 11.627 ; 16.894\n"
            "\n"
            "A02 ; S1 ; FOO ;  -5.5 ; ; 6.0\n";

        const auto recs = parse_csv(text);
        REQUIRE(recs.size() == 2);
        CHECK(recs[0].at("UID") == "A01");
        CHECK(recs[0].at("Sample") == "ETH-1");
        CHECK(recs[0].at("d46") == "11.627");
        CHECK(recs[1].count("d46") == 0);        // empty cells are dropped
    }

    TEST_CASE("002: records to analyses", "[002][io][csv]") {
        const auto recs = parse_csv(
            "UID,Session,Sample,d45,d46,d47,d48,TimeTag\n"
            "1,S1,ETH-1,5.795,11.627,16.894,24.56,10\n"
            "2,S1,ETH-2,-6.059,-4.817,-11.635,-8.04,20\n");
        const auto an = analyses_from_records(recs);
        REQUIRE(an.size() == 2);
        CHECK(an[0].Sample == "ETH-1");
        CHECK(an[0].Session == "S1");
        CHECK(an[0].d45 == Approx(5.795));
        CHECK(an[1].d47 == Approx(-11.635));
        CHECK(an[1].d48 == Approx(-8.04));
        REQUIRE(an[1].TimeTag);
        CHECK(*an[1].TimeTag == Approx(20.0));
        CHECK(std::isnan(an[0].d49));

        CHECK_THROWS_AS(analyses_from_records(parse_csv("Sample,d45,d47\nX,1,2\n")), ConfigurationError);
        CHECK_THROWS_AS(analyses_from_records(parse_csv("Sample,d45,d46\nX,1,2\n")), ConfigurationError);
        CHECK_THROWS_AS(analyses_from_records(parse_csv("Sample,d45,d46,d47\nX,1,two,3\n")), ConfigurationError);
    }

    TEST_CASE("002: analysis records carry the working gas when known", "[002][io][csv]") {
        Analysis r = raw_analysis("FOO", "S1", 1.25, 0.3);
        r.UID = "7";
        r.d45 = -0.5;
        r.d46 = 2.0;

        Record rec = record_from_analysis(r);
        CHECK(rec.at("UID") == "7");
        CHECK(rec.at("d47") == "1.25");
        CHECK(rec.count("d13Cwg_VPDB") == 0);

        r.d13Cwg_VPDB  = -4.0;
        r.d18Owg_VSMOW = 26.0;
        rec = record_from_analysis(r);
        const auto back = analyses_from_records({ rec });
        REQUIRE(back.size() == 1);
        CHECK(back[0].d13Cwg_VPDB == Approx(-4.0));
        CHECK(back[0].d18Owg_VSMOW == Approx(26.0));
        CHECK(back[0].d46 == Approx(2.0));
    }

    TEST_CASE("002: dataset ingestion fills in defaults", "[002][io][dataset]") {
        const auto dir = scratch_dir("002");
        const auto path = (dir / "rawdata.csv").string();
        {
            std::ofstream f(path);
            f << "Sample,d45,d46,d47\n"
                 "ETH-1,5.795,11.627,16.894\n"
                 "ETH-2,-6.059,-4.817,-11.635\n"
                 "FOO,-0.8,2.1,1.3\n";
        }

        D4xData data;
        data.read(path);
        REQUIRE(data.size() == 3);
        CHECK(data.analyses()[0].UID == "1");
        CHECK(data.analyses()[2].UID == "3");
        CHECK(data.analyses()[1].Session == "mySession");
        CHECK(data.session_names() == std::vector<std::string>{ "mySession" });
        CHECK(data.anchors()  == std::vector<std::string>{ "ETH-1", "ETH-2" });
        CHECK(data.unknowns() == std::vector<std::string>{ "FOO" });

        D4xData other;
        other.read(path, '\0', "Session_A");
        CHECK(other.session_names() == std::vector<std::string>{ "Session_A" });

        CHECK_THROWS(data.read((dir / "missing.csv").string()));
    }

    TEST_CASE("002: pretty_table layout", "[002][io][report]") {
        const Table rows { {"Sample", "N"}, {"ETH-1", "12"} };
        CHECK(pretty_table(rows) ==
              "––––––  ––\n"
              "Sample   N\n"
              "––––––  ––\n"
              "ETH-1   12\n"
              "––––––  ––\n");

        /* multibyte cells count as single characters */
        const Table pm { {"a ± SE"}, {"1 ± 2"} };
        CHECK(pretty_table(pm) ==
              "––––––\n"
              "a ± SE\n"
              "––––––\n"
              "1 ± 2 \n"
              "––––––\n");

        /* header = 0: no header rule */
        CHECK(pretty_table(Table{ {"x", "1"} }, 0) == "–  –\nx  1\n–  –\n");
    }

} // namespace clumpfit::test
