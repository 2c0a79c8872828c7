#pragma once

#include "clumpfit/AnalysisCruncher.hpp"
#include "clumpfit/CO2Equilibrium.hpp"
#include "clumpfit/Config.hpp"
#include "clumpfit/ConsolidationStatistics.hpp"
#include "clumpfit/ConstraintMap.hpp"
#include "clumpfit/CovariancePropagator.hpp"
#include "clumpfit/CsvIO.hpp"
#include "clumpfit/Dataset.hpp"
#include "clumpfit/Errors.hpp"
#include "clumpfit/IsobarModel.hpp"
#include "clumpfit/ParameterIndexer.hpp"
#include "clumpfit/ReportUtils.hpp"
#include "clumpfit/SampleSplitter.hpp"
#include "clumpfit/StandardizationEngine.hpp"
#include "clumpfit/StatsUtils.hpp"
#include "clumpfit/VirtualData.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

namespace clumpfit::test {

    /*  Analysis with δ47 and Δ47raw given directly, so that a dataset can
     *  be standardized without crunching.                                */
    inline Analysis raw_analysis(const std::string& sample, const std::string& session,
                                 double d47, double D47raw)
    {
        Analysis r;
        r.Sample     = sample;
        r.Session    = session;
        r.d47        = d47;
        r.D47raw     = D47raw;
        r.d13C_VPDB  = 0.0;
        r.d18O_VSMOW = 0.0;
        return r;
    }

    /*  Three anchors A / B / C and one unknown U measured with
     *  a = 1, b = 0, c = −0.5 and no noise.  U has Δ47 = 0.8.            */
    inline Config exact_config()
    {
        Config cfg;
        cfg.nominal_D47 = { {"A", 0.0}, {"B", 0.6}, {"C", 0.3} };
        return cfg;
    }

    inline std::vector<Analysis> exact_session(const std::string& session)
    {
        return {
            raw_analysis("A", session,  0.0, -0.5),
            raw_analysis("B", session,  5.0,  0.1),
            raw_analysis("C", session, -3.0, -0.2),
            raw_analysis("U", session,  2.0,  0.3),
        };
    }

    inline D4xData exact_dataset()
    {
        return D4xData(exact_session("S1"), exact_config());
    }

    /*  ETH-1/2/3 plus two unknowns, N analyses each, in one session.      */
    inline VirtualSession eth_session(const std::string& name, unsigned seed,
                                      int N = 4, double rD47 = 0.0)
    {
        VirtualSession v;
        v.session = name;
        v.seed    = seed;
        v.rD47    = rD47;
        v.rD48    = 0.0;

        VirtualSample foo;
        foo.Sample = "FOO"; foo.N = N;
        foo.d13C_VPDB = -4.0; foo.d18O_VPDB = -12.0; foo.D47 = 0.6; foo.D48 = 0.1;

        VirtualSample bar;
        bar.Sample = "BAR"; bar.N = N;
        bar.d13C_VPDB = -14.0; bar.d18O_VPDB = -22.0; bar.D47 = 0.5; bar.D48 = 0.1;

        VirtualSample eth1; eth1.Sample = "ETH-1"; eth1.N = N;
        VirtualSample eth2; eth2.Sample = "ETH-2"; eth2.N = N;
        VirtualSample eth3; eth3.Sample = "ETH-3"; eth3.N = N;

        v.samples = { eth1, eth2, eth3, foo, bar };
        return v;
    }

    /*  Two crunched virtual sessions.                                     */
    inline D4xData virtual_dataset(double rD47 = 0.0, int N = 4, Config cfg = {})
    {
        std::vector<Analysis> all = virtual_data(cfg, eth_session("Session_01", 101, N, rD47));
        for (auto& r : virtual_data(cfg, eth_session("Session_02", 202, N, rD47)))
            all.push_back(r);
        D4xData data(std::move(all), cfg);
        crunch(data);
        return data;
    }

    inline std::filesystem::path scratch_dir(const std::string& name)
    {
        auto p = std::filesystem::temp_directory_path() / ("clumpfit_test_" + name);
        std::filesystem::remove_all(p);
        std::filesystem::create_directories(p);
        return p;
    }

} // namespace clumpfit::test
