#pragma once
#include "Analysis.hpp"
#include "Config.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace clumpfit {

/*  Instrumental model injected into simulated raw anomalies:
 *  D4xraw = a·D4x + b·δ4x + c                                           */
struct InstrumentModel {
    double a47 = 1.0, b47 = 0.0, c47 = -0.9;
    double a48 = 1.0, b48 = 0.0, c48 = -0.45;
};

/*  One sample entry of a virtual session.  Missing values are looked up
 *  in the nominal tables of the configuration.                           */
struct VirtualSample {
    std::string Sample;
    int N = 1;
    std::optional<double> d13C_VPDB;
    std::optional<double> d18O_VPDB;
    std::optional<double> D47;
    std::optional<double> D48;
    double D49  = 0.0;
    double D17O = 0.0;
};

struct VirtualSession {
    std::vector<VirtualSample> samples;
    InstrumentModel model;
    double rD47 = 0.015;
    double rD48 = 0.045;
    double d13Cwg_VPDB  = -4.0;
    double d18Owg_VSMOW = 26.0;
    std::string session;            // empty: no session tag
    unsigned    seed = 0;           // 0: non-deterministic
};

/*  Working-gas deltas of a noiseless analysis of `s`, measured against a
 *  stochastic working gas.                                               */
Analysis simulate_single_analysis(const Config& cfg,
                                  const VirtualSample& s,
                                  double d13Cwg_VPDB  = -4.0,
                                  double d18Owg_VSMOW = 26.0,
                                  const InstrumentModel& model = {});

/*  N analyses per sample entry, with normal errors rescaled to a sample
 *  standard deviation of exactly rD47 / rD48 (times a47 / a48) added to
 *  δ47 / δ48.                                                            */
std::vector<Analysis> virtual_data(const Config& cfg, const VirtualSession& v);

VirtualSession virtual_session_from_json(const nlohmann::json& j);

} // namespace clumpfit
