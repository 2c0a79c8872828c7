#pragma once
#include "Config.hpp"
#include "Types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clumpfit {

/*  Session view of the analysis list.  `data` holds indices into
 *  D4xData::analyses(), in input order.                                  */
struct Session {
    std::string              name;
    std::vector<std::size_t> data;
    SessionSettings          settings;

    double d13Cwg_VPDB  = kNaN;
    double d18Owg_VSMOW = kNaN;

    /* instrumental parameters: D4xraw = a·D4x + b·d4x + c + t·(a2·D4x + b2·d4x + c2) */
    double a  = kNaN, b  = kNaN, c  = kNaN;
    double a2 = 0.0,  b2 = 0.0,  c2 = 0.0;
    double SE_a  = kNaN, SE_b  = kNaN, SE_c  = kNaN;
    double SE_a2 = 0.0,  SE_b2 = 0.0,  SE_c2 = 0.0;
    Matrix6 CM = Matrix6::Zero();

    int Np = 3;
    int Na = 0;
    int Nu = 0;

    double r_d13C_VPDB  = kNaN;
    double r_d18O_VSMOW = kNaN;
    double r_D4x        = kNaN;
};

/*  Per-session estimate of an unknown (indep_sessions only).            */
struct SessionEstimate {
    double D4x    = kNaN;
    double SE     = kNaN;
    double weight = kNaN;   // invVar / Σ invVar over this sample's sessions
};

struct Sample {
    std::string              name;
    std::vector<std::size_t> data;
    bool                     anchor = false;

    double D4x    = kNaN;
    double SE_D4x = kNaN;
    int    N      = 0;
    std::optional<double> SD_D4x;      // N > 1
    double d13C_VPDB  = kNaN;
    double d18O_VSMOW = kNaN;
    std::optional<double> p_Levene;    // N > 2

    std::map<std::string, SessionEstimate> session_D4x;
};

using SessionMap = std::map<std::string, Session>;
using SampleMap  = std::map<std::string, Sample>;

} // namespace clumpfit
