#pragma once
#include "IsobarModel.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clumpfit {

enum class BulkMethod { None, OnePoint, TwoPoint };
enum class Method     { Pooled, IndepSessions };
enum class TeqLaw     { Petersen, Wang };
enum class TeqPriority{ New, Old, Replace };

BulkMethod  parse_bulk_method(const std::string& s);
Method      parse_method     (const std::string& s);
TeqLaw      parse_teq_law    (const std::string& s);
TeqPriority parse_teq_priority(const std::string& s);

std::string to_string(BulkMethod m);
std::string to_string(Method m);

/*  Per-session switches.  Survive every registry refresh.               */
struct SessionSettings {
    bool       scrambling_drift = false;   // a2 free
    bool       slope_drift      = false;   // b2 free
    bool       wg_drift         = false;   // c2 free
    BulkMethod d13C_method      = BulkMethod::TwoPoint;
    BulkMethod d18O_method      = BulkMethod::TwoPoint;

    int n_active_params() const {
        return 3 + int(scrambling_drift) + int(slope_drift) + int(wg_drift);
    }
};

struct TeqOptions {
    TeqLaw      law      = TeqLaw::Petersen;
    TeqPriority priority = TeqPriority::New;
};

struct Config {
    ReferenceRatios ratios;
    double alpha_18O_acid = 1.008129;      // calcite at 90 °C, Kim et al. (2007)

    std::map<std::string, double> nominal_d13C_VPDB {
        {"ETH-1",   2.02}, {"ETH-2", -10.17}, {"ETH-3",  1.71} };
    std::map<std::string, double> nominal_d18O_VPDB {
        {"ETH-1",  -2.19}, {"ETH-2", -18.69}, {"ETH-3", -1.78} };
    std::map<std::string, double> nominal_D47 {
        {"ETH-1",   0.2052}, {"ETH-2",   0.2085}, {"ETH-3", 0.6132},
        {"ETH-4",   0.4511}, {"IAEA-C1", 0.3018}, {"IAEA-C2", 0.6409},
        {"MERCK",   0.5135} };
    std::map<std::string, double> nominal_D48 {
        {"ETH-1",   0.138}, {"ETH-2", 0.138}, {"ETH-3", 0.270},
        {"ETH-4",   0.223}, {"GU-1", -0.419} };

    BulkMethod  d13C_method       = BulkMethod::TwoPoint;
    BulkMethod  d18O_method       = BulkMethod::TwoPoint;
    std::string levene_ref_sample = "ETH-3";
    int         mass              = 47;

    Method method = Method::Pooled;
    std::vector<std::vector<std::string>> weighted_sessions;
    std::map<std::string, std::string>    constraints;   // pooled only

    std::string default_session = "mySession";
    std::map<std::string, SessionSettings> sessions;

    bool compute_wg = false;
    std::optional<TeqOptions> teq;

    int  max_iterations = 200;
    int  threads        = 0;
    bool verbose        = false;
    std::string logfile;

    std::map<std::string, double>&       nominal_D4x();
    const std::map<std::string, double>& nominal_D4x() const;

    /*  settings for a session not listed in `sessions`                  */
    SessionSettings default_session_settings() const;

    /*  throws ConfigurationError on inconsistent values                 */
    void validate() const;
};

Config config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const Config& cfg);
Config load_config(const std::string& path);

} // namespace clumpfit
