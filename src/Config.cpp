#include "clumpfit/Config.hpp"
#include "clumpfit/Errors.hpp"
#include "clumpfit/JsonUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace clumpfit {

namespace {

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::map<std::string, double> read_table(const nlohmann::json& j, const char* key)
{
    if (!j.is_object())
        throw ConfigurationError(std::string("'") + key + "' must be an object of sample: value");
    std::map<std::string, double> out;
    for (auto it = j.begin(); it != j.end(); ++it)
        out[it.key()] = it.value().get<double>();
    return out;
}

SessionSettings read_session(const nlohmann::json& j, SessionSettings s)
{
    s.scrambling_drift = j.value("scrambling_drift", s.scrambling_drift);
    s.slope_drift      = j.value("slope_drift",      s.slope_drift);
    s.wg_drift         = j.value("wg_drift",         s.wg_drift);
    if (j.contains("d13C_standardization_method"))
        s.d13C_method = parse_bulk_method(j["d13C_standardization_method"].get<std::string>());
    if (j.contains("d18O_standardization_method"))
        s.d18O_method = parse_bulk_method(j["d18O_standardization_method"].get<std::string>());
    return s;
}

} // namespace

/* ------------------------------------------------------------------------- */
/*  enum <-> string                                                          */
/* ------------------------------------------------------------------------- */
BulkMethod parse_bulk_method(const std::string& s)
{
    const std::string k = lower(s);
    if (k == "none" || k.empty()) return BulkMethod::None;
    if (k == "1pt")               return BulkMethod::OnePoint;
    if (k == "2pt")               return BulkMethod::TwoPoint;
    throw ConfigurationError("Unknown bulk standardization method '" + s
                             + "' (expected none | 1pt | 2pt)");
}

Method parse_method(const std::string& s)
{
    const std::string k = lower(s);
    if (k == "pooled")         return Method::Pooled;
    if (k == "indep_sessions") return Method::IndepSessions;
    throw ConfigurationError("Unknown standardization method '" + s
                             + "' (expected pooled | indep_sessions)");
}

TeqLaw parse_teq_law(const std::string& s)
{
    const std::string k = lower(s);
    if (k == "petersen") return TeqLaw::Petersen;
    if (k == "wang")     return TeqLaw::Wang;
    throw ConfigurationError("Unknown CO2 equilibrium law '" + s + "'");
}

TeqPriority parse_teq_priority(const std::string& s)
{
    const std::string k = lower(s);
    if (k == "new")     return TeqPriority::New;
    if (k == "old")     return TeqPriority::Old;
    if (k == "replace") return TeqPriority::Replace;
    throw ConfigurationError("Unknown Teq priority '" + s + "'");
}

std::string to_string(BulkMethod m)
{
    switch (m) {
        case BulkMethod::None:     return "none";
        case BulkMethod::OnePoint: return "1pt";
        case BulkMethod::TwoPoint: return "2pt";
    }
    return "none";
}

std::string to_string(Method m)
{
    return m == Method::Pooled ? "pooled" : "indep_sessions";
}

/* ------------------------------------------------------------------------- */
/*  Config members                                                           */
/* ------------------------------------------------------------------------- */
std::map<std::string, double>& Config::nominal_D4x()
{
    return mass == 48 ? nominal_D48 : nominal_D47;
}

const std::map<std::string, double>& Config::nominal_D4x() const
{
    return mass == 48 ? nominal_D48 : nominal_D47;
}

SessionSettings Config::default_session_settings() const
{
    SessionSettings s;
    s.d13C_method = d13C_method;
    s.d18O_method = d18O_method;
    return s;
}

void Config::validate() const
{
    if (mass != 47 && mass != 48)
        throw ConfigurationError("mass must be 47 or 48, got " + std::to_string(mass));
    if (!(alpha_18O_acid > 0.0) || !std::isfinite(alpha_18O_acid))
        throw ConfigurationError("Acid fractionation factor must be a positive number.");
    if (!(ratios.R13_VPDB > 0.0 && ratios.R18_VSMOW > 0.0 &&
          ratios.R17_VSMOW > 0.0 && ratios.R18_VPDB > 0.0))
        throw ConfigurationError("Reference isotope ratios must be positive.");
    if (!constraints.empty() && method != Method::Pooled)
        throw ConfigurationError("Parameter constraints are only supported by the pooled method.");
    if (max_iterations <= 0)
        throw ConfigurationError("max_iterations must be positive.");
}

/* ------------------------------------------------------------------------- */
/*  JSON                                                                     */
/* ------------------------------------------------------------------------- */
Config config_from_json(const nlohmann::json& j)
{
    Config c;
    try {
        c.ratios.R13_VPDB  = j.value("R13_VPDB",  c.ratios.R13_VPDB);
        c.ratios.R18_VSMOW = j.value("R18_VSMOW", c.ratios.R18_VSMOW);
        c.ratios.R17_VSMOW = j.value("R17_VSMOW", c.ratios.R17_VSMOW);
        c.ratios.LAMBDA_17 = j.value("LAMBDA_17", c.ratios.LAMBDA_17);
        /* R18_VPDB follows R18_VSMOW unless given explicitly */
        c.ratios.R18_VPDB  = j.value("R18_VPDB",  c.ratios.R18_VSMOW * 1.03092);

        c.alpha_18O_acid = j.value("ALPHA_18O_ACID_REACTION", c.alpha_18O_acid);

        if (j.contains("Nominal_d13C_VPDB"))
            c.nominal_d13C_VPDB = read_table(j["Nominal_d13C_VPDB"], "Nominal_d13C_VPDB");
        if (j.contains("Nominal_d18O_VPDB"))
            c.nominal_d18O_VPDB = read_table(j["Nominal_d18O_VPDB"], "Nominal_d18O_VPDB");
        if (j.contains("Nominal_D47"))
            c.nominal_D47 = read_table(j["Nominal_D47"], "Nominal_D47");
        if (j.contains("Nominal_D48"))
            c.nominal_D48 = read_table(j["Nominal_D48"], "Nominal_D48");

        if (j.contains("d13C_STANDARDIZATION_METHOD"))
            c.d13C_method = parse_bulk_method(j["d13C_STANDARDIZATION_METHOD"].get<std::string>());
        if (j.contains("d18O_STANDARDIZATION_METHOD"))
            c.d18O_method = parse_bulk_method(j["d18O_STANDARDIZATION_METHOD"].get<std::string>());

        c.levene_ref_sample = j.value("LEVENE_REF_SAMPLE", c.levene_ref_sample);
        c.mass              = j.value("mass", c.mass);

        if (j.contains("method"))
            c.method = parse_method(j["method"].get<std::string>());
        if (j.contains("weighted_sessions"))
            c.weighted_sessions =
                j["weighted_sessions"].get<std::vector<std::vector<std::string>>>();
        if (j.contains("constraints"))
            c.constraints = j["constraints"].get<std::map<std::string, std::string>>();

        c.default_session = j.value("default_session", c.default_session);

        if (j.contains("sessions")) {
            const SessionSettings base = c.default_session_settings();
            for (auto it = j["sessions"].begin(); it != j["sessions"].end(); ++it)
                c.sessions[it.key()] = read_session(it.value(), base);
        }

        c.compute_wg = j.value("compute_wg", c.compute_wg);
        if (j.contains("D47fromTeq")) {
            const auto& t = j["D47fromTeq"];
            TeqOptions opt;
            opt.law      = parse_teq_law(t.value("law", std::string("petersen")));
            opt.priority = parse_teq_priority(t.value("priority", std::string("new")));
            c.teq = opt;
        }

        c.max_iterations = j.value("max_iterations", c.max_iterations);
        c.threads        = j.value("threads", c.threads);
        c.verbose        = j.value("verbose", c.verbose);
        c.logfile        = j.value("logfile", c.logfile);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
    }

    c.validate();
    return c;
}

nlohmann::json config_to_json(const Config& c)
{
    nlohmann::json j;
    j["R13_VPDB"]  = c.ratios.R13_VPDB;
    j["R18_VSMOW"] = c.ratios.R18_VSMOW;
    j["R17_VSMOW"] = c.ratios.R17_VSMOW;
    j["R18_VPDB"]  = c.ratios.R18_VPDB;
    j["LAMBDA_17"] = c.ratios.LAMBDA_17;
    j["ALPHA_18O_ACID_REACTION"] = c.alpha_18O_acid;
    j["Nominal_d13C_VPDB"] = c.nominal_d13C_VPDB;
    j["Nominal_d18O_VPDB"] = c.nominal_d18O_VPDB;
    j["Nominal_D47"] = c.nominal_D47;
    j["Nominal_D48"] = c.nominal_D48;
    j["d13C_STANDARDIZATION_METHOD"] = to_string(c.d13C_method);
    j["d18O_STANDARDIZATION_METHOD"] = to_string(c.d18O_method);
    j["LEVENE_REF_SAMPLE"] = c.levene_ref_sample;
    j["mass"]   = c.mass;
    j["method"] = to_string(c.method);
    j["weighted_sessions"] = c.weighted_sessions;
    j["constraints"]       = c.constraints;
    j["default_session"]   = c.default_session;
    for (const auto& [name, s] : c.sessions) {
        j["sessions"][name] = {
            {"scrambling_drift", s.scrambling_drift},
            {"slope_drift",      s.slope_drift},
            {"wg_drift",         s.wg_drift},
            {"d13C_standardization_method", to_string(s.d13C_method)},
            {"d18O_standardization_method", to_string(s.d18O_method)} };
    }
    j["compute_wg"]     = c.compute_wg;
    j["max_iterations"] = c.max_iterations;
    j["threads"]        = c.threads;
    return j;
}

Config load_config(const std::string& path)
{
    nlohmann::json j = load_json(path);
    expand_env(j);
    return config_from_json(j);
}

} // namespace clumpfit
