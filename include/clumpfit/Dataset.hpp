#pragma once
#include "Analysis.hpp"
#include "Config.hpp"
#include "Registry.hpp"
#include "StandardizationResult.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clumpfit {

/*  A collection of Δ47 or Δ48 analyses spanning one or more sessions,
 *  together with the session / sample registries derived from it and
 *  the outcome of the last standardization.
 *
 *  The registries are index maps into `analyses()` and must be rebuilt
 *  (refresh(), refresh_samples()) after any change of `Session` or
 *  `Sample` fields.  Keys are kept sorted.                               */
class D4xData {
public:
    explicit D4xData(Config config = {});
    D4xData(std::vector<Analysis> analyses, Config config = {});

    /* ---- ingestion ---------------------------------------------------- */
    void add(std::vector<Analysis> analyses, const std::string& session = "");
    void read(const std::string& path, char sep = '\0', const std::string& session = "");

    void refresh();
    void refresh_sessions();
    void refresh_samples();

    /*  Copy of the analyses belonging to `sessions`, with the same
     *  configuration.  Standardization state is not copied.              */
    D4xData subset(const std::vector<std::string>& sessions) const;

    /* ---- access ------------------------------------------------------- */
    std::vector<Analysis>&       analyses()       { return analyses_; }
    const std::vector<Analysis>& analyses() const { return analyses_; }
    std::size_t size() const { return analyses_.size(); }

    SessionMap&       sessions()       { return sessions_; }
    const SessionMap& sessions() const { return sessions_; }
    SampleMap&        samples()        { return samples_; }
    const SampleMap&  samples()  const { return samples_; }

    Session&       session(const std::string& name);
    const Session& session(const std::string& name) const;
    Sample&        sample(const std::string& name);
    const Sample&  sample(const std::string& name) const;

    std::vector<std::string> session_names() const;
    std::vector<std::string> anchors() const;
    std::vector<std::string> unknowns() const;
    bool is_anchor(const std::string& sample) const;

    Config&       config()       { return config_; }
    const Config& config() const { return config_; }
    int mass() const { return config_.mass; }
    std::string D4x_name() const { return "D" + std::to_string(config_.mass); }

    const std::map<std::string, double>& nominal_D4x() const { return config_.nominal_D4x(); }
    void set_nominal_D4x(std::map<std::string, double> nominal);

    void set_session_settings(const std::string& session, const SessionSettings& s);
    /*  switch a drift term on/off in every session                       */
    void set_drift(bool scrambling, bool slope, bool wg);

    /* ---- standardization state --------------------------------------- */
    bool has_standardization() const { return standardization_.has_value(); }
    const StandardizationResult& standardization() const;
    StandardizationResult&       standardization();
    void set_standardization(StandardizationResult r);

    Method standardization_method() const { return method_; }
    void   set_standardization_method(Method m) { method_ = m; }

    int    Nf  = 0;
    double t95 = kNaN;
    std::map<std::string, double> repeatability;
    std::optional<std::string>    grouping;      // set by split_samples()

    /* ---- logging ------------------------------------------------------ */
    void msg (const std::string& prefix, const std::string& txt) const;
    void vmsg(const std::string& prefix, const std::string& txt) const;
    void log (const std::string& prefix, const std::string& txt) const;

    bool verbose() const { return config_.verbose; }
    void set_verbose(bool v) { config_.verbose = v; }

    int  numerical_anomalies() const { return numerical_anomalies_; }
    void note_numerical_anomaly() { ++numerical_anomalies_; }

private:
    void fill_in_missing_info();

    Config                config_;
    std::vector<Analysis> analyses_;
    SessionMap            sessions_;
    SampleMap             samples_;

    std::optional<StandardizationResult> standardization_;
    Method method_ = Method::Pooled;
    int    numerical_anomalies_ = 0;
};

} // namespace clumpfit
