#include "clumpfit/Dataset.hpp"
#include "clumpfit/CsvIO.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace clumpfit {

D4xData::D4xData(Config config)
    : config_(std::move(config))
{
    config_.validate();
}

D4xData::D4xData(std::vector<Analysis> analyses, Config config)
    : config_(std::move(config))
    , analyses_(std::move(analyses))
{
    config_.validate();
    refresh();
}

/* ------------------------------------------------------------------------- */
/*  ingestion                                                                */
/* ------------------------------------------------------------------------- */
void D4xData::add(std::vector<Analysis> analyses, const std::string& session)
{
    for (auto& r : analyses) {
        if (!session.empty()) r.Session = session;
        analyses_.push_back(std::move(r));
    }
    refresh();
}

void D4xData::read(const std::string& path, char sep, const std::string& session)
{
    add(analyses_from_records(read_csv(path, sep)), session);
    msg("read", "Read " + std::to_string(analyses_.size()) + " analyses from '" + path + "'");
}

void D4xData::fill_in_missing_info()
{
    for (std::size_t i = 0; i < analyses_.size(); ++i) {
        auto& r = analyses_[i];
        if (r.UID.empty())     r.UID     = std::to_string(i + 1);
        if (r.Session.empty()) r.Session = config_.default_session;
    }
}

void D4xData::refresh()
{
    fill_in_missing_info();
    refresh_sessions();
    refresh_samples();
}

void D4xData::refresh_sessions()
{
    SessionMap fresh;
    for (std::size_t i = 0; i < analyses_.size(); ++i)
        fresh[analyses_[i].Session].data.push_back(i);

    for (auto& [name, s] : fresh) {
        s.name = name;
        auto it = config_.sessions.find(name);
        s.settings = it != config_.sessions.end() ? it->second
                                                  : config_.default_session_settings();
        s.Np = s.settings.n_active_params();
        /* keep the working gas if it was computed already */
        const Analysis& first = analyses_[s.data.front()];
        s.d13Cwg_VPDB  = first.d13Cwg_VPDB;
        s.d18Owg_VSMOW = first.d18Owg_VSMOW;
    }
    sessions_.swap(fresh);
}

void D4xData::refresh_samples()
{
    const auto& nominal = config_.nominal_D4x();
    SampleMap fresh;
    for (std::size_t i = 0; i < analyses_.size(); ++i)
        fresh[analyses_[i].Sample].data.push_back(i);
    for (auto& [name, s] : fresh) {
        s.name   = name;
        s.anchor = nominal.count(name) > 0;
    }
    samples_.swap(fresh);
}

D4xData D4xData::subset(const std::vector<std::string>& sessions) const
{
    const std::set<std::string> keep(sessions.begin(), sessions.end());
    std::vector<Analysis> sel;
    for (const auto& r : analyses_)
        if (keep.count(r.Session)) sel.push_back(r);
    if (sel.empty())
        throw std::invalid_argument("No analyses found in the requested sessions");
    return D4xData(std::move(sel), config_);
}

/* ------------------------------------------------------------------------- */
/*  access                                                                   */
/* ------------------------------------------------------------------------- */
Session& D4xData::session(const std::string& name)
{
    auto it = sessions_.find(name);
    if (it == sessions_.end()) throw std::out_of_range("Unknown session '" + name + "'");
    return it->second;
}

const Session& D4xData::session(const std::string& name) const
{
    auto it = sessions_.find(name);
    if (it == sessions_.end()) throw std::out_of_range("Unknown session '" + name + "'");
    return it->second;
}

Sample& D4xData::sample(const std::string& name)
{
    auto it = samples_.find(name);
    if (it == samples_.end()) throw std::out_of_range("Unknown sample '" + name + "'");
    return it->second;
}

const Sample& D4xData::sample(const std::string& name) const
{
    auto it = samples_.find(name);
    if (it == samples_.end()) throw std::out_of_range("Unknown sample '" + name + "'");
    return it->second;
}

std::vector<std::string> D4xData::session_names() const
{
    std::vector<std::string> out;
    out.reserve(sessions_.size());
    for (const auto& [name, s] : sessions_) out.push_back(name);
    return out;
}

std::vector<std::string> D4xData::anchors() const
{
    std::vector<std::string> out;
    for (const auto& [name, s] : samples_)
        if (s.anchor) out.push_back(name);
    return out;
}

std::vector<std::string> D4xData::unknowns() const
{
    std::vector<std::string> out;
    for (const auto& [name, s] : samples_)
        if (!s.anchor) out.push_back(name);
    return out;
}

bool D4xData::is_anchor(const std::string& sample) const
{
    return config_.nominal_D4x().count(sample) > 0;
}

void D4xData::set_nominal_D4x(std::map<std::string, double> nominal)
{
    config_.nominal_D4x() = std::move(nominal);
    refresh_samples();
}

void D4xData::set_session_settings(const std::string& session, const SessionSettings& s)
{
    config_.sessions[session] = s;
    if (auto it = sessions_.find(session); it != sessions_.end()) {
        it->second.settings = s;
        it->second.Np       = s.n_active_params();
    }
}

void D4xData::set_drift(bool scrambling, bool slope, bool wg)
{
    for (auto& [name, s] : sessions_) {
        SessionSettings st = s.settings;
        st.scrambling_drift = scrambling;
        st.slope_drift      = slope;
        st.wg_drift         = wg;
        set_session_settings(name, st);
    }
}

const StandardizationResult& D4xData::standardization() const
{
    if (!standardization_)
        throw std::logic_error("Dataset has not been standardized yet");
    return *standardization_;
}

StandardizationResult& D4xData::standardization()
{
    if (!standardization_)
        throw std::logic_error("Dataset has not been standardized yet");
    return *standardization_;
}

void D4xData::set_standardization(StandardizationResult r)
{
    method_ = r.method;
    standardization_ = std::move(r);
}

/* ------------------------------------------------------------------------- */
/*  logging                                                                  */
/* ------------------------------------------------------------------------- */
static std::string tagged(const std::string& prefix, const std::string& txt)
{
    std::ostringstream s;
    s << std::left << std::setw(16) << ("[" + prefix + "]") << ' ' << txt;
    return s.str();
}

void D4xData::log(const std::string& prefix, const std::string& txt) const
{
    if (config_.logfile.empty()) return;
    std::ofstream f(config_.logfile, std::ios::app);
    if (!f) return;

    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_now{};
    localtime_r(&now, &tm_now);
    f << '\n' << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S") << ' ' << tagged(prefix, txt);
}

void D4xData::msg(const std::string& prefix, const std::string& txt) const
{
    log(prefix, txt);
    if (config_.verbose)
        std::cout << tagged(prefix, txt) << '\n';
}

void D4xData::vmsg(const std::string& prefix, const std::string& txt) const
{
    log(prefix, txt);
    std::cout << "[" << prefix << "] " << txt << '\n';
}

} // namespace clumpfit
