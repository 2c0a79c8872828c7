#pragma once
#include "Dataset.hpp"
#include "StandardizationResult.hpp"
#include <map>
#include <string>
#include <vector>

namespace clumpfit {

/*  t = TimeTag − session mean when every analysis of a session carries a
 *  TimeTag, otherwise the centred index within the session.             */
void assign_timestamps(D4xData& data);

/*  Computes absolute Δ4x for every analysis and the instrumental
 *  parameters of every session, either with one global fit over all
 *  sessions ("pooled") or session by session from the anchors only
 *  ("indep_sessions").                                                  */
class StandardizationEngine {
public:
    struct Options {
        Method method = Method::Pooled;
        std::vector<std::vector<std::string>> weighted_sessions;
        std::map<std::string, std::string>    constraints;     // pooled only
        bool consolidate    = true;
        int  max_iterations = 200;
        int  threads        = 0;       // ≤ 0: OpenMP default
    };

    static Options options_from(const Config& cfg);

    StandardizationEngine(D4xData& data, Options opt);

    /*  Standardizes the dataset in place and stores the result on it.   */
    const StandardizationResult& run();

private:
    void check_inputs() const;
    void check_weighted_groups() const;

    void reset_weights();
    void weight_groups_pooled();
    void weight_groups_indep();

    StandardizationResult run_pooled();
    StandardizationResult run_indep();

    void fit_session(Session& s);
    StandardizationResult indep_result() const;

    D4xData& data_;
    Options  opt_;
};

/*  StandardizationEngine with the options found in data.config().       */
const StandardizationResult& standardize(D4xData& data);
const StandardizationResult& standardize(D4xData& data, const StandardizationEngine::Options& opt);

} // namespace clumpfit
