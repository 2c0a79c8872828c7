#include "clumpfit/SampleSplitter.hpp"
#include "clumpfit/ConsolidationStatistics.hpp"
#include "clumpfit/Errors.hpp"
#include "clumpfit/ParameterIndexer.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace clumpfit {

void split_samples(D4xData& data, const std::vector<std::string>& samples, const std::string& grouping)
{
    std::string g = grouping;
    std::transform(g.begin(), g.end(), g.begin(), [](unsigned char ch) { return std::tolower(ch); });
    if (g != "by_uid" && g != "by_session")
        throw ConfigurationError("Unknown grouping '" + grouping + "' (expected by_uid or by_session)");

    const auto unknowns = data.unknowns();
    const std::set<std::string> targets = samples.empty()
        ? std::set<std::string>(unknowns.begin(), unknowns.end())
        : std::set<std::string>(samples.begin(), samples.end());
    const std::set<std::string> unknown_set(unknowns.begin(), unknowns.end());

    for (auto& r : data.analyses()) {
        if (targets.count(r.Sample)) {
            r.Sample_original = r.Sample;
            r.Sample += "__" + (g == "by_uid" ? r.UID : r.Session);
        } else if (unknown_set.count(r.Sample)) {
            r.Sample_original = r.Sample;
        }
    }
    data.grouping = g;
    data.refresh_samples();
    data.msg("split", "Split " + std::to_string(targets.size()) + " samples " + g);
}

void unsplit_samples(D4xData& data)
{
    if (!data.has_standardization() || data.standardization().method != Method::Pooled)
        throw std::logic_error("unsplit_samples() requires a pooled standardization");
    if (!data.grouping)
        throw std::logic_error("unsplit_samples() called without a prior split_samples()");

    const StandardizationResult& old = data.standardization();
    const std::string prefix = data.D4x_name() + "_";
    const auto Ns = static_cast<Eigen::Index>(old.n_session_params);
    const auto n_old = static_cast<Eigen::Index>(old.values.size());

    std::set<std::string> originals;
    for (const auto& r : data.analyses())
        if (r.Sample_original) originals.insert(*r.Sample_original);
    const std::vector<std::string> unknowns_new(originals.begin(), originals.end());

    const auto n_new = Ns + static_cast<Eigen::Index>(unknowns_new.size());
    Matrix W = Matrix::Zero(n_new, n_old);
    W.topLeftCorner(Ns, Ns).setIdentity();

    std::vector<std::string> vars_new(old.var_names.begin(), old.var_names.begin() + Ns);
    for (std::size_t k = 0; k < unknowns_new.size(); ++k) {
        const std::string& u = unknowns_new[k];
        vars_new.push_back(prefix + pf(u));

        std::set<std::string> splits;
        for (const auto& r : data.analyses())
            if (r.Sample_original && *r.Sample_original == u) splits.insert(r.Sample);

        std::vector<std::size_t> cols;
        for (const auto& s : splits)
            if (auto i = old.find(prefix + pf(s))) cols.push_back(*i);
        if (cols.empty()) {
            /* not refitted since the split */
            if (auto i = old.find(prefix + pf(u))) cols.push_back(*i);
            else throw std::logic_error("No fitted parameter for sample '" + u + "'");
        }

        std::vector<double> w(cols.size(), 1.0);
        const bool has_variances = std::all_of(cols.begin(), cols.end(),
                                               [&](std::size_t i) { return old.covar(i, i) > 0.0; });
        if (*data.grouping == "by_session" && has_variances)
            for (std::size_t j = 0; j < cols.size(); ++j)
                w[j] = 1.0 / old.covar(cols[j], cols[j]);
        double sw = 0.0;
        for (double x : w) sw += x;

        for (std::size_t j = 0; j < cols.size(); ++j)
            W(Ns + static_cast<Eigen::Index>(k), static_cast<Eigen::Index>(cols[j])) = w[j] / sw;
    }

    StandardizationResult res = old;
    res.var_names = vars_new;
    res.values    = W * old.values;
    res.covar     = W * old.covar * W.transpose();
    res.unknowns  = unknowns_new;
    res.varying.assign(old.varying.begin(), old.varying.begin() + Ns);
    res.varying.resize(static_cast<std::size_t>(n_new), true);
    data.set_standardization(std::move(res));

    for (auto& r : data.analyses()) {
        if (!r.Sample_original) continue;
        r.Sample = *r.Sample_original;
        r.Sample_original.reset();
    }
    data.grouping.reset();
    data.refresh_samples();
    consolidate_samples(data);
    repeatabilities(data);
    data.msg("split", "Recombined " + std::to_string(unknowns_new.size()) + " unknowns");
}

} // namespace clumpfit
