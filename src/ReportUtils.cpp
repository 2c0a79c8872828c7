#include "clumpfit/ReportUtils.hpp"
#include "clumpfit/JsonUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

/* ===================================================================== */
/*            H e l p e r s   f o r   t a b l e   f o r m a t t i n g     */
/* ===================================================================== */
namespace clumpfit {

static std::string fmt_fixed(double v, int prec)
{
    std::ostringstream s;
    s << std::fixed << std::setprecision(prec) << v;
    return s.str();
}

static std::string fmt_sci(double v, int prec)
{
    std::ostringstream s;
    s << std::scientific << std::setprecision(prec) << v;
    return s.str();
}

static std::string fmt_pm(double v, double err, int prec, bool sci = false)
{
    return sci ? fmt_sci(v, prec) + " ± " + fmt_sci(err, prec)
               : fmt_fixed(v, prec) + " ± " + fmt_fixed(err, prec);
}

/* number of code points, not bytes ('±', '–', 'Δ' are multibyte) */
static std::size_t display_width(const std::string& s)
{
    std::size_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80) ++n;
    return n;
}

static double repeatability_of(const D4xData& data, const std::string& key)
{
    auto it = data.repeatability.find(key);
    return it == data.repeatability.end() ? kNaN : it->second;
}

static std::string ppm(double r)
{
    return fmt_fixed(1000.0 * r, 1) + " ppm";
}

/* ===================================================================== */
/*                         p r e t t y _ t a b l e                       */
/* ===================================================================== */
std::string pretty_table(const Table&       rows,
                         std::size_t        header,
                         const std::string& hsep,
                         const std::string& vsep,
                         const std::string& align)
{
    std::size_t ncol = 0;
    for (const auto& r : rows) ncol = std::max(ncol, r.size());

    std::vector<std::size_t> widths(ncol, 0);
    for (const auto& r : rows)
        for (std::size_t k = 0; k < r.size(); ++k)
            widths[k] = std::max(widths[k], display_width(r[k]));

    std::string al = align;
    if (al.size() < ncol) al.append(ncol - al.size(), '>');

    std::string sepline;
    for (std::size_t k = 0; k < ncol; ++k) {
        if (k) sepline += hsep;
        for (std::size_t i = 0; i < widths[k]; ++i) sepline += vsep;
    }

    std::ostringstream out;
    out << sepline << '\n';
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (i && i == header) out << sepline << '\n';
        std::string line;
        for (std::size_t k = 0; k < ncol; ++k) {
            const std::string cell = k < rows[i].size() ? rows[i][k] : std::string();
            const std::string pad(widths[k] - display_width(cell), ' ');
            if (k) line += hsep;
            line += al[k] == '<' ? cell + pad : pad + cell;
        }
        out << line << '\n';
    }
    out << sepline << '\n';
    return out.str();
}

/* ===================================================================== */
/*                              t a b l e s                              */
/* ===================================================================== */
Table summary_table(const D4xData& data)
{
    const std::string D  = data.D4x_name();
    const std::string Dx = "Δ" + std::to_string(data.mass());
    const auto anchors  = data.anchors();
    const auto unknowns = data.unknowns();

    std::size_t na = 0, nu = 0;
    for (const auto& r : data.analyses())
        (data.is_anchor(r.Sample) ? na : nu) += 1;

    Table out;
    out.push_back({"N samples (anchors + unknowns)",
                   std::to_string(data.samples().size()) + " (" + std::to_string(anchors.size())
                   + " + " + std::to_string(unknowns.size()) + ")"});
    out.push_back({"N analyses (anchors + unknowns)",
                   std::to_string(data.size()) + " (" + std::to_string(na)
                   + " + " + std::to_string(nu) + ")"});
    out.push_back({"Repeatability of δ13C_VPDB",  ppm(repeatability_of(data, "r_d13C_VPDB"))});
    out.push_back({"Repeatability of δ18O_VSMOW", ppm(repeatability_of(data, "r_d18O_VSMOW"))});
    out.push_back({"Repeatability of " + Dx + " (anchors)",  ppm(repeatability_of(data, "r_" + D + "a"))});
    out.push_back({"Repeatability of " + Dx + " (unknowns)", ppm(repeatability_of(data, "r_" + D + "u"))});
    out.push_back({"Repeatability of " + Dx + " (all)",      ppm(repeatability_of(data, "r_" + D))});
    out.push_back({"Model degrees of freedom", std::to_string(data.Nf)});
    out.push_back({"Student's 95% t-factor",   fmt_fixed(data.t95, 2)});
    out.push_back({"Standardization method",   to_string(data.standardization_method())});
    return out;
}

Table table_of_sessions(const D4xData& data)
{
    bool has_a2 = false, has_b2 = false, has_c2 = false;
    for (const auto& [name, s] : data.sessions()) {
        has_a2 |= s.settings.scrambling_drift;
        has_b2 |= s.settings.slope_drift;
        has_c2 |= s.settings.wg_drift;
    }

    Table out;
    out.push_back({"Session", "Na", "Nu", "d13Cwg_VPDB", "d18Owg_VSMOW",
                   "r_d13C", "r_d18O", "r_" + data.D4x_name(),
                   "a ± SE", "1e3 x b ± SE", "c ± SE"});
    if (has_a2) out.back().push_back("a2 ± SE");
    if (has_b2) out.back().push_back("b2 ± SE");
    if (has_c2) out.back().push_back("c2 ± SE");

    for (const auto& [name, s] : data.sessions()) {
        std::vector<std::string> row {
            name,
            std::to_string(s.Na),
            std::to_string(s.Nu),
            fmt_fixed(s.d13Cwg_VPDB, 3),
            fmt_fixed(s.d18Owg_VSMOW, 3),
            fmt_fixed(s.r_d13C_VPDB, 4),
            fmt_fixed(s.r_d18O_VSMOW, 4),
            fmt_fixed(s.r_D4x, 4),
            fmt_pm(s.a, s.SE_a, 3),
            fmt_pm(1e3 * s.b, 1e3 * s.SE_b, 3),
            fmt_pm(s.c, s.SE_c, 3)
        };
        if (has_a2) row.push_back(s.settings.scrambling_drift ? fmt_pm(s.a2, s.SE_a2, 1, true) : "");
        if (has_b2) row.push_back(s.settings.slope_drift      ? fmt_pm(s.b2, s.SE_b2, 1, true) : "");
        if (has_c2) row.push_back(s.settings.wg_drift         ? fmt_pm(s.c2, s.SE_c2, 1, true) : "");
        out.push_back(std::move(row));
    }
    return out;
}

Table table_of_samples(const D4xData& data)
{
    Table out;
    out.push_back({"Sample", "N", "d13C_VPDB", "d18O_VSMOW", data.D4x_name(),
                   "SE", "95% CL", "SD", "p_Levene"});

    for (const auto& name : data.anchors()) {
        const Sample& s = data.sample(name);
        out.push_back({
            name,
            std::to_string(s.N),
            fmt_fixed(s.d13C_VPDB, 2),
            fmt_fixed(s.d18O_VSMOW, 2),
            fmt_fixed(s.D4x, 4),
            "", "",
            (s.N > 1 && s.SD_D4x) ? fmt_fixed(*s.SD_D4x, 4) : "",
            ""
        });
    }
    for (const auto& name : data.unknowns()) {
        const Sample& s = data.sample(name);
        out.push_back({
            name,
            std::to_string(s.N),
            fmt_fixed(s.d13C_VPDB, 2),
            fmt_fixed(s.d18O_VSMOW, 2),
            fmt_fixed(s.D4x, 4),
            fmt_fixed(s.SE_D4x, 4),
            "± " + fmt_fixed(s.SE_D4x * data.t95, 4),
            (s.N > 1 && s.SD_D4x)   ? fmt_fixed(*s.SD_D4x, 4)   : "",
            (s.N > 2 && s.p_Levene) ? fmt_fixed(*s.p_Levene, 3) : ""
        });
    }
    return out;
}

Table table_of_analyses(const D4xData& data)
{
    Table out;
    out.push_back({"UID", "Session", "Sample", "d13Cwg_VPDB", "d18Owg_VSMOW",
                   "d45", "d46", "d47", "d48", "d49", "d13C_VPDB", "d18O_VSMOW",
                   "D47raw", "D48raw", "D49raw", data.D4x_name()});
    for (const auto& r : data.analyses()) {
        out.push_back({
            r.UID, r.Session, r.Sample,
            fmt_fixed(r.d13Cwg_VPDB, 3),
            fmt_fixed(r.d18Owg_VSMOW, 3),
            fmt_fixed(r.d45, 6),
            fmt_fixed(r.d46, 6),
            fmt_fixed(r.d47, 6),
            fmt_fixed(r.d48, 6),
            fmt_fixed(r.d49, 6),
            fmt_fixed(r.d13C_VPDB, 6),
            fmt_fixed(r.d18O_VSMOW, 6),
            fmt_fixed(r.D47raw, 6),
            fmt_fixed(r.D48raw, 6),
            fmt_fixed(r.D49raw, 6),
            fmt_fixed(r.D4x, 6)
        });
    }
    return out;
}

void save_tables(const D4xData& data, const std::string& out_dir)
{
    fs::create_directories(out_dir);
    const std::string D = data.D4x_name();
    write_csv(out_dir + "/" + D + "_summary.csv",  summary_table(data));
    write_csv(out_dir + "/" + D + "_sessions.csv", table_of_sessions(data));
    write_csv(out_dir + "/" + D + "_samples.csv",  table_of_samples(data));
    write_csv(out_dir + "/" + D + "_analyses.csv", table_of_analyses(data));
}

/* ===================================================================== */
/*                      g e n e r a t e _ r e s u l t s                  */
/* ===================================================================== */
void generate_results(const D4xData& data, const std::string& out_dir, bool print_out)
{
    save_tables(data, out_dir);

    if (data.has_standardization()) {
        nlohmann::json j = data.standardization().to_json();
        j["repeatability"] = data.repeatability;
        save_json(out_dir + "/" + data.D4x_name() + "_standardization.json", j);
    }

    if (print_out) {
        std::cout << '\n' << pretty_table(summary_table(data), 0)
                  << '\n' << pretty_table(table_of_sessions(data))
                  << '\n' << pretty_table(table_of_samples(data));
    }
    data.log("report", "results written to " + out_dir);
}

} // namespace clumpfit
