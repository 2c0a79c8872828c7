#include "clumpfit/CsvIO.hpp"
#include "clumpfit/Errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace clumpfit {
namespace {

std::string trim(const std::string& s)
{
    auto b = std::find_if_not(s.begin(), s.end(), ::isspace);
    auto e = std::find_if_not(s.rbegin(), s.rend(), ::isspace).base();
    return b < e ? std::string(b, e) : std::string();
}

std::vector<std::string> split(const std::string& line, char sep)
{
    std::vector<std::string> out;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, sep)) out.push_back(trim(field));
    if (!line.empty() && line.back() == sep) out.emplace_back();
    return out;
}

double to_double(const Record& rec, const std::string& key, std::size_t row)
{
    const std::string& txt = rec.at(key);
    try {
        std::size_t pos = 0;
        const double v = std::stod(txt, &pos);
        if (pos != txt.size()) throw std::invalid_argument(txt);
        return v;
    } catch (const std::exception&) {
        throw ConfigurationError("Row " + std::to_string(row) + ": field '" + key
                                 + "' is not a number ('" + txt + "')");
    }
}

std::string fmt(double v)
{
    std::ostringstream s;
    s << std::setprecision(12) << v;
    return s.str();
}

} // namespace

char detect_separator(const std::string& text)
{
    const std::array<char, 3> candidates{',', ';', '\t'};
    char best = ',';
    std::ptrdiff_t nbest = -1;
    for (char c : candidates) {
        const auto n = std::count(text.begin(), text.end(), c);
        if (n > nbest) { best = c; nbest = n; }
    }
    return best;
}

std::vector<Record> parse_csv(const std::string& text, char sep)
{
    if (sep == '\0') sep = detect_separator(text);

    std::vector<std::vector<std::string>> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;
        lines.push_back(split(line, sep));
    }
    if (lines.empty()) return {};

    const auto& header = lines.front();
    std::vector<Record> out;
    out.reserve(lines.size() - 1);
    for (std::size_t i = 1; i < lines.size(); ++i) {
        Record rec;
        const std::size_t n = std::min(header.size(), lines[i].size());
        for (std::size_t k = 0; k < n; ++k)
            if (!lines[i][k].empty()) rec[header[k]] = lines[i][k];
        out.push_back(std::move(rec));
    }
    return out;
}

std::vector<Record> read_csv(const std::string& path, char sep)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open '" + path + "'");
    std::ostringstream buf;
    buf << f.rdbuf();
    auto rows = parse_csv(buf.str(), sep);
    if (rows.empty())
        throw std::runtime_error("File '" + path + "' contains no valid data");
    return rows;
}

std::vector<Analysis> analyses_from_records(const std::vector<Record>& records)
{
    std::vector<Analysis> out;
    out.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        const Record& rec = records[i];
        const std::size_t row = i + 1;
        for (const char* key : {"Sample", "d45", "d46"})
            if (!rec.count(key))
                throw ConfigurationError("Row " + std::to_string(row)
                                         + ": missing required field '" + key + "'");
        if (!rec.count("d47") && !rec.count("d48"))
            throw ConfigurationError("Row " + std::to_string(row)
                                     + ": at least one of 'd47' or 'd48' is required");

        Analysis r;
        r.Sample = rec.at("Sample");
        if (rec.count("UID"))     r.UID     = rec.at("UID");
        if (rec.count("Session")) r.Session = rec.at("Session");
        r.d45 = to_double(rec, "d45", row);
        r.d46 = to_double(rec, "d46", row);
        if (rec.count("d47"))  r.d47  = to_double(rec, "d47", row);
        if (rec.count("d48"))  r.d48  = to_double(rec, "d48", row);
        if (rec.count("d49"))  r.d49  = to_double(rec, "d49", row);
        if (rec.count("D17O")) r.D17O = to_double(rec, "D17O", row);
        if (rec.count("TimeTag")) r.TimeTag = to_double(rec, "TimeTag", row);
        if (rec.count("Teq"))     r.Teq     = to_double(rec, "Teq", row);
        if (rec.count("d13Cwg_VPDB"))  r.d13Cwg_VPDB  = to_double(rec, "d13Cwg_VPDB", row);
        if (rec.count("d18Owg_VSMOW")) r.d18Owg_VSMOW = to_double(rec, "d18Owg_VSMOW", row);
        out.push_back(std::move(r));
    }
    return out;
}

Record record_from_analysis(const Analysis& r)
{
    Record rec;
    if (!r.UID.empty())     rec["UID"]     = r.UID;
    if (!r.Session.empty()) rec["Session"] = r.Session;
    rec["Sample"] = r.Sample;
    rec["d45"] = fmt(r.d45);
    rec["d46"] = fmt(r.d46);
    rec["d47"] = fmt(r.d47);
    rec["d48"] = fmt(r.d48);
    rec["d49"] = fmt(r.d49);
    rec["D17O"] = fmt(r.D17O);
    if (r.TimeTag) rec["TimeTag"] = fmt(*r.TimeTag);
    if (r.Teq)     rec["Teq"]     = fmt(*r.Teq);
    if (!std::isnan(r.d13Cwg_VPDB))  rec["d13Cwg_VPDB"]  = fmt(r.d13Cwg_VPDB);
    if (!std::isnan(r.d18Owg_VSMOW)) rec["d18Owg_VSMOW"] = fmt(r.d18Owg_VSMOW);
    return rec;
}

std::string make_csv(const Table& rows, const std::string& hsep, const std::string& vsep)
{
    std::string out;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (i) out += vsep;
        for (std::size_t k = 0; k < rows[i].size(); ++k) {
            if (k) out += hsep;
            out += rows[i][k];
        }
    }
    return out;
}

void write_csv(const std::string& path, const Table& rows)
{
    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot write '" + path + "'");
    f << make_csv(rows);
}

} // namespace clumpfit
