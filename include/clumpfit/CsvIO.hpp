#pragma once
#include "Analysis.hpp"
#include <map>
#include <string>
#include <vector>

namespace clumpfit {

/*  One CSV row: column name → trimmed text.  Empty cells are dropped.    */
using Record = std::map<std::string, std::string>;
using Table  = std::vector<std::vector<std::string>>;

/*  ',' ';' or '\t', whichever appears most often.                        */
char detect_separator(const std::string& text);

std::vector<Record> parse_csv(const std::string& text, char sep = '\0');
std::vector<Record> read_csv(const std::string& path, char sep = '\0');

/*  Records → analyses.  Requires Sample, d45, d46 and one of d47 / d48;
 *  throws ConfigurationError otherwise.                                   */
std::vector<Analysis> analyses_from_records(const std::vector<Record>& records);
Record record_from_analysis(const Analysis& r);

std::string make_csv(const Table& rows, const std::string& hsep = ",",
                     const std::string& vsep = "\n");
void write_csv(const std::string& path, const Table& rows);

} // namespace clumpfit
