#pragma once
#include "CsvIO.hpp"
#include "Dataset.hpp"
#include <string>

namespace clumpfit {

/* --------------------------------------------------------------------- */
/*                     p l a i n - t e x t   t a b l e s                 */
/* --------------------------------------------------------------------- */

/*  Column-aligned text table.  Rows before `header` are header rows and
 *  are followed by a rule.  `align` holds one of '<' / '>' per column;
 *  missing entries default to '>'.  Widths count UTF-8 code points.      */
std::string pretty_table(const Table&       rows,
                         std::size_t        header = 1,
                         const std::string& hsep   = "  ",
                         const std::string& vsep   = "–",
                         const std::string& align  = "<");

/* --------------------------------------------------------------------- */
/*                  t a b l e s   o f   r e s u l t s                    */
/* --------------------------------------------------------------------- */
Table summary_table    (const D4xData& data);
Table table_of_sessions(const D4xData& data);
Table table_of_samples (const D4xData& data);
Table table_of_analyses(const D4xData& data);

/*  D47_summary.csv, D47_sessions.csv, D47_samples.csv, D47_analyses.csv
 *  (D48_… for Δ48) in `out_dir`, created if needed.                     */
void save_tables(const D4xData& data, const std::string& out_dir);

/* --------------------------------------------------------------------- */
/*      High-level helper:  create *all* results at the very end         */
/* --------------------------------------------------------------------- */

/*  CSV tables, plus D4x_standardization.json with the parameter vector
 *  and covariance when the dataset has been standardized.  With
 *  `print_out` the summary, sessions and samples tables go to stdout.    */
void generate_results(const D4xData& data, const std::string& out_dir,
                      bool print_out = true);

} // namespace clumpfit
