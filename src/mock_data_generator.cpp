#include "clumpfit/Config.hpp"
#include "clumpfit/CsvIO.hpp"
#include "clumpfit/Errors.hpp"
#include "clumpfit/JsonUtils.hpp"
#include "clumpfit/VirtualData.hpp"
#include <cxxopts.hpp>
#include <iostream>

using namespace clumpfit;

int main(int argc, char** argv) {
    cxxopts::Options options("clumpfit-mock",
                             "Generate virtual clumped-isotope analyses for testing");

    options.add_options()
        ("c,config", "Virtual sessions JSON", cxxopts::value<std::string>())
        ("o,output", "Output CSV", cxxopts::value<std::string>()->default_value("virtual_data.csv"))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help") || !result.count("config")) {
            std::cout << options.help() << std::endl;
            std::cout << "\nExample config.json:\n"
                      << "{\n"
                      << "  \"config\": { \"Nominal_D47\": { \"ETH-1\": 0.2052 } },\n"
                      << "  \"sessions\": [\n"
                      << "    { \"session\": \"Session_01\", \"seed\": 123, \"rD47\": 0.010,\n"
                      << "      \"samples\": [ { \"Sample\": \"ETH-1\", \"N\": 4 },\n"
                      << "                   { \"Sample\": \"FOO\", \"N\": 3,\n"
                      << "                     \"d13C_VPDB\": -5.0, \"d18O_VPDB\": -10.0,\n"
                      << "                     \"D47\": 0.3, \"D48\": 0.15 } ] }\n"
                      << "  ]\n"
                      << "}\n";
            return 0;
        }

        nlohmann::json j = load_json(result["config"].as<std::string>());
        expand_env(j);

        const Config cfg = j.contains("config") ? config_from_json(j["config"]) : Config{};
        if (!j.contains("sessions") || !j["sessions"].is_array())
            throw ConfigurationError("Virtual data config needs a 'sessions' array.");

        const std::vector<std::string> columns {
            "UID", "Session", "Sample", "d45", "d46", "d47", "d48", "d49",
            "d13Cwg_VPDB", "d18Owg_VSMOW" };
        Table rows { columns };

        std::size_t uid = 0;
        for (const auto& js : j["sessions"]) {
            const VirtualSession v = virtual_session_from_json(js);
            for (Analysis r : virtual_data(cfg, v)) {
                r.UID = std::to_string(++uid);
                Record rec = record_from_analysis(r);
                std::vector<std::string> row;
                for (const auto& c : columns) row.push_back(rec[c]);
                rows.push_back(std::move(row));
            }
            std::cout << "Session '" << v.session << "': "
                      << v.samples.size() << " sample(s)\n";
        }

        const std::string out = result["output"].as<std::string>();
        write_csv(out, rows);
        std::cout << "Wrote " << uid << " analyses to " << out << '\n';

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
