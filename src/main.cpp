#include "clumpfit/AnalysisCruncher.hpp"
#include "clumpfit/CO2Equilibrium.hpp"
#include "clumpfit/Config.hpp"
#include "clumpfit/Dataset.hpp"
#include "clumpfit/ReportUtils.hpp"
#include "clumpfit/StandardizationEngine.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <iostream>

using namespace clumpfit;

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("clumpfit", "Clumped-isotope (Δ47 / Δ48) standardization");
        opts.add_options()
            ("d,data", "Analyses (CSV)", cxxopts::value<std::string>())
            ("c,config", "Configuration JSON", cxxopts::value<std::string>())
            ("m,mass", "47 or 48", cxxopts::value<int>())
            ("method", "pooled | indep_sessions", cxxopts::value<std::string>())
            ("o,output", "Output directory", cxxopts::value<std::string>()->default_value("output"))
            ("wg", "Compute the working-gas composition from the carbonate standards")
            ("v,verbose", "Verbose output")
            ("j,threads", "Number of threads", cxxopts::value<int>())
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("data")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        // Configuration: file first, command line on top
        Config cfg = cli.count("config") ? load_config(cli["config"].as<std::string>()) : Config{};
        if (cli.count("mass"))    cfg.mass    = cli["mass"].as<int>();
        if (cli.count("method"))  cfg.method  = parse_method(cli["method"].as<std::string>());
        if (cli.count("threads")) cfg.threads = cli["threads"].as<int>();
        if (cli.count("wg"))      cfg.compute_wg = true;
        if (cli.count("verbose")) cfg.verbose = true;
        cfg.validate();

        D4xData data(cfg);
        data.read(cli["data"].as<std::string>());
        std::cout << "Loaded " << data.size() << " analyses in "
                  << data.sessions().size() << " session(s)\n";

        if (cfg.compute_wg)
            compute_wg(data);
        if (cfg.teq)
            D47fromTeq(data, *cfg.teq);

        crunch(data);
        standardize(data);

        generate_results(data, cli["output"].as<std::string>());

        if (data.numerical_anomalies() > 0)
            std::cout << "\n" << data.numerical_anomalies()
                      << " analyses with inconsistent isobar ratios\n";
        std::cout << "\nStandardization completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    std::cout << "\nTook: ";
    if (duration >= 1000) std::cout << duration / 1000 << "s ";
    std::cout << duration % 1000 << "ms\n";

    return 0;
}
