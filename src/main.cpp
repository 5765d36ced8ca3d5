#include "DataQualityEngine.h"
#include "GuardrailConfig.h"
#include "GuardrailExceptions.h"
#include "ReportJson.h"
#include "TableLoader.h"

#include <fstream>
#include <iostream>
#include <optional>
#include <string>

void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " <dataset.csv> [options]\n"
              << "Options:\n"
              << "  --baseline <file>                 Baseline CSV to compare against\n"
              << "  --config <file>                   key: value configuration file\n"
              << "  --output <file>                   Write the JSON report to a file instead of stdout\n"
              << "  --delimiter <char>                CSV delimiter character (default: ,)\n"
              << "  --threads <n>                     Worker threads for column profiling (default: all cores)\n"
              << "  --pretty <true|false>             Indented JSON output (default: true)\n"
              << "  --verbose <true|false>            Progress logs on stderr\n"
              << "  --type.<column> <type>            Force numeric|boolean|categorical|datetime|text\n"
              << "  --<threshold_key> <value>         Override any threshold, e.g. --psi_critical 0.3\n"
              << "  --help                            Show this help message\n";
}

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage(argv[0]);
        return 0;
    }

    try {
        const GuardrailConfig config = GuardrailConfig::fromArgs(argc, argv);
        const TableLoader loader(config.delimiter);

        const Table dataset = loader.fromCsvFile(config.datasetPath);
        std::optional<Table> baseline;
        if (!config.baselinePath.empty()) {
            baseline.emplace(loader.fromCsvFile(config.baselinePath));
        }

        const DataQualityEngine engine(config);
        const Report report = engine.analyze(dataset, baseline ? &*baseline : nullptr);
        const std::string json = ReportJson::toJson(report, config.pretty);

        if (config.outputPath.empty()) {
            std::cout << json << "\n";
        } else {
            std::ofstream out(config.outputPath);
            if (!out) throw Guardrail::IOException("Could not open output file: " + config.outputPath);
            out << json << "\n";
            if (!out) throw Guardrail::IOException("Failed writing output file: " + config.outputPath);
            if (config.verbose) {
                std::cerr << "[Guardrail] report written to " << config.outputPath << "\n";
            }
        }
        return 0;
    } catch (const Guardrail::GuardrailException& e) {
        std::cerr << "[Guardrail] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Guardrail] Fatal: " << e.what() << "\n";
        return 1;
    }
}
