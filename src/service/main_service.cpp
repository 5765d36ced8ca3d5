#include "AnalysisService.h"
#include "DataQualityEngine.h"
#include "GuardrailConfig.h"
#include "GuardrailExceptions.h"

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        const GuardrailConfig config = GuardrailConfig::fromArgs(argc, argv, false);
        const DataQualityEngine engine(config);
        RequestMonitor monitor;
        AnalysisService service(engine, monitor, config.service);
        return service.start();
    } catch (const Guardrail::GuardrailException& e) {
        std::cerr << "[GuardrailService] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[GuardrailService] Fatal: " << e.what() << "\n";
        return 1;
    }
}
