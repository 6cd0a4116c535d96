#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "app/LedgerLensApp.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace ledgerlens;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::filesystem::path settingsPath = infrastructure::PathUtils::GetDefaultSettingsPath();
    if (args.size() >= 2 && args[0] == "--config") {
        settingsPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        return app::LedgerLensApp::PrintUsage();
    }

    const std::string command = args[0];
    args.erase(args.begin());

    try {
        app::LedgerLensApp ledgerLens(infrastructure::ConfigLoader::Load(settingsPath));
        return ledgerLens.Run(command, args);
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "[LedgerLens] Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[LedgerLens] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
