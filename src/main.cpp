#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <exception>
#include <unistd.h>
#include "Bootstrapper.hpp"
#include "core/ConsoleSink.hpp"
#include "utils/ActivationFile.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/PreflightInitializer.hpp"

namespace fs = std::filesystem;

namespace {

int runPreflight(int argc, char* argv[]) {
    const std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "preflight";

    // A konzol a busznál tovább él, a busz lezárása (on_completed) így biztonságos
    Preflight::Core::ConsoleSink console(std::cout, std::cerr,
        Preflight::Core::ConsoleSink::streamIsTerminal(STDOUT_FILENO),
        Preflight::Core::ConsoleSink::streamIsTerminal(STDERR_FILENO));
    Preflight::Core::NoticeBus bus;
    rxcpp::composite_subscription lifetime;
    console.attach(bus, lifetime);

    Preflight::Core::PosixEnvironment env;
    Preflight::Core::LocalFileSystem localFs;

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        bus.pushError("bootstrap", "Cannot determine working directory: " + ec.message());
        return PreflightTemplates::EXIT_INTERNAL;
    }

    Preflight::Init::BootstrapConfig config;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    auto loaded = Preflight::Init::loadConfig(args, env, cwd, config);
    if (!loaded.ok()) {
        bus.pushError("bootstrap", loaded.message);
        std::cerr << Preflight::Init::usage(program);
        return Preflight::Core::exitCodeFor(loaded.failure);
    }
    if (config.showHelp) {
        std::cout << Preflight::Init::usage(program);
        return PreflightTemplates::EXIT_OK;
    }

    auto workdir = Preflight::Init::checkWorkingDirectory(config, localFs);
    if (!workdir.ok()) {
        bus.pushError("bootstrap", workdir.message);
        return Preflight::Core::exitCodeFor(workdir.failure);
    }

    if (config.dryRun) {
        std::cout << "\n[!] DRY-RUN MODE ACTIVATED - NO CHANGES WILL BE MADE [!]\n" << std::endl;
    }

    Preflight::Modules::VenvProvisioner provisioner(localFs, config.interpreter, config.searchPath);
    Preflight::Bootstrapper bootstrapper(bus, localFs, env, provisioner);

    auto outcome = bootstrapper.run(Preflight::Init::makeRunContext(config));
    if (!outcome.ok()) {
        return outcome.exitCode();
    }

    if (config.envFile && outcome.environment) {
        if (config.dryRun) {
            bus.pushEvent("bootstrap", "[DRY-RUN] Would write activation exports to " + config.envFile->string());
        } else if (PreflightUtils::writeTextFile(config.envFile->string(),
                       PreflightUtils::activationExports(*outcome.environment, env))) {
            bus.pushEvent("bootstrap", "Activation exports written to " + config.envFile->string());
        } else {
            bus.pushWarning("bootstrap", "Cannot write activation exports to " + config.envFile->string());
        }
    }

    auto snapshot = bus.getTelemetrySnapshot();
    std::cout << "\n[SUCCESS] Bootstrap finished in " << snapshot.window_ms << " ms ("
              << snapshot.warnings << " warnings)." << std::endl;

    return PreflightTemplates::EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        return runPreflight(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "✗ Internal error: " << e.what() << std::endl;
        return PreflightTemplates::EXIT_INTERNAL;
    }
}
