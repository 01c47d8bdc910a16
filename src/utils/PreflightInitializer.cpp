#include "utils/PreflightInitializer.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StringUtils.hpp"
#include <sstream>

namespace fs = std::filesystem;

namespace Preflight::Init {

    namespace {
        // Az opciók értéket várnak: "--zip PATH" vagy "--zip=PATH"
        bool takeValue(const std::vector<std::string>& args, size_t& i, const std::string& option,
                       std::string& value, bool& matched) {
            const std::string& arg = args[i];
            matched = false;
            if (arg == option) {
                matched = true;
                if (i + 1 >= args.size()) return false;
                value = args[++i];
                return true;
            }
            if (arg.rfind(option + "=", 0) == 0) {
                matched = true;
                value = arg.substr(option.size() + 1);
                return true;
            }
            return true;
        }
    }

    bool detectEnvironment(const Core::ProcessEnvironment& env) {
        auto flag = env.get(PreflightTemplates::CI_FLAG_VAR);
        return flag && *flag == PreflightTemplates::CI_FLAG_VALUE;
    }

    Core::StepResult loadConfig(const std::vector<std::string>& args,
                                const Core::ProcessEnvironment& env,
                                const fs::path& cwd,
                                BootstrapConfig& out) {
        BootstrapConfig config;

        // 1. Alapértékek
        config.workingDirectory = cwd;
        config.interpreter = PreflightTemplates::DEFAULT_INTERPRETER;
        config.searchPath = PreflightTemplates::FALLBACK_SEARCH_PATH;

        // 2. Környezeti változók
        config.isCI = detectEnvironment(env);

        auto zip = env.get(PreflightTemplates::INPUT_ARCHIVE_VAR);
        if (zip && !zip->empty()) config.inputArchive = fs::path(*zip);

        auto python = env.get(PreflightTemplates::INTERPRETER_VAR);
        if (python && !python->empty()) config.interpreter = *python;

        auto path = env.get(PreflightTemplates::PATH_VAR);
        if (path && !path->empty()) config.searchPath = *path;

        // 3. Parancssor
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg == "-h" || arg == "--help") {
                config.showHelp = true;
                continue;
            }
            if (arg == "--dry-run") {
                config.dryRun = true;
                continue;
            }

            std::string value;
            bool matched = false;
            bool complete = true;

            for (const char* option : {"--workdir", "--zip", "--python", "--env-file"}) {
                complete = takeValue(args, i, option, value, matched);
                if (!matched) continue;
                if (!complete) {
                    return Core::StepResult::fatal(Core::FailureKind::Usage,
                        std::string("Option ") + option + " requires a value");
                }

                const std::string name = option;
                if (name == "--workdir") {
                    if (value.empty()) {
                        return Core::StepResult::fatal(Core::FailureKind::Usage, "Option --workdir requires a value");
                    }
                    fs::path dir(value);
                    config.workingDirectory = dir.is_absolute() ? dir : cwd / dir;
                } else if (name == "--zip") {
                    // Üres érték: kihagyás, mint az üres ZIP változónál
                    if (value.empty()) config.inputArchive.reset();
                    else config.inputArchive = fs::path(value);
                } else if (name == "--python") {
                    if (value.empty()) {
                        return Core::StepResult::fatal(Core::FailureKind::Usage, "Option --python requires a value");
                    }
                    config.interpreter = value;
                } else {
                    if (value.empty()) {
                        return Core::StepResult::fatal(Core::FailureKind::Usage, "Option --env-file requires a value");
                    }
                    config.envFile = fs::path(value);
                }
                break;
            }

            if (!matched) {
                return Core::StepResult::fatal(Core::FailureKind::Usage, "Unknown option: " + arg, arg);
            }
        }

        config.workingDirectory = config.workingDirectory.lexically_normal();
        out = config;
        return Core::StepResult::success();
    }

    Core::StepResult checkWorkingDirectory(const BootstrapConfig& config,
                                           const Core::FileSystem& fileSystem) {
        const auto& dir = config.workingDirectory;
        std::error_code ec;
        if (fileSystem.isDirectory(dir, ec)) return Core::StepResult::success();
        if (ec) {
            return Core::StepResult::fatal(Core::FailureKind::Usage,
                "Cannot inspect working directory " + dir.string() + ": " + ec.message(), dir.string());
        }
        return Core::StepResult::fatal(Core::FailureKind::Usage,
            "Working directory does not exist or is not a directory: " + dir.string(), dir.string());
    }

    Core::RunContext makeRunContext(const BootstrapConfig& config) {
        Core::RunContext ctx;
        ctx.isCI = config.isCI;
        ctx.workingDirectory = config.workingDirectory;
        ctx.inputArchivePath = config.inputArchive;
        ctx.dryRun = config.dryRun;
        return ctx;
    }

    std::optional<fs::path> resolveExecutable(const std::string& name,
                                              const std::string& searchPath,
                                              const Core::FileSystem& fileSystem) {
        if (name.empty()) return std::nullopt;

        if (name.find('/') != std::string::npos) {
            if (fileSystem.isExecutable(name)) return fs::path(name);
            return std::nullopt;
        }

        for (const auto& dir : PreflightUtils::split(searchPath, ':')) {
            // Üres PATH elem = aktuális könyvtár
            fs::path candidate = dir.empty() ? fs::path(name) : fs::path(dir) / name;
            if (fileSystem.isExecutable(candidate)) return candidate;
        }
        return std::nullopt;
    }

    std::string usage(const std::string& program) {
        std::ostringstream ss;
        ss << "Usage: " << program << " [options]\n"
           << "\n"
           << "Prepares the working directory before the build/validation pipeline runs.\n"
           << "\n"
           << "Options:\n"
           << "  --dry-run          report what would be done, change nothing\n"
           << "  --workdir DIR      directory to prepare (default: current directory)\n"
           << "  --zip PATH         input archive to check (overrides $" << PreflightTemplates::INPUT_ARCHIVE_VAR << ")\n"
           << "  --python BIN       interpreter used to create the virtualenv (overrides $"
           << PreflightTemplates::INTERPRETER_VAR << ", default " << PreflightTemplates::DEFAULT_INTERPRETER << ")\n"
           << "  --env-file PATH    write the activated environment as shell exports\n"
           << "  -h, --help         show this help\n"
           << "\n"
           << "Environment:\n"
           << "  " << PreflightTemplates::CI_FLAG_VAR << "=true   CI runner: use the runner's Python, no virtualenv\n"
           << "\n"
           << "Exit codes:\n"
           << "  " << PreflightTemplates::EXIT_OK << " success\n"
           << "  " << PreflightTemplates::EXIT_INTERNAL << " internal error\n"
           << "  " << PreflightTemplates::EXIT_USAGE << " usage error\n"
           << "  " << PreflightTemplates::EXIT_MISSING_INPUT << " input archive not found\n"
           << "  " << PreflightTemplates::EXIT_ANOMALY << " stray .venv file could not be removed\n"
           << "  " << PreflightTemplates::EXIT_ENVIRONMENT << " virtualenv could not be created or activated\n";
        return ss.str();
    }
}
