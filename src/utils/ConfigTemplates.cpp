#include "utils/ConfigTemplates.hpp"

namespace PreflightTemplates {

    const std::string PRIMARY_ENV_DIR   = "venv";
    const std::string SECONDARY_ENV_DIR = ".venv";

    const std::string CI_FLAG_VAR       = "GITHUB_ACTIONS";
    const std::string CI_FLAG_VALUE     = "true";
    const std::string INPUT_ARCHIVE_VAR = "ZIP";
    const std::string INTERPRETER_VAR   = "PREFLIGHT_PYTHON";

    const std::string VIRTUAL_ENV_VAR = "VIRTUAL_ENV";
    const std::string PATH_VAR        = "PATH";
    const std::string PYTHONHOME_VAR  = "PYTHONHOME";

    const std::string DEFAULT_INTERPRETER  = "python3";
    // Ha a PATH üres vagy hiányzik, execvp-szerű alapértelmezés
    const std::string FALLBACK_SEARCH_PATH = "/usr/local/bin:/usr/bin:/bin";
}
