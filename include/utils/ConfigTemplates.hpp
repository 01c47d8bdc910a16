#ifndef CONFIGTEMPLATES_HPP
#define CONFIGTEMPLATES_HPP

#include <string>

namespace PreflightTemplates {

    // Fenntartott környezet-könyvtárak (feloldási sorrendben)
    extern const std::string PRIMARY_ENV_DIR;    // "venv"
    extern const std::string SECONDARY_ENV_DIR;  // ".venv", egyben a fenntartott útvonal

    // Környezeti változók
    extern const std::string CI_FLAG_VAR;
    extern const std::string CI_FLAG_VALUE;
    extern const std::string INPUT_ARCHIVE_VAR;
    extern const std::string INTERPRETER_VAR;

    // Aktiválás által érintett változók
    extern const std::string VIRTUAL_ENV_VAR;
    extern const std::string PATH_VAR;
    extern const std::string PYTHONHOME_VAR;

    extern const std::string DEFAULT_INTERPRETER;
    extern const std::string FALLBACK_SEARCH_PATH;

    // Kilépési kódok
    constexpr int EXIT_OK            = 0;
    constexpr int EXIT_INTERNAL      = 1;
    constexpr int EXIT_USAGE         = 2;
    constexpr int EXIT_MISSING_INPUT = 3;
    constexpr int EXIT_ANOMALY       = 4;
    constexpr int EXIT_ENVIRONMENT   = 5;
}

#endif
