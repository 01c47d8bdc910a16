// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#ifndef SAFE_EXECUTOR_HPP
#define SAFE_EXECUTOR_HPP

#include <string>
#include <vector>

namespace Preflight::Core {

    struct ExecOutcome {
        bool started = false; // fork sikerült
        int exitCode = -1;    // 127: az execv nem indult el; 128+N: N szignál ölte meg

        [[nodiscard]] bool ok() const { return started && exitCode == 0; }
    };

    class SafeExecutor {
    public:
        /**
         * @brief Bináris és argumentum vektor szétválasztva, shell nélkül (fork/execv).
         * Blokkol, amíg a gyerekfolyamat ki nem lép.
         */
        static ExecOutcome run(const std::string& binary, const std::vector<std::string>& args);

        static bool execute(const std::string& binary, const std::vector<std::string>& args) {
            return run(binary, args).ok();
        }
    };
}

#endif
