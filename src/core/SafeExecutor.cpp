// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#include "core/SafeExecutor.hpp"
#include <cerrno>
#include <unistd.h>
#include <sys/wait.h>
#include <vector>

namespace Preflight::Core {

    ExecOutcome SafeExecutor::run(const std::string& binary, const std::vector<std::string>& args) {
        ExecOutcome outcome;

        // Az argv-t még a fork előtt építjük fel, a gyerekben nincs allokáció
        std::vector<char*> c_args;
        c_args.reserve(args.size() + 2);
        c_args.push_back(const_cast<char*>(binary.c_str()));
        for (const auto& arg : args) {
            c_args.push_back(const_cast<char*>(arg.c_str()));
        }
        c_args.push_back(nullptr);

        pid_t pid = fork();

        if (pid == -1) {
            return outcome; // Fork hiba
        }

        if (pid == 0) { // Gyerek folyamat
            execv(binary.c_str(), c_args.data());
            _exit(127);
        }

        // Szülő folyamat
        outcome.started = true;
        int status = 0;
        pid_t waited;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited == -1 && errno == EINTR);

        if (waited == -1) {
            outcome.exitCode = -1;
        } else if (WIFEXITED(status)) {
            outcome.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            outcome.exitCode = 128 + WTERMSIG(status);
        }
        return outcome;
    }
}
