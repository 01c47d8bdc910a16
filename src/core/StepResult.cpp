// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#include "core/StepResult.hpp"
#include "utils/ConfigTemplates.hpp"
#include <utility>

namespace Preflight::Core {

    StepResult StepResult::fatal(FailureKind kind, std::string message, std::string path) {
        StepResult result;
        result.failure = kind;
        result.message = std::move(message);
        result.path = std::move(path);
        return result;
    }

    int exitCodeFor(FailureKind kind) {
        switch (kind) {
            case FailureKind::None:           return PreflightTemplates::EXIT_OK;
            case FailureKind::Usage:          return PreflightTemplates::EXIT_USAGE;
            case FailureKind::MissingInput:   return PreflightTemplates::EXIT_MISSING_INPUT;
            case FailureKind::AnomalyRemoval: return PreflightTemplates::EXIT_ANOMALY;
            case FailureKind::Provisioning:
            case FailureKind::Activation:     return PreflightTemplates::EXIT_ENVIRONMENT;
            case FailureKind::Internal:       break;
        }
        return PreflightTemplates::EXIT_INTERNAL;
    }

    const char* toString(FailureKind kind) {
        switch (kind) {
            case FailureKind::None:           return "none";
            case FailureKind::Usage:          return "usage";
            case FailureKind::AnomalyRemoval: return "anomaly_removal";
            case FailureKind::Provisioning:   return "provisioning";
            case FailureKind::Activation:     return "activation";
            case FailureKind::MissingInput:   return "missing_input";
            case FailureKind::Internal:       return "internal";
        }
        return "internal";
    }
}
