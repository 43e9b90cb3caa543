#include "RunResult.hpp"
#include "StringUtils.hpp"
#include <sstream>

std::string RunResult::report() const {
    std::ostringstream out;

    if (ok()) {
        out << "Stage " << stage << " succeeded";
        if (!completed.empty()) {
            out << " (" << completed.size() << " steps)";
        }
        out << "\n";
        return out.str();
    }

    out << "Stage " << stage << " failed";
    if (!failed_step.empty()) {
        out << " at step " << failed_step;
    } else if (!interrupted_before.empty()) {
        out << " before step " << interrupted_before;
    }
    out << " (" << to_string(kind) << ")\n";
    out << "  cause: " << message << "\n";

    if (!completed.empty()) {
        out << "  completed: " << StringUtils::join(completed, ", ") << "\n";
    }
    if (!rolled_back.empty()) {
        out << "  rolled back: " << StringUtils::join(rolled_back, ", ") << "\n";
    }
    if (!rollback_failures.empty()) {
        out << "  rollback failures:\n";
        for (const auto& failure : rollback_failures) {
            out << "    " << failure.step << ": " << failure.message << "\n";
        }
    }
    return out.str();
}

void RunResult::throw_if_failed() const {
    if (!ok()) {
        throw PipelineError(*this);
    }
}
