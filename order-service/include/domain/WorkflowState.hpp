#pragma once

#include <string>

namespace cafe::domain {

/**
 * @brief Состояние одного запуска CreateOrderWorkflow
 *
 * Start -> ValidatingUser -> ResolvingItems -> Persisting -> {Completed | Failed}
 */
enum class WorkflowState {
    Start,
    ValidatingUser,
    ResolvingItems,
    Persisting,
    Completed,
    Failed
};

inline std::string toString(WorkflowState state) {
    switch (state) {
        case WorkflowState::Start: return "Start";
        case WorkflowState::ValidatingUser: return "ValidatingUser";
        case WorkflowState::ResolvingItems: return "ResolvingItems";
        case WorkflowState::Persisting: return "Persisting";
        case WorkflowState::Completed: return "Completed";
        case WorkflowState::Failed: return "Failed";
        default: return "Unknown";
    }
}

inline bool isTerminal(WorkflowState state) {
    return state == WorkflowState::Completed || state == WorkflowState::Failed;
}

} // namespace cafe::domain
