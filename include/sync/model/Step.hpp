#pragma once

#include <string_view>

namespace sv::sync::model {

// States of the orchestrator, in protocol order.
enum class Step {
    Idle,
    SelectTarget,
    SelectBase,
    Clone,
    Barrier1,
    StructuralDiff,
    ContentTransfer,
    MarkReadOnly,
    Barrier2,
    Done,
};

constexpr std::string_view to_string(const Step s) {
    switch (s) {
    case Step::Idle: return "idle";
    case Step::SelectTarget: return "select-target";
    case Step::SelectBase: return "select-base";
    case Step::Clone: return "clone";
    case Step::Barrier1: return "barrier";
    case Step::StructuralDiff: return "structural-diff";
    case Step::ContentTransfer: return "content-transfer";
    case Step::MarkReadOnly: return "mark-readonly";
    case Step::Barrier2: return "final-barrier";
    case Step::Done: return "done";
    }
    return "unknown";
}

}
