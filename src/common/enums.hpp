#pragma once

namespace triage {

enum class ItemKind {
    Note,
    Document,
    Sheet
};

enum class OperatingMode {
    Auto,
    Manual
};

enum class CycleDirection {
    Forward,
    Back
};

} // namespace triage
