#include <format>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

const char* taskKindName(TaskKind kind)
{
    switch (kind) {
        case TaskKind::Separate: return "separate";
        case TaskKind::ApplyEffect: return "apply_effect";
    }
    return "";
}

const char* taskStatusName(TaskStatus status)
{
    switch (status) {
        case TaskStatus::Queued: return "queued";
        case TaskStatus::Processing: return "processing";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
    }
    return "";
}

std::string TaskError::displayMessage() const
{
    return std::format("{}: {}", errorKindName(kind), message);
}

} // namespace lionsfx
