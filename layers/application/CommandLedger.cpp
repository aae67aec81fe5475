#include "CommandLedger.h"

namespace application {

std::string commandStatusToString(CommandStatus status) {
    switch (status) {
        case CommandStatus::NoActiveCommand:
            return "NO_ACTIVE_COMMAND";
        case CommandStatus::NotAllocated:
            return "NOT_ALLOCATED";
        case CommandStatus::Executing:
            return "EXECUTING";
        case CommandStatus::InvocationFailed:
            return "INVOCATION_FAILED";
        case CommandStatus::InvocationSuccess:
            return "INVOCATION_SUCCESS";
    }
    return "UNKNOWN";
}

bool parseCommandStatus(const std::string& name, CommandStatus& status) {
    if (name == "NO_ACTIVE_COMMAND") {
        status = CommandStatus::NoActiveCommand;
        return true;
    }
    if (name == "NOT_ALLOCATED") {
        status = CommandStatus::NotAllocated;
        return true;
    }
    if (name == "EXECUTING") {
        status = CommandStatus::Executing;
        return true;
    }
    if (name == "INVOCATION_FAILED") {
        status = CommandStatus::InvocationFailed;
        return true;
    }
    if (name == "INVOCATION_SUCCESS") {
        status = CommandStatus::InvocationSuccess;
        return true;
    }
    return false;
}

void CommandLedger::record(const std::string& serial, const CommandResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_[serial] = result;
}

CommandResult CommandLedger::lastResult(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find(serial);
    if (it == results_.end()) {
        return CommandResult{};
    }
    return it->second;
}

std::size_t CommandLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

} // namespace application
