#include "modelmig/core/phase.h"
#include <algorithm>
#include <map>

namespace modelmig {
namespace core {

namespace {

const std::map<Phase, std::vector<Phase>>& transition_table() {
    static const std::map<Phase, std::vector<Phase>> table = {
        {Phase::QUIESCE, {Phase::READONLY, Phase::ABORT}},
        {Phase::READONLY, {Phase::PRECHECK, Phase::ABORT}},
        {Phase::PRECHECK, {Phase::IMPORT, Phase::ABORT}},
        {Phase::IMPORT, {Phase::VALIDATION, Phase::ABORT}},
        {Phase::VALIDATION, {Phase::SUCCESS, Phase::ABORT}},
        {Phase::SUCCESS, {Phase::LOGTRANSFER}},
        {Phase::LOGTRANSFER, {Phase::REAP}},
        {Phase::REAP, {Phase::DONE, Phase::REAPFAILED}},
        {Phase::ABORT, {Phase::ABORTDONE}},
    };
    return table;
}

} // namespace

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::UNKNOWN: return "UNKNOWN";
        case Phase::NONE: return "NONE";
        case Phase::QUIESCE: return "QUIESCE";
        case Phase::READONLY: return "READONLY";
        case Phase::PRECHECK: return "PRECHECK";
        case Phase::IMPORT: return "IMPORT";
        case Phase::VALIDATION: return "VALIDATION";
        case Phase::SUCCESS: return "SUCCESS";
        case Phase::LOGTRANSFER: return "LOGTRANSFER";
        case Phase::REAP: return "REAP";
        case Phase::REAPFAILED: return "REAPFAILED";
        case Phase::DONE: return "DONE";
        case Phase::ABORT: return "ABORT";
        case Phase::ABORTDONE: return "ABORTDONE";
    }
    return "UNKNOWN";
}

Phase parse_phase(const std::string& name) {
    for (Phase phase : migration_phases()) {
        if (name == phase_name(phase)) {
            return phase;
        }
    }
    if (name == phase_name(Phase::NONE)) {
        return Phase::NONE;
    }
    return Phase::UNKNOWN;
}

const std::vector<Phase>& migration_phases() {
    static const std::vector<Phase> phases = {
        Phase::QUIESCE, Phase::READONLY, Phase::PRECHECK, Phase::IMPORT,
        Phase::VALIDATION, Phase::SUCCESS, Phase::LOGTRANSFER, Phase::REAP,
        Phase::REAPFAILED, Phase::DONE, Phase::ABORT, Phase::ABORTDONE,
    };
    return phases;
}

bool is_terminal(Phase phase) {
    return phase == Phase::DONE || phase == Phase::ABORTDONE || phase == Phase::REAPFAILED;
}

bool is_running(Phase phase) {
    if (phase == Phase::UNKNOWN || phase == Phase::NONE) {
        return false;
    }
    return !is_terminal(phase);
}

const std::vector<Phase>& next_phases(Phase from) {
    static const std::vector<Phase> none;
    const auto& table = transition_table();
    auto it = table.find(from);
    if (it == table.end()) {
        return none;
    }
    return it->second;
}

bool can_transition_to(Phase from, Phase to) {
    const auto& allowed = next_phases(from);
    return std::find(allowed.begin(), allowed.end(), to) != allowed.end();
}

bool has_succeeded(Phase phase) {
    switch (phase) {
        case Phase::SUCCESS:
        case Phase::LOGTRANSFER:
        case Phase::REAP:
        case Phase::REAPFAILED:
        case Phase::DONE:
            return true;
        default:
            return false;
    }
}

} // namespace core
} // namespace modelmig
