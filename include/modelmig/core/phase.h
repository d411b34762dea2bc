#ifndef MODELMIG_CORE_PHASE_H_
#define MODELMIG_CORE_PHASE_H_

#include <string>
#include <vector>

namespace modelmig {
namespace core {

/**
 * @brief Steps of the model migration state machine
 *
 * QUIESCE is the initial phase. DONE, ABORTDONE and REAPFAILED are
 * terminal. UNKNOWN and NONE are sentinels: UNKNOWN for text that does
 * not name a phase, NONE for "no migration". Sentinels have no
 * transitions. Legality is decided by the adjacency table in phase.cpp,
 * never by comparing enumerator values.
 */
enum class Phase {
    UNKNOWN,
    NONE,
    QUIESCE,
    READONLY,
    PRECHECK,
    IMPORT,
    VALIDATION,
    SUCCESS,
    LOGTRANSFER,
    REAP,
    REAPFAILED,
    DONE,
    ABORT,
    ABORTDONE
};

const char* phase_name(Phase phase);

// Returns Phase::UNKNOWN when the text names no phase
Phase parse_phase(const std::string& name);

// All phases a migration can occupy, in state machine order
const std::vector<Phase>& migration_phases();

bool is_terminal(Phase phase);

// A phase a migration can be in that is not terminal
bool is_running(Phase phase);

bool can_transition_to(Phase from, Phase to);

// Phases reachable from `from` in one step
const std::vector<Phase>& next_phases(Phase from);

/**
 * @brief True for SUCCESS and every phase after it on the success branch
 */
bool has_succeeded(Phase phase);

} // namespace core
} // namespace modelmig

#endif // MODELMIG_CORE_PHASE_H_
