#include "outcome.hpp"

const char* outcome_name(SupervisorOutcome outcome) {
    switch (outcome) {
        case SupervisorOutcome::AlreadyRunning: return "already-running";
        case SupervisorOutcome::StartedByOther: return "started-by-other";
        case SupervisorOutcome::Spawned:        return "spawned";
        case SupervisorOutcome::SpawnFailed:    return "spawn-failed";
    }
    return "unknown";
}

const char* claim_name(InstanceClaim claim) {
    switch (claim) {
        case InstanceClaim::Acquired:       return "acquired";
        case InstanceClaim::AlreadyRunning: return "already-running";
        case InstanceClaim::Error:          return "error";
    }
    return "unknown";
}
