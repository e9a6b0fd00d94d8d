#pragma once

#include <string>

// How a backend spawn protocol run concluded. Emitted exactly once per run.
enum class SupervisorOutcome {
    AlreadyRunning,   // endpoint was reachable before any attempt
    StartedByOther,   // endpoint became reachable during the retry loop
    Spawned,          // this process launched the backend
    SpawnFailed,      // launch error or attempt budget exhausted
};

// Result of claiming the supervisor singleton.
enum class InstanceClaim {
    Acquired,
    AlreadyRunning,
    Error,
};

// Wire names: "already-running", "started-by-other", "spawned", "spawn-failed".
const char* outcome_name(SupervisorOutcome outcome);

const char* claim_name(InstanceClaim claim);
