#pragma once

// ── Backend endpoint ────────────────────────────────────────
constexpr const char* DEFAULT_BACKEND_HOST = "127.0.0.1";
constexpr int DEFAULT_BACKEND_PORT         = 8001;

// ── Timeouts ────────────────────────────────────────────────
constexpr int PROBE_TIMEOUT_MS     = 200;   // Connect timeout for every liveness probe
constexpr int SPAWN_BACKOFF_MS     = 150;   // Sleep after removing a stale spawn lock
constexpr int EXIT_GRACE_MS        = 50;    // Let the contention diagnostic be observed
constexpr int RESIDENT_POLL_MS     = 200;   // Signal check interval while resident

// ── Retry counts ────────────────────────────────────────────
constexpr int SPAWN_MAX_ATTEMPTS   = 3;     // Acquire/verify/spawn cycles

// ── Lock and log file names (under the system temp directory) ──
constexpr const char* INSTANCE_LOCK_NAME = "hubwarden_hub.lock";
constexpr const char* SPAWN_LOCK_NAME    = "hubwarden_backend.lock";
constexpr const char* DEBUG_LOG_NAME     = "hubwarden_debug.log";
constexpr const char* BACKEND_LOG_NAME   = "hubwarden_backend.log";

// ── Event names ─────────────────────────────────────────────
constexpr const char* EVENT_BACKEND_STARTED = "backend-started";
constexpr const char* EVENT_ALREADY_RUNNING = "already-running";
constexpr const char* PAYLOAD_ANOTHER_INSTANCE = "another-instance";
constexpr const char* EVENT_INSTANCE_LOCK_ERROR = "instance-lock-error";

// Default backend command: provision a venv, install requirements, start uvicorn.
// Use fmt::format with these: fmt::format(DEFAULT_BACKEND_COMMAND, host, port)
constexpr const char* DEFAULT_BACKEND_COMMAND =
    "if command -v python3 >/dev/null 2>&1; then PY=python3; "
    "elif command -v python >/dev/null 2>&1; then PY=python; "
    "else echo 'no-python' >&2; exit 127; fi; "
    "[ -d .venv ] || $PY -m venv .venv; "
    ". .venv/bin/activate 2>/dev/null || true; "
    "[ -f requirements.txt ] && $PY -m pip install -q -r requirements.txt; "
    "PYTHONUNBUFFERED=1 exec $PY -m uvicorn app.main:app --host {} --port {}";
