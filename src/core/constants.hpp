#pragma once

// ── Scheduler binaries ──────────────────────────────────────
constexpr const char* DEFAULT_SUBMIT_COMMAND = "condor_submit";
constexpr const char* DEFAULT_QUEUE_COMMAND  = "condor_q";
constexpr const char* DEFAULT_SERVER         = "condor.cs.wlu.edu";
constexpr const char* DEFAULT_LOGIN_COMMAND  = "ssh";

// ── Shell used to launch every child process ────────────────
constexpr const char* SHELL_PATH = "/bin/sh";

// ── Default resource requests ───────────────────────────────
constexpr const char* DEFAULT_UNIVERSE   = "vanilla";
constexpr int DEFAULT_REQUEST_CPUS       = 1;
constexpr int DEFAULT_REQUEST_MEMORY_MB  = 1024;
constexpr int DEFAULT_REQUEST_DISK_MB    = 32;

// ── Polling ─────────────────────────────────────────────────
constexpr double WAIT_INITIAL_POLL_SECS  = 1.0;   // First sleep of wait()
constexpr double WAIT_POLL_STEP_SECS     = 0.5;   // Linear growth per round
constexpr double DEFAULT_MAX_POLL_SECS   = 30.0;  // Cap on the sleep interval
constexpr double MIN_POLL_SECS           = 0.1;   // Lowest accepted cap

// ── Notification lookup ─────────────────────────────────────
constexpr const char* DEFAULT_MAIL_MAP   = "/mnt/config/scripts/mail_map.yaml";
constexpr const char* MAIL_MAP_DEFAULT_KEY = "default";

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PROCESS_READ_BUF_SIZE      = 4096;
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── SSH ─────────────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int DEFAULT_SSH_TIMEOUT_SECS   = 30;
