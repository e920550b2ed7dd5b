#pragma once

#include <cstddef>

// ── Billing ─────────────────────────────────────────────────
constexpr double HOURS_PER_MONTH         = 730.0; // storage rates are $/GB/month
constexpr double DISK_TOLERANCE_GB       = 1.0;   // disk delta treated as "unchanged"
constexpr double DISK_DROP_THRESHOLD_GB  = 0.1;   // smaller drops are noise
constexpr int    SESSION_ID_WIDTH        = 4;     // m<machine>-0001

// ── Occupancy codes ─────────────────────────────────────────
constexpr char CODE_ON_DEMAND            = 'D';
constexpr char CODE_INTERRUPTIBLE        = 'I';
constexpr char CODE_RESERVED             = 'R';
constexpr char CODE_FREE                 = 'x';

// ── Polling ─────────────────────────────────────────────────
constexpr int MIN_CHECK_FREQUENCY_SECS   = 60;    // upstream refresh is no faster
constexpr int STOP_POLL_SLICE_MS         = 100;   // stop flag granularity while waiting
constexpr int FETCH_MAX_ATTEMPTS         = 3;
constexpr int FETCH_RETRY_MIN_SECS       = 2;
constexpr int FETCH_RETRY_MAX_SECS       = 30;

// ── Notifications ───────────────────────────────────────────
constexpr int NOTIFY_MAX_WORKERS         = 8;
constexpr int NOTIFY_MAX_ATTEMPTS        = 3;
constexpr int NOTIFY_RETRY_MIN_SECS      = 2;
constexpr int NOTIFY_RETRY_MAX_SECS      = 10;
constexpr int NOTIFY_SEND_TIMEOUT_MS     = 60000;
constexpr int DEFAULT_ERROR_PING_MINUTES = 60;
constexpr size_t DISCORD_CHUNK_LIMIT     = 1800;  // characters per message body

// ── Logging ─────────────────────────────────────────────────
constexpr int LOG_ROTATE_KEEP            = 7;     // rotated daily files kept

// ── State layout ────────────────────────────────────────────
constexpr const char* REGISTRY_DIR       = "registries";
constexpr const char* SNAPSHOT_DIR       = "machine_snapshots";
constexpr const char* ARCHIVE_DIR        = "rental_logs";
constexpr const char* DEFAULT_CONFIG     = "rentwatch.yaml";
constexpr const char* RENTWATCH_VERSION  = "0.4.0";
