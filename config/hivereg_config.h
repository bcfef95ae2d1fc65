#pragma once

// Compile-time configuration for hivereg.
//
// Notes:
// - The store database is chosen at runtime through HIVEREG_DB_PATH_ENV; the
//   remaining values only provide defaults when it is unset.
// - Tracing is off unless HIVEREG_TRACE_ENV names one or more operations.

// Environment variable holding an explicit path to the SQLite store.
#define HIVEREG_DB_PATH_ENV "HIVEREG_DB_PATH"

// Directory (under the XDG data dir, ~/.local/share or the temp dir) holding the store.
#define HIVEREG_DATA_DIR_NAME "hivereg"

// Store file name inside HIVEREG_DATA_DIR_NAME.
#define HIVEREG_DB_FILE_NAME "registry.sqlite"

// Comma-separated list of traced operations ("all" traces everything).
#define HIVEREG_TRACE_ENV "HIVEREG_TRACE"

// Optional file receiving trace lines instead of stderr.
#define HIVEREG_TRACE_FILE_ENV "HIVEREG_TRACE_FILE"

// Milliseconds SQLite waits on a locked database before failing with SQLITE_BUSY.
#define HIVEREG_STORE_BUSY_TIMEOUT_MS 5000
