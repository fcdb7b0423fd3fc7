#pragma once

#include <cstdint>
#include <cstddef>

// ── Persisted layout ────────────────────────────────────────
// Relative to the repository control directory (.git)
constexpr const char* SYNC_LOCK_FILE         = "tandem-sync.lock";

// Relative to the repository root
constexpr const char* METADATA_FILE          = "metadata.json";
constexpr const char* METADATA_LOCK_FILE     = ".metadata.lock";
constexpr const char* METADATA_BACKUP_FILE   = ".metadata.json.backup";
constexpr const char* METADATA_TEMP_FILE     = ".metadata.json.tmp";
constexpr const char* REPO_CONFIG_FILE       = ".tandem.yaml";
constexpr const char* GITATTRIBUTES_FILE     = ".gitattributes";

constexpr const char* TOOL_ID                = "tandem";
constexpr const char* DEFAULT_AUTHOR_NAME    = "tandem";
constexpr const char* DEFAULT_AUTHOR_EMAIL   = "tandem@localhost";

// ── Timeouts ────────────────────────────────────────────────
constexpr int64_t METADATA_LOCK_TIMEOUT_MS   = 30000;  // metadata lock is stale after 30s
constexpr int METADATA_LOCK_POLL_MS          = 50;     // wait between lock polls
constexpr int METADATA_LOCK_WAIT_MS          = 2000;   // max wait for one acquisition attempt
constexpr int CONNECTIVITY_TIMEOUT_MS        = 3000;
constexpr int PUSH_RETRY_DELAY_MS            = 1000;

// ── Retry counts ────────────────────────────────────────────
constexpr int METADATA_MAX_RETRIES           = 5;
constexpr int METADATA_RETRY_DELAY_MS        = 100;    // doubled per attempt
constexpr int LFS_TRANSFER_MAX_ATTEMPTS      = 3;
constexpr int LFS_RETRY_DELAY_MS             = 500;    // doubled per attempt

// ── LFS protocol ────────────────────────────────────────────
constexpr const char* LFS_POINTER_VERSION    = "https://git-lfs.github.com/spec/v1";
constexpr const char* LFS_MEDIA_TYPE         = "application/vnd.git-lfs+json";
constexpr int LFS_POINTER_MAX_BYTES          = 1024;   // pointer files are tiny text blocks
constexpr int LFS_HTTP_TIMEOUT_SECS          = 300;
constexpr size_t LFS_BATCH_SIZE              = 100;    // objects per batch request

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE              = 4096;
constexpr int HASH_READ_BUF_SIZE             = 65536;
