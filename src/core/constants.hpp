#pragma once

#include <cstdint>

// ── Store layout ────────────────────────────────────────────
// Relative to the config home (~/.shutterbox by default).
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* HASH_DB_FILE_NAME  = "hashes.db";
constexpr const char* UPLOAD_STATE_NAME  = "uploads.yaml";
constexpr const char* LOG_DIR_NAME       = "logs";
constexpr const char* APP_LOG_NAME       = "shutterbox.log";

// ── Dedup store ─────────────────────────────────────────────
constexpr int MAX_COLLISION_SUFFIX       = 9999;  // base_2 .. base_9999
constexpr const char* UNKNOWN_ORIGIN     = "unknown-origin";
constexpr int DIGEST_HEX_LEN             = 64;    // SHA-256

// ── Archive layout ──────────────────────────────────────────
constexpr int BUCKET_DEPTH               = 3;     // YYYY/MM/DD

// ── Upload defaults ─────────────────────────────────────────
constexpr int DEFAULT_CONCURRENT_TASKS   = 4;
constexpr int MAX_CONCURRENT_TASKS       = 20;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int HASH_READ_BUF_SIZE         = 1 << 20;
constexpr int CAPTURE_READ_BUF_SIZE      = 4096;

// ── Default extension filters ───────────────────────────────
constexpr const char* DEFAULT_MEDIA_EXTENSIONS =
    ".arw,.cr3,.cr2,.nef,.raf,.dng,.tif,.jpg,.jpeg,.heic,.mp4,.mov";

constexpr const char* APP_VERSION        = "0.4.0";
