#pragma once

#include <cstdint>

// ── Per-unit files ──────────────────────────────────────────
// Written by the download/convert/analysis tools; only read here.
constexpr const char* SRA_INFO_FILE          = "sras_info.yaml";
constexpr const char* FQ_GZ_INFO_FILE        = "fq_gzs_info.yaml";
constexpr const char* SUBMIT_SCRIPT_FILE     = "0_submit.sh";
constexpr const char* ANALYSIS_COMPLETE_FLAG = "rsem.COMPLETE";
constexpr const char* DOWNLOAD_FLAG_SUFFIX   = ".download.COMPLETE";
constexpr const char* CONVERT_FLAG_SUFFIX    = ".sra2fastq.COMPLETE";
constexpr const char* FASTQ_GZ_SUFFIX        = ".fastq.gz";

// ── Per-tree files ──────────────────────────────────────────
constexpr const char* TRANSFER_LEDGER_FILE   = "transferred_GSMs.txt";
constexpr const char* RUN_LOCK_FILE          = ".rp-run";
constexpr const char* TRANSFER_LOCK_FILE     = ".rp-transfer";
constexpr const char* TRANSFER_SCRIPTS_DIR   = "transfer_scripts";
constexpr const char* DEFAULT_LOG_FILE       = "rpctl.log";
constexpr const char* DEFAULT_CONFIG_FILE    = "rpctl.yaml";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Max time for a single remote query

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Log truncation ──────────────────────────────────────────
constexpr std::size_t LOG_OUTPUT_PREVIEW = 500;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_RAN     = 0;   // cycle ran, admitted N >= 0 units
constexpr int EXIT_ERROR   = 1;   // aborted
constexpr int EXIT_LOCKED  = 2;   // declined, another cycle holds the lock
