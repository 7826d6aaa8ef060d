#pragma once

#include "blobmover/net/http.hpp"
#include "blobmover/transfer/coordinator.hpp"

#include <filesystem>
#include <string>

namespace blobmover {

/// Defaults for transfers plus the HTTP client settings they run over.
///
/// Sources are applied in order: built-in defaults, load_json(), apply_env().
/// Runtime-only fields of TransferOptions (cancellation token, progress
/// callback, expected digest) are never read from configuration.
struct TransferConfig {
    TransferOptions transfer;
    net::HttpClientConfig http;

    bool verbose = false;

    /// Load configuration from a JSON file, overlaying onto current values.
    /// Unknown keys are ignored. Returns false (and logs) on unreadable or
    /// malformed input.
    bool load_json(const std::filesystem::path& path);

    /// Same as load_json() for an in-memory document.
    bool load_json_string(const std::string& text);

    /// Apply BLOBMOVER_* environment overrides. Out-of-range values are
    /// logged and ignored.
    void apply_env();

    /// Validate ranges. Returns error message or empty string.
    std::string validate() const;

    /// Push process-wide settings (log verbosity).
    void apply_logging() const;
};

}  // namespace blobmover
