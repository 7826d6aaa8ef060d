#include "blobmover/config/transfer_config.hpp"
#include "blobmover/core/log.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>

namespace blobmover {

namespace {

// Parse an unsigned environment value within [lo, hi]. Returns false and logs
// when the variable is set but unusable.
bool env_in_range(const char* name, uint64_t lo, uint64_t hi, uint64_t& out) {
    const char* env = std::getenv(name);
    if (!env) return false;
    try {
        unsigned long long value = std::stoull(env);
        if (value >= lo && value <= hi) {
            out = value;
            return true;
        }
        log_warn("%s=%s out of range [%llu,%llu], using default", name, env,
                 static_cast<unsigned long long>(lo), static_cast<unsigned long long>(hi));
    } catch (const std::exception&) {
        log_warn("invalid %s=%s, using default", name, env);
    }
    return false;
}

bool apply_document(TransferConfig& config, const nlohmann::json& j) {
    auto& t = config.transfer;

    if (j.contains("chunk_size")) t.chunk_size = j["chunk_size"].get<uint64_t>();
    if (j.contains("single_shot_threshold"))
        t.single_shot_threshold = j["single_shot_threshold"].get<uint64_t>();
    if (j.contains("max_chunk_count")) {
        auto count = j["max_chunk_count"].get<size_t>();
        t.max_chunk_count = count == 0 ? std::nullopt : std::optional<size_t>(count);
    }
    if (j.contains("max_connections")) t.max_connections = j["max_connections"].get<size_t>();
    if (j.contains("max_retry_attempts")) t.max_retry_attempts = j["max_retry_attempts"].get<uint32_t>();
    if (j.contains("retry_base_wait_ms"))
        t.retry_base_wait = std::chrono::milliseconds(j["retry_base_wait_ms"].get<int64_t>());
    if (j.contains("retry_max_wait_ms"))
        t.retry_max_wait = std::chrono::milliseconds(j["retry_max_wait_ms"].get<int64_t>());
    if (j.contains("retry_jitter_fraction"))
        t.retry_jitter_fraction = j["retry_jitter_fraction"].get<double>();
    if (j.contains("retry_on_signature_expiry"))
        t.retry_on_signature_expiry = j["retry_on_signature_expiry"].get<bool>();
    if (j.contains("request_timeout_secs")) {
        auto secs = std::chrono::seconds(j["request_timeout_secs"].get<int64_t>());
        t.request_timeout = secs;
        config.http.request_timeout = secs;
    }
    if (j.contains("validate_content")) t.validate_content = j["validate_content"].get<bool>();

    if (j.contains("digest")) {
        auto name = j["digest"].get<std::string>();
        if (name == "md5") {
            t.digest_algorithm = DigestAlgorithm::MD5;
        } else if (name == "sha256") {
            t.digest_algorithm = DigestAlgorithm::SHA256;
        } else {
            log_error("config: unknown digest '%s' (expected md5 or sha256)", name.c_str());
            return false;
        }
    }
    if (j.contains("blob_type")) {
        auto name = j["blob_type"].get<std::string>();
        auto type = parse_blob_type(name);
        if (!type) {
            log_error("config: unknown blob_type '%s' (expected block, page or append)", name.c_str());
            return false;
        }
        t.blob_type = *type;
    }
    if (j.contains("on_failure")) {
        auto name = j["on_failure"].get<std::string>();
        if (name == "abandon") {
            t.on_failure = FailurePolicy::Abandon;
        } else if (name == "rollback") {
            t.on_failure = FailurePolicy::Rollback;
        } else {
            log_error("config: unknown on_failure '%s' (expected abandon or rollback)", name.c_str());
            return false;
        }
    }

    if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();
    if (j.contains("metrics_file")) t.metrics_file = j["metrics_file"].get<std::string>();

    // HTTP client
    if (j.contains("http") && j["http"].is_object()) {
        auto& jh = j["http"];
        auto& h = config.http;
        if (jh.contains("connect_timeout_ms"))
            h.connect_timeout = std::chrono::milliseconds(jh["connect_timeout_ms"].get<int64_t>());
        if (jh.contains("max_idle_handles")) h.max_idle_handles = jh["max_idle_handles"].get<size_t>();
        if (jh.contains("verify_ssl")) h.verify_ssl = jh["verify_ssl"].get<bool>();
        if (jh.contains("ca_bundle_path")) h.ca_bundle_path = jh["ca_bundle_path"].get<std::string>();
        if (jh.contains("user_agent")) h.user_agent = jh["user_agent"].get<std::string>();
        if (jh.contains("proxy_url")) h.proxy_url = jh["proxy_url"].get<std::string>();
        if (jh.contains("tcp_keepalive")) h.tcp_keepalive = jh["tcp_keepalive"].get<bool>();
    }
    return true;
}

}  // namespace

bool TransferConfig::load_json(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        log_error("cannot open config file: %s", path.c_str());
        return false;
    }
    try {
        auto j = nlohmann::json::parse(ifs);
        return apply_document(*this, j);
    } catch (const nlohmann::json::exception& e) {
        log_error("parsing config %s: %s", path.c_str(), e.what());
        return false;
    }
}

bool TransferConfig::load_json_string(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        return apply_document(*this, j);
    } catch (const nlohmann::json::exception& e) {
        log_error("parsing config: %s", e.what());
        return false;
    }
}

void TransferConfig::apply_env() {
    uint64_t value = 0;
    if (env_in_range("BLOBMOVER_MAX_CONNECTIONS", 1, constants::MAX_CONNECTIONS_LIMIT, value)) {
        transfer.max_connections = static_cast<size_t>(value);
    }
    if (env_in_range("BLOBMOVER_CHUNK_SIZE", 1, constants::MAX_CHUNK_SIZE, value)) {
        transfer.chunk_size = value;
    }
    if (env_in_range("BLOBMOVER_SINGLE_SHOT_THRESHOLD", 0, UINT64_MAX, value)) {
        transfer.single_shot_threshold = value;
    }
    if (env_in_range("BLOBMOVER_MAX_RETRY_ATTEMPTS", 1, 100, value)) {
        transfer.max_retry_attempts = static_cast<uint32_t>(value);
    }
    if (env_in_range("BLOBMOVER_REQUEST_TIMEOUT", 5, 3600, value)) {
        transfer.request_timeout = std::chrono::seconds(value);
        http.request_timeout = std::chrono::seconds(value);
    }
    if (const char* env = std::getenv("BLOBMOVER_VERBOSE")) {
        verbose = std::string(env) != "0";
    }
}

std::string TransferConfig::validate() const {
    const auto& t = transfer;
    if (t.chunk_size == 0) return "chunk_size must be > 0";
    if (t.chunk_size > constants::MAX_CHUNK_SIZE)
        return "chunk_size must be <= " + std::to_string(constants::MAX_CHUNK_SIZE);
    if (t.max_connections < 1 || t.max_connections > constants::MAX_CONNECTIONS_LIMIT)
        return "max_connections must be in [1, " + std::to_string(constants::MAX_CONNECTIONS_LIMIT) + "]";
    if (t.max_retry_attempts < 1) return "max_retry_attempts must be >= 1";
    if (t.retry_base_wait.count() < 0) return "retry_base_wait_ms must be >= 0";
    if (t.retry_base_wait > t.retry_max_wait) return "retry_base_wait_ms must be <= retry_max_wait_ms";
    if (t.retry_jitter_fraction < 0.0 || t.retry_jitter_fraction > 1.0)
        return "retry_jitter_fraction must be in [0, 1]";
    if (t.request_timeout.count() < 0) return "request_timeout_secs must not be negative";
    if (t.blob_type == BlobType::Page && t.chunk_size % constants::PAGE_ALIGNMENT != 0)
        return "page blob chunk_size must be a multiple of " + std::to_string(constants::PAGE_ALIGNMENT);
    if (http.connect_timeout.count() <= 0) return "http.connect_timeout_ms must be > 0";
    return {};
}

void TransferConfig::apply_logging() const {
    set_log_verbose(verbose);
}

}  // namespace blobmover
