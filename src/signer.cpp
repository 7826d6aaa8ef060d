#include "blobmover/net/signer.hpp"
#include "blobmover/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <map>
#include <string_view>

namespace blobmover::net {

namespace {

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& message) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};
    unsigned int mac_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(message.data()), message.size(),
         mac.data(), &mac_len);
    return {mac.begin(), mac.begin() + mac_len};
}

// Path component of an absolute URL ("/container/blob"), without the query
std::string url_path(const std::string& url) {
    size_t scheme_end = url.find("://");
    size_t host_start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    if (path_start == std::string::npos) return "/";
    size_t query_start = url.find('?', path_start);
    return url.substr(path_start, query_start == std::string::npos
                                      ? std::string::npos
                                      : query_start - path_start);
}

// Canonicalized resources carry decoded query values
std::string url_decode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += value[i];
        }
    }
    return out;
}

// "x-ms-*:value\n" lines; HttpHeaders already yields lowercase sorted names
std::string canonical_headers(const HttpHeaders& headers) {
    std::string out;
    for (const auto& [name, value] : headers.all()) {
        if (name.starts_with("x-ms-")) {
            out += name + ":" + value + "\n";
        }
    }
    return out;
}

// "\nname:value" per query parameter, names lowercased and sorted, values decoded
std::string canonical_query(const std::string& url) {
    auto qpos = url.find('?');
    if (qpos == std::string::npos) return {};

    std::map<std::string, std::string> params;
    std::string_view rest(url);
    rest.remove_prefix(qpos + 1);
    while (!rest.empty()) {
        auto amp = rest.find('&');
        std::string_view pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view() : rest.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        std::string name(pair.substr(0, eq));
        for (auto& c : name) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        params[name] = eq == std::string_view::npos ? std::string()
                                                    : url_decode(std::string(pair.substr(eq + 1)));
    }

    std::string out;
    for (const auto& [name, value] : params) {
        out += "\n" + name + ":" + value;
    }
    return out;
}

}  // namespace

std::string rfc1123_now() {
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);
    char date_buf[64];
    strftime(date_buf, sizeof(date_buf), "%a, %d %b %Y %H:%M:%S GMT", &tm_buf);
    return date_buf;
}

// --- SharedKeySigner ---

SharedKeySigner::SharedKeySigner(std::string account_name, const std::string& account_key_base64)
    : account_name_(std::move(account_name))
    , account_key_(base64_decode(account_key_base64)) {}

std::string SharedKeySigner::string_to_sign(const HttpRequest& request) const {
    std::string s = std::string(http_method_to_string(request.method)) + "\n";
    auto field = [&](const char* name) { s += request.headers.get(name).value_or("") + "\n"; };

    field("Content-Encoding");
    field("Content-Language");
    // A zero-length body signs as an empty Content-Length
    s += (request.body.empty() ? std::string() : std::to_string(request.body.size())) + "\n";
    field("Content-MD5");
    field("Content-Type");
    s += "\n";  // Date; x-ms-date is signed instead
    for (const char* name : {"If-Modified-Since", "If-Match", "If-None-Match", "If-Unmodified-Since", "Range"}) {
        field(name);
    }

    s += canonical_headers(request.headers);
    s += "/" + account_name_ + url_path(request.url);
    s += canonical_query(request.url);
    return s;
}

void SharedKeySigner::sign(HttpRequest& request) const {
    auto signature = base64_encode(hmac_sha256(account_key_, string_to_sign(request)));
    request.headers.set("Authorization", "SharedKey " + account_name_ + ":" + signature);
}

// --- SasTokenSigner ---

SasTokenSigner::SasTokenSigner(std::string sas_token)
    : sas_token_(std::move(sas_token)) {
    if (!sas_token_.empty() && sas_token_.front() == '?') {
        sas_token_.erase(0, 1);
    }
}

void SasTokenSigner::sign(HttpRequest& request) const {
    if (sas_token_.empty()) return;
    auto& url = request.url;
    url += (url.find('?') != std::string::npos ? "&" : "?") + sas_token_;
}

// --- SigningTransport ---

SigningTransport::SigningTransport(Transport& inner, std::shared_ptr<const RequestSigner> signer)
    : inner_(inner)
    , signer_(std::move(signer)) {}

HttpResponse SigningTransport::execute(const HttpRequest& request) {
    HttpRequest signed_request = request;
    signed_request.headers.set("x-ms-date", rfc1123_now());
    signed_request.headers.set("x-ms-version", constants::STORAGE_API_VERSION);
    if (signer_) {
        signer_->sign(signed_request);
    }
    return inner_.execute(signed_request);
}

} // namespace blobmover::net
