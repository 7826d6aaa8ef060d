#pragma once

#include "blobmover/net/http.hpp"

#include <memory>
#include <string>
#include <vector>

namespace blobmover::net {

/// Signs an outgoing request in place (authorization header or query token).
class RequestSigner {
public:
    virtual ~RequestSigner() = default;

    virtual void sign(HttpRequest& request) const = 0;
};

/// Storage SharedKey signing: HMAC-SHA256 over the canonical request string,
/// keyed with the base64-decoded account key.
class SharedKeySigner : public RequestSigner {
public:
    SharedKeySigner(std::string account_name, const std::string& account_key_base64);

    void sign(HttpRequest& request) const override;

    /// Canonical string that sign() would authenticate. Exposed for tests.
    std::string string_to_sign(const HttpRequest& request) const;

private:
    std::string account_name_;
    std::vector<uint8_t> account_key_;
};

/// Shared access signature: appends a pre-issued query string to every URL.
class SasTokenSigner : public RequestSigner {
public:
    explicit SasTokenSigner(std::string sas_token);

    void sign(HttpRequest& request) const override;

private:
    std::string sas_token_;
};

/// Transport decorator that stamps x-ms-date/x-ms-version and signs every
/// request just before it is sent, so a retried attempt carries a fresh signature.
class SigningTransport : public Transport {
public:
    SigningTransport(Transport& inner, std::shared_ptr<const RequestSigner> signer);

    HttpResponse execute(const HttpRequest& request) override;

private:
    Transport& inner_;
    std::shared_ptr<const RequestSigner> signer_;
};

/// Current time in RFC 1123 format, as required by x-ms-date.
std::string rfc1123_now();

} // namespace blobmover::net
