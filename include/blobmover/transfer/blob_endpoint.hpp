#pragma once

#include "blobmover/net/http.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace blobmover {

enum class BlobType {
    Block,
    Page,
    Append
};

const char* blob_type_name(BlobType type);  // "BlockBlob", "PageBlob", "AppendBlob"
std::optional<BlobType> parse_blob_type(const std::string& name);

/// What Get Blob Properties reports.
struct BlobProperties {
    uint64_t content_length = 0;
    std::string content_md5;  // base64, empty when the service has none
    std::string etag;
    std::optional<BlobType> blob_type;

    static BlobProperties from_response(const net::HttpResponse& response);
};

/// Builds the requests the transfer engine sends for one blob URL. The
/// requests are unsigned; signing is the transport's job.
class BlobEndpoint {
public:
    explicit BlobEndpoint(std::string blob_url);

    const std::string& url() const { return url_; }

    // Put Blob: whole payload in one request
    net::HttpRequest put_blob(std::span<const uint8_t> data, const std::string& content_md5 = {}) const;

    // Put Block / Put Block List
    net::HttpRequest put_block(const std::string& block_id,
                               std::span<const uint8_t> data,
                               const std::string& content_md5 = {}) const;
    net::HttpRequest put_block_list(const std::vector<std::string>& block_ids,
                                    const std::string& blob_content_md5 = {}) const;

    // Create an empty page blob of `size` bytes, or an empty append blob
    net::HttpRequest create_page_blob(uint64_t size) const;
    net::HttpRequest create_append_blob() const;

    net::HttpRequest put_page(const net::ByteRange& range,
                              std::span<const uint8_t> data,
                              const std::string& content_md5 = {}) const;
    net::HttpRequest append_block(uint64_t append_position,
                                  std::span<const uint8_t> data,
                                  const std::string& content_md5 = {}) const;

    net::HttpRequest get_properties() const;

    /// Ranged Get Blob. With want_range_md5 the service returns Content-MD5 of
    /// the range (only honoured for ranges up to 4 MiB).
    net::HttpRequest get_range(const net::ByteRange& range, bool want_range_md5) const;

    // Whole blob, used for single-shot downloads
    net::HttpRequest get_blob() const;

    net::HttpRequest delete_blob() const;

    /// Block id of the chunk starting at `offset`: base64 of the offset as a
    /// 32-digit zero-padded decimal, so every id has the same length.
    static std::string block_id_for_offset(uint64_t offset);

private:
    std::string with_query(const std::string& query) const;

    std::string url_;
};

}  // namespace blobmover
