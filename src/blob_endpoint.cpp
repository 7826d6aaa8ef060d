#include "blobmover/transfer/blob_endpoint.hpp"

#include <cinttypes>
#include <cstdio>
#include <sstream>

namespace blobmover {

namespace {

std::vector<uint8_t> to_body(std::span<const uint8_t> data) {
    return std::vector<uint8_t>(data.begin(), data.end());
}

void set_md5(net::HttpRequest& request, const std::string& content_md5) {
    if (!content_md5.empty()) {
        request.headers.set("Content-MD5", content_md5);
    }
}

}  // namespace

const char* blob_type_name(BlobType type) {
    switch (type) {
        case BlobType::Block: return "BlockBlob";
        case BlobType::Page: return "PageBlob";
        case BlobType::Append: return "AppendBlob";
    }
    return "BlockBlob";
}

std::optional<BlobType> parse_blob_type(const std::string& name) {
    if (name == "BlockBlob" || name == "block") return BlobType::Block;
    if (name == "PageBlob" || name == "page") return BlobType::Page;
    if (name == "AppendBlob" || name == "append") return BlobType::Append;
    return std::nullopt;
}

BlobProperties BlobProperties::from_response(const net::HttpResponse& response) {
    BlobProperties props;
    props.content_length = response.headers.content_length().value_or(0);
    props.content_md5 = response.headers.get("Content-MD5").value_or("");
    props.etag = response.headers.get("ETag").value_or("");
    if (auto type = response.headers.get("x-ms-blob-type")) {
        props.blob_type = parse_blob_type(*type);
    }
    return props;
}

BlobEndpoint::BlobEndpoint(std::string blob_url)
    : url_(std::move(blob_url)) {}

std::string BlobEndpoint::with_query(const std::string& query) const {
    return url_ + (url_.find('?') == std::string::npos ? "?" : "&") + query;
}

std::string BlobEndpoint::block_id_for_offset(uint64_t offset) {
    char id_buf[40];
    snprintf(id_buf, sizeof(id_buf), "%032" PRIu64, offset);
    return net::base64_encode(std::string(id_buf));
}

net::HttpRequest BlobEndpoint::put_blob(std::span<const uint8_t> data,
                                        const std::string& content_md5) const {
    auto request = net::HttpRequest::put(url_, to_body(data));
    request.headers.set("x-ms-blob-type", blob_type_name(BlobType::Block));
    set_md5(request, content_md5);
    return request;
}

net::HttpRequest BlobEndpoint::put_block(const std::string& block_id,
                                         std::span<const uint8_t> data,
                                         const std::string& content_md5) const {
    auto request = net::HttpRequest::put(
        with_query("comp=block&blockid=" + net::url_encode(block_id)), to_body(data));
    set_md5(request, content_md5);
    return request;
}

net::HttpRequest BlobEndpoint::put_block_list(const std::vector<std::string>& block_ids,
                                              const std::string& blob_content_md5) const {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
    xml << "<BlockList>\n";
    for (const auto& id : block_ids) {
        xml << "  <Latest>" << id << "</Latest>\n";
    }
    xml << "</BlockList>";

    std::string body = xml.str();
    auto request = net::HttpRequest::put(with_query("comp=blocklist"),
                                         std::vector<uint8_t>(body.begin(), body.end()));
    request.headers.set_content_type("application/xml");
    if (!blob_content_md5.empty()) {
        request.headers.set("x-ms-blob-content-md5", blob_content_md5);
    }
    return request;
}

net::HttpRequest BlobEndpoint::create_page_blob(uint64_t size) const {
    auto request = net::HttpRequest::put(url_, {});
    request.headers.set("x-ms-blob-type", blob_type_name(BlobType::Page));
    request.headers.set("x-ms-blob-content-length", std::to_string(size));
    return request;
}

net::HttpRequest BlobEndpoint::create_append_blob() const {
    auto request = net::HttpRequest::put(url_, {});
    request.headers.set("x-ms-blob-type", blob_type_name(BlobType::Append));
    return request;
}

net::HttpRequest BlobEndpoint::put_page(const net::ByteRange& range,
                                        std::span<const uint8_t> data,
                                        const std::string& content_md5) const {
    auto request = net::HttpRequest::put(with_query("comp=page"), to_body(data));
    request.headers.set("x-ms-range", range.to_header());
    request.headers.set("x-ms-page-write", "update");
    set_md5(request, content_md5);
    return request;
}

net::HttpRequest BlobEndpoint::append_block(uint64_t append_position,
                                            std::span<const uint8_t> data,
                                            const std::string& content_md5) const {
    auto request = net::HttpRequest::put(with_query("comp=appendblock"), to_body(data));
    request.headers.set("x-ms-blob-condition-appendpos", std::to_string(append_position));
    set_md5(request, content_md5);
    return request;
}

net::HttpRequest BlobEndpoint::get_properties() const {
    return net::HttpRequest::head(url_);
}

net::HttpRequest BlobEndpoint::get_range(const net::ByteRange& range, bool want_range_md5) const {
    auto request = net::HttpRequest::get(url_);
    request.headers.set("x-ms-range", range.to_header());
    if (want_range_md5) {
        request.headers.set("x-ms-range-get-content-md5", "true");
    }
    return request;
}

net::HttpRequest BlobEndpoint::get_blob() const {
    return net::HttpRequest::get(url_);
}

net::HttpRequest BlobEndpoint::delete_blob() const {
    return net::HttpRequest::del(url_);
}

}  // namespace blobmover
