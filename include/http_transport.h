// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file http_transport.h
 * @brief One-shot HTTP request seam used by HttpConnection and network scanning
 *
 * HttpConnection never talks to libhv directly; it hands an HttpCall to an
 * HttpTransport and interprets the HttpReply. Tests substitute
 * MockHttpTransport (tests/mocks/) and assert on its call count.
 */

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace wit {

struct HttpFormFile {
    std::string filename;
    std::string content;
};

/**
 * @brief A single HTTP request
 */
struct HttpCall {
    std::string method = "GET"; ///< GET, POST, PUT, PATCH or DELETE
    std::string url;            ///< Absolute URL including any query string
    std::map<std::string, std::string> headers;
    std::string body;           ///< Sent as application/json when non-empty
    std::map<std::string, std::string> form_fields; ///< Multipart text fields
    std::map<std::string, HttpFormFile> form_files; ///< Multipart file parts by field name
    std::chrono::seconds timeout{10};

    bool is_multipart() const {
        return !form_files.empty();
    }
};

/**
 * @brief Outcome of an HttpCall
 *
 * transport_ok == false means no HTTP response arrived (refused, DNS,
 * timeout); status and body are meaningless in that case.
 */
struct HttpReply {
    bool transport_ok = false;
    bool timed_out = false; ///< Only meaningful when transport_ok is false
    int status = 0;
    std::string body;
    std::string error;

    bool is_success() const {
        return transport_ok && status >= 200 && status < 300;
    }
};

class HttpTransport {
  public:
    virtual ~HttpTransport() = default;

    /// Blocks for at most call.timeout; never throws
    virtual HttpReply perform(const HttpCall& call) = 0;

    /// libhv-backed transport
    static std::shared_ptr<HttpTransport> create();
};

/**
 * @brief HttpTransport over libhv's synchronous requests API
 */
class LibhvHttpTransport : public HttpTransport {
  public:
    HttpReply perform(const HttpCall& call) override;
};

/// Percent-encode a query-string or path component
std::string url_encode(const std::string& value);

} // namespace wit
