// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection.h"
#include "http_transport.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace wit {

struct HttpOptions {
    std::string base_url;                  ///< e.g., "http://192.168.1.50" (no trailing slash needed)
    std::string api_key;                   ///< Sent as X-Api-Key when non-empty
    std::string probe_path = "/api/version"; ///< GET target used by connect()
    std::chrono::seconds timeout{10};      ///< Per-request timeout
};

/**
 * @brief Generic REST transport
 *
 * connect() issues a GET to probe_path and succeeds only on HTTP 200.
 * send_command() takes "METHOD /path" (or a bare "/path" meaning GET):
 * - params become the JSON body for POST/PUT/PATCH, the query string otherwise
 * - 2xx: success with the parsed JSON body (non-JSON bodies as {"text": body})
 * - non-2xx: REQUEST_ERROR, message taken from the body's "error" field if any
 * - no response: TIMEOUT or CONNECTION_ERROR
 *
 * Requests are serialized by an internal mutex so the ConnectionState sees
 * one exchange at a time.
 */
class HttpConnection : public Connection {
  public:
    /**
     * @param options Base URL, credentials and timeout
     * @param transport Request executor; nullptr selects the libhv transport
     * @throws std::invalid_argument if base_url is empty
     */
    explicit HttpConnection(HttpOptions options,
                            std::shared_ptr<HttpTransport> transport = nullptr);
    ~HttpConnection() override = default;

    bool connect() override;
    bool disconnect() override;
    bool is_connected() const override;
    CommandResult send_command(const std::string& command,
                               const json& params = json::object()) override;

    ConnectionKind kind() const override {
        return ConnectionKind::HTTP;
    }

    /**
     * @brief Multipart POST of one file
     *
     * @param path Endpoint path (e.g., "/api/files/local")
     * @param filename Name reported in the file part
     * @param content File bytes
     * @param fields Extra text form fields
     */
    CommandResult upload(const std::string& path, const std::string& filename,
                         const std::string& content,
                         const std::map<std::string, std::string>& fields = {});

    const HttpOptions& options() const {
        return options_;
    }

  private:
    /// Perform one call and translate the reply; caller holds mutex_
    CommandResult execute(HttpCall call, const std::string& label);
    std::string build_url(const std::string& path) const;
    void apply_headers(HttpCall& call) const;

    HttpOptions options_;
    std::shared_ptr<HttpTransport> transport_;
    mutable std::mutex mutex_;
};

/**
 * @brief Split "POST /api/job" into method and path
 *
 * A command without a method word is a GET. Methods are upper-cased.
 * @return false if the path part is empty
 */
bool parse_http_command(const std::string& command, std::string& method, std::string& path);

/// {"a":1,"b":"x y"} -> "a=1&b=x%20y"
std::string build_query_string(const json& params);

} // namespace wit
