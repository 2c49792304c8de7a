// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file http_connection.cpp
 * @brief REST transport: probe on connect, "METHOD /path" commands, uploads
 */

#include "http_connection.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace wit {

namespace {

std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

const char* to_string(ConnectionKind kind) {
    switch (kind) {
    case ConnectionKind::SERIAL:
        return "serial";
    case ConnectionKind::HTTP:
        return "http";
    case ConnectionKind::OCTOPRINT:
        return "octoprint";
    }
    return "unknown";
}

bool parse_http_command(const std::string& command, std::string& method, std::string& path) {
    std::istringstream in(command);
    std::string first;
    in >> first;
    if (first.empty()) {
        return false;
    }

    if (first.front() == '/') {
        method = "GET";
        path = first;
    } else {
        method = first;
        std::transform(method.begin(), method.end(), method.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        in >> path;
    }
    return !path.empty();
}

std::string build_query_string(const json& params) {
    if (!params.is_object()) {
        return "";
    }
    std::string out;
    for (auto it = params.begin(); it != params.end(); ++it) {
        if (!out.empty()) {
            out += '&';
        }
        std::string value = it.value().is_string() ? it.value().get<std::string>()
                                                   : it.value().dump();
        out += url_encode(it.key()) + "=" + url_encode(value);
    }
    return out;
}

HttpConnection::HttpConnection(HttpOptions options, std::shared_ptr<HttpTransport> transport)
    : Connection("http_" + strip_trailing_slashes(options.base_url)),
      options_(std::move(options)),
      transport_(transport ? std::move(transport) : HttpTransport::create()) {
    options_.base_url = strip_trailing_slashes(options_.base_url);
    if (options_.base_url.empty()) {
        throw std::invalid_argument("HttpConnection requires a base URL");
    }
}

std::string HttpConnection::build_url(const std::string& path) const {
    if (path.empty() || path.front() != '/') {
        return options_.base_url + "/" + path;
    }
    return options_.base_url + path;
}

void HttpConnection::apply_headers(HttpCall& call) const {
    if (!options_.api_key.empty()) {
        call.headers["X-Api-Key"] = options_.api_key;
    }
    call.timeout = options_.timeout;
}

bool HttpConnection::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state().connected();
}

bool HttpConnection::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    mutable_state().reset_for_reconnect();

    HttpCall call;
    call.method = "GET";
    call.url = build_url(options_.probe_path);
    apply_headers(call);

    HttpReply reply = transport_->perform(call);
    if (reply.transport_ok && reply.status == 200) {
        mutable_state().set_connected(true);
        mutable_state().mark_success();
        spdlog::info("[HttpConnection] Connected to {}", options_.base_url);
        return true;
    }

    std::string error = reply.transport_ok ? "HTTP " + std::to_string(reply.status) : reply.error;
    mutable_state().mark_failure(error);
    spdlog::warn("[HttpConnection] Connect to {} failed: {}", options_.base_url, error);
    return false;
}

bool HttpConnection::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    mutable_state().set_connected(false);
    spdlog::debug("[HttpConnection] Disconnected from {}", options_.base_url);
    return true;
}

CommandResult HttpConnection::send_command(const std::string& command, const json& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!state().connected()) {
        return CommandResult::error("Not connected", error_code::CONNECTION_ERROR);
    }

    std::string method;
    std::string path;
    if (!parse_http_command(command, method, path)) {
        return CommandResult::error("Malformed HTTP command '" + command + "'",
                                    error_code::INVALID_PARAMETER);
    }

    HttpCall call;
    call.method = method;
    call.url = build_url(path);
    apply_headers(call);

    const bool has_params = params.is_object() && !params.empty();
    if (method == "POST" || method == "PUT" || method == "PATCH") {
        call.body = params.is_null() ? std::string() : params.dump();
    } else if (has_params) {
        call.url += (call.url.find('?') == std::string::npos ? "?" : "&") +
                    build_query_string(params);
    }

    return execute(std::move(call), method + " " + path);
}

CommandResult HttpConnection::upload(const std::string& path, const std::string& filename,
                                     const std::string& content,
                                     const std::map<std::string, std::string>& fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!state().connected()) {
        return CommandResult::error("Not connected", error_code::CONNECTION_ERROR);
    }

    HttpCall call;
    call.method = "POST";
    call.url = build_url(path);
    apply_headers(call);
    // Uploads get a longer timeout than status calls
    call.timeout = std::max(call.timeout, std::chrono::seconds(120));
    call.form_fields = fields;
    call.form_files["file"] = HttpFormFile{filename, content};

    spdlog::info("[HttpConnection] Uploading {} ({} bytes) to {}", filename, content.size(),
                 path);
    return execute(std::move(call), "upload " + filename);
}

CommandResult HttpConnection::execute(HttpCall call, const std::string& label) {
    HttpReply reply = transport_->perform(call);

    if (!reply.transport_ok) {
        mutable_state().mark_failure(reply.error);
        spdlog::warn("[HttpConnection] {} failed: {}", label, reply.error);
        return CommandResult::error(reply.error, reply.timed_out ? error_code::TIMEOUT
                                                                 : error_code::CONNECTION_ERROR);
    }

    if (!reply.is_success()) {
        std::string error = reply.error.empty() ? "HTTP " + std::to_string(reply.status)
                                                : reply.error;
        if (!reply.body.empty()) {
            try {
                auto body = json::parse(reply.body);
                if (body.contains("error") && body["error"].is_string()) {
                    error = body["error"].get<std::string>();
                } else if (body.contains("error") && body["error"].is_object() &&
                           body["error"].contains("message")) {
                    error = body["error"]["message"].get<std::string>();
                } else if (body.contains("message") && body["message"].is_string()) {
                    error = body["message"].get<std::string>();
                }
            } catch (const std::exception& e) {
                spdlog::trace("[HttpConnection] Error body is not JSON: {}", e.what());
            }
        }
        mutable_state().mark_failure(error);
        spdlog::debug("[HttpConnection] {} -> HTTP {}: {}", label, reply.status, error);
        return CommandResult::error(error, error_code::REQUEST_ERROR);
    }

    json data = json::object();
    if (!reply.body.empty()) {
        try {
            data = json::parse(reply.body);
        } catch (const json::parse_error& e) {
            spdlog::trace("[HttpConnection] {} response is not JSON: {}", label, e.what());
            data = json{{"text", reply.body}};
        }
        if (!data.is_object()) {
            data = json{{"value", std::move(data)}};
        }
    }
    data["status_code"] = reply.status;

    mutable_state().mark_success();
    spdlog::debug("[HttpConnection] {} succeeded (HTTP {})", label, reply.status);
    return CommandResult::success(std::move(data));
}

} // namespace wit
