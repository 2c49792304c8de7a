// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file http_transport_libhv.cpp
 * @brief HttpTransport over libhv requests::request
 *
 * @gotchas libhv returns a null response on any transport failure and does not
 *          say why; a failure that took at least the configured timeout is
 *          reported as a timeout
 */

#include "http_transport.h"

#include "hv/requests.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>

namespace wit {

namespace {

http_method to_hv_method(const std::string& method) {
    if (method == "POST") {
        return HTTP_POST;
    }
    if (method == "PUT") {
        return HTTP_PUT;
    }
    if (method == "PATCH") {
        return HTTP_PATCH;
    }
    if (method == "DELETE") {
        return HTTP_DELETE;
    }
    return HTTP_GET;
}

} // namespace

std::shared_ptr<HttpTransport> HttpTransport::create() {
    return std::make_shared<LibhvHttpTransport>();
}

HttpReply LibhvHttpTransport::perform(const HttpCall& call) {
    HttpReply reply;

    auto req = std::make_shared<HttpRequest>();
    req->method = to_hv_method(call.method);
    req->url = call.url;
    req->timeout = static_cast<int>(call.timeout.count());
    for (const auto& [name, value] : call.headers) {
        req->SetHeader(name.c_str(), value);
    }

    if (call.is_multipart()) {
        req->content_type = MULTIPART_FORM_DATA;
        for (const auto& [name, value] : call.form_fields) {
            req->SetFormData(name.c_str(), value);
        }
        for (const auto& [name, file] : call.form_files) {
            hv::FormData part;
            part.content = file.content;
            part.filename = file.filename;
            req->form[name] = part;
        }
    } else if (!call.body.empty()) {
        req->content_type = APPLICATION_JSON;
        req->body = call.body;
    }

    auto started = std::chrono::steady_clock::now();
    auto resp = requests::request(req);

    if (!resp) {
        auto elapsed = std::chrono::steady_clock::now() - started;
        reply.timed_out = elapsed >= call.timeout;
        reply.error = reply.timed_out ? "Request timed out" : "HTTP request failed - no response";
        spdlog::debug("[HttpTransport] {} {} failed: {}", call.method, call.url, reply.error);
        return reply;
    }

    reply.transport_ok = true;
    reply.status = static_cast<int>(resp->status_code);
    reply.body = resp->body;
    if (!reply.is_success()) {
        reply.error = "HTTP " + std::to_string(reply.status) + ": " + resp->status_message();
    }
    spdlog::trace("[HttpTransport] {} {} -> {}", call.method, call.url, reply.status);
    return reply;
}

std::string url_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // namespace wit
