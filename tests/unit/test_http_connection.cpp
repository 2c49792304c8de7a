// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "http_connection.h"
#include "octoprint_connection.h"

#include "../mocks/mock_http_transport.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace wit;

namespace {

HttpOptions options_for(const std::string& base_url, const std::string& api_key = "") {
    HttpOptions opts;
    opts.base_url = base_url;
    opts.api_key = api_key;
    return opts;
}

} // namespace

// ============================================================================
// Construction and connect
// ============================================================================

TEST_CASE("HttpConnection: empty base URL is rejected", "[http][connection]") {
    REQUIRE_THROWS_AS(HttpConnection(options_for("")), std::invalid_argument);
}

TEST_CASE("HttpConnection: connect probes the version endpoint", "[http][connection]") {
    auto http = std::make_shared<MockHttpTransport>();
    http->on("GET", "/api/version", MockHttpTransport::ok(R"({"api":"0.1"})"));
    HttpConnection conn(options_for("http://printer.local/", "secret"), http);

    REQUIRE(conn.id() == "http_http://printer.local");
    REQUIRE(conn.connect());
    REQUIRE(conn.is_connected());
    REQUIRE(conn.state().is_healthy());

    auto call = http->last_call();
    REQUIRE(call.url == "http://printer.local/api/version");
    REQUIRE(call.headers["X-Api-Key"] == "secret");
    REQUIRE(call.timeout == std::chrono::seconds(10));
}

TEST_CASE("HttpConnection: connect fails on non-200 or no response", "[http][connection]") {
    auto http = std::make_shared<MockHttpTransport>();
    HttpConnection conn(options_for("http://printer.local"), http);

    SECTION("refused") {
        REQUIRE_FALSE(conn.connect());
        REQUIRE(conn.state().last_error() == std::string("Connection refused"));
    }

    SECTION("403") {
        http->on("GET", "/api/version", MockHttpTransport::status(403));
        REQUIRE_FALSE(conn.connect());
        REQUIRE(conn.state().last_error() == std::string("HTTP 403"));
    }

    REQUIRE_FALSE(conn.is_connected());
}

// ============================================================================
// send_command
// ============================================================================

TEST_CASE("HttpConnection: commands before connect never reach the transport",
          "[http][connection]") {
    auto http = std::make_shared<MockHttpTransport>();
    HttpConnection conn(options_for("http://printer.local"), http);

    auto r = conn.send_command("GET /api/job");
    REQUIRE(r.has_error_code(error_code::CONNECTION_ERROR));
    REQUIRE(http->call_count() == 0);

    REQUIRE(conn.upload("/api/files/local", "a.gcode", "G28")
                .has_error_code(error_code::CONNECTION_ERROR));
    REQUIRE(http->call_count() == 0);
}

class ConnectedHttpFixture {
  protected:
    std::shared_ptr<MockHttpTransport> http = std::make_shared<MockHttpTransport>();
    std::unique_ptr<HttpConnection> conn;

    ConnectedHttpFixture() {
        http->on("GET", "/api/version", MockHttpTransport::ok("{}"));
        conn = std::make_unique<HttpConnection>(options_for("http://printer.local"), http);
        REQUIRE(conn->connect());
        http->clear_calls();
    }
};

TEST_CASE_METHOD(ConnectedHttpFixture, "HttpConnection: GET with query parameters",
                 "[http][connection]") {
    http->on("GET", "/server/files/list", MockHttpTransport::ok(R"({"result":[]})"));

    auto r = conn->send_command("GET /server/files/list", {{"root", "gcodes"}});
    REQUIRE(r.ok());
    REQUIRE(r.data()["status_code"] == 200);
    REQUIRE(http->last_call().url == "http://printer.local/server/files/list?root=gcodes");
    REQUIRE(http->last_call().body.empty());
}

TEST_CASE_METHOD(ConnectedHttpFixture, "HttpConnection: bare path means GET",
                 "[http][connection]") {
    http->on("GET", "/api/job", MockHttpTransport::ok(R"({"state":"Operational"})"));
    auto r = conn->send_command("/api/job");
    REQUIRE(r.ok());
    REQUIRE(r.data()["state"] == "Operational");
}

TEST_CASE_METHOD(ConnectedHttpFixture, "HttpConnection: POST sends a JSON body",
                 "[http][connection]") {
    http->on("POST", "/api/job", MockHttpTransport::status(204));

    auto r = conn->send_command("post /api/job", {{"command", "cancel"}});
    REQUIRE(r.ok());
    REQUIRE(r.data()["status_code"] == 204);

    auto call = http->last_call();
    REQUIRE(call.method == "POST");
    REQUIRE(json::parse(call.body)["command"] == "cancel");
}

TEST_CASE_METHOD(ConnectedHttpFixture, "HttpConnection: response shapes", "[http][connection]") {
    SECTION("plain text body") {
        http->on("GET", "/text", MockHttpTransport::ok("hello"));
        REQUIRE(conn->send_command("GET /text").data()["text"] == "hello");
    }

    SECTION("array body is wrapped") {
        http->on("GET", "/list", MockHttpTransport::ok("[1,2]"));
        auto r = conn->send_command("GET /list");
        REQUIRE(r.data()["value"].size() == 2);
    }
}

TEST_CASE_METHOD(ConnectedHttpFixture, "HttpConnection: error mapping", "[http][connection]") {
    SECTION("non-2xx with error field") {
        http->on("POST", "/api/job", MockHttpTransport::status(409, R"({"error":"Printer is not operational"})"));
        auto r = conn->send_command("POST /api/job", {{"command", "start"}});
        REQUIRE(r.has_error_code(error_code::REQUEST_ERROR));
        REQUIRE(r.error_message() == "Printer is not operational");
    }

    SECTION("non-2xx with nested message") {
        http->on("GET", "/printer/info", MockHttpTransport::status(503, R"({"error":{"message":"Klippy not ready"}})"));
        REQUIRE(conn->send_command("GET /printer/info").error_message() == "Klippy not ready");
    }

    SECTION("non-2xx without body") {
        http->on("GET", "/missing", MockHttpTransport::status(404));
        REQUIRE(conn->send_command("GET /missing").error_message() == "HTTP 404");
    }

    SECTION("timeout") {
        http->on("GET", "/slow", MockHttpTransport::timeout());
        REQUIRE(conn->send_command("GET /slow").has_error_code(error_code::TIMEOUT));
        REQUIRE_FALSE(conn->state().is_healthy());
    }

    SECTION("refused") {
        REQUIRE(conn->send_command("GET /nowhere").has_error_code(error_code::CONNECTION_ERROR));
    }

    SECTION("malformed command") {
        REQUIRE(conn->send_command("   ").has_error_code(error_code::INVALID_PARAMETER));
        REQUIRE(http->call_count() == 0);
    }
}

TEST_CASE_METHOD(ConnectedHttpFixture, "HttpConnection: zero-second health window",
                 "[http][connection]") {
    http->on("GET", "/printer/info", MockHttpTransport::ok("{}"));

    REQUIRE(conn->send_command("GET /printer/info").ok());
    REQUIRE(conn->state().is_healthy(std::chrono::seconds(0)));

    REQUIRE_FALSE(conn->send_command("GET /nowhere").ok());
    REQUIRE_FALSE(conn->state().is_healthy(std::chrono::seconds(0)));

    REQUIRE(conn->send_command("GET /printer/info").ok());
    REQUIRE(conn->state().is_healthy(std::chrono::seconds(0)));
}

TEST_CASE_METHOD(ConnectedHttpFixture, "HttpConnection: upload is multipart",
                 "[http][connection]") {
    http->on("POST", "/server/files/upload", MockHttpTransport::ok(R"({"item":{}})", 201));

    auto r = conn->upload("/server/files/upload", "cube.gcode", "G28\n", {{"root", "gcodes"}});
    REQUIRE(r.ok());

    auto call = http->last_call();
    REQUIRE(call.is_multipart());
    REQUIRE(call.form_files["file"].filename == "cube.gcode");
    REQUIRE(call.form_files["file"].content == "G28\n");
    REQUIRE(call.form_fields["root"] == "gcodes");
    REQUIRE(call.timeout >= std::chrono::seconds(120));
}

TEST_CASE("HttpConnection: command parsing helpers", "[http][parser]") {
    std::string method, path;
    REQUIRE(parse_http_command("delete /api/files/local/a.gcode", method, path));
    REQUIRE(method == "DELETE");
    REQUIRE(path == "/api/files/local/a.gcode");

    REQUIRE_FALSE(parse_http_command("GET", method, path));
    REQUIRE(build_query_string({{"a", "x y"}, {"b", 2}}) == "a=x%20y&b=2");
    REQUIRE(build_query_string(json::array()).empty());
}

// ============================================================================
// OctoPrintConnection
// ============================================================================

TEST_CASE("OctoPrintConnection: connect reads the server version", "[http][octoprint]") {
    auto http = std::make_shared<MockHttpTransport>();
    http->on("GET", "/api/version", MockHttpTransport::ok(R"({"text":"OctoPrint 1.9.3"})"));
    http->on("GET", "/api/server", MockHttpTransport::ok(R"({"version":"1.9.3","safemode":null})"));

    OctoPrintConnection conn(options_for("http://octopi.local", "key"), http);
    REQUIRE(conn.kind() == ConnectionKind::OCTOPRINT);
    REQUIRE(conn.connect());
    REQUIRE(conn.server_version() == "1.9.3");
    REQUIRE(conn.state().is_healthy());
}

TEST_CASE("OctoPrintConnection: zero-second health window", "[http][octoprint]") {
    auto http = std::make_shared<MockHttpTransport>();
    http->on("GET", "/api/version", MockHttpTransport::ok("{}"));
    http->on("GET", "/api/job", MockHttpTransport::ok(R"({"state":"Operational"})"));

    OctoPrintConnection conn(options_for("http://octopi.local"), http);
    REQUIRE(conn.connect());
    REQUIRE(conn.send_command("GET /api/job").ok());
    REQUIRE(conn.state().is_healthy(std::chrono::seconds(0)));

    http->on("GET", "/api/printer", MockHttpTransport::timeout());
    REQUIRE_FALSE(conn.send_command("GET /api/printer").ok());
    REQUIRE_FALSE(conn.state().is_healthy(std::chrono::seconds(0)));
}

TEST_CASE("OctoPrintConnection: job verbs", "[http][octoprint]") {
    auto http = std::make_shared<MockHttpTransport>();
    http->on("GET", "/api/version", MockHttpTransport::ok("{}"));
    http->on("POST", "/api/", MockHttpTransport::status(204));

    OctoPrintConnection conn(options_for("http://octopi.local"), http);
    REQUIRE(conn.connect());

    REQUIRE(conn.pause_job().ok());
    auto body = json::parse(http->last_call().body);
    REQUIRE(body["command"] == "pause");
    REQUIRE(body["action"] == "pause");

    REQUIRE(conn.resume_job().ok());
    REQUIRE(json::parse(http->last_call().body)["action"] == "resume");

    REQUIRE(conn.select_and_print("my part.gcode").ok());
    REQUIRE(http->last_call().url == "http://octopi.local/api/files/local/my%20part.gcode");
    REQUIRE(json::parse(http->last_call().body)["print"] == true);
}
