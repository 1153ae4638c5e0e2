#pragma once

/// @file http_codec.hpp
/// @brief Request parsing and response rendering for the admission HTTP API.
///
/// Pure functions with no socket access; AdmissionHttpServer does the I/O.

#include "agw/foundation/gateway_result.hpp"
#include "agw/service/admission_types.hpp"
#include "agw/service/override_registry.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace agw::service::http {

using QueryParams = std::map<std::string, std::string, std::less<>>;

struct HttpRequest {
    std::string method;
    std::string path;
    QueryParams query;
};

struct HttpResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /// Full HTTP/1.1 wire form with Content-Length and `Connection: close`.
    [[nodiscard]] std::string serialize() const;
};

[[nodiscard]] std::string_view reasonPhrase(int status);

/// `%XX` and `+` decoding. nullopt on a truncated or non-hex escape.
[[nodiscard]] std::optional<std::string> percentDecode(std::string_view text);

/// `a=1&b=two` into a map. Later duplicates win; keys without `=` map to "".
[[nodiscard]] foundation::GatewayResult<QueryParams> parseQuery(std::string_view query);

/// Value of @p key, or nullptr when absent.
[[nodiscard]] const std::string* findParam(const QueryParams& query, std::string_view key);

/// Whole-string integer parse; nullopt on any trailing junk.
[[nodiscard]] std::optional<uint64_t> parseUnsigned(std::string_view text);
[[nodiscard]] std::optional<int64_t> parseSigned(std::string_view text);

/// Parse the request line of a raw HTTP request.
/// @return InvalidRequest when the line is malformed.
[[nodiscard]] foundation::GatewayResult<HttpRequest> parseRequest(std::string_view raw);

// ── /admit ──────────────────────────────────────────────────────────────────

/// principal, resource (required); event_id, event_date, urgency, cost.
[[nodiscard]] foundation::GatewayResult<AdmissionRequest>
admissionRequestFromQuery(const QueryParams& query);

/// HTTP status for a decision: 200, 429, 503, 403, 400 or 500.
[[nodiscard]] int statusFor(const AdmissionDecision& decision);

[[nodiscard]] std::string decisionToJson(const AdmissionDecision& decision,
                                         std::optional<uint64_t> ticket);

/// Decision response with X-RateLimit-* and Retry-After headers.
[[nodiscard]] HttpResponse admissionResponse(const AdmissionDecision& decision,
                                             std::optional<uint64_t> ticket);

// ── /overrides ──────────────────────────────────────────────────────────────

/// scope, target, effect, value, expires_in_seconds, issued_by.
///
/// expires_in_seconds must lie in (0, @p maxLifetime].
[[nodiscard]] foundation::GatewayResult<OverrideRequest> overrideRequestFromQuery(
    const QueryParams& query, std::chrono::system_clock::time_point now,
    std::chrono::seconds maxLifetime = OverrideRegistry::kDefaultMaxLifetime);

[[nodiscard]] std::string overrideToJson(const EmergencyOverride& record);

// ── Errors ──────────────────────────────────────────────────────────────────

[[nodiscard]] HttpResponse errorResponse(int status, std::string_view code,
                                         std::string_view message);

}  // namespace agw::service::http
