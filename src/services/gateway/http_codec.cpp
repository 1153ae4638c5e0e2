/// @file http_codec.cpp
/// @brief HTTP parsing and JSON rendering for the admission API.

#include "agw/service/http_codec.hpp"

#include "agw/foundation/json_log_formatter.hpp"

#include <charconv>
#include <sstream>

namespace agw::service::http {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
}

template <typename T>
std::optional<T> parseNumber(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

GatewayError badRequest(std::string message) {
    return GatewayError(ErrorCode::InvalidRequest, std::move(message));
}

int64_t epochSeconds(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    // Rounded up: a reset is never reported early.
    return ms >= 0 ? (ms + 999) / 1000 : ms / 1000;
}

void appendField(std::string& out, std::string_view key) {
    if (out.back() != '{') {
        out += ',';
    }
    foundation::appendJsonString(out, key);
    out += ':';
}

}  // namespace

const std::string* findParam(const QueryParams& query, std::string_view key) {
    auto it = query.find(key);
    return it == query.end() ? nullptr : &it->second;
}

std::optional<uint64_t> parseUnsigned(std::string_view text) {
    return parseNumber<uint64_t>(text);
}

std::optional<int64_t> parseSigned(std::string_view text) {
    return parseNumber<int64_t>(text);
}

// ── Wire ────────────────────────────────────────────────────────────────────

std::string_view reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Error";
    }
}

std::string HttpResponse::serialize() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << ' ' << reasonPhrase(status)
        << "\r\nContent-Type: " << contentType
        << "\r\nContent-Length: " << body.size();
    for (const auto& [name, value] : headers) {
        out << "\r\n" << name << ": " << value;
    }
    out << "\r\nConnection: close\r\n\r\n" << body;
    return out.str();
}

std::optional<std::string> percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%') {
            if (i + 2 >= text.size()) {
                return std::nullopt;
            }
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            out += static_cast<char>(hi * 16 + lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

GatewayResult<QueryParams> parseQuery(std::string_view query) {
    QueryParams params;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }

        auto eq = pair.find('=');
        auto key = percentDecode(pair.substr(0, eq));
        auto value = percentDecode(eq == std::string_view::npos ? std::string_view{}
                                                                : pair.substr(eq + 1));
        if (!key || !value) {
            return GatewayResult<QueryParams>::err(badRequest("malformed percent-encoding"));
        }
        params[std::move(*key)] = std::move(*value);
    }
    return GatewayResult<QueryParams>::ok(std::move(params));
}

GatewayResult<HttpRequest> parseRequest(std::string_view raw) {
    auto lineEnd = raw.find('\n');
    if (lineEnd == std::string_view::npos) {
        return GatewayResult<HttpRequest>::err(badRequest("incomplete request line"));
    }
    auto line = raw.substr(0, lineEnd);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    auto firstSpace = line.find(' ');
    auto secondSpace = firstSpace == std::string_view::npos
                           ? std::string_view::npos
                           : line.find(' ', firstSpace + 1);
    if (secondSpace == std::string_view::npos ||
        line.substr(secondSpace + 1).rfind("HTTP/", 0) != 0) {
        return GatewayResult<HttpRequest>::err(badRequest("malformed request line"));
    }

    HttpRequest request;
    request.method = std::string(line.substr(0, firstSpace));
    auto target = line.substr(firstSpace + 1, secondSpace - firstSpace - 1);
    if (request.method.empty() || target.empty() || target.front() != '/') {
        return GatewayResult<HttpRequest>::err(badRequest("malformed request target"));
    }

    auto question = target.find('?');
    request.path = std::string(target.substr(0, question));
    if (question != std::string_view::npos) {
        auto query = parseQuery(target.substr(question + 1));
        if (!query) {
            return query.propagate<HttpRequest>();
        }
        request.query = std::move(query).value();
    }
    return GatewayResult<HttpRequest>::ok(std::move(request));
}

// ── /admit ──────────────────────────────────────────────────────────────────

GatewayResult<AdmissionRequest> admissionRequestFromQuery(const QueryParams& query) {
    AdmissionRequest request;

    const auto* principal = findParam(query, "principal");
    const auto* resource = findParam(query, "resource");
    if (principal == nullptr || principal->empty() || resource == nullptr || resource->empty()) {
        return GatewayResult<AdmissionRequest>::err(
            badRequest("principal and resource are required"));
    }
    request.principalId = *principal;
    request.resource = *resource;

    if (const auto* cost = findParam(query, "cost")) {
        auto parsed = parseUnsigned(*cost);
        if (!parsed || *parsed == 0) {
            return GatewayResult<AdmissionRequest>::err(
                badRequest("cost must be a positive integer"));
        }
        request.cost = *parsed;
    }

    if (const auto* eventId = findParam(query, "event_id"); eventId && !eventId->empty()) {
        request.context.eventId = *eventId;
    }
    if (const auto* eventDate = findParam(query, "event_date"); eventDate && !eventDate->empty()) {
        request.context.eventDate = *eventDate;
    }
    if (const auto* urgency = findParam(query, "urgency"); urgency && !urgency->empty()) {
        request.context.declaredUrgency = *urgency;
    }
    return GatewayResult<AdmissionRequest>::ok(std::move(request));
}

int statusFor(const AdmissionDecision& decision) {
    if (decision.allowed) {
        return 200;
    }
    switch (decision.reason.value_or(DenyReason::InternalError)) {
        case DenyReason::QuotaExceeded:
            return 429;
        case DenyReason::UpstreamUnavailable:
        case DenyReason::UpstreamSaturated:
        case DenyReason::StoreUnavailable:
            return 503;
        case DenyReason::UnknownPrincipal:
            return 403;
        case DenyReason::InvalidRequest:
            return 400;
        case DenyReason::ConfigurationMissing:
        case DenyReason::InternalError:
            return 500;
    }
    return 500;
}

std::string decisionToJson(const AdmissionDecision& decision, std::optional<uint64_t> ticket) {
    std::string out = "{";

    appendField(out, "allowed");
    out += decision.allowed ? "true" : "false";

    appendField(out, "priority");
    foundation::appendJsonString(out, priorityClassName(decision.priority));

    appendField(out, "upstream");
    if (decision.upstreamTarget) {
        foundation::appendJsonString(out, *decision.upstreamTarget);
    } else {
        out += "null";
    }

    appendField(out, "degraded");
    out += decision.degraded ? "true" : "false";

    appendField(out, "failed_open");
    out += decision.failedOpen ? "true" : "false";

    appendField(out, "reason");
    if (decision.reason) {
        foundation::appendJsonString(out, denyReasonName(*decision.reason));
    } else {
        out += "null";
    }

    appendField(out, "detail");
    foundation::appendJsonString(out, decision.detail);

    appendField(out, "retry_after_seconds");
    out += decision.retryAfterSeconds ? std::to_string(*decision.retryAfterSeconds) : "null";

    appendField(out, "limit");
    out += std::to_string(decision.limit);

    appendField(out, "remaining");
    out += std::to_string(decision.remaining);

    appendField(out, "reset_at");
    out += decision.resetAt ? std::to_string(epochSeconds(*decision.resetAt)) : "null";

    appendField(out, "request_id");
    foundation::appendJsonString(out, decision.requestId);

    if (ticket) {
        appendField(out, "ticket");
        out += std::to_string(*ticket);
    }

    out += '}';
    return out;
}

HttpResponse admissionResponse(const AdmissionDecision& decision,
                               std::optional<uint64_t> ticket) {
    HttpResponse response;
    response.status = statusFor(decision);
    response.body = decisionToJson(decision, ticket);

    if (decision.limit > 0) {
        response.headers.emplace_back("X-RateLimit-Limit", std::to_string(decision.limit));
        response.headers.emplace_back("X-RateLimit-Remaining",
                                      std::to_string(decision.remaining));
        if (decision.resetAt) {
            response.headers.emplace_back("X-RateLimit-Reset",
                                          std::to_string(epochSeconds(*decision.resetAt)));
        }
    }
    if (decision.retryAfterSeconds) {
        response.headers.emplace_back("Retry-After", std::to_string(*decision.retryAfterSeconds));
    }
    if (!decision.requestId.empty()) {
        response.headers.emplace_back("X-Request-Id", decision.requestId);
    }
    return response;
}

// ── /overrides ──────────────────────────────────────────────────────────────

GatewayResult<OverrideRequest> overrideRequestFromQuery(const QueryParams& query,
                                                        std::chrono::system_clock::time_point now,
                                                        std::chrono::seconds maxLifetime) {
    using Parsed = GatewayResult<OverrideRequest>;
    OverrideRequest request;

    const auto* scope = findParam(query, "scope");
    const auto* target = findParam(query, "target");
    if (scope == nullptr || *scope == "global") {
        request.scope = OverrideScope::global();
    } else if (*scope == "principal" && target != nullptr) {
        request.scope = OverrideScope::principal(*target);
    } else if (*scope == "event" && target != nullptr) {
        request.scope = OverrideScope::event(*target);
    } else {
        return Parsed::err(badRequest("scope must be global, principal or event with a target"));
    }

    const auto* effect = findParam(query, "effect");
    const auto* value = findParam(query, "value");
    if (effect == nullptr || value == nullptr) {
        return Parsed::err(badRequest("effect and value are required"));
    }
    if (*effect == overrideEffectName(OverrideEffectKind::QuotaMultiplier)) {
        auto n = parseNumber<double>(*value);
        if (!n) {
            return Parsed::err(badRequest("quota_multiplier value must be a number"));
        }
        request.effect = OverrideEffect::quotaMultiplier(*n);
    } else {
        auto cls = parsePriorityClass(*value);
        if (!cls) {
            return Parsed::err(badRequest("unknown priority class '" + *value + "'"));
        }
        if (*effect == overrideEffectName(OverrideEffectKind::PriorityFloor)) {
            request.effect = OverrideEffect::priorityFloor(*cls);
        } else if (*effect == overrideEffectName(OverrideEffectKind::PriorityCeiling)) {
            request.effect = OverrideEffect::priorityCeiling(*cls);
        } else {
            return Parsed::err(badRequest("unknown effect '" + *effect + "'"));
        }
    }

    const auto* expires = findParam(query, "expires_in_seconds");
    auto seconds = expires ? parseSigned(*expires) : std::nullopt;
    if (!seconds) {
        return Parsed::err(badRequest("expires_in_seconds must be an integer"));
    }
    // Range-checked before it reaches chrono arithmetic.
    if (*seconds <= 0 || *seconds > maxLifetime.count()) {
        return Parsed::err(badRequest("expires_in_seconds must be within (0, " +
                                      std::to_string(maxLifetime.count()) + "]"));
    }
    request.expiresAt = now + std::chrono::seconds(*seconds);

    if (const auto* issuer = findParam(query, "issued_by")) {
        request.issuedBy = *issuer;
    }
    return Parsed::ok(std::move(request));
}

std::string overrideToJson(const EmergencyOverride& record) {
    std::string out = "{";

    appendField(out, "id");
    out += std::to_string(record.id.value());

    appendField(out, "scope");
    foundation::appendJsonString(out, overrideScopeName(record.scope.kind));

    appendField(out, "target");
    foundation::appendJsonString(out, record.scope.target);

    appendField(out, "effect");
    foundation::appendJsonString(out, overrideEffectName(record.effect.kind));

    appendField(out, "value");
    if (record.effect.kind == OverrideEffectKind::QuotaMultiplier) {
        std::ostringstream number;
        number << record.effect.multiplier;
        out += number.str();
    } else {
        foundation::appendJsonString(out, priorityClassName(record.effect.priority));
    }

    appendField(out, "expires_at");
    out += std::to_string(epochSeconds(record.expiresAt));

    appendField(out, "issued_by");
    foundation::appendJsonString(out, record.issuedBy);

    out += '}';
    return out;
}

// ── Errors ──────────────────────────────────────────────────────────────────

HttpResponse errorResponse(int status, std::string_view code, std::string_view message) {
    HttpResponse response;
    response.status = status;
    response.body = "{";
    appendField(response.body, "error");
    foundation::appendJsonString(response.body, code);
    appendField(response.body, "message");
    foundation::appendJsonString(response.body, message);
    response.body += '}';
    return response;
}

}  // namespace agw::service::http
