#include "tanto/core/problem.hpp"

#include <cstdio>

namespace tanto {

namespace {

void append_json_string(std::string& out, std::string_view value) {
    out.push_back('"');
    for (char ch : value) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
                out.append(buf);
            } else {
                out.push_back(ch);
            }
        }
    }
    out.push_back('"');
}

} // namespace

std::string problem_details::to_json() const {
    std::string out;
    out.reserve(96);
    out.append("{\"type\":");
    append_json_string(out, type);
    out.append(",\"title\":");
    append_json_string(out, title);
    out.append(",\"status\":");
    out.append(std::to_string(status));

    if (detail) {
        out.append(",\"detail\":");
        append_json_string(out, *detail);
    }

    if (instance) {
        out.append(",\"instance\":");
        append_json_string(out, *instance);
    }

    for (const auto& [key, value] : extensions) {
        out.push_back(',');
        append_json_string(out, key);
        out.push_back(':');
        append_json_string(out, value);
    }

    out.push_back('}');
    return out;
}

std::string_view reason_phrase(int status) noexcept {
    switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 406: return "Not Acceptable";
    case 409: return "Conflict";
    case 410: return "Gone";
    case 413: return "Payload Too Large";
    case 415: return "Unsupported Media Type";
    case 422: return "Unprocessable Entity";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    default: return {};
    }
}

problem_details problem_details::from_status(int status, std::string_view detail) {
    problem_details p;
    p.status = status;
    p.title = std::string(reason_phrase(status));
    if (!detail.empty()) {
        p.detail = std::string(detail);
    }
    return p;
}

problem_details problem_details::bad_request(std::string_view detail) {
    return from_status(400, detail);
}

problem_details problem_details::unauthorized(std::string_view detail) {
    return from_status(401, detail);
}

problem_details problem_details::forbidden(std::string_view detail) {
    return from_status(403, detail);
}

problem_details problem_details::not_found(std::string_view detail) {
    return from_status(404, detail);
}

problem_details problem_details::method_not_allowed(std::string_view detail) {
    return from_status(405, detail);
}

problem_details problem_details::not_acceptable(std::string_view detail) {
    return from_status(406, detail);
}

problem_details problem_details::conflict(std::string_view detail) {
    return from_status(409, detail);
}

problem_details problem_details::unsupported_media_type(std::string_view detail) {
    return from_status(415, detail);
}

problem_details problem_details::unprocessable_entity(std::string_view detail) {
    return from_status(422, detail);
}

problem_details problem_details::internal_server_error(std::string_view detail) {
    return from_status(500, detail);
}

problem_details problem_details::service_unavailable(std::string_view detail) {
    return from_status(503, detail);
}

} // namespace tanto
