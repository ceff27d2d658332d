/**
 * @file http_backend.cpp
 * @brief Backend-independent helpers: header lookup, TLS version parsing,
 *        transport error wrapping
 */

#include "wsconn/transport/http/http_backend.hpp"

#include <string>

namespace wsconn::transport::http {

namespace {

constexpr char ascii_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

}  // anonymous namespace

//=============================================================================
// Headers
//=============================================================================

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) {
            return false;
        }
    }
    return true;
}

void ResponseHeaders::append_to_last(std::string_view continuation) {
    if (entries_.empty()) {
        return;
    }
    auto& value = entries_.back().second;
    if (!value.empty()) {
        value += ' ';
    }
    value.append(continuation);
}

std::optional<std::string_view> ResponseHeaders::find(std::string_view name) const noexcept {
    for (const auto& [key, value] : entries_) {
        if (header_name_equals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

std::vector<std::string_view> ResponseHeaders::find_all(std::string_view name) const {
    std::vector<std::string_view> values;
    for (const auto& [key, value] : entries_) {
        if (header_name_equals(key, name)) {
            values.emplace_back(value);
        }
    }
    return values;
}

//=============================================================================
// TLS
//=============================================================================

std::optional<TlsVersion> parse_tls_version(std::string_view text) noexcept {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += ascii_lower(c);
    }

    std::string_view v = lower;
    if (v.starts_with("tlsv")) {
        v.remove_prefix(4);
    } else if (v.starts_with("tls")) {
        v.remove_prefix(3);
    }

    if (v == "1.0" || v == "1")
        return TlsVersion::TLS_1_0;
    if (v == "1.1")
        return TlsVersion::TLS_1_1;
    if (v == "1.2")
        return TlsVersion::TLS_1_2;
    if (v == "1.3")
        return TlsVersion::TLS_1_3;
    return std::nullopt;
}

//=============================================================================
// Errors
//=============================================================================

Error transport_failure(std::string_view url, Error cause) {
    Error error(ErrorCode::TRANSPORT_FAILED, "Fail to request " + std::string(url));
    error.with_context("url", url);
    error.with_cause(std::move(cause));
    return error;
}

}  // namespace wsconn::transport::http
