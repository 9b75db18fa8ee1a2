#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace hypoforge {

enum class ErrorKind {
    NotFound,
    BadInput,
    PermissionDenied,
    UpstreamError,
    ExecutionError,
    ConfigError
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::BadInput: return "BadInput";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::UpstreamError: return "UpstreamError";
        case ErrorKind::ExecutionError: return "ExecutionError";
        case ErrorKind::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

class ForgeError : public std::runtime_error {
public:
    ForgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    virtual int http_status() const {
        switch (kind_) {
            case ErrorKind::NotFound: return 404;
            case ErrorKind::BadInput: return 400;
            case ErrorKind::PermissionDenied: return 403;
            case ErrorKind::UpstreamError: return 502;
            case ErrorKind::ExecutionError: return 500;
            case ErrorKind::ConfigError: return 500;
        }
        return 500;
    }

private:
    ErrorKind kind_;
};

class NotFoundError : public ForgeError {
public:
    explicit NotFoundError(const std::string& message) : ForgeError(ErrorKind::NotFound, message) {}
};

class BadInputError : public ForgeError {
public:
    explicit BadInputError(const std::string& message) : ForgeError(ErrorKind::BadInput, message) {}
};

class PermissionDeniedError : public ForgeError {
public:
    explicit PermissionDeniedError(const std::string& message)
        : ForgeError(ErrorKind::PermissionDenied, message) {}
};

// Carries the upstream status and body verbatim. status 0 means the upstream
// was never reached (DNS, connect, TLS, timeout).
class UpstreamError : public ForgeError {
public:
    UpstreamError(const std::string& message, int upstream_status, std::string upstream_body)
        : ForgeError(ErrorKind::UpstreamError, message),
          upstream_status_(upstream_status),
          upstream_body_(std::move(upstream_body)) {}

    int upstream_status() const { return upstream_status_; }
    const std::string& upstream_body() const { return upstream_body_; }

    int http_status() const override {
        return (upstream_status_ >= 400 && upstream_status_ <= 599) ? upstream_status_ : 502;
    }

private:
    int upstream_status_;
    std::string upstream_body_;
};

class ExecutionError : public ForgeError {
public:
    explicit ExecutionError(const std::string& message) : ForgeError(ErrorKind::ExecutionError, message) {}
};

class ConfigError : public ForgeError {
public:
    explicit ConfigError(const std::string& message) : ForgeError(ErrorKind::ConfigError, message) {}
};

inline nlohmann::json error_payload(const ForgeError& e) {
    nlohmann::json payload = {
        {"detail", e.what()},
        {"kind", error_kind_name(e.kind())},
        {"status", e.http_status()}
    };
    if (const auto* upstream = dynamic_cast<const UpstreamError*>(&e)) {
        payload["upstream_status"] = upstream->upstream_status();
        payload["upstream_body"] = upstream->upstream_body();
    }
    return payload;
}

} // namespace hypoforge
