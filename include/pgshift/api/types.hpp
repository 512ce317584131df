#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace pgshift::api {

// Configuration variable name -> value
using ConfigVars = std::map<std::string, std::string>;

// Process type -> number of running instances
using ProcessCounts = std::map<std::string, int>;

struct AddonResult {
    std::string message;  // e.g. "Attached as HEROKU_POSTGRESQL_RED"
};

// State of a database-to-database copy on the transfer service
struct Transfer {
    std::string id;
    std::string log;
    std::optional<std::string> error_at;
    std::optional<std::string> finished_at;

    bool failed() const { return error_at.has_value(); }
    bool terminal() const { return error_at || finished_at; }
};

// Non-2xx answer from a remote API
class ApiError : public std::runtime_error {
public:
    ApiError(unsigned status, const std::string& message,
             const std::string& body = "")
        : std::runtime_error(message), status_(status), body_(body) {}

    unsigned status() const noexcept { return status_; }
    const std::string& body() const noexcept { return body_; }

private:
    unsigned status_;
    std::string body_;
};

// The add-on is already installed on the application
class AddonConflictError : public ApiError {
public:
    using ApiError::ApiError;
};

}  // namespace pgshift::api
