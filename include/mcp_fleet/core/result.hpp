#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access -------------------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // -- Monadic: AndThen ---------------------------------------------------
    // fn: T -> Result<U, E>

    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // -- Monadic: Map -------------------------------------------------------
    // fn: T -> U

    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorKind: the failure taxonomy surfaced to API callers.
//
// ProcessCrash and ProcessTimeout are transient: the router and health
// monitor absorb them into the restart policy. Everything else surfaces
// to the caller without retry.
// ---------------------------------------------------------------------------
enum class ErrorKind {
    Config,
    ProcessStart,
    ProcessTimeout,
    ProcessCrash,
    Protocol,
    ToolUnavailable,
    SessionExpired,
    RequestTimeout,
    ToolError,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error type for fleet operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string tool;
    std::string message;
    std::optional<int> rpc_code;
    ErrorKind kind = ErrorKind::Internal;

    static Error Make(ErrorKind kind,
                      std::string operation,
                      std::string message,
                      std::string tool = "") {
        return Error{std::move(operation), std::move(tool), std::move(message),
                     std::nullopt, kind};
    }

    /// Build an Error from a JSON-RPC error object ({code, message, data?}).
    /// Parse/invalid-request codes are protocol faults; everything else is
    /// an application error reported by the tool itself.
    static Error FromRpcError(const std::string& operation,
                              const std::string& tool,
                              const nlohmann::json& error_object);

    /// Build an Error from a non-2xx HTTP status returned by a network tool.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& tool,
                                int status_code,
                                const std::string& response_body = "");

    [[nodiscard]] bool IsTransient() const noexcept {
        return kind == ErrorKind::ProcessCrash ||
               kind == ErrorKind::ProcessTimeout;
    }

    [[nodiscard]] std::string KindName() const;
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] nlohmann::json ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               tool == other.tool &&
               message == other.message &&
               rpc_code == other.rpc_code &&
               kind == other.kind;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

/// Wire name for an ErrorKind ("config_error", "tool_unavailable_error", ...).
const char* ErrorKindName(ErrorKind kind);

} // namespace mcp_fleet
