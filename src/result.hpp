#pragma once
// =============================================================================
// scrcpy-pilot - Result / Error
// =============================================================================
// Fallible operations return Result<T> instead of throwing. The Error carries
// an ErrorKind so callers branch on the failure class (AlreadyRunning vs Io,
// InvalidTarget vs AlreadyActive) rather than on message text.
//
//   Result<int> parsePid(const std::string& s) {
//       if (s.empty()) return Err<int>("empty pid", ErrorKind::Io);
//       return Ok(std::stoi(s));
//   }
//
//   auto holder = readLockHolder(path);
//   if (holder.is_err()) PLOG_WARN("lock", "%s", holder.error().message.c_str());
//
// Reading value() of an error (or error() of a success) is a programming
// mistake and throws BadResultAccess.
// =============================================================================

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pilot {

// =============================================================================
// Error
// =============================================================================

enum class ErrorKind {
    Other = 0,
    AlreadyRunning,         // another live launcher holds the instance lock
    DiscoveryUnavailable,   // adb failed/timed out this tick
    SpawnFailure,           // scrcpy could not be started
    UnexpectedExit,         // scrcpy exited non-zero without a Stop
    InvalidTarget,          // command names an unknown or non-online device
    AlreadyActive,          // device already has a live session
    ToolMissing,            // adb/scrcpy executable not found
    Timeout,
    Io,
};

inline const char* errorKindStr(ErrorKind k) {
    switch (k) {
        case ErrorKind::Other:                return "Other";
        case ErrorKind::AlreadyRunning:       return "AlreadyRunning";
        case ErrorKind::DiscoveryUnavailable: return "DiscoveryUnavailable";
        case ErrorKind::SpawnFailure:         return "SpawnFailure";
        case ErrorKind::UnexpectedExit:       return "UnexpectedExit";
        case ErrorKind::InvalidTarget:        return "InvalidTarget";
        case ErrorKind::AlreadyActive:        return "AlreadyActive";
        case ErrorKind::ToolMissing:          return "ToolMissing";
        case ErrorKind::Timeout:              return "Timeout";
        case ErrorKind::Io:                   return "Io";
    }
    return "?";
}

struct Error {
    std::string message;
    int code = 0;               // errno or exit code, 0 if none
    ErrorKind kind = ErrorKind::Other;

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::Other, int c = 0)
        : message(std::move(msg)), code(c), kind(k) {}
    explicit Error(const char* msg, ErrorKind k = ErrorKind::Other, int c = 0)
        : message(msg), code(c), kind(k) {}

    // "prefix: message", same kind and code
    Error withContext(const std::string& prefix) const {
        return Error(prefix + ": " + message, kind, code);
    }

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }
    bool operator!=(const Error& other) const { return !(*this == other); }
};

class BadResultAccess : public std::runtime_error {
public:
    explicit BadResultAccess(const std::string& what) : std::runtime_error(what) {}
};

// =============================================================================
// Result<T, E>
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { ensureOk(); return std::get<0>(data_); }
    const T& value() const& { ensureOk(); return std::get<0>(data_); }
    T&& value() && { ensureOk(); return std::get<0>(std::move(data_)); }

    E& error() & { ensureErr(); return std::get<1>(data_); }
    const E& error() const& { ensureErr(); return std::get<1>(data_); }

    T value_or(T fallback) const& { return is_ok() ? std::get<0>(data_) : std::move(fallback); }
    T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    template<typename F>
    auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

private:
    void ensureOk() const {
        if (is_err()) throw BadResultAccess("value() on error result: " + describe(std::get<1>(data_)));
    }
    void ensureErr() const {
        if (is_ok()) throw BadResultAccess("error() on ok result");
    }
    static std::string describe(const Error& e) { return e.message; }
    template<typename Other>
    static std::string describe(const Other&) { return "(non-Error type)"; }

    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E>
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() = default;

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : error_(E(std::move(error))) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (error_) throw BadResultAccess("value() on error result: " + error_->message);
    }

    E& error() & {
        if (!error_) throw BadResultAccess("error() on ok result");
        return *error_;
    }
    const E& error() const& {
        if (!error_) throw BadResultAccess("error() on ok result");
        return *error_;
    }

    std::optional<E> err() const& { return error_; }

private:
    std::optional<E> error_;
};

// =============================================================================
// Constructors
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(Error error) {
    return Result<T, Error>(std::move(error));
}

template<typename T>
Result<T, Error> Err(std::string message, ErrorKind kind = ErrorKind::Other, int code = 0) {
    return Result<T, Error>(Error(std::move(message), kind, code));
}

template<typename T>
Result<T, Error> Err(const char* message, ErrorKind kind = ErrorKind::Other, int code = 0) {
    return Result<T, Error>(Error(message, kind, code));
}

// Unwrap or return the error from the enclosing function (GNU statement
// expression): int pid = PILOT_TRY(parsePid(text));
#define PILOT_TRY(expr)                                     \
    ({                                                      \
        auto _pilot_result = (expr);                        \
        if (_pilot_result.is_err()) return _pilot_result.error(); \
        std::move(_pilot_result).value();                   \
    })

} // namespace pilot
