#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Error categories surfaced by the auth subsystem.
enum class ErrorKind {
    None,
    Generic,
    Transport,          // HTTP/network failure
    Protocol,           // OAuth error code other than pending/slow_down
    Expired,            // device code deadline passed
    NotLoggedIn,        // unknown host, or unknown (host, user)
    NotAMember,         // user is not registered on the host
    AmbiguousSelection, // several candidates and no way to choose
    Storage,            // keychain or config file I/O failure
    Timeout,            // keychain call exceeded its deadline
    WriteProtected,     // token comes from an environment variable
    Validation,         // bad flags or input
    Cancelled,          // interactive prompt aborted
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Generic};
    }

    static Result<T> Err(ErrorKind k, const std::string& err) {
        return {false, T{}, err, k};
    }

    // Carry the failure of another result across a type change.
    template <typename U>
    static Result<T> From(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Generic};
    }

    static Result<void> Err(ErrorKind k, const std::string& err) {
        return {false, err, k};
    }

    template <typename U>
    static Result<void> From(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// A resolved token and where it came from ("keyring", "config", or the
// name of an environment variable).
struct AuthToken {
    std::string token;
    std::string source;
};

// A single (host, user) pair, used by selection and status listings.
struct HostUser {
    std::string host;
    std::string user;

    bool operator==(const HostUser& other) const {
        return host == other.host && user == other.user;
    }
};

// Looks up an environment variable. Injected so tests never touch the
// real process environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment; empty values count as unset.
std::optional<std::string> process_env(const std::string& name);

