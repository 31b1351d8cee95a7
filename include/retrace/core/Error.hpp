#pragma once
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace RT {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        ValidationError,
        InvalidSelection,
        UnknownOperation,
        OutOfRange,
        DecodeError,
        CacheBackendError,
        NoSuchSession,
        CapacityExceeded,
        MalformedInput
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
    // Index of the action whose resolution failed, when the error comes from a stack.
    std::optional<std::size_t> actionIndex;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::ValidationError:
        return "validation_error";
    case Error::Code::InvalidSelection:
        return "invalid_selection";
    case Error::Code::UnknownOperation:
        return "unknown_operation";
    case Error::Code::OutOfRange:
        return "out_of_range";
    case Error::Code::DecodeError:
        return "decode_error";
    case Error::Code::CacheBackendError:
        return "cache_backend_error";
    case Error::Code::NoSuchSession:
        return "no_such_session";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    case Error::Code::MalformedInput:
        return "malformed_input";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto withActionIndex(Error error, std::size_t index) -> Error {
    if (!error.actionIndex) {
        error.actionIndex = index;
    }
    return error;
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const  label = errorCodeToString(error.code);
    std::string description{label};
    if (error.actionIndex) {
        description.append("[action ");
        description.append(std::to_string(*error.actionIndex));
        description.push_back(']');
    }
    if (error.message && !error.message->empty()) {
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
    }
    return description;
}

} // namespace RT
