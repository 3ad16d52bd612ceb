#pragma once
#include <stdexcept>
#include <string>

// Connect/send/receive failure on the websocket, or a failed REST round trip.
// The stream lifecycle backs off and reconnects on these.
struct TransportError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// REST body without the expected fields, or with non-numeric values.
struct MalformedResponseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Same as above for a stream payload. The router drops the message and logs.
struct MalformedMessageError : MalformedResponseError {
    using MalformedResponseError::MalformedResponseError;
};

// Exchange-native id the symbol codec cannot map back to a canonical pair.
struct UnknownSymbolError : MalformedMessageError {
    using MalformedMessageError::MalformedMessageError;
};

// No frame arrived within the receive window. Not fatal: answered with a ping.
struct IdleTimeout : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Raised when a CancellationToken fires. Not a std::exception: retry
// handlers written as catch (const std::exception&) never see it.
class OperationCancelled {
public:
    OperationCancelled() = default;
    const char* what() const noexcept { return "operation cancelled"; }
};
