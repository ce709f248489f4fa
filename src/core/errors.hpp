// core/errors.hpp
// Exception types thrown at the I/O boundary
//
// Transport, TLS and handshake code throws; the session workers catch these and
// turn them into events. Decoding never throws (see protocol/decoder.hpp).
#pragma once

#include <stdexcept>
#include <string>

namespace anagram {

// Initial dial, TLS handshake or HTTP upgrade failed (fatal for the session)
struct ConnectError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Connection broke or the server closed it while reading
struct ReadError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Outbound write (user payload or keepalive) failed
struct WriteError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace anagram
