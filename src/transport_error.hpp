#pragma once
#include <system_error>

enum class TransportError {
  None,
  Unreachable,
  Timeout,
  Refused,
  Malformed
};

const char* to_string(TransportError error);

// Maps a socket error from a connect or write onto the transport taxonomy.
TransportError classify_transport_error(const std::error_code& ec);
