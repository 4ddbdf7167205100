#ifndef NIXIE_ERROR_H
#define NIXIE_ERROR_H

#include <stdint.h>

namespace SmartNixie {

enum class Error : uint8_t {
    Ok = 0,
    InvalidArgument,
    OutOfRange,
    TransportUnavailable,
    TransportError,
};

// Upper-case name used in logs and console replies.
const char *errorName(Error error);

} // namespace SmartNixie

#endif // NIXIE_ERROR_H
