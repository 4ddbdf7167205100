#include "nixie_error.h"

namespace SmartNixie {

const char *errorName(Error error) {
    switch (error) {
        case Error::Ok: return "OK";
        case Error::InvalidArgument: return "INVALID_ARGUMENT";
        case Error::OutOfRange: return "OUT_OF_RANGE";
        case Error::TransportUnavailable: return "TRANSPORT_UNAVAILABLE";
        case Error::TransportError: return "TRANSPORT_ERROR";
    }
    return "UNKNOWN";
}

} // namespace SmartNixie
