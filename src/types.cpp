#include "common/types.hpp"

namespace bledom {

const char* to_string(Error error)
{
    switch (error) {
        case Error::PORT_ERROR:               return "PORT_ERROR";
        case Error::TIMEOUT:                  return "TIMEOUT";
        case Error::READ_ERROR:               return "READ_ERROR";
        case Error::WRITE_ERROR:              return "WRITE_ERROR";
        case Error::INVALID_RESPONSE:         return "INVALID_RESPONSE";
        case Error::DEVICE_ERROR:             return "DEVICE_ERROR";
        case Error::NO_ADAPTERS_FOUND:        return "NO_ADAPTERS_FOUND";
        case Error::SCAN_ERROR:               return "SCAN_ERROR";
        case Error::DEVICE_NOT_FOUND:         return "DEVICE_NOT_FOUND";
        case Error::PROPERTIES_UNAVAILABLE:   return "PROPERTIES_UNAVAILABLE";
        case Error::CONNECTION_FAILED:        return "CONNECTION_FAILED";
        case Error::SERVICE_DISCOVERY_ERROR:  return "SERVICE_DISCOVERY_ERROR";
        case Error::CHARACTERISTIC_NOT_FOUND: return "CHARACTERISTIC_NOT_FOUND";
        case Error::INVALID_PARAMETER:        return "INVALID_PARAMETER";
    }
    return "UNKNOWN";
}

} // namespace bledom
