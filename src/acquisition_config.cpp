#include "acquisition/acquisition_config.hpp"

namespace bledom {

Result<bool> AcquisitionConfig::validate() const
{
    if (scan_retries == 0) {
        return Result<bool>::failure(Error::INVALID_PARAMETER, "scan_retries must be at least 1");
    }
    if (connection_retries == 0) {
        return Result<bool>::failure(Error::INVALID_PARAMETER, "connection_retries must be at least 1");
    }
    return Result<bool>::success(true);
}

const char* to_string(AcquisitionState state)
{
    switch (state) {
        case AcquisitionState::IDLE:             return "IDLE";
        case AcquisitionState::SCANNING:         return "SCANNING";
        case AcquisitionState::LOCATED:          return "LOCATED";
        case AcquisitionState::CONNECTING:       return "CONNECTING";
        case AcquisitionState::CONNECTED:        return "CONNECTED";
        case AcquisitionState::SERVICE_RESOLVED: return "SERVICE_RESOLVED";
        case AcquisitionState::READY:            return "READY";
        case AcquisitionState::FAILED:           return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace bledom
