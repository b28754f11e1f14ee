#include "ScaleTypes.hpp"

const char* getScaleResultString(const ScaleResult_e value)
{
    switch (value) {
        case ScaleResult_e::SCREZ_OK:
            return "SCREZ_OK";
        case ScaleResult_e::SCREZ_TIMEOUT:
            return "SCREZ_TIMEOUT";
        case ScaleResult_e::SCREZ_INVALID_GAIN:
            return "SCREZ_INVALID_GAIN";
        case ScaleResult_e::SCREZ_INVALID_SCALE:
            return "SCREZ_INVALID_SCALE";
        case ScaleResult_e::SCREZ_INVALID_CALIBRATION:
            return "SCREZ_INVALID_CALIBRATION";
        case ScaleResult_e::SCREZ_INVALID_CONFIG:
            return "SCREZ_INVALID_CONFIG";
        case ScaleResult_e::SCREZ_ALREADY_RUNNING:
            return "SCREZ_ALREADY_RUNNING";
        case ScaleResult_e::SCREZ_HARDWARE_UNAVAILABLE:
            return "SCREZ_HARDWARE_UNAVAILABLE";
        case ScaleResult_e::SCREZ_NOT_CONFIGURED:
            return "SCREZ_NOT_CONFIGURED";
        case ScaleResult_e::SCREZ_CANCELLED:
            return "SCREZ_CANCELLED";
        case ScaleResult_e::SCREZ_WRONG_STATE:
            return "SCREZ_WRONG_STATE";
        case ScaleResult_e::SCREZ_STORAGE_FAILED:
            return "SCREZ_STORAGE_FAILED";
        case ScaleResult_e::SCREZ_MUTEX_ACQUISITION:
            return "SCREZ_MUTEX_ACQUISITION";
        default:
            break;
    }
    return "SCREZ_UNKNOWN";
}

bool isFatalScaleResult(const ScaleResult_e value)
{
    switch (value) {
        case ScaleResult_e::SCREZ_HARDWARE_UNAVAILABLE:
        case ScaleResult_e::SCREZ_NOT_CONFIGURED:
        case ScaleResult_e::SCREZ_INVALID_GAIN:
            return true;
        default:
            return false;
    }
}
