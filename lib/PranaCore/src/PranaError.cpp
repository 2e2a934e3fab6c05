#include "PranaError.hpp"

const char* errorToString(PranaError error) {
    switch (error) {
        case PranaError::None: return "None";
        case PranaError::ConnectionError: return "ConnectionError";
        case PranaError::TransportTimeout: return "TransportTimeout";
        case PranaError::TransportError: return "TransportError";
        case PranaError::MalformedFrame: return "MalformedFrame";
        case PranaError::UnexpectedCommand: return "UnexpectedCommand";
        case PranaError::DeviceUnreachable: return "DeviceUnreachable";
        case PranaError::ProtocolError: return "ProtocolError";
        case PranaError::Timeout: return "Timeout";
        case PranaError::DiscoveryError: return "DiscoveryError";
        case PranaError::SessionClosed: return "SessionClosed";
        case PranaError::InvalidArgument: return "InvalidArgument";
        default: return "Unknown";
    }
}

bool isTransportFailure(PranaError error) {
    return error == PranaError::ConnectionError ||
           error == PranaError::TransportTimeout ||
           error == PranaError::TransportError;
}

bool isDecodeFailure(PranaError error) {
    return error == PranaError::MalformedFrame ||
           error == PranaError::UnexpectedCommand;
}
