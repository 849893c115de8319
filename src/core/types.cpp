#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::ConfigurationInvalid: return "ConfigurationInvalid";
        case ErrorKind::RemoteQueryFailed:    return "RemoteQueryFailed";
        case ErrorKind::AlreadyLocked:        return "AlreadyLocked";
        case ErrorKind::MetadataMissing:      return "MetadataMissing";
        case ErrorKind::IoFailed:             return "IoFailed";
    }
    return "Unknown";
}
