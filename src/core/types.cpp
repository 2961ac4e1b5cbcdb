#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:        return "none";
    case ErrorKind::Config:      return "config";
    case ErrorKind::Connection:  return "connection";
    case ErrorKind::Command:     return "command";
    case ErrorKind::Transfer:    return "transfer";
    case ErrorKind::TransientIO: return "transient-io";
    }
    return "unknown";
}
