#include "transfer_event.hpp"
#include <fmt/format.h>

const char* transfer_event_name(TransferEvent::Kind kind) {
    switch (kind) {
    case TransferEvent::Kind::Open:   return "open";
    case TransferEvent::Kind::Put:    return "put";
    case TransferEvent::Kind::Get:    return "get";
    case TransferEvent::Kind::Mkdir:  return "mkdir";
    case TransferEvent::Kind::Close:  return "close";
    case TransferEvent::Kind::Finish: return "finish";
    }
    return "?";
}

std::string describe_transfer_event(const TransferEvent& event) {
    switch (event.kind) {
    case TransferEvent::Kind::Open:
        return fmt::format("open({} -> {})", event.local, event.remote);
    case TransferEvent::Kind::Put:
    case TransferEvent::Kind::Get:
        return fmt::format("{}({}, size {} bytes, offset {})",
                           transfer_event_name(event.kind), event.remote,
                           event.size, event.offset);
    case TransferEvent::Kind::Mkdir:
        return fmt::format("mkdir({})", event.path);
    case TransferEvent::Kind::Close:
        return fmt::format("close({})", event.path);
    case TransferEvent::Kind::Finish:
        return "finish";
    }
    return "?";
}
