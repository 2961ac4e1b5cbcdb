#pragma once

#include <cstdint>
#include <functional>
#include <string>

// Lifecycle notifications emitted while a file is moved over SFTP.
// Observability only: nothing here feeds back into control flow.
struct TransferEvent {
    enum class Kind {
        Open,     // both ends opened (local, remote)
        Put,      // chunk written to remote (remote, offset, size)
        Get,      // chunk read from remote (remote, offset, size)
        Mkdir,    // missing directory created (path)
        Close,    // destination closed (path)
        Finish,   // transfer complete
    };

    Kind kind;
    std::string local;
    std::string remote;
    std::string path;          // Mkdir/Close target
    uint64_t offset = 0;
    uint64_t size = 0;
};

using TransferObserver = std::function<void(const TransferEvent&)>;

const char* transfer_event_name(TransferEvent::Kind kind);

// One log line per event, e.g. "put(/tmp/b.txt, size 32768 bytes, offset 0)"
std::string describe_transfer_event(const TransferEvent& event);
