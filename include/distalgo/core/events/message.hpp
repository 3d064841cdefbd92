#pragma once

#include <cstdint>
#include <string>

namespace DistAlgo {

/**
 * Delivery policy of a message type over the shared pending queue.
 *
 * FIFO:     new messages go to the back, total order equals emission order
 * NON_FIFO: new messages land at a uniformly random position
 *
 * Each message type pins its policy with a `static constexpr
 * ChannelDiscipline kDiscipline` member; the driver reads it at compile time.
 */
enum class ChannelDiscipline : uint8_t {
    FIFO = 0,
    NON_FIFO = 1
};

inline const char* toString(ChannelDiscipline discipline) {
    switch (discipline) {
        case ChannelDiscipline::FIFO:     return "FIFO";
        case ChannelDiscipline::NON_FIFO: return "NON_FIFO";
        default:                          return "UNKNOWN";
    }
}

struct MessageHeader {
    std::string sender;         // Node name
    std::string destination;    // Node name, always derived from a connection
    uint64_t timestamp = 0;     // Sender's Lamport clock at send time
};

} // namespace DistAlgo
