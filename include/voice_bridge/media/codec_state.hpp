#pragma once

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>

#include "voice_bridge/media/frame_filter.hpp"
#include "voice_bridge/media/opus_codec.hpp"

namespace voice_bridge {
namespace media {

enum class Direction {
    TelephonyToModel,
    ModelToTelephony
};

const char* to_string(Direction direction);

// Rolling per-direction codec state. Only the forwarding task reading the
// direction's track touches it after creation.
struct CodecState {
    std::unique_ptr<Decoder> decoder;
    DtxSparsifier dtx;
    DuplicateSuppressor duplicates;
    uint64_t packets = 0;
    uint64_t decode_errors = 0;
    uint64_t write_errors = 0;

    CodecState(int dtx_interval, int duplicate_limit)
        : dtx(dtx_interval), duplicates(duplicate_limit) {}
};

class CodecStateRegistry {
public:
    using Factory = std::function<std::unique_ptr<CodecState>()>;

    // Returns the state for (connection, direction), creating it with the
    // factory exactly once even when called concurrently.
    std::shared_ptr<CodecState> get_or_create(const std::string& connection_id,
                                              Direction direction,
                                              const Factory& factory);
    std::shared_ptr<CodecState> find(const std::string& connection_id,
                                     Direction direction) const;
    void remove_connection(const std::string& connection_id);
    size_t size() const;

private:
    using Key = std::pair<std::string, Direction>;

    mutable std::shared_mutex mutex_;
    std::map<Key, std::shared_ptr<CodecState>> states_;
};

}
}
