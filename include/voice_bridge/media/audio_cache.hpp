#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voice_bridge {
namespace media {

enum class CacheRole {
    UserInput,
    ModelOutput
};

enum class CacheFormat {
    Opus,
    Pcm16
};

const char* to_string(CacheRole role);
const char* to_string(CacheFormat format);

// Optional recording collaborator. Calls are best-effort and must not be
// relied on by the forwarding path.
class AudioCache {
public:
    virtual ~AudioCache() = default;

    virtual void cache_frame(const std::string& connection_id,
                             CacheRole role,
                             CacheFormat format,
                             const std::vector<uint8_t>& frame) = 0;
    virtual void cleanup(const std::string& connection_id) = 0;
};

// Appends frames as <u32 little-endian length><bytes> records to
// <root>/<connection>/<role>.<format>.
class FileAudioCache : public AudioCache {
public:
    explicit FileAudioCache(std::filesystem::path root);

    void cache_frame(const std::string& connection_id,
                     CacheRole role,
                     CacheFormat format,
                     const std::vector<uint8_t>& frame) override;
    void cleanup(const std::string& connection_id) override;

    size_t open_files() const;

private:
    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, std::unique_ptr<std::ofstream>>> files_;
};

}
}
