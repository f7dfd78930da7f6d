#include "voice_bridge/media/audio_cache.hpp"

#include <system_error>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::media {

const char* to_string(CacheRole role) {
    return role == CacheRole::UserInput ? "user_input" : "model_output";
}

const char* to_string(CacheFormat format) {
    return format == CacheFormat::Opus ? "opus" : "pcm16";
}

FileAudioCache::FileAudioCache(std::filesystem::path root)
    : root_(std::move(root)) {}

void FileAudioCache::cache_frame(const std::string& connection_id,
                                 CacheRole role,
                                 CacheFormat format,
                                 const std::vector<uint8_t>& frame) {
    const auto name = std::string(to_string(role)) + "." + to_string(format);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stream = files_[connection_id][name];
    if (!stream) {
        const auto dir = root_ / connection_id;
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            logging::warn("Failed to create audio cache directory",
                          {kv("path", dir.string()), kv("error", ec.message())});
            files_[connection_id].erase(name);
            return;
        }
        stream = std::make_unique<std::ofstream>(dir / name, std::ios::binary | std::ios::app);
        if (!*stream) {
            logging::warn("Failed to open audio cache file",
                          {kv("path", (dir / name).string())});
            files_[connection_id].erase(name);
            return;
        }
    }
    const auto size = static_cast<uint32_t>(frame.size());
    const char header[4] = {static_cast<char>(size & 0xFF),
                            static_cast<char>((size >> 8) & 0xFF),
                            static_cast<char>((size >> 16) & 0xFF),
                            static_cast<char>((size >> 24) & 0xFF)};
    stream->write(header, sizeof(header));
    stream->write(reinterpret_cast<const char*>(frame.data()), static_cast<std::streamsize>(frame.size()));
}

void FileAudioCache::cleanup(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = files_.find(connection_id);
    if (it == files_.end()) {
        return;
    }
    for (auto& entry : it->second) {
        entry.second->close();
    }
    files_.erase(it);
}

size_t FileAudioCache::open_files() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : files_) {
        count += entry.second.size();
    }
    return count;
}

}
