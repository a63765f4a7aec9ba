#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tasv::video_sync {

// Everything the video host needs to describe a publication's video
struct VideoDescriptor {
    uint64_t publication_id;
    std::string url;
    std::optional<std::string> display_name;
    std::string title;
    std::string markup;
    std::string system_code;
    std::vector<std::string> authors;
    std::optional<uint64_t> obsoleted_by_id;
};

class VideoSync {
public:
    VideoSync() = default;
    VideoSync(const VideoSync&) = delete;
    VideoSync(VideoSync&&) = delete;
    VideoSync& operator=(const VideoSync&) = delete;
    VideoSync& operator=(VideoSync&&) = delete;
    virtual ~VideoSync() = default;

    [[nodiscard]] virtual bool is_recognized_url(std::string_view url) const = 0;

    // Throws on failure
    virtual void sync(const VideoDescriptor& video) = 0;
};

[[nodiscard]] bool is_youtube_url(std::string_view url) noexcept;

// Returns the id of the YouTube video or an empty string if @p url is not a YouTube url
[[nodiscard]] std::string_view youtube_video_id(std::string_view url) noexcept;

// Converts a YouTube watch url into the embeddable form, other urls are returned unchanged
std::string to_embed_link(std::string_view url);

// Syncs by running an external command:
//   <command> <publication_id> <url> <title> <system_code> <authors> <obsoleted_by_id or "">
// with the description markup passed on the standard input
class CommandVideoSync final : public VideoSync {
    std::string command;

public:
    // Empty @p command_ disables syncing, sync() only logs what it would do
    explicit CommandVideoSync(std::string command_) noexcept : command{std::move(command_)} {}

    [[nodiscard]] bool is_recognized_url(std::string_view url) const override {
        return is_youtube_url(url);
    }

    void sync(const VideoDescriptor& video) override;
};

} // namespace tasv::video_sync
