/**
 * @file voice_mixer.h
 * @brief Defines the VoiceMixer, the 20 ms real-time heart of the driver.
 * @details The mixer owns every playing track, the Opus encoder and the outbound packet
 *          buffer. Once per tick it drains its inbox, mixes (or passes through) one frame,
 *          encrypts it into an RTP packet for the UDP send worker, then applies track
 *          commands and mirrors state changes to the event scheduler.
 */
#ifndef VOICELINK_VOICE_MIXER_H
#define VOICELINK_VOICE_MIXER_H

#include "../rtp/rtp_packet.h"
#include "../utils/voice_component.h"
#include "../voice_types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

struct OpusEncoder;

namespace voicelink {
namespace voice {

/**
 * @class VoiceMixer
 * @brief Produces exactly one RTP packet per tick while there is something to say.
 * @details After the last audible frame, up to five Opus silence frames are sent before
 *          the mixer goes quiet. With a single unity-gain track whose source is already
 *          Opus, frames are forwarded without re-encoding.
 */
class VoiceMixer : public VoiceComponent {
public:
    /**
     * @param interconnect Channels to the core and event scheduler; `mixer` is this mixer's inbox.
     * @param config Driver settings.
     * @throws std::runtime_error if the Opus encoder cannot be created.
     */
    VoiceMixer(Interconnect interconnect, DriverConfig config);
    ~VoiceMixer() override;

    void start() override;
    void stop() override;

    /** @brief Applies one inbox message; returns false on `POISON`. */
    bool handle_message(MixerMessage& msg);

    /**
     * @brief Drains the inbox without blocking.
     * @return false if the mixer was poisoned or its inbox closed.
     */
    bool process_messages();

    /**
     * @brief Runs one tick: mix and send, sleep to the next deadline, then apply track
     *        commands, removals and the scheduler `TICK`.
     */
    void cycle();

    std::size_t track_count() const { return tracks_.size(); }
    bool has_connection() const { return conn_.has_value(); }
    bool is_muted() const { return muted_; }
    int bitrate() const { return bitrate_; }
    int silence_frames() const { return silence_frames_; }
    const MixerPacketBuffer& packet() const { return packet_; }

protected:
    void run() override;

private:
    void add_track(std::unique_ptr<Track> track);
    void clear_tracks();
    void set_bitrate(int bitrate);
    bool rebuild_encoder(int bitrate);

    /** @brief Mixes all playing tracks. Sets `passthrough` if `opus_frame_` holds the output. */
    std::size_t mix_tracks(bool& passthrough);
    bool read_passthrough_frame(Track& track, std::size_t index);
    bool rewind_for_loop(Track& track, std::size_t index);

    void mix_and_send();
    void send_packet(bool passthrough);
    void set_speaking(bool speaking);
    void march_deadline();

    bool push_event(EventMessage msg);
    void process_track_commands_and_events();
    void report_failures();

    std::shared_ptr<MixerQueue> rx_;
    Interconnect interconnect_;
    DriverConfig config_;

    std::vector<std::unique_ptr<Track>> tracks_;
    OpusEncoder* encoder_ = nullptr;
    int bitrate_;
    bool muted_ = false;

    std::optional<MixerConnection> conn_;
    std::shared_ptr<WsQueue> ws_;
    MixerPacketBuffer packet_;
    uint32_t lite_nonce_ = 0;
    int silence_frames_ = 0;
    bool speaking_ = false;

    std::vector<float> mix_buffer_;
    std::vector<uint8_t> opus_frame_;
    float softclip_mem_[2] = {0.0f, 0.0f};

    std::chrono::steady_clock::time_point deadline_;
    bool events_failure_ = false;
    bool conn_failure_ = false;
    bool prevent_events_ = false;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_VOICE_MIXER_H
