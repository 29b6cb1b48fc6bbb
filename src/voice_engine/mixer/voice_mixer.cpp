/**
 * @file voice_mixer.cpp
 * @brief Implements the VoiceMixer tick loop.
 */
#include "voice_mixer.h"
#include "../utils/cpp_logger.h"
#include "../utils/thread_priority.h"

#include <opus/opus.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace voicelink {
namespace voice {

VoiceMixer::VoiceMixer(Interconnect interconnect, DriverConfig config)
    : rx_(interconnect.mixer),
      interconnect_(std::move(interconnect)),
      config_(std::move(config)),
      bitrate_(config_.default_bitrate),
      mix_buffer_(STEREO_FRAME_SIZE, 0.0f),
      deadline_(std::chrono::steady_clock::now()) {
    if (!rx_) {
        throw std::runtime_error("VoiceMixer requires an inbox");
    }
    if (!rebuild_encoder(bitrate_)) {
        LOG_VL_WARNING("[VoiceMixer] Bitrate %d rejected, using default %d", bitrate_, DEFAULT_BITRATE);
        bitrate_ = DEFAULT_BITRATE;
        if (!rebuild_encoder(bitrate_)) {
            throw std::runtime_error("Failed to create Opus encoder for the voice mixer");
        }
    }
    tracks_.reserve(config_.preallocated_tracks);
    opus_frame_.reserve(VOICE_PACKET_MAX);
}

VoiceMixer::~VoiceMixer() {
    stop();
    if (encoder_) {
        opus_encoder_destroy(encoder_);
        encoder_ = nullptr;
    }
}

void VoiceMixer::start() {
    if (component_thread_.joinable()) {
        return;
    }
    stop_flag_ = false;
    component_thread_ = std::thread(&VoiceMixer::run, this);
}

void VoiceMixer::stop() {
    stop_flag_ = true;
    if (rx_) {
        rx_->stop();
    }
    join_component_thread();
}

bool VoiceMixer::rebuild_encoder(int bitrate) {
    int error = OPUS_OK;
    OpusEncoder* fresh = opus_encoder_create(SAMPLE_RATE, 2, OPUS_APPLICATION_AUDIO, &error);
    if (error != OPUS_OK || !fresh) {
        LOG_VL_ERROR("[VoiceMixer] Failed to create Opus encoder: %s", opus_strerror(error));
        return false;
    }
    error = opus_encoder_ctl(fresh, OPUS_SET_BITRATE(bitrate));
    if (error != OPUS_OK) {
        LOG_VL_ERROR("[VoiceMixer] Failed to set Opus bitrate %d: %s", bitrate, opus_strerror(error));
        opus_encoder_destroy(fresh);
        return false;
    }
    if (encoder_) {
        opus_encoder_destroy(encoder_);
    }
    encoder_ = fresh;
    return true;
}

void VoiceMixer::set_bitrate(int bitrate) {
    if (rebuild_encoder(bitrate)) {
        bitrate_ = bitrate;
        LOG_VL_INFO("[VoiceMixer] Bitrate set to %d", bitrate_);
        return;
    }
    LOG_VL_WARNING("[VoiceMixer] Encoder rebuild at %d failed, falling back to %d", bitrate, DEFAULT_BITRATE);
    if (rebuild_encoder(DEFAULT_BITRATE)) {
        bitrate_ = DEFAULT_BITRATE;
    } else {
        LOG_VL_ERROR("[VoiceMixer] Encoder rebuild failed; keeping previous encoder at %d", bitrate_);
    }
}

bool VoiceMixer::push_event(EventMessage msg) {
    if (prevent_events_ || !interconnect_.events) {
        return !prevent_events_;
    }
    if (!interconnect_.events->push(std::move(msg))) {
        events_failure_ = true;
        return false;
    }
    return true;
}

void VoiceMixer::add_track(std::unique_ptr<Track> track) {
    if (!track) {
        return;
    }
    EventMessage msg = EventMessage::make(EventMessage::Type::ADD_TRACK);
    msg.store = track->take_events();
    msg.state = track->state();
    msg.handle = track->handle();
    push_event(std::move(msg));
    LOG_VL_DEBUG("[VoiceMixer] Track %llu added (%zu playing)",
                 static_cast<unsigned long long>(track->handle().id()), tracks_.size() + 1);
    tracks_.push_back(std::move(track));
}

void VoiceMixer::clear_tracks() {
    for (auto& track : tracks_) {
        track->close_commands();
    }
    tracks_.clear();
    push_event(EventMessage::make(EventMessage::Type::REMOVE_ALL_TRACKS));
}

bool VoiceMixer::handle_message(MixerMessage& msg) {
    switch (msg.type) {
        case MixerMessage::Type::ADD_TRACK:
            add_track(std::move(msg.track));
            break;

        case MixerMessage::Type::SET_TRACK:
            clear_tracks();
            add_track(std::move(msg.track));
            break;

        case MixerMessage::Type::SET_BITRATE:
            set_bitrate(msg.bitrate);
            break;

        case MixerMessage::Type::SET_CONFIG:
            config_ = msg.config;
            if (tracks_.capacity() < config_.preallocated_tracks) {
                tracks_.reserve(config_.preallocated_tracks);
            }
            break;

        case MixerMessage::Type::SET_MUTE:
            muted_ = msg.mute;
            break;

        case MixerMessage::Type::SET_CONN: {
            conn_ = msg.connection;
            packet_.reset(conn_->ssrc);
            std::random_device rd;
            lite_nonce_ = std::uniform_int_distribution<uint32_t>()(rd);
            silence_frames_ = 0;
            speaking_ = false;
            opus_encoder_ctl(encoder_, OPUS_RESET_STATE);
            deadline_ = std::chrono::steady_clock::now();
            LOG_VL_INFO("[VoiceMixer] Connection set: SSRC %u, mode %s", conn_->ssrc,
                        crypto_mode_name(conn_->crypto_mode));
            break;
        }

        case MixerMessage::Type::DROP_CONN:
            conn_.reset();
            LOG_VL_INFO("[VoiceMixer] Connection dropped");
            break;

        case MixerMessage::Type::REPLACE_INTERCONNECT:
            interconnect_ = msg.interconnect;
            prevent_events_ = false;
            // The new scheduler knows nothing of the playing tracks.
            for (auto& track : tracks_) {
                EventMessage add = EventMessage::make(EventMessage::Type::ADD_TRACK);
                add.state = track->state();
                add.handle = track->handle();
                push_event(std::move(add));
            }
            break;

        case MixerMessage::Type::REBUILD_ENCODER:
            set_bitrate(bitrate_);
            break;

        case MixerMessage::Type::WS:
            ws_ = msg.ws;
            speaking_ = false;
            break;

        case MixerMessage::Type::POISON:
            return false;
    }
    return true;
}

bool VoiceMixer::process_messages() {
    MixerMessage msg;
    while (rx_->try_pop(msg)) {
        if (!handle_message(msg)) {
            return false;
        }
    }
    return !rx_->is_stopped();
}

void VoiceMixer::run() {
    LOG_VL_INFO("[VoiceMixer] Mixer thread started");
    if (config_.mixer_realtime_priority) {
        utils::set_current_thread_realtime_priority("VoiceMixer");
    }
    deadline_ = std::chrono::steady_clock::now();

    while (!stop_flag_) {
        if (!conn_ && tracks_.empty()) {
            // Nothing to do until a track or a connection arrives.
            MixerMessage msg;
            if (!rx_->pop(msg) || !handle_message(msg)) {
                break;
            }
            deadline_ = std::chrono::steady_clock::now();
        }
        if (!process_messages()) {
            break;
        }
        cycle();
    }

    for (auto& track : tracks_) {
        track->close_commands();
    }
    if (!tracks_.empty()) {
        tracks_.clear();
        push_event(EventMessage::make(EventMessage::Type::REMOVE_ALL_TRACKS));
    }
    LOG_VL_INFO("[VoiceMixer] Mixer thread exited");
}

void VoiceMixer::cycle() {
    if (conn_) {
        mix_and_send();
    } else {
        march_deadline();
    }
    process_track_commands_and_events();
    report_failures();
}

void VoiceMixer::march_deadline() {
    const auto late = utils::sleep_until_deadline(deadline_);
    if (late >= TIMESTEP_LENGTH) {
        LOG_VL_DEBUG("[VoiceMixer] Tick started %lld us late", static_cast<long long>(late.count()));
    }
    deadline_ += TIMESTEP_LENGTH;
}

bool VoiceMixer::rewind_for_loop(Track& track, std::size_t index) {
    if (!track.do_loop()) {
        return false;
    }
    const auto reached = track.seek_time(std::chrono::milliseconds(0));
    if (!reached) {
        LOG_VL_WARNING("[VoiceMixer] Track %llu could not rewind for its loop",
                       static_cast<unsigned long long>(track.handle().id()));
        return false;
    }
    if (interconnect_.events && !prevent_events_) {
        if (!send_state_change(*interconnect_.events, index, TrackStateChange::make_position(*reached)) ||
            !send_state_change(*interconnect_.events, index, TrackStateChange::make_loops(track.loops(), false))) {
            events_failure_ = true;
        }
    }
    return true;
}

bool VoiceMixer::read_passthrough_frame(Track& track, std::size_t index) {
    if (track.source().read_opus_frame(opus_frame_)) {
        return true;
    }
    return rewind_for_loop(track, index) && track.source().read_opus_frame(opus_frame_);
}

std::size_t VoiceMixer::mix_tracks(bool& passthrough) {
    passthrough = false;
    std::fill(mix_buffer_.begin(), mix_buffer_.end(), 0.0f);

    const bool single_unity = tracks_.size() == 1 && std::fabs(1.0f - tracks_[0]->volume()) < VOLUME_EPSILON;
    std::size_t len = 0;

    for (std::size_t i = 0; i < tracks_.size(); ++i) {
        Track& track = *tracks_[i];
        if (track.playing() != PlayMode::PLAY) {
            continue;
        }

        if (single_unity && track.source().supports_passthrough()) {
            if (read_passthrough_frame(track, i)) {
                passthrough = true;
                track.step_frame();
            } else {
                track.end();
            }
            continue;
        }

        std::size_t got = track.source().mix(mix_buffer_, track.volume());
        if (got == 0 && rewind_for_loop(track, i)) {
            got = track.source().mix(mix_buffer_, track.volume());
        }
        if (got == 0) {
            track.end();
            continue;
        }
        track.step_frame();
        len = std::max(len, got);
    }
    return len;
}

void VoiceMixer::set_speaking(bool speaking) {
    if (speaking == speaking_ || !ws_) {
        return;
    }
    WsMessage msg;
    msg.type = WsMessage::Type::SPEAKING;
    msg.speaking = speaking;
    if (!ws_->push(std::move(msg))) {
        LOG_VL_ERROR("[VoiceMixer] Websocket worker channel closed");
        conn_failure_ = true;
        return;
    }
    speaking_ = speaking;
}

void VoiceMixer::mix_and_send() {
    bool passthrough = false;
    std::size_t mix_len = mix_tracks(passthrough);

    if (muted_) {
        mix_len = 0;
        passthrough = false;
    }

    if (mix_len == 0 && !passthrough) {
        if (silence_frames_ > 0) {
            --silence_frames_;
            opus_frame_.assign(SILENT_FRAME.begin(), SILENT_FRAME.end());
            passthrough = true;
        } else {
            set_speaking(false);
            march_deadline();
            return;
        }
    } else {
        silence_frames_ = SILENT_FRAME_BURST;
        set_speaking(true);
    }

    if (!passthrough) {
        opus_pcm_soft_clip(mix_buffer_.data(), static_cast<int>(MONO_FRAME_SIZE), 2, softclip_mem_);
    }

    march_deadline();
    send_packet(passthrough);
}

void VoiceMixer::send_packet(bool passthrough) {
    uint8_t* payload = packet_.payload();
    const std::size_t capacity = packet_.payload_capacity(conn_->crypto_mode);
    std::size_t payload_len = 0;

    if (passthrough) {
        if (opus_frame_.size() > capacity) {
            LOG_VL_WARNING("[VoiceMixer] Opus frame of %zu bytes exceeds packet capacity", opus_frame_.size());
            return;
        }
        std::memcpy(payload, opus_frame_.data(), opus_frame_.size());
        payload_len = opus_frame_.size();
    } else {
        const opus_int32 encoded = opus_encode_float(encoder_, mix_buffer_.data(), static_cast<int>(MONO_FRAME_SIZE),
                                                     payload, static_cast<opus_int32>(capacity));
        if (encoded < 0) {
            LOG_VL_ERROR("[VoiceMixer] Opus encoding failed: %s", opus_strerror(encoded));
            return;
        }
        payload_len = static_cast<std::size_t>(encoded);
    }

    std::size_t packet_len = 0;
    if (!conn_->cipher->encrypt_in_place(conn_->crypto_mode, packet_.data(), RTP_HEADER_SIZE, payload_len,
                                         packet_.capacity(), lite_nonce_, packet_len)) {
        LOG_VL_ERROR("[VoiceMixer] Packet encryption failed (payload %zu bytes)", payload_len);
        return;
    }

    UdpTxMessage msg;
    msg.type = UdpTxMessage::Type::PACKET;
    msg.packet.assign(packet_.data(), packet_.data() + packet_len);
    if (!conn_->udp_tx || !conn_->udp_tx->push(std::move(msg))) {
        LOG_VL_ERROR("[VoiceMixer] UDP send worker channel closed");
        conn_failure_ = true;
        return;
    }
    packet_.advance();
}

void VoiceMixer::process_track_commands_and_events() {
    if (!interconnect_.events) {
        return;
    }
    EventQueue& events = *interconnect_.events;

    for (std::size_t i = 0; i < tracks_.size(); ++i) {
        if (!tracks_[i]->process_commands(i, events)) {
            events_failure_ = true;
        }
    }

    std::vector<std::size_t> done;
    for (std::size_t i = 0; i < tracks_.size(); ++i) {
        const PlayMode mode = tracks_[i]->playing();
        if (play_mode_is_done(mode)) {
            done.push_back(i);
            if (!prevent_events_ && !send_state_change(events, i, TrackStateChange::make_mode(mode))) {
                events_failure_ = true;
            }
        }
    }

    push_event(EventMessage::make(EventMessage::Type::TICK));

    // Highest index first, so earlier indices stay valid for the scheduler.
    for (auto it = done.rbegin(); it != done.rend(); ++it) {
        const std::size_t index = *it;
        tracks_[index]->close_commands();
        tracks_.erase(tracks_.begin() + static_cast<std::ptrdiff_t>(index));
        EventMessage remove = EventMessage::make(EventMessage::Type::REMOVE_TRACK);
        remove.track_index = index;
        push_event(std::move(remove));
    }
}

void VoiceMixer::report_failures() {
    if (events_failure_) {
        events_failure_ = false;
        if (!prevent_events_) {
            prevent_events_ = true;
            LOG_VL_WARNING("[VoiceMixer] Event scheduler unreachable, requesting interconnect rebuild");
            CoreMessage msg;
            msg.type = CoreMessage::Type::REBUILD_INTERCONNECT;
            if (interconnect_.core && !interconnect_.core->push(std::move(msg))) {
                LOG_VL_ERROR("[VoiceMixer] Driver core unreachable");
            }
        }
    }
    if (conn_failure_) {
        conn_failure_ = false;
        conn_.reset();
        ws_.reset();
        LOG_VL_WARNING("[VoiceMixer] Connection workers unreachable, requesting full reconnect");
        CoreMessage msg;
        msg.type = CoreMessage::Type::FULL_RECONNECT;
        if (interconnect_.core && !interconnect_.core->push(std::move(msg))) {
            LOG_VL_ERROR("[VoiceMixer] Driver core unreachable");
        }
    }
}

} // namespace voice
} // namespace voicelink
