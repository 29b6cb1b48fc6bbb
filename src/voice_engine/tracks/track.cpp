#include "track.h"
#include "../utils/cpp_logger.h"

#include <atomic>

namespace voicelink {
namespace voice {

namespace {
std::atomic<uint64_t> g_next_track_id{1};
} // namespace

bool send_state_change(EventQueue& events, std::size_t index, const TrackStateChange& change) {
    EventMessage msg = EventMessage::make(EventMessage::Type::CHANGE_STATE);
    msg.track_index = index;
    msg.change = change;
    return events.push(std::move(msg));
}

Track::Track(std::unique_ptr<Input> source, std::shared_ptr<TrackCommandQueue> commands, TrackHandle handle)
    : source_(std::move(source)),
      commands_(std::move(commands)),
      handle_(std::move(handle)),
      events_(EventStore::new_local()) {}

Track::~Track() {
    close_commands();
}

void Track::close_commands() {
    if (commands_) {
        commands_->stop_and_clear();
    }
}

bool Track::set_loops(LoopState loops) {
    if (!source_->is_seekable()) {
        return false;
    }
    loops_ = loops;
    return true;
}

TrackState Track::state() const {
    TrackState s;
    s.playing = playing_;
    s.volume = volume_;
    s.position = position_;
    s.play_time = play_time_;
    s.loops = loops_;
    return s;
}

void Track::step_frame() {
    position_ += TIMESTEP_LENGTH;
    play_time_ += TIMESTEP_LENGTH;
}

bool Track::do_loop() {
    if (!source_->is_seekable()) {
        return false;
    }
    if (loops_.kind == LoopState::Kind::INFINITE) {
        return true;
    }
    if (loops_.remaining == 0) {
        return false;
    }
    --loops_.remaining;
    return true;
}

std::optional<std::chrono::milliseconds> Track::seek_time(std::chrono::milliseconds position) {
    auto reached = source_->seek_time(position);
    if (reached) {
        position_ = *reached;
    }
    return reached;
}

EventStore Track::take_events() {
    EventStore out = std::move(events_);
    events_ = EventStore::new_local();
    return out;
}

bool Track::process_commands(std::size_t index, EventQueue& events) {
    bool events_ok = true;
    TrackCommand cmd;
    while (commands_->try_pop(cmd)) {
        switch (cmd.type) {
            case TrackCommand::Type::PLAY:
                play();
                events_ok &= send_state_change(events, index, TrackStateChange::make_mode(playing_));
                break;
            case TrackCommand::Type::PAUSE:
                pause();
                events_ok &= send_state_change(events, index, TrackStateChange::make_mode(playing_));
                break;
            case TrackCommand::Type::STOP:
                stop();
                events_ok &= send_state_change(events, index, TrackStateChange::make_mode(playing_));
                break;
            case TrackCommand::Type::VOLUME:
                volume_ = cmd.volume;
                events_ok &= send_state_change(events, index, TrackStateChange::make_volume(volume_));
                break;
            case TrackCommand::Type::SEEK:
                if (auto reached = seek_time(cmd.seek_to)) {
                    events_ok &= send_state_change(events, index, TrackStateChange::make_position(*reached));
                }
                break;
            case TrackCommand::Type::ADD_EVENT: {
                EventMessage msg = EventMessage::make(EventMessage::Type::ADD_TRACK_EVENT);
                msg.track_index = index;
                msg.event = std::move(cmd.event);
                events_ok &= events.push(std::move(msg));
                break;
            }
            case TrackCommand::Type::DO:
                if (cmd.action) {
                    cmd.action(*this);
                }
                events_ok &= send_state_change(events, index, TrackStateChange::make_total(state()));
                break;
            case TrackCommand::Type::REQUEST:
                if (cmd.reply) {
                    cmd.reply->set_value(state());
                }
                break;
            case TrackCommand::Type::LOOP:
                if (set_loops(cmd.loops)) {
                    events_ok &= send_state_change(events, index, TrackStateChange::make_loops(loops_, true));
                }
                break;
        }
    }
    if (!events_ok) {
        LOG_VL_WARNING("[Track:%llu] Event scheduler queue closed while applying commands",
                       static_cast<unsigned long long>(handle_.id()));
    }
    return events_ok;
}

std::pair<std::unique_ptr<Track>, TrackHandle> create_player(std::unique_ptr<Input> source) {
    auto commands = std::make_shared<TrackCommandQueue>();
    const bool seekable = source && source->is_seekable();
    TrackHandle handle(commands, seekable, g_next_track_id.fetch_add(1));
    auto track = std::make_unique<Track>(std::move(source), commands, handle);
    return {std::move(track), handle};
}

} // namespace voice
} // namespace voicelink
