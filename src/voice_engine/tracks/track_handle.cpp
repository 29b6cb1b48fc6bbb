#include "track_handle.h"

namespace voicelink {
namespace voice {

const char* track_result_name(TrackResult result) {
    switch (result) {
        case TrackResult::OK: return "ok";
        case TrackResult::FINISHED: return "finished";
        case TrackResult::SEEK_UNSUPPORTED: return "seek unsupported";
        case TrackResult::INVALID_TRACK_EVENT: return "invalid track event";
    }
    return "unknown";
}

TrackHandle::TrackHandle(std::shared_ptr<TrackCommandQueue> commands, bool seekable, uint64_t id)
    : commands_(std::move(commands)), seekable_(seekable), id_(id) {}

TrackResult TrackHandle::send(TrackCommand command) {
    if (!commands_ || !commands_->push(std::move(command))) {
        return TrackResult::FINISHED;
    }
    return TrackResult::OK;
}

TrackResult TrackHandle::play() {
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::PLAY;
    return send(std::move(cmd));
}

TrackResult TrackHandle::pause() {
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::PAUSE;
    return send(std::move(cmd));
}

TrackResult TrackHandle::stop() {
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::STOP;
    return send(std::move(cmd));
}

TrackResult TrackHandle::set_volume(float volume) {
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::VOLUME;
    cmd.volume = volume;
    return send(std::move(cmd));
}

TrackResult TrackHandle::seek_time(std::chrono::milliseconds position) {
    if (!seekable_) {
        return TrackResult::SEEK_UNSUPPORTED;
    }
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::SEEK;
    cmd.seek_to = position;
    return send(std::move(cmd));
}

TrackResult TrackHandle::enable_loop() {
    if (!seekable_) {
        return TrackResult::SEEK_UNSUPPORTED;
    }
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::LOOP;
    cmd.loops = LoopState::infinite();
    return send(std::move(cmd));
}

TrackResult TrackHandle::disable_loop() {
    if (!seekable_) {
        return TrackResult::SEEK_UNSUPPORTED;
    }
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::LOOP;
    cmd.loops = LoopState::finite(0);
    return send(std::move(cmd));
}

TrackResult TrackHandle::loop_for(std::size_t count) {
    if (!seekable_) {
        return TrackResult::SEEK_UNSUPPORTED;
    }
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::LOOP;
    cmd.loops = LoopState::finite(count);
    return send(std::move(cmd));
}

TrackResult TrackHandle::add_event(const Event& event, EventHandler handler) {
    if (event.is_global_only()) {
        return TrackResult::INVALID_TRACK_EVENT;
    }
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::ADD_EVENT;
    cmd.event = EventData(event, std::move(handler));
    return send(std::move(cmd));
}

TrackResult TrackHandle::action(std::function<void(Track&)> action) {
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::DO;
    cmd.action = std::move(action);
    return send(std::move(cmd));
}

TrackResult TrackHandle::get_info(std::future<TrackState>& reply) {
    auto promise = std::make_shared<std::promise<TrackState>>();
    reply = promise->get_future();
    TrackCommand cmd;
    cmd.type = TrackCommand::Type::REQUEST;
    cmd.reply = std::move(promise);
    return send(std::move(cmd));
}

} // namespace voice
} // namespace voicelink
