#include "overlay/frame/frame_clock.h"

#ifdef EMSCRIPTEN
#include <emscripten/html5.h>
#endif

#include <vector>

FrameRequestId ManualFrameClock::requestFrame(FrameCallback callback) {
    const FrameRequestId id = nextId_++;
    pending_.emplace(id, std::move(callback));
    requests_++;
    return id;
}

void ManualFrameClock::cancelFrame(FrameRequestId id) {
    pending_.erase(id);
}

std::size_t ManualFrameClock::advance(double nowMs) {
    // Requests made by the callbacks themselves wait for the next advance.
    std::vector<FrameRequestId> due;
    due.reserve(pending_.size());
    for (const auto& kv : pending_) due.push_back(kv.first);

    std::size_t ran = 0;
    for (const FrameRequestId id : due) {
        auto it = pending_.find(id);
        if (it == pending_.end()) continue; // cancelled by an earlier callback
        FrameCallback callback = std::move(it->second);
        pending_.erase(it);
        if (callback) callback(nowMs);
        ran++;
    }
    return ran;
}

#ifdef EMSCRIPTEN
BrowserFrameClock::~BrowserFrameClock() {
    for (const auto& kv : pending_) {
        emscripten_cancel_animation_frame(kv.second->handle);
    }
    pending_.clear();
}

FrameRequestId BrowserFrameClock::requestFrame(FrameCallback callback) {
    const FrameRequestId id = nextId_++;
    auto p = std::make_unique<Pending>(Pending{this, id, std::move(callback), 0});
    p->handle = emscripten_request_animation_frame(&BrowserFrameClock::onAnimationFrame, p.get());
    pending_.emplace(id, std::move(p));
    return id;
}

void BrowserFrameClock::cancelFrame(FrameRequestId id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) return;
    emscripten_cancel_animation_frame(it->second->handle);
    pending_.erase(it);
}

int BrowserFrameClock::onAnimationFrame(double nowMs, void* userData) {
    Pending* p = static_cast<Pending*>(userData);
    BrowserFrameClock* clock = p->clock;
    const FrameRequestId id = p->id;
    FrameCallback callback = std::move(p->callback);
    // Erasing destroys *p.
    clock->pending_.erase(id);
    if (callback) callback(nowMs);
    return 0; // do not repeat
}
#endif
