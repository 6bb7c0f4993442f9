#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

using FrameRequestId = std::uint32_t;
static constexpr FrameRequestId invalidFrameRequest = 0;

using FrameCallback = std::function<void(double nowMs)>;

// Source of display-refresh callbacks.
class FrameClock {
public:
    virtual ~FrameClock() = default;
    virtual FrameRequestId requestFrame(FrameCallback callback) = 0;
    virtual void cancelFrame(FrameRequestId id) = 0;
};

// Deterministic clock for native hosts and tests; frames fire on advance().
class ManualFrameClock : public FrameClock {
public:
    FrameRequestId requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameRequestId id) override;

    bool hasPending() const noexcept { return !pending_.empty(); }
    std::size_t pendingCount() const noexcept { return pending_.size(); }
    std::uint32_t requestCount() const noexcept { return requests_; }

    // Runs every callback queued before the call. Returns how many ran.
    std::size_t advance(double nowMs);

private:
    std::map<FrameRequestId, FrameCallback> pending_;
    FrameRequestId nextId_{1};
    std::uint32_t requests_{0};
};

#ifdef EMSCRIPTEN
// requestAnimationFrame-backed clock.
class BrowserFrameClock : public FrameClock {
public:
    ~BrowserFrameClock() override;
    FrameRequestId requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameRequestId id) override;

private:
    struct Pending {
        BrowserFrameClock* clock;
        FrameRequestId id;
        FrameCallback callback;
        long handle;
    };
    static int onAnimationFrame(double nowMs, void* userData);

    std::map<FrameRequestId, std::unique_ptr<Pending>> pending_;
    FrameRequestId nextId_{1};
};
#endif
