#pragma once

namespace CP::Theme {

// Counts nested update transactions. Change notifications are sent only
// when the outermost UpdateScope closes, and handlers that would feed a change
// back into the same state check is_updating() and return early.
class UpdateGate {
public:
    [[nodiscard]] auto is_updating() const -> bool { return depth_ > 0; }
    [[nodiscard]] auto depth() const -> int { return depth_; }

private:
    friend class UpdateScope;
    int depth_ = 0;
};

class UpdateScope {
public:
    explicit UpdateScope(UpdateGate& gate)
        : gate_(gate), outermost_(gate.depth_ == 0) {
        ++gate_.depth_;
    }
    ~UpdateScope() { --gate_.depth_; }

    UpdateScope(UpdateScope const&)            = delete;
    UpdateScope& operator=(UpdateScope const&) = delete;
    UpdateScope(UpdateScope&&)                 = delete;
    UpdateScope& operator=(UpdateScope&&)      = delete;

    [[nodiscard]] auto is_outermost() const -> bool { return outermost_; }

private:
    UpdateGate& gate_;
    bool        outermost_;
};

} // namespace CP::Theme
