#pragma once
// Continuation: a non-empty stack of frames
//
// The base frame is never popped. Agents keep two of these: the env
// position stack and the execution stack of substitution frames.

#include "sexp.hpp"
#include <map>
#include <optional>
#include <vector>

namespace smriti {

template <typename Frame>
class Continuation {
public:
    explicit Continuation(Frame base) { frames_.push_back(std::move(base)); }

    void push(Frame f) { frames_.push_back(std::move(f)); }

    // nullopt when only the base frame remains
    std::optional<Frame> pop() {
        if (frames_.size() <= 1) return std::nullopt;
        Frame f = std::move(frames_.back());
        frames_.pop_back();
        return f;
    }

    const Frame& top() const { return frames_.back(); }
    Frame& top_mut() { return frames_.back(); }
    const Frame& base() const { return frames_.front(); }

    size_t depth() const { return frames_.size(); }

    // Oldest first; walk in reverse for newest-first lookups
    const std::vector<Frame>& frames() const { return frames_; }

private:
    std::vector<Frame> frames_;
};

// Current position of an agent: a node in some env
struct EnvFrame {
    Node pos;
};

// Local substitutions active while applying the procedure named by context
struct ExecFrame {
    Node context;
    std::map<Node, Sexp> map;

    ExecFrame() = default;
    explicit ExecFrame(Node ctx) : context(ctx) {}

    // false if the key is already bound in this frame
    bool insert(Node key, Sexp value) {
        return map.emplace(key, std::move(value)).second;
    }

    const Sexp* lookup(Node key) const {
        auto it = map.find(key);
        return it == map.end() ? nullptr : &it->second;
    }
};

using ExecStack = Continuation<ExecFrame>;

} // namespace smriti
