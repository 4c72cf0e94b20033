// Time-ordered queue of one-shot actions keyed by entity.
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <utility>
#include <vector>

#include "../ecs/Entity.h"

namespace Engine {

template <typename Action>
class DeferredQueue {
public:
    void schedule(double dueAtMs, ECS::Entity entity, Action action) {
        heap_.push(Entry{dueAtMs, nextSeq_++, entity, std::move(action)});
    }

    // Pops every entry due at or before nowMs, earliest first (ties in scheduling order),
    // and hands it to func(entity, action). Entries scheduled from inside func run on the
    // same pass if they are already due.
    template <typename Func>
    std::size_t runDue(double nowMs, Func&& func) {
        std::size_t fired = 0;
        while (!heap_.empty() && heap_.top().dueAtMs <= nowMs) {
            Entry entry = heap_.top();
            heap_.pop();
            func(entry.entity, entry.action);
            ++fired;
        }
        return fired;
    }

    void clear() { heap_ = Heap{}; }
    bool empty() const { return heap_.empty(); }
    std::size_t size() const { return heap_.size(); }
    double nextDueMs() const { return heap_.empty() ? 0.0 : heap_.top().dueAtMs; }

private:
    struct Entry {
        double dueAtMs{0.0};
        std::uint64_t seq{0};
        ECS::Entity entity{ECS::kInvalidEntity};
        Action action{};
    };

    // priority_queue is a max-heap; "greater" puts the earliest entry on top.
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.dueAtMs != b.dueAtMs) return a.dueAtMs > b.dueAtMs;
            return a.seq > b.seq;
        }
    };

    using Heap = std::priority_queue<Entry, std::vector<Entry>, Later>;

    Heap heap_;
    std::uint64_t nextSeq_{0};
};

}  // namespace Engine
