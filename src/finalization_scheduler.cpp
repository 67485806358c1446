#include "finalization_scheduler.h"
#include "logger.h"

namespace voicekit {

FinalizationScheduler::FinalizationScheduler(IExecutor& executor)
    : executor_(executor), slot_(std::make_shared<Slot>()) {}

FinalizationScheduler::~FinalizationScheduler() {
    cancel();
}

void FinalizationScheduler::arm(int delay_ms, std::function<void()> callback) {
    cancel();
    if (delay_ms < 0) {
        delay_ms = 0;
    }

    const uint64_t generation = slot_->generation;
    slot_->callback = std::move(callback);

    std::weak_ptr<Slot> weak_slot = slot_;
    slot_->timer = executor_.post_delayed(Duration(delay_ms), [weak_slot, generation]() {
        auto slot = weak_slot.lock();
        // A timer already handed to the ready queue can outlive cancel(); the generation tells
        if (!slot || slot->generation != generation || slot->timer == 0) {
            return;
        }
        slot->timer = 0;
        ++slot->generation;
        auto fire = std::move(slot->callback);
        slot->callback = nullptr;
        if (fire) {
            fire();
        }
    });

    if (slot_->timer == 0) {
        Logger::warn("Finalization timer could not be scheduled (executor stopped)");
        slot_->callback = nullptr;
    }
}

void FinalizationScheduler::cancel() {
    if (slot_->timer != 0) {
        executor_.cancel(slot_->timer);
        slot_->timer = 0;
    }
    ++slot_->generation;
    slot_->callback = nullptr;
}

bool FinalizationScheduler::is_armed() const {
    return slot_->timer != 0;
}

} // namespace voicekit
