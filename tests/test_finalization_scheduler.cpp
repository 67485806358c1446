/**
 * FinalizationScheduler: single-slot debounce on a virtual-time executor.
 *
 * Run from build dir: ./test_finalization_scheduler
 */

#include "finalization_scheduler.h"
#include "test_helpers.h"

using namespace voicekit;
using namespace voicekit::testing;

int main() {
    // --- fires once after the delay ---
    {
        ManualExecutor executor;
        FinalizationScheduler scheduler(executor);
        int fired = 0;
        scheduler.arm(1000, [&]() { fired++; });
        ASSERT(scheduler.is_armed());
        executor.advance(999);
        ASSERT(fired == 0);
        executor.advance(1);
        ASSERT(fired == 1);
        ASSERT(!scheduler.is_armed());
        executor.advance(10000);
        ASSERT(fired == 1);
    }

    // --- rearm replaces the pending callback ---
    {
        ManualExecutor executor;
        FinalizationScheduler scheduler(executor);
        int first = 0;
        int second = 0;
        scheduler.arm(500, [&]() { first++; });
        executor.advance(400);
        scheduler.arm(500, [&]() { second++; });
        ASSERT(executor.timer_count() == 1);
        executor.advance(400);
        ASSERT(first == 0 && second == 0);
        executor.advance(100);
        ASSERT(first == 0);
        ASSERT(second == 1);
    }

    // --- cancel is idempotent and prevents firing ---
    {
        ManualExecutor executor;
        FinalizationScheduler scheduler(executor);
        int fired = 0;
        scheduler.cancel();
        scheduler.arm(100, [&]() { fired++; });
        scheduler.cancel();
        scheduler.cancel();
        ASSERT(!scheduler.is_armed());
        ASSERT(executor.timer_count() == 0);
        executor.advance(1000);
        ASSERT(fired == 0);
    }

    // --- negative delay behaves as zero ---
    {
        ManualExecutor executor;
        FinalizationScheduler scheduler(executor);
        int fired = 0;
        scheduler.arm(-50, [&]() { fired++; });
        executor.advance(0);
        ASSERT(fired == 1);
    }

    // --- callback may rearm its own scheduler ---
    {
        ManualExecutor executor;
        FinalizationScheduler scheduler(executor);
        int fired = 0;
        std::function<void()> tick = [&]() {
            fired++;
            if (fired < 3) scheduler.arm(100, tick);
        };
        scheduler.arm(100, tick);
        executor.advance(1000);
        ASSERT(fired == 3);
        ASSERT(!scheduler.is_armed());
    }

    // --- cancel from inside the callback is harmless ---
    {
        ManualExecutor executor;
        FinalizationScheduler scheduler(executor);
        int fired = 0;
        scheduler.arm(10, [&]() { fired++; scheduler.cancel(); });
        executor.advance(10);
        ASSERT(fired == 1);
    }

    // --- a refusing executor leaves the scheduler disarmed ---
    {
        ManualExecutor executor;
        executor.set_accepting(false);
        FinalizationScheduler scheduler(executor);
        int fired = 0;
        scheduler.arm(10, [&]() { fired++; });
        ASSERT(!scheduler.is_armed());
        executor.set_accepting(true);
        executor.advance(100);
        ASSERT(fired == 0);
    }

    // --- destruction cancels the pending callback ---
    {
        ManualExecutor executor;
        int fired = 0;
        {
            FinalizationScheduler scheduler(executor);
            scheduler.arm(10, [&]() { fired++; });
        }
        ASSERT(executor.timer_count() == 0);
        executor.advance(100);
        ASSERT(fired == 0);
    }

    // --- independent schedulers on one executor ---
    {
        ManualExecutor executor;
        FinalizationScheduler a(executor);
        FinalizationScheduler b(executor);
        std::vector<char> order;
        a.arm(200, [&]() { order.push_back('a'); });
        b.arm(100, [&]() { order.push_back('b'); });
        executor.advance(300);
        ASSERT(order.size() == 2);
        ASSERT(order.size() == 2 && order[0] == 'b' && order[1] == 'a');
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All finalization scheduler tests passed.\n";
    return 0;
}
