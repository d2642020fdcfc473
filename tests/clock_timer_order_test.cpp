/*
Purpose: Unit test for VirtualClock.

What this tests: Timers fire in (deadline, creation) order, negative delays are due
immediately, cancelled timers never fire, and time refuses to move backwards.
*/

#include "clock.hpp"

#include <cassert>
#include <stdexcept>
#include <vector>

int main()
{
    detsim::VirtualClock c;
    assert(c.now() == 0);
    assert(!c.next_deadline());

    const auto late1 = c.schedule(detsim::millis(5), 1);
    const auto late2 = c.schedule(detsim::millis(5), 2);
    const auto early = c.schedule(detsim::millis(1), 3);
    const auto past = c.schedule(-detsim::millis(10), 4);
    const auto doomed = c.schedule(detsim::millis(2), 5);

    assert(c.pending() == 5);
    assert(c.next_deadline() == detsim::SimInstant{0});

    assert(c.cancel(doomed));
    assert(!c.cancel(doomed));
    assert(!c.is_pending(doomed));

    const auto fired = c.advance_to(detsim::millis(5));
    assert(c.now() == detsim::millis(5));
    assert(fired.size() == 4);
    assert(fired[0].handle == past && fired[0].owner == 4 && fired[0].deadline == 0);
    assert(fired[1].handle == early && fired[1].owner == 3);
    assert(fired[2].handle == late1 && fired[2].owner == 1);
    assert(fired[3].handle == late2 && fired[3].owner == 2);
    assert(c.pending() == 0);

    // Zero delay: due now, fires on an advance that does not move time.
    const auto now = c.schedule(0, 9);
    assert(c.next_deadline() == c.now());
    const auto same = c.advance_to(c.now());
    assert(same.size() == 1 && same[0].handle == now);

    // A deadline in the past is clamped to now.
    (void)c.schedule_at(detsim::millis(1), 10);
    assert(c.next_deadline() == detsim::millis(5));

    // Dropping everything a task owns.
    (void)c.schedule(detsim::millis(1), 11);
    (void)c.schedule(detsim::millis(2), 11);
    assert(c.cancel_owned(11) == 2);
    assert(c.cancel_owned(10) == 1);
    assert(c.pending() == 0);

    bool threw = false;
    try
    {
        (void)c.advance_to(detsim::millis(4));
    }
    catch (const std::logic_error &)
    {
        threw = true;
    }
    assert(threw);

    // Host views.
    c.set_skew(7, detsim::millis(3));
    c.set_skew(8, -detsim::seconds(10));
    assert(c.now_for(7) == detsim::millis(8));
    assert(c.now_for(8) == 0);
    assert(c.now_for(9) == c.now());
    c.set_skew(7, 0);
    assert(c.skew_of(7) == 0);

    return 0;
}
