#include "subscriber.hpp"

bool Subscriber::try_acquire() {
    bool expected = false;
    return in_flight_.compare_exchange_strong(expected, true);
}

void Subscriber::release() {
    in_flight_.store(false);
}
