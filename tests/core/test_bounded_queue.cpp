/**
 * test_bounded_queue.cpp - Unit test for the bounded blocking queue
 */

#include "sui/core/BoundedQueue.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace sui::core;
using namespace std::chrono_literals;

void test_capacity() {
    BoundedQueue<int> queue(2);

    assert(queue.tryPush(1));
    assert(queue.tryPush(2));
    assert(!queue.tryPush(3));  // full
    assert(queue.size() == 2);

    assert(queue.tryPop() == 1);
    assert(queue.tryPush(3));
    assert(queue.tryPop() == 2);
    assert(queue.tryPop() == 3);
    assert(!queue.tryPop());

    std::cout << "[PASS] test_capacity" << std::endl;
}

void test_pop_timeout() {
    BoundedQueue<int> queue(4);

    auto start = std::chrono::steady_clock::now();
    auto item = queue.pop(50ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(!item);
    assert(elapsed >= 40ms);

    std::cout << "[PASS] test_pop_timeout" << std::endl;
}

void test_push_waits_for_room() {
    BoundedQueue<int> queue(1);
    assert(queue.tryPush(1));
    assert(!queue.push(2, 20ms));  // nobody consumes

    std::thread consumer([&]() {
        std::this_thread::sleep_for(30ms);
        queue.pop(100ms);
    });
    assert(queue.push(2, 1000ms));
    consumer.join();
    assert(queue.tryPop() == 2);

    std::cout << "[PASS] test_push_waits_for_room" << std::endl;
}

void test_close_wakes_consumer() {
    BoundedQueue<int> queue(4);
    assert(queue.tryPush(7));

    std::thread closer([&]() {
        std::this_thread::sleep_for(20ms);
        queue.close();
    });

    assert(queue.pop(1000ms) == 7);  // queued items survive close
    auto start = std::chrono::steady_clock::now();
    assert(!queue.pop(5000ms));
    assert(std::chrono::steady_clock::now() - start < 2000ms);
    closer.join();

    assert(queue.closed());
    assert(!queue.tryPush(8));

    std::cout << "[PASS] test_close_wakes_consumer" << std::endl;
}

void test_drain() {
    BoundedQueue<int> queue(8);
    for (int i = 0; i < 5; ++i) {
        assert(queue.tryPush(i));
    }

    auto items = queue.drain();
    assert(items.size() == 5);
    for (int i = 0; i < 5; ++i) {
        assert(items[static_cast<size_t>(i)] == i);
    }
    assert(queue.empty());

    std::cout << "[PASS] test_drain" << std::endl;
}

int main() {
    std::cout << "=== BoundedQueue Tests ===" << std::endl;

    test_capacity();
    test_pop_timeout();
    test_push_waits_for_room();
    test_close_wakes_consumer();
    test_drain();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
