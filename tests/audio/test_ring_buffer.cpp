/**
 * test_ring_buffer.cpp - Unit test for lock-free ring buffer
 */

#include "sui/audio/RingBuffer.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace sui::audio;

void test_basic_push_pop() {
    RingBuffer<float> buffer(1024);

    std::vector<float> data = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
    assert(buffer.push(data.data(), data.size()) == 5);
    assert(buffer.available() == 5);

    std::vector<float> out(5);
    assert(buffer.pop(out.data(), 5) == 5);
    assert(out == data);
    assert(buffer.available() == 0);

    std::cout << "[PASS] test_basic_push_pop" << std::endl;
}

void test_full_capacity() {
    RingBuffer<float> buffer(4);
    assert(buffer.capacity() == 4);

    std::vector<float> data = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
    assert(buffer.push(data.data(), data.size()) == 4);  // Only 4 fit
    assert(buffer.available() == 4);

    std::vector<float> out(4);
    assert(buffer.pop(out.data(), 4) == 4);
    assert(out[3] == 4.0f);

    std::cout << "[PASS] test_full_capacity" << std::endl;
}

void test_wraparound() {
    RingBuffer<int16_t> buffer(8);
    std::vector<int16_t> chunk = {1, 2, 3, 4, 5, 6};
    std::vector<int16_t> out(6);

    for (int round = 0; round < 5; ++round) {
        assert(buffer.push(chunk.data(), chunk.size()) == 6);
        assert(buffer.pop(out.data(), out.size()) == 6);
        assert(out == chunk);
    }

    std::cout << "[PASS] test_wraparound" << std::endl;
}

void test_clear() {
    RingBuffer<float> buffer(16);
    std::vector<float> data(10, 0.5f);
    buffer.push(data.data(), data.size());
    buffer.clear();
    assert(buffer.available() == 0);
    assert(buffer.push(data.data(), data.size()) == 10);

    std::cout << "[PASS] test_clear" << std::endl;
}

void test_concurrent() {
    RingBuffer<float> buffer(1024);
    std::atomic<bool> done{false};
    std::atomic<size_t> total_written{0};
    std::atomic<size_t> total_read{0};

    // Producer
    std::thread producer([&]() {
        std::vector<float> chunk(64, 1.0f);
        for (int i = 0; i < 100; ++i) {
            total_written += buffer.push(chunk.data(), chunk.size());
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
        done = true;
    });

    // Consumer
    std::thread consumer([&]() {
        std::vector<float> chunk(64);
        while (!done || buffer.available() > 0) {
            total_read += buffer.pop(chunk.data(), chunk.size());
            std::this_thread::sleep_for(std::chrono::microseconds(50));
        }
    });

    producer.join();
    consumer.join();
    assert(total_written == total_read);

    std::cout << "[PASS] test_concurrent (written=" << total_written
              << ", read=" << total_read << ")" << std::endl;
}

int main() {
    std::cout << "=== RingBuffer Tests ===" << std::endl;

    test_basic_push_pop();
    test_full_capacity();
    test_wraparound();
    test_clear();
    test_concurrent();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
