#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>

namespace cgloc {
namespace Rtos {

void SleepMs(int ms);

// Monotonic clock in microseconds.
uint64_t NowUs();

// Number of online hardware threads, at least 1.
unsigned CpuCount();

// ---------------------------------------------------------------------------
// Task: one joinable thread running fn(arg). A task that is destroyed
// without Join() is detached.
// ---------------------------------------------------------------------------
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // false if the thread could not be started or was started before
    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

private:
    struct Handle;
    std::unique_ptr<Handle> m_handle;
};

class Mutex {
public:
    Mutex();
    ~Mutex();

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct Handle;
    std::unique_ptr<Handle> m_handle;
};

// Counting semaphore bounded by max_count; give() on a full semaphore is
// reported and ignored.
class CountingSemaphore {
public:
    CountingSemaphore(size_t max_count, size_t initial_count);
    ~CountingSemaphore();

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void take();
    bool try_take();
    void give();

private:
    struct Handle;
    std::unique_ptr<Handle> m_handle;
};

// ---------------------------------------------------------------------------
// Queue: bounded FIFO for handing jobs between tasks.
//
// Ring buffer guarded by a Mutex, with one semaphore counting free slots and
// one counting filled slots. send() blocks while full, receive() while
// empty. T must be default constructible and copy assignable.
// ---------------------------------------------------------------------------
template <typename T, size_t Capacity>
class Queue {
    static_assert(Capacity > 0, "Queue capacity must be non-zero");

public:
    Queue() = default;

    void send(const T& item) {
        m_free.take();
        push(item);
    }

    bool try_send(const T& item) {
        if (!m_free.try_take()) return false;
        push(item);
        return true;
    }

    void receive(T& item) {
        m_used.take();
        pop(item);
    }

    bool try_receive(T& item) {
        if (!m_used.try_take()) return false;
        pop(item);
        return true;
    }

    static constexpr size_t capacity() { return Capacity; }

private:
    T      m_items[Capacity];
    size_t m_head = 0;      // next slot to write
    size_t m_tail = 0;      // next slot to read

    Mutex             m_lock;
    CountingSemaphore m_free{Capacity, Capacity};
    CountingSemaphore m_used{Capacity, 0};

    void push(const T& item) {
        m_lock.lock();
        m_items[m_head] = item;
        m_head = (m_head + 1) % Capacity;
        m_lock.unlock();
        m_used.give();
    }

    void pop(T& item) {
        m_lock.lock();
        item = m_items[m_tail];
        m_tail = (m_tail + 1) % Capacity;
        m_lock.unlock();
        m_free.give();
    }
};

} // namespace Rtos
} // namespace cgloc
