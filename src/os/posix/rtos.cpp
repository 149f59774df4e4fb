#include "cgloc/os/rtos.hpp"

#include <pthread.h>
#include <semaphore.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <iostream>

namespace cgloc {
namespace Rtos {

void SleepMs(int ms) {
    timespec ts{};
    ts.tv_sec  = ms / 1000;
    ts.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
    while (::nanosleep(&ts, &ts) != 0 && errno == EINTR) {}
}

uint64_t NowUs() {
    timespec ts{};
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return uint64_t(ts.tv_sec) * 1000000ull + uint64_t(ts.tv_nsec) / 1000ull;
}

unsigned CpuCount() {
    const long n = ::sysconf(_SC_NPROCESSORS_ONLN);
    return (n > 0) ? static_cast<unsigned>(n) : 1u;
}

// ============================================================
// Task
// ============================================================

namespace {

struct StartArgs {
    void (*fn)(void*);
    void* arg;
};

void* startRoutine(void* p) {
    std::unique_ptr<StartArgs> args(static_cast<StartArgs*>(p));
    args->fn(args->arg);
    return nullptr;
}

} // namespace

struct Task::Handle {
    pthread_t thread{};
    bool      running = false;
};

Task::Task() : m_handle(std::make_unique<Handle>()) {}

Task::~Task() {
    if (m_handle->running) {
        pthread_detach(m_handle->thread);
    }
}

bool Task::Create(const char* name, void (*fn)(void*), void* arg) {
    const char* label = name ? name : "?";
    if (m_handle->running) {
        std::cerr << "[Task] " << label << " already running\n";
        return false;
    }

    auto args = std::make_unique<StartArgs>(StartArgs{fn, arg});
    const int rc = pthread_create(&m_handle->thread, nullptr, startRoutine, args.get());
    if (rc != 0) {
        std::cerr << "[Task] pthread_create failed for " << label
                  << ": " << std::strerror(rc) << "\n";
        return false;
    }
    args.release();     // owned by startRoutine now
    m_handle->running = true;
    return true;
}

void Task::Join() {
    if (!m_handle->running) return;
    pthread_join(m_handle->thread, nullptr);
    m_handle->running = false;
}

// ============================================================
// Mutex
// ============================================================

struct Mutex::Handle {
    pthread_mutex_t native;
};

Mutex::Mutex() : m_handle(std::make_unique<Handle>()) {
    if (pthread_mutex_init(&m_handle->native, nullptr) != 0) {
        std::cerr << "[Mutex] pthread_mutex_init failed\n";
    }
}

Mutex::~Mutex() {
    pthread_mutex_destroy(&m_handle->native);
}

void Mutex::lock()   { pthread_mutex_lock(&m_handle->native); }
void Mutex::unlock() { pthread_mutex_unlock(&m_handle->native); }

// ============================================================
// CountingSemaphore
// ============================================================

struct CountingSemaphore::Handle {
    sem_t    sem;
    unsigned max_count;
};

CountingSemaphore::CountingSemaphore(size_t max_count, size_t initial_count) :
    m_handle(std::make_unique<Handle>())
{
    m_handle->max_count = static_cast<unsigned>(max_count);

    if (initial_count > max_count) {
        std::cerr << "[CountingSemaphore] initial count " << initial_count
                  << " clamped to " << max_count << "\n";
        initial_count = max_count;
    }
    if (sem_init(&m_handle->sem, 0, static_cast<unsigned>(initial_count)) != 0) {
        std::cerr << "[CountingSemaphore] sem_init failed: " << std::strerror(errno) << "\n";
    }
}

CountingSemaphore::~CountingSemaphore() {
    sem_destroy(&m_handle->sem);
}

void CountingSemaphore::take() {
    while (sem_wait(&m_handle->sem) != 0) {
        if (errno != EINTR) {
            std::cerr << "[CountingSemaphore] sem_wait failed: " << std::strerror(errno) << "\n";
            return;
        }
    }
}

bool CountingSemaphore::try_take() {
    return sem_trywait(&m_handle->sem) == 0;
}

void CountingSemaphore::give() {
    int val = 0;
    sem_getvalue(&m_handle->sem, &val);
    if (static_cast<unsigned>(val) >= m_handle->max_count) {
        std::cerr << "[CountingSemaphore] give() on a full semaphore\n";
        return;
    }
    sem_post(&m_handle->sem);
}

} // namespace Rtos
} // namespace cgloc
