#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

#include "cgloc/os/rtos.hpp"
#include "cgloc/loc/Locator.hpp"

#include "cgloc/msg/ImageFrame.hpp"
#include "cgloc/msg/FeatureFrame.hpp"

namespace cgloc {
namespace loc {

struct BatchConfig {
    uint32_t NUM_THREADS = 0;   // worker tasks, 0 = one per CPU
};

// ------------------------------
// Job queue (dispatcher -> workers)
// ------------------------------
struct FrameJob {
    std::size_t index = 0;      // position in the input sequence
    bool        quit  = false;  // sentinel: worker exits
};

static constexpr std::size_t JOB_QUEUE_DEPTH = 16;
using JobQueue = Rtos::Queue<FrameJob, JOB_QUEUE_DEPTH>;

// ---------------------------------------------------------------------------
//  BatchLocator
//
//  Runs a Locator over a frame sequence on a fixed pool of Rtos tasks.
//  Every worker owns its Locator. Results are gathered per frame and
//  concatenated in input order once all workers are joined, so the output
//  does not depend on scheduling or on the number of threads.
// ---------------------------------------------------------------------------
class BatchLocator {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx objects must outlive the worker tasks (run() joins them).
    struct TaskCtx {
        BatchLocator* self    = nullptr;
        Locator*      locator = nullptr;
        JobQueue*     jobs    = nullptr;
    };

    enum class Status : uint8_t {
        OK = 0,
        EMPTY_FRAME,
        BAD_FORMAT,
        BAD_CONFIG,
        CANCELLED,
        TASK_FAILED,
    };

    static const char* StatusStr(Status s);

    explicit BatchLocator(const LocatorConfig& loc_cfg, const BatchConfig& cfg = {});

    void setConfig(const LocatorConfig& loc_cfg) { m_loc_cfg = loc_cfg; }
    const LocatorConfig& getConfig() const { return m_loc_cfg; }
    const BatchConfig& getBatchConfig() const { return m_cfg; }

    // The frame column is ImageFrame::frame_no when set, else the index.
    bool run(const std::vector<msg::ImageFrame>& frames, msg::FeatureTable& out);
    // The frame column is the index in `frames`.
    bool run(const std::vector<cv::Mat>& frames, msg::FeatureTable& out);

    // OSAL-compatible worker entry point
    static void TaskEntry(void* arg);

    // Request graceful stop (thread-safe). Frames already handed to a worker
    // complete; the flag is cleared when run() returns.
    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    Status      lastStatus() const { return m_status; }
    std::size_t framesCompleted() const { return m_completed.load(); }

    // Worker count used for a sequence of n frames
    uint32_t threadCount(std::size_t n_frames) const;

private:
    struct Slot {
        msg::FeatureTable features;
        bool            done   = false;
        Locator::Status status = Locator::Status::OK;
    };

    // Worker loop. Intended to be called only by worker tasks.
    void Run(Locator& locator, JobQueue& jobs);

    bool runViews(const std::vector<cv::Mat>& views,
                  const std::vector<int32_t>& frame_nos,
                  msg::FeatureTable& out);

    bool fail(Status s, const char* detail);

private:
    LocatorConfig m_loc_cfg{};
    BatchConfig   m_cfg{};

    // Per-run state, fixed before the workers start
    const std::vector<cv::Mat>* m_frames    = nullptr;
    const std::vector<int32_t>* m_frame_nos = nullptr;
    std::vector<Slot>           m_slots;

    std::atomic<bool>        m_stop_requested{false};
    std::atomic<std::size_t> m_completed{0};

    // FDIR
    Status m_status = Status::OK;
};

} // namespace loc
} // namespace cgloc
