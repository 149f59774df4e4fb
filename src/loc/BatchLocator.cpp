#include "cgloc/loc/BatchLocator.hpp"
#include "cgloc/loc/ImageConvert.hpp"

#include <iostream>
#include <memory>

namespace cgloc {
namespace loc {

static BatchLocator::Status fromLocator(Locator::Status s) {
    switch (s) {
        case Locator::Status::OK:          return BatchLocator::Status::OK;
        case Locator::Status::EMPTY_FRAME: return BatchLocator::Status::EMPTY_FRAME;
        case Locator::Status::BAD_FORMAT:  return BatchLocator::Status::BAD_FORMAT;
        case Locator::Status::BAD_CONFIG:  return BatchLocator::Status::BAD_CONFIG;
    }
    return BatchLocator::Status::BAD_CONFIG;
}

const char* BatchLocator::StatusStr(Status s) {
    switch (s) {
        case Status::OK:          return "OK";
        case Status::EMPTY_FRAME: return "EMPTY_FRAME";
        case Status::BAD_FORMAT:  return "BAD_FORMAT";
        case Status::BAD_CONFIG:  return "BAD_CONFIG";
        case Status::CANCELLED:   return "CANCELLED";
        case Status::TASK_FAILED: return "TASK_FAILED";
    }
    return "UNKNOWN";
}

BatchLocator::BatchLocator(const LocatorConfig& loc_cfg, const BatchConfig& cfg)
: m_loc_cfg(loc_cfg)
, m_cfg(cfg) {
    m_status = Status::OK;
}

uint32_t BatchLocator::threadCount(std::size_t n_frames) const {
    uint32_t n = (m_cfg.NUM_THREADS > 0) ? m_cfg.NUM_THREADS : Rtos::CpuCount();
    if (n_frames < n) n = static_cast<uint32_t>(n_frames);
    return (n > 0) ? n : 1u;
}

bool BatchLocator::fail(Status s, const char* detail) {
    m_status = s;
    std::cerr << "[Batch] " << StatusStr(s) << ": " << detail << "\n";
    return false;
}

void BatchLocator::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    if (!ctx || !ctx->self || !ctx->locator || !ctx->jobs) {
        return;
    }

    ctx->self->Run(*ctx->locator, *ctx->jobs);
}

void BatchLocator::Run(Locator& locator, JobQueue& jobs) {
    while (true) {
        FrameJob job{};
        jobs.receive(job);
        if (job.quit) break;

        // Each slot is written by exactly one worker and read after Join()
        Slot& slot = m_slots[job.index];
        if (!locator.locate((*m_frames)[job.index], slot.features, (*m_frame_nos)[job.index])) {
            slot.status = locator.lastStatus();
        }
        slot.done = true;

        m_completed.fetch_add(1);
    }
}

bool BatchLocator::run(const std::vector<msg::ImageFrame>& frames, msg::FeatureTable& out) {
    out.clear();

    std::vector<cv::Mat> views(frames.size());
    std::vector<int32_t> frame_nos(frames.size());

    for (std::size_t i = 0; i < frames.size(); ++i) {
        const msg::ImageFrame& f = frames[i];
        if (f.empty()) {
            return fail(Status::EMPTY_FRAME, "frame has no pixels");
        }
        if (!toMat(f, views[i])) {
            return fail(Status::BAD_FORMAT, "stride does not match pixel format");
        }
        frame_nos[i] = (f.frame_no != msg::NO_FRAME) ? f.frame_no : static_cast<int32_t>(i);
    }

    return runViews(views, frame_nos, out);
}

bool BatchLocator::run(const std::vector<cv::Mat>& frames, msg::FeatureTable& out) {
    out.clear();

    std::vector<int32_t> frame_nos(frames.size());
    for (std::size_t i = 0; i < frames.size(); ++i) {
        frame_nos[i] = static_cast<int32_t>(i);
    }

    return runViews(frames, frame_nos, out);
}

bool BatchLocator::runViews(const std::vector<cv::Mat>& views,
                            const std::vector<int32_t>& frame_nos,
                            msg::FeatureTable& out) {
    out.clear();
    m_completed.store(0);

    // ---- Validation, before any job is dispatched ----
    const char* reason = "";
    if (!validateConfig(m_loc_cfg, &reason)) {
        return fail(Status::BAD_CONFIG, reason);
    }
    for (const cv::Mat& v : views) {
        if (v.empty() || v.dims != 2) {
            return fail(Status::EMPTY_FRAME, "frame has no pixels");
        }
        if (!isSupportedMat(v)) {
            return fail(Status::BAD_FORMAT, "expected single channel 8U/16U/32F/64F");
        }
    }

    m_status = Status::OK;
    if (views.empty()) {
        m_stop_requested.store(false);
        return true;
    }

    m_frames    = &views;
    m_frame_nos = &frame_nos;
    m_slots.assign(views.size(), Slot{});

    // ---- Start workers ----
    const uint32_t n_workers = threadCount(views.size());

    JobQueue jobs;
    std::vector<std::unique_ptr<Locator>>    locators;
    std::vector<std::unique_ptr<Rtos::Task>> tasks;
    std::vector<TaskCtx>                     ctxs(n_workers);
    locators.reserve(n_workers);
    tasks.reserve(n_workers);

    bool task_failed = false;
    for (uint32_t k = 0; k < n_workers; ++k) {
        locators.push_back(std::make_unique<Locator>(m_loc_cfg));

        ctxs[k].self    = this;
        ctxs[k].locator = locators.back().get();
        ctxs[k].jobs    = &jobs;

        auto task = std::make_unique<Rtos::Task>();
        if (!task->Create("cgloc_worker", &BatchLocator::TaskEntry, &ctxs[k])) {
            task_failed = true;
            break;
        }
        tasks.push_back(std::move(task));
    }

    // ---- Dispatch ----
    bool cancelled = false;
    if (!task_failed && !tasks.empty()) {
        for (std::size_t i = 0; i < views.size(); ++i) {
            if (StopRequested()) {
                cancelled = true;
                break;
            }
            FrameJob job{};
            job.index = i;
            jobs.send(job);
        }
    }

    // One sentinel per running worker, then wait for all of them
    for (std::size_t k = 0; k < tasks.size(); ++k) {
        FrameJob quit{};
        quit.quit = true;
        jobs.send(quit);
    }
    for (auto& t : tasks) {
        t->Join();
    }

    m_frames    = nullptr;
    m_frame_nos = nullptr;
    m_stop_requested.store(false);

    if (task_failed || tasks.empty()) {
        m_slots.clear();
        return fail(Status::TASK_FAILED, "could not start worker task");
    }

    // ---- Reassemble in frame order ----
    Status frame_status = Status::OK;
    std::size_t total = 0;
    for (const Slot& s : m_slots) {
        if (s.done) total += s.features.size();
    }
    out.reserve(total);
    for (const Slot& s : m_slots) {
        if (!s.done) continue;
        if (s.status != Locator::Status::OK && frame_status == Status::OK) {
            frame_status = fromLocator(s.status);
        }
        out.insert(out.end(), s.features.begin(), s.features.end());
    }
    m_slots.clear();

    if (m_loc_cfg.VERBOSE) {
        std::cout << "[Batch] " << m_completed.load() << "/" << views.size()
                  << " frames on " << tasks.size() << " workers, "
                  << out.size() << " features\n";
    }

    if (cancelled) {
        return fail(Status::CANCELLED, "stop requested");
    }
    if (frame_status != Status::OK) {
        out.clear();
        return fail(frame_status, "frame failed in worker");
    }
    return true;
}

} // namespace loc
} // namespace cgloc
