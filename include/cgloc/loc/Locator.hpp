#pragma once
#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

#include "cgloc/loc/BandPass.hpp"
#include "cgloc/loc/LocalMax.hpp"
#include "cgloc/loc/Refiner.hpp"

#include "cgloc/msg/ImageFrame.hpp"
#include "cgloc/msg/FeatureFrame.hpp"

namespace cgloc {
namespace loc {

// ---------------------------------------------------------------------------
// Configuration for the Locator (tunable parameters, no state).
// ---------------------------------------------------------------------------
struct LocatorConfig {
    int   RADIUS         = 3;       // feature radius [pixels], window is (2r+1)^2
    float SIGNAL_THRESH  = 300.0f;  // min (filtered) peak value of a candidate
    float MASS_THRESH    = 5000.0f; // min integrated, background-subtracted mass

    bool  BANDPASS       = true;    // search maxima on the bandpassed image
    float NOISE_RADIUS   = 1.0f;    // sigma of the noise-suppression Gaussian [pixels]

    // Refinement
    int   MAX_ITERATIONS = 10;      // windows evaluated per candidate
    float SHIFT_EPS      = 0.01f;   // convergence: max |shift| [pixels]

    // Features closer than DEDUP_FACTOR * RADIUS are merged
    float DEDUP_FACTOR   = 0.5f;

    bool  VERBOSE        = false;   // per-frame log lines
};

// Returns false for a configuration that cannot be run. `reason` (optional)
// receives a static description.
bool validateConfig(const LocatorConfig& cfg, const char** reason = nullptr);

// ---------------------------------------------------------------------------
// Locator: one frame in, one feature table out.
// Owns scratch buffers, so one instance per thread.
// ---------------------------------------------------------------------------
class Locator {
public:
    enum class Status : uint8_t {
        OK = 0,
        EMPTY_FRAME,
        BAD_FORMAT,
        BAD_CONFIG,
    };

    static const char* StatusStr(Status s);

    explicit Locator(const LocatorConfig& cfg = {});

    // Update configuration at runtime (rebuilds kernels)
    void setConfig(const LocatorConfig& cfg);
    const LocatorConfig& getConfig() const { return m_cfg; }
    bool configValid() const { return m_cfg_ok; }

    // Core API. `out` is cleared first and stays empty on failure.
    bool locate(const msg::ImageFrame& img, msg::FeatureTable& out);
    bool locate(const cv::Mat& img, msg::FeatureTable& out, int32_t frame_no = msg::NO_FRAME);

    Status lastStatus() const { return m_status; }

    // Diagnostics of the last successful call
    std::size_t lastCandidateCount() const { return m_candidates.size(); }

private:
    LocatorConfig m_cfg{};
    bool          m_cfg_ok = false;
    const char*   m_cfg_error = "";

    BandPass m_bandpass;
    LocalMax m_localmax;
    Refiner  m_refiner;

    // Scratch, reused between frames
    cv::Mat m_raw;
    cv::Mat m_filtered;
    std::vector<cv::Point> m_candidates;

    Status m_status = Status::OK;

    bool fail(Status s, const char* detail);
};

// Convenience: one-shot locate with a temporary Locator.
bool locate(const cv::Mat& img, const LocatorConfig& cfg, msg::FeatureTable& out);

} // namespace loc
} // namespace cgloc
