#include "cgloc/loc/Locator.hpp"
#include "cgloc/loc/FeatureFilter.hpp"
#include "cgloc/loc/ImageConvert.hpp"

#include <cmath>
#include <iostream>

namespace cgloc {
namespace loc {

bool validateConfig(const LocatorConfig& cfg, const char** reason) {
    const char* why = nullptr;

    if (cfg.RADIUS < 1)                                 why = "RADIUS must be >= 1";
    else if (!(cfg.SIGNAL_THRESH >= 0.0f))              why = "SIGNAL_THRESH must be >= 0";
    else if (!(cfg.MASS_THRESH >= 0.0f))                why = "MASS_THRESH must be >= 0";
    else if (!(cfg.NOISE_RADIUS > 0.0f))                why = "NOISE_RADIUS must be > 0";
    else if (cfg.MAX_ITERATIONS < 1)                    why = "MAX_ITERATIONS must be >= 1";
    else if (!(cfg.SHIFT_EPS > 0.0f))                   why = "SHIFT_EPS must be > 0";
    else if (!(cfg.DEDUP_FACTOR >= 0.0f) ||
             !std::isfinite(cfg.DEDUP_FACTOR))          why = "DEDUP_FACTOR must be >= 0";

    if (reason) *reason = why ? why : "";
    return why == nullptr;
}

const char* Locator::StatusStr(Status s) {
    switch (s) {
        case Status::OK:          return "OK";
        case Status::EMPTY_FRAME: return "EMPTY_FRAME";
        case Status::BAD_FORMAT:  return "BAD_FORMAT";
        case Status::BAD_CONFIG:  return "BAD_CONFIG";
    }
    return "UNKNOWN";
}

Locator::Locator(const LocatorConfig& cfg) {
    setConfig(cfg);
}

void Locator::setConfig(const LocatorConfig& cfg) {
    m_cfg = cfg;
    m_cfg_ok = validateConfig(m_cfg, &m_cfg_error);

    // A bad config is kept and reported on every locate() call
    if (!m_cfg_ok) {
        std::cerr << "[Locator] Invalid config: " << m_cfg_error << "\n";
        return;
    }

    m_bandpass = BandPass(m_cfg.RADIUS, m_cfg.NOISE_RADIUS);
    m_localmax = LocalMax(m_cfg.RADIUS, m_cfg.SIGNAL_THRESH);
    m_refiner  = Refiner(m_cfg.RADIUS, m_cfg.MAX_ITERATIONS, m_cfg.SHIFT_EPS);
}

bool Locator::fail(Status s, const char* detail) {
    m_status = s;
    m_candidates.clear();
    std::cerr << "[Locator] " << StatusStr(s) << ": " << detail << "\n";
    return false;
}

bool Locator::locate(const msg::ImageFrame& img, msg::FeatureTable& out) {
    out.clear();

    if (!m_cfg_ok) {
        return fail(Status::BAD_CONFIG, m_cfg_error);
    }
    if (img.empty()) {
        return fail(Status::EMPTY_FRAME, "frame has no pixels");
    }

    cv::Mat view;
    if (!toMat(img, view)) {
        return fail(Status::BAD_FORMAT, "stride does not match pixel format");
    }
    return locate(view, out, img.frame_no);
}

bool Locator::locate(const cv::Mat& img, msg::FeatureTable& out, int32_t frame_no) {
    out.clear();

    // ---- Validation, before any per-pixel work ----
    if (!m_cfg_ok) {
        return fail(Status::BAD_CONFIG, m_cfg_error);
    }
    if (img.empty() || img.dims != 2) {
        return fail(Status::EMPTY_FRAME, "frame has no pixels");
    }
    if (!isSupportedMat(img)) {
        return fail(Status::BAD_FORMAT, "expected single channel 8U/16U/32F/64F");
    }

    toFloat(img, m_raw);

    // ---- Candidate search ----
    if (m_cfg.BANDPASS) {
        m_bandpass.apply(m_raw, m_filtered);
        m_localmax.find(m_filtered, m_candidates);
    } else {
        m_localmax.find(m_raw, m_candidates);
    }

    // ---- Refinement on the raw frame ----
    msg::FeatureTable found;
    found.reserve(m_candidates.size());
    for (const cv::Point& c : m_candidates) {
        msg::Feature f{};
        if (m_refiner.refine(m_raw, c, f)) {
            f.frame = frame_no;
            found.push_back(f);
        }
    }
    const std::size_t refined = found.size();

    // ---- Dedup, then mass threshold ----
    const std::size_t merged  = dedupeFeatures(found, m_cfg.DEDUP_FACTOR * m_cfg.RADIUS);
    const std::size_t dropped = filterByMass(found, m_cfg.MASS_THRESH);

    if (m_cfg.VERBOSE) {
        std::cout << "[Locator] frame " << frame_no
                  << " " << img.cols << "x" << img.rows
                  << ": candidates=" << m_candidates.size()
                  << " refined=" << refined
                  << " merged=" << merged
                  << " below_mass=" << dropped
                  << " features=" << found.size() << "\n";
    }

    // Release the caller's view of a CV_32F frame
    if (m_raw.data == img.data) m_raw.release();

    out.swap(found);
    m_status = Status::OK;
    return true;
}

bool locate(const cv::Mat& img, const LocatorConfig& cfg, msg::FeatureTable& out) {
    Locator locator(cfg);
    return locator.locate(img, out);
}

} // namespace loc
} // namespace cgloc
