#pragma once
#include <opencv2/core.hpp>

#include "cgloc/msg/FeatureFrame.hpp"

namespace cgloc {
namespace loc {

// ---------------------------------------------------------------------------
// Refiner: iterative centroid refinement and moment computation on the raw
// frame. One instance is reused for all candidates of a frame (and across
// frames); it owns the window scratch buffer.
// ---------------------------------------------------------------------------
class Refiner {
public:
    Refiner();
    Refiner(int radius, int max_iterations, float shift_eps);

    // raw: CV_32F. Returns false when the candidate is dropped (window
    // leaves the frame, no signal, or final position too close to an edge).
    bool refine(const cv::Mat& raw, const cv::Point& candidate, msg::Feature& out);

    // Diagnostics of the last refine() call
    int  lastIterations() const { return m_last_iterations; }
    bool lastConverged() const { return m_last_converged; }

private:
    struct Moments {
        double mass = 0.0;
        double dx   = 0.0;   // centroid offset from the disk centre
        double dy   = 0.0;
        double sxx  = 0.0;   // raw second moments about the disk centre
        double syy  = 0.0;
        double sxy  = 0.0;
    };

    int   m_radius;
    int   m_max_iterations;
    float m_shift_eps;

    cv::Mat m_window;   // (2r+1)^2, CV_32F

    int  m_last_iterations = 0;
    bool m_last_converged  = false;

    bool extractWindow(const cv::Mat& raw, int cx, int cy);
    void computeMoments(double fx, double fy, Moments& m) const;
};

} // namespace loc
} // namespace cgloc
