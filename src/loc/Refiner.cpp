#include "cgloc/loc/Refiner.hpp"

#include <algorithm>
#include <cmath>

namespace cgloc {
namespace loc {

Refiner::Refiner() :
    m_radius(0),
    m_max_iterations(1),
    m_shift_eps(0.0f)
{}

Refiner::Refiner(int radius, int max_iterations, float shift_eps) :
    m_radius(radius),
    m_max_iterations(max_iterations),
    m_shift_eps(shift_eps)
{
    const int d = 2 * m_radius + 1;
    m_window.create(d, d, CV_32F);
}

bool Refiner::extractWindow(const cv::Mat& raw, int cx, int cy) {
    const int r = m_radius;
    if (cx - r < 0 || cy - r < 0 || cx + r >= raw.cols || cy + r >= raw.rows) {
        return false;
    }

    // Same size and type every time, so copyTo keeps the allocation
    raw(cv::Rect(cx - r, cy - r, 2 * r + 1, 2 * r + 1)).copyTo(m_window);
    return true;
}

void Refiner::computeMoments(double fx, double fy, Moments& m) const {
    const int r = m_radius;
    const double r2 = double(r) * double(r);

    // ---- Background: mean of the pixels outside the disk ----
    double bg_sum = 0.0;
    int    bg_n   = 0;
    for (int ky = -r; ky <= r; ++ky) {
        const float* row = m_window.ptr<float>(ky + r);
        const double ry = ky - fy;
        for (int kx = -r; kx <= r; ++kx) {
            const double rx = kx - fx;
            if (rx * rx + ry * ry > r2) {
                bg_sum += row[kx + r];
                ++bg_n;
            }
        }
    }
    const double bg = (bg_n > 0) ? bg_sum / bg_n : 0.0;

    // ---- Signal moments inside the disk ----
    m = Moments{};
    for (int ky = -r; ky <= r; ++ky) {
        const float* row = m_window.ptr<float>(ky + r);
        const double ry = ky - fy;
        for (int kx = -r; kx <= r; ++kx) {
            const double rx = kx - fx;
            if (rx * rx + ry * ry > r2) continue;

            const double s = std::max(double(row[kx + r]) - bg, 0.0);
            m.mass += s;
            m.dx   += s * rx;
            m.dy   += s * ry;
            m.sxx  += s * rx * rx;
            m.syy  += s * ry * ry;
            m.sxy  += s * rx * ry;
        }
    }

    if (m.mass > 0.0) {
        m.dx  /= m.mass;
        m.dy  /= m.mass;
        m.sxx /= m.mass;
        m.syy /= m.mass;
        m.sxy /= m.mass;
    }
}

bool Refiner::refine(const cv::Mat& raw, const cv::Point& candidate, msg::Feature& out) {
    CV_Assert(raw.type() == CV_32FC1);

    double cx = candidate.x;
    double cy = candidate.y;

    Moments m;
    m_last_iterations = 0;
    m_last_converged  = false;

    while (true) {
        const int ix = static_cast<int>(std::floor(cx + 0.5));
        const int iy = static_cast<int>(std::floor(cy + 0.5));

        if (!extractWindow(raw, ix, iy)) {
            return false;
        }

        computeMoments(cx - ix, cy - iy, m);
        ++m_last_iterations;

        if (!(m.mass > 0.0)) {
            return false;
        }

        if (std::max(std::fabs(m.dx), std::fabs(m.dy)) <= m_shift_eps) {
            m_last_converged = true;
            break;
        }
        if (m_last_iterations >= m_max_iterations) {
            break;   // accept the last iterate
        }

        cx += m.dx;
        cy += m.dy;
    }

    const double x = cx + m.dx;
    const double y = cy + m.dy;

    // Same edge band as the candidate search
    const int r = m_radius;
    if (x < r + 1 || y < r + 1 || x >= raw.cols - r - 1 || y >= raw.rows - r - 1) {
        return false;
    }

    // Central moments about the centroid
    const double mxx = m.sxx - m.dx * m.dx;
    const double myy = m.syy - m.dy * m.dy;
    const double mxy = m.sxy - m.dx * m.dy;
    const double trace = mxx + myy;

    double ecc = 0.0;
    if (trace > 0.0) {
        ecc = std::sqrt((mxx - myy) * (mxx - myy) + 4.0 * mxy * mxy) / trace;
        ecc = std::min(ecc, 1.0);
    }

    out.x    = static_cast<float>(x);
    out.y    = static_cast<float>(y);
    out.mass = static_cast<float>(m.mass);
    out.size = static_cast<float>(std::sqrt(std::max(trace, 0.0)));
    out.ecc  = static_cast<float>(ecc);
    return true;
}

} // namespace loc
} // namespace cgloc
