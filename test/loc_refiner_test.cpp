#include "cgloc/loc/Refiner.hpp"
#include "cgloc/sim/GaussSim.hpp"
#include "test_common.hpp"

#include <opencv2/core.hpp>
#include <iostream>

using namespace cgloc;

static cv::Mat spot(float x, float y, float sx, float sy) {
    sim::GaussSpot s;
    s.x = x; s.y = y; s.amplitude = 1000.0f; s.sigma_x = sx; s.sigma_y = sy;
    return sim::simulateGauss(64, 64, {s});
}

int main() {
    const int r = 6;
    loc::Refiner ref(r, 10, 0.01f);
    msg::Feature f{};

    // ---- Circular spot: sub-pixel position, near-zero eccentricity ----
    {
        cv::Mat img = spot(30.3f, 25.7f, 2.0f, 2.0f);
        check(ref.refine(img, cv::Point(30, 26), f), __LINE__);
        check_near(f.x, 30.3, 0.02, __LINE__);
        check_near(f.y, 25.7, 0.02, __LINE__);
        check(f.ecc >= 0.0f && f.ecc < 0.01f, __LINE__);
        check(f.size > 2.0f && f.size < 3.2f, __LINE__);

        // Integral 2*pi*sigma^2*A, a little is lost outside the disk
        const double ideal = 2.0 * CV_PI * 4.0 * 1000.0;
        check(f.mass > 0.9 * ideal && f.mass < 1.02 * ideal, __LINE__);
        check(ref.lastConverged(), __LINE__);
        check(ref.lastIterations() >= 1 && ref.lastIterations() <= 10, __LINE__);
    }

    // ---- Off-centre start converges to the same answer ----
    {
        cv::Mat img = spot(30.3f, 25.7f, 2.0f, 2.0f);
        msg::Feature a{}, b{};
        check(ref.refine(img, cv::Point(30, 26), a), __LINE__);
        check(ref.refine(img, cv::Point(28, 26), b), __LINE__);
        check_near(a.x, b.x, 1e-3, __LINE__);
        check_near(a.y, b.y, 1e-3, __LINE__);
        check_near(a.mass, b.mass, 1e-3 * a.mass, __LINE__);
    }

    // ---- Elongated spot: clearly non-zero eccentricity ----
    {
        cv::Mat img = spot(32.0f, 32.0f, 3.0f, 1.5f);
        check(ref.refine(img, cv::Point(32, 32), f), __LINE__);
        check_near(f.x, 32.0, 0.02, __LINE__);
        check_near(f.y, 32.0, 0.02, __LINE__);
        check(f.ecc > 0.3f && f.ecc <= 1.0f, __LINE__);
    }

    // ---- Window leaving the frame -> dropped ----
    {
        cv::Mat img = spot(3.0f, 30.0f, 2.0f, 2.0f);
        check(!ref.refine(img, cv::Point(3, 30), f), __LINE__);
    }

    // ---- No signal -> dropped ----
    {
        cv::Mat flat(64, 64, CV_32F, cv::Scalar(100.0f));
        check(!ref.refine(flat, cv::Point(32, 32), f), __LINE__);
    }

    // ---- Iteration cap: the last iterate is still returned ----
    {
        loc::Refiner once(r, 1, 0.01f);
        cv::Mat img = spot(30.3f, 25.7f, 2.0f, 2.0f);
        check(once.refine(img, cv::Point(28, 26), f), __LINE__);
        check(once.lastIterations() == 1, __LINE__);
        check(!once.lastConverged(), __LINE__);
        check(f.mass > 0.0f, __LINE__);
    }

    return test_summary("loc_refiner_test");
}
