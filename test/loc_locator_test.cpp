#include "cgloc/loc/Locator.hpp"
#include "cgloc/loc/ImageConvert.hpp"
#include "cgloc/sim/GaussSim.hpp"
#include "test_common.hpp"

#include <opencv2/core.hpp>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace cgloc;

// Nearest feature to (x, y), nullptr if the table is empty
static const msg::Feature* nearest(const msg::FeatureTable& t, float x, float y) {
    const msg::Feature* best = nullptr;
    float best_d = 0.0f;
    for (const msg::Feature& f : t) {
        const float d = std::hypot(f.x - x, f.y - y);
        if (!best || d < best_d) {
            best = &f;
            best_d = d;
        }
    }
    return best;
}

static bool sameTable(const msg::FeatureTable& a, const msg::FeatureTable& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].x != b[i].x || a[i].y != b[i].y || a[i].mass != b[i].mass ||
            a[i].size != b[i].size || a[i].ecc != b[i].ecc || a[i].frame != b[i].frame) {
            return false;
        }
    }
    return true;
}

static void checkInvariants(const msg::FeatureTable& t, const cv::Mat& img, int r) {
    for (const msg::Feature& f : t) {
        check(f.x >= r + 1 && f.x < img.cols - r - 1, __LINE__);
        check(f.y >= r + 1 && f.y < img.rows - r - 1, __LINE__);
        check(f.mass > 0.0f, __LINE__);
        check(f.size >= 0.0f, __LINE__);
        check(f.ecc >= 0.0f && f.ecc <= 1.0f, __LINE__);
    }
}

// ---------------------------------------------------------------------------
// Synthetic round trip, sigma = 2, radius = 3 sigma
// ---------------------------------------------------------------------------
static void testRoundTrip(bool use_bandpass) {
    const float A = 1000.0f;
    const std::vector<cv::Point2f> truth = {
        {30.3f, 25.7f}, {80.6f, 30.2f}, {40.45f, 90.8f}, {95.1f, 100.35f}
    };

    std::vector<sim::GaussSpot> spots;
    for (const cv::Point2f& p : truth) {
        sim::GaussSpot s;
        s.x = p.x; s.y = p.y; s.amplitude = A; s.sigma_x = s.sigma_y = 2.0f;
        spots.push_back(s);
    }
    cv::Mat img = sim::simulateGauss(128, 128, spots);

    loc::LocatorConfig cfg;
    cfg.RADIUS        = 6;
    cfg.SIGNAL_THRESH = A / 2;
    cfg.MASS_THRESH   = 0.0f;
    cfg.BANDPASS      = use_bandpass;

    loc::Locator locator(cfg);
    msg::FeatureTable out;
    check(locator.locate(img, out), __LINE__);
    check(locator.lastStatus() == loc::Locator::Status::OK, __LINE__);
    check(out.size() == truth.size(), __LINE__);

    for (const cv::Point2f& p : truth) {
        const msg::Feature* f = nearest(out, p.x, p.y);
        check(f != nullptr, __LINE__);
        if (!f) continue;
        check_near(f->x, p.x, 0.05, __LINE__);
        check_near(f->y, p.y, 0.05, __LINE__);
        check(f->ecc < 0.03f, __LINE__);
        check(f->frame == msg::NO_FRAME, __LINE__);
    }

    // Raster order of the originating candidates
    for (std::size_t i = 1; i < out.size(); ++i) {
        check(std::lround(out[i - 1].y) <= std::lround(out[i].y), __LINE__);
    }
    checkInvariants(out, img, cfg.RADIUS);
}

// ---------------------------------------------------------------------------
// Reference case: 7 spots, 5 of them rejected (too close to an edge or too
// faint).
// ---------------------------------------------------------------------------
static void testReferenceSpots() {
    struct Ref { float x, y, mass, sigma; };
    const Ref in[] = {
        {4.45f, 10.0f, 1000.0f, 0.8f}, {10.0f, 4.48f, 1500.0f, 0.9f},
        {96.0f, 50.0f, 1200.0f, 1.0f}, {52.0f, 77.5f, 1750.0f, 1.1f},
        {27.3f, 56.7f, 1450.0f, 1.2f}, {34.2f, 61.4f, 950.0f, 1.05f},
        {62.2f, 11.4f, 1320.0f, 1.05f},
    };

    std::vector<sim::GaussSpot> spots;
    for (const Ref& r : in) {
        sim::GaussSpot s;
        s.x = r.x; s.y = r.y;
        s.sigma_x = s.sigma_y = r.sigma;
        s.amplitude = sim::massToAmplitude(r.mass, r.sigma, r.sigma);
        spots.push_back(s);
    }
    cv::Mat img = sim::simulateGauss(100, 80, spots);

    loc::LocatorConfig cfg;
    cfg.RADIUS        = 4;
    cfg.SIGNAL_THRESH = 10.0f;
    cfg.MASS_THRESH   = 1000.0f;
    cfg.BANDPASS      = false;

    msg::FeatureTable out;
    check(loc::locate(img, cfg, out), __LINE__);
    check(out.size() == 2, __LINE__);
    if (out.size() != 2) return;

    // x, y, mass, size; (10.0, 4.48) lies in the edge band and is dropped
    const float expected[2][4] = {
        {62.2f, 11.400f, 1317.55f, 1.4788f},
        {27.3f, 56.699f, 1432.94f, 1.6663f},
    };
    for (int i = 0; i < 2; ++i) {
        check_near(out[i].x, expected[i][0], 0.01, __LINE__);
        check_near(out[i].y, expected[i][1], 0.01, __LINE__);
        check_near(out[i].mass, expected[i][2], 0.01 * expected[i][2], __LINE__);
        check_near(out[i].size, expected[i][3], 0.01, __LINE__);
        check(out[i].ecc < 0.01f, __LINE__);
    }
    checkInvariants(out, img, cfg.RADIUS);
}

// ---------------------------------------------------------------------------
// Nothing to find: all-zero frame with positive thresholds
// ---------------------------------------------------------------------------
static void testZeroFrame(bool use_bandpass) {
    const cv::Mat img(64, 64, CV_32F, cv::Scalar(0.0f));

    loc::LocatorConfig cfg;
    cfg.BANDPASS = use_bandpass;
    loc::Locator locator(cfg);

    msg::FeatureTable out(2);   // pre-filled, must be cleared
    check(locator.locate(img, out), __LINE__);
    check(locator.lastStatus() == loc::Locator::Status::OK, __LINE__);
    check(out.empty(), __LINE__);

    cv::Mat img8(64, 64, CV_8U, cv::Scalar(0));
    msg::ImageFrame frame{};
    check(loc::toImageFrame(img8, frame, 0), __LINE__);
    out.resize(1);
    check(locator.locate(frame, out), __LINE__);
    check(locator.lastStatus() == loc::Locator::Status::OK, __LINE__);
    check(out.empty(), __LINE__);
}

// ---------------------------------------------------------------------------
// Noisy frame: determinism and mass threshold monotonicity
// ---------------------------------------------------------------------------
static cv::Mat noisyFrame() {
    std::vector<sim::GaussSpot> spots;
    float amp = 300.0f;
    for (int gy = 0; gy < 3; ++gy) {
        for (int gx = 0; gx < 3; ++gx) {
            sim::GaussSpot s;
            s.x = 20.0f + 40.0f * gx + 0.3f * gy;
            s.y = 20.0f + 40.0f * gy + 0.2f * gx;
            s.amplitude = amp;
            s.sigma_x = s.sigma_y = 1.5f;
            spots.push_back(s);
            amp += 150.0f;
        }
    }
    cv::Mat img = sim::simulateGauss(128, 128, spots);
    sim::addBackgroundNoise(img, 100.0f, 10.0f, 42);
    return img;
}

static void testDeterminismAndMonotonicity() {
    cv::Mat img = noisyFrame();

    loc::LocatorConfig cfg;
    cfg.RADIUS        = 4;
    cfg.SIGNAL_THRESH = 50.0f;
    cfg.MASS_THRESH   = 0.0f;

    loc::Locator locator(cfg);
    msg::FeatureTable a, b;
    check(locator.locate(img, a), __LINE__);
    check(locator.locate(img, b), __LINE__);
    check(sameTable(a, b), __LINE__);
    check(a.size() >= 9, __LINE__);
    checkInvariants(a, img, cfg.RADIUS);

    const float thresholds[] = {0.0f, 2000.0f, 5000.0f, 10000.0f, 20000.0f, 1e9f};
    std::size_t prev = a.size();
    for (float t : thresholds) {
        cfg.MASS_THRESH = t;
        locator.setConfig(cfg);
        msg::FeatureTable out;
        check(locator.locate(img, out), __LINE__);
        check(out.size() <= prev, __LINE__);
        prev = out.size();
        for (const msg::Feature& f : out) check(f.mass >= t, __LINE__);
    }
    check(prev == 0, __LINE__);
}

// ---------------------------------------------------------------------------
// Failure paths: nothing computed, output cleared
// ---------------------------------------------------------------------------
static void testFailures() {
    msg::FeatureTable out(3);   // pre-filled, must be cleared

    loc::Locator locator;
    check(!locator.locate(cv::Mat(), out), __LINE__);
    check(locator.lastStatus() == loc::Locator::Status::EMPTY_FRAME, __LINE__);
    check(out.empty(), __LINE__);

    msg::ImageFrame empty_frame{};
    out.resize(2);
    check(!locator.locate(empty_frame, out), __LINE__);
    check(locator.lastStatus() == loc::Locator::Status::EMPTY_FRAME, __LINE__);
    check(out.empty(), __LINE__);

    cv::Mat color(32, 32, CV_8UC3, cv::Scalar(10, 20, 30));
    check(!locator.locate(color, out), __LINE__);
    check(locator.lastStatus() == loc::Locator::Status::BAD_FORMAT, __LINE__);

    cv::Mat s32(32, 32, CV_32S, cv::Scalar(1));
    check(!locator.locate(s32, out), __LINE__);
    check(locator.lastStatus() == loc::Locator::Status::BAD_FORMAT, __LINE__);

    // Stride shorter than a row
    std::vector<uint8_t> buf(32 * 32, 0);
    msg::ImageFrame bad{};
    bad.data = buf.data(); bad.width = 32; bad.height = 32; bad.stride = 16;
    bad.format = msg::PixelFormat::GRAY8;
    check(!locator.locate(bad, out), __LINE__);
    check(locator.lastStatus() == loc::Locator::Status::BAD_FORMAT, __LINE__);

    cv::Mat img = noisyFrame();
    const char* reason = nullptr;

    loc::LocatorConfig cfg;
    cfg.RADIUS = 0;
    check(!loc::validateConfig(cfg, &reason), __LINE__);
    check(reason != nullptr && reason[0] != '\0', __LINE__);
    locator.setConfig(cfg);
    check(!locator.configValid(), __LINE__);
    out.resize(1);
    check(!locator.locate(img, out), __LINE__);
    check(locator.lastStatus() == loc::Locator::Status::BAD_CONFIG, __LINE__);
    check(out.empty(), __LINE__);

    cfg = loc::LocatorConfig{};
    cfg.MASS_THRESH = -1.0f;
    check(!loc::validateConfig(cfg), __LINE__);

    cfg = loc::LocatorConfig{};
    cfg.NOISE_RADIUS = 0.0f;
    check(!loc::validateConfig(cfg), __LINE__);

    cfg = loc::LocatorConfig{};
    cfg.MAX_ITERATIONS = 0;
    check(!loc::validateConfig(cfg), __LINE__);

    check(loc::validateConfig(loc::LocatorConfig{}), __LINE__);
    check(std::string(loc::Locator::StatusStr(loc::Locator::Status::BAD_CONFIG)) == "BAD_CONFIG", __LINE__);
}

// ---------------------------------------------------------------------------
// Edge handling: a spot inside the edge band is never reported
// ---------------------------------------------------------------------------
static void testEdgeSpots() {
    std::vector<sim::GaussSpot> spots(2);
    spots[0].x = 3.0f;  spots[0].y = 30.0f;
    spots[1].x = 40.0f; spots[1].y = 30.0f;
    for (auto& s : spots) { s.amplitude = 1000.0f; s.sigma_x = s.sigma_y = 2.0f; }
    cv::Mat img = sim::simulateGauss(64, 64, spots);

    loc::LocatorConfig cfg;
    cfg.RADIUS = 6;
    cfg.SIGNAL_THRESH = 500.0f;
    cfg.MASS_THRESH = 0.0f;

    msg::FeatureTable out;
    check(loc::locate(img, cfg, out), __LINE__);
    check(out.size() == 1, __LINE__);
    check(!out.empty() && std::fabs(out[0].x - 40.0f) < 0.05f, __LINE__);
    checkInvariants(out, img, cfg.RADIUS);
}

// ---------------------------------------------------------------------------
// ImageFrame entry point: other pixel formats, frame number stamping
// ---------------------------------------------------------------------------
static void testImageFrame() {
    cv::Mat img = noisyFrame();
    cv::Mat img16;
    img.convertTo(img16, CV_16U);

    loc::LocatorConfig cfg;
    cfg.RADIUS = 4;
    cfg.SIGNAL_THRESH = 50.0f;
    cfg.MASS_THRESH = 1000.0f;
    loc::Locator locator(cfg);

    msg::FeatureTable from_mat, from_frame;
    check(locator.locate(img16, from_mat, 7), __LINE__);

    msg::ImageFrame frame{};
    check(loc::toImageFrame(img16, frame, 7), __LINE__);
    check(frame.format == msg::PixelFormat::GRAY16, __LINE__);
    check(locator.locate(frame, from_frame), __LINE__);

    check(!from_mat.empty(), __LINE__);
    check(sameTable(from_mat, from_frame), __LINE__);
    for (const msg::Feature& f : from_frame) check(f.frame == 7, __LINE__);
}

int main() {
    testRoundTrip(true);
    testRoundTrip(false);
    testReferenceSpots();
    testZeroFrame(true);
    testZeroFrame(false);
    testDeterminismAndMonotonicity();
    testFailures();
    testEdgeSpots();
    testImageFrame();
    return test_summary("loc_locator_test");
}
