// cgloc_locate: localize features in image files and write a CSV table.
#include "cgloc/loc/BatchLocator.hpp"
#include "cgloc/roi/PathRoi.hpp"
#include "cgloc/sim/GaussSim.hpp"
#include "cgloc/io/FeatureCsv.hpp"
#include "cgloc/os/rtos.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace cgloc;

struct Args {
    std::vector<std::string> inputs;
    std::string output;                 // empty -> stdout

    loc::LocatorConfig loc_cfg;
    loc::BatchConfig   batch_cfg;

    bool  use_roi = false;
    float roi[4]  = {0, 0, 0, 0};       // x0, y0, x1, y1

    int simulate = 0;                   // synthetic frames for the self-check
};

static void print_usage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " --input <FILE> [--input <FILE> ...] [options]\n"
        << "  " << exe << " --simulate N [options]\n"
        << "\nOptions:\n"
        << "  --radius N          feature radius [px]            (default 3)\n"
        << "  --signal_thresh V   min filtered peak value        (default 300)\n"
        << "  --mass_thresh V     min feature mass               (default 5000)\n"
        << "  --bandpass 0|1      search on bandpassed image     (default 1)\n"
        << "  --noise_radius V    noise filter sigma [px]        (default 1)\n"
        << "  --threads N         worker tasks, 0 = CPU count    (default 0)\n"
        << "  --roi x0,y0,x1,y1   restrict to a rectangle (full-frame coordinates kept)\n"
        << "  --output <CSV>      write table here instead of stdout\n"
        << "  --verbose 0|1       per-frame log lines\n"
        << "\nMulti-page TIFF inputs expand to one frame per page.\n"
        << "\nExample:\n"
        << "  " << exe << " --input stack.tif --radius 4 --signal_thresh 10 --mass_thresh 1000 --output features.csv\n";
}

static bool parse_roi(const std::string& s, float roi[4]) {
    return std::sscanf(s.c_str(), "%f,%f,%f,%f", &roi[0], &roi[1], &roi[2], &roi[3]) == 4;
}

static bool parse_args(int argc, char** argv, Args& out) {
    if (argc < 3) return false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        const char* v = nullptr;
        if (a == "--input") {
            if (!(v = need_value("--input"))) return false;
            out.inputs.emplace_back(v);
        } else if (a == "--output") {
            if (!(v = need_value("--output"))) return false;
            out.output = v;
        } else if (a == "--radius") {
            if (!(v = need_value("--radius"))) return false;
            out.loc_cfg.RADIUS = std::stoi(v);
        } else if (a == "--signal_thresh") {
            if (!(v = need_value("--signal_thresh"))) return false;
            out.loc_cfg.SIGNAL_THRESH = std::stof(v);
        } else if (a == "--mass_thresh") {
            if (!(v = need_value("--mass_thresh"))) return false;
            out.loc_cfg.MASS_THRESH = std::stof(v);
        } else if (a == "--bandpass") {
            if (!(v = need_value("--bandpass"))) return false;
            out.loc_cfg.BANDPASS = (std::stoi(v) != 0);
        } else if (a == "--noise_radius") {
            if (!(v = need_value("--noise_radius"))) return false;
            out.loc_cfg.NOISE_RADIUS = std::stof(v);
        } else if (a == "--threads") {
            if (!(v = need_value("--threads"))) return false;
            const int n = std::stoi(v);
            if (n < 0) {
                std::cerr << "--threads must be >= 0\n";
                return false;
            }
            out.batch_cfg.NUM_THREADS = static_cast<uint32_t>(n);
        } else if (a == "--roi") {
            if (!(v = need_value("--roi"))) return false;
            if (!parse_roi(v, out.roi)) {
                std::cerr << "--roi expects x0,y0,x1,y1\n";
                return false;
            }
            out.use_roi = true;
        } else if (a == "--simulate") {
            if (!(v = need_value("--simulate"))) return false;
            out.simulate = std::stoi(v);
        } else if (a == "--verbose") {
            if (!(v = need_value("--verbose"))) return false;
            out.loc_cfg.VERBOSE = (std::stoi(v) != 0);
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        }
    }

    if (out.inputs.empty() && out.simulate <= 0) return false;
    return true;
}

// Load every page of `path` as a single channel frame
static bool load_frames(const std::string& path, std::vector<cv::Mat>& frames) {
    std::vector<cv::Mat> pages;
    if (!cv::imreadmulti(path, pages, cv::IMREAD_UNCHANGED) || pages.empty()) {
        cv::Mat img = cv::imread(path, cv::IMREAD_UNCHANGED);
        if (img.empty()) {
            std::cerr << "[CLI] ERROR loading image " << path << "\n";
            return false;
        }
        pages.push_back(img);
    }

    for (cv::Mat& img : pages) {
        // Expect grayscale (1 channel). If not, still try to proceed by converting.
        if (img.channels() == 3) {
            cv::Mat gray;
            cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
            img = gray;
        } else if (img.channels() == 4) {
            cv::Mat gray;
            cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY);
            img = gray;
        }
        frames.push_back(img);
    }

    std::cerr << "[CLI] " << path << ": " << pages.size() << " frame(s)\n";
    return true;
}

static bool run_frames(const Args& args, const std::vector<cv::Mat>& frames,
                       msg::FeatureTable& features) {
    loc::BatchLocator batch(args.loc_cfg, args.batch_cfg);

    bool ok = false;
    if (args.use_roi) {
        const roi::PathRoi rect = roi::RectangleRoi(cv::Point2f(args.roi[0], args.roi[1]),
                                                    cv::Point2f(args.roi[2], args.roi[3]),
                                                    static_cast<float>(args.loc_cfg.RADIUS));
        ok = roi::batchRoi(batch, frames, rect, features, /*reset_origin=*/false);
    } else {
        ok = batch.run(frames, features);
    }

    if (!ok) {
        std::cerr << "[CLI] localization failed: "
                  << loc::BatchLocator::StatusStr(batch.lastStatus()) << "\n";
    }
    return ok;
}

// ============================================================
// Self-check on synthetic frames
// ============================================================

static int run_simulation(const Args& args) {
    constexpr int   W = 128, H = 128;
    constexpr int   GRID = 4;                 // GRID x GRID spots per frame
    constexpr float AMPLITUDE = 1000.0f;
    constexpr float SIGMA = 1.5f;
    constexpr float BACKGROUND = 100.0f;
    constexpr float NOISE = 5.0f;
    constexpr float MATCH_PX = 1.0f;

    cv::RNG rng(12345);
    std::vector<cv::Mat> frames;
    std::vector<std::vector<sim::GaussSpot>> truth;

    const float cell = float(W) / GRID;
    for (int k = 0; k < args.simulate; ++k) {
        std::vector<sim::GaussSpot> spots;
        for (int gy = 0; gy < GRID; ++gy) {
            for (int gx = 0; gx < GRID; ++gx) {
                sim::GaussSpot s;
                s.x = (gx + 0.5f) * cell + rng.uniform(-4.0f, 4.0f);
                s.y = (gy + 0.5f) * cell + rng.uniform(-4.0f, 4.0f);
                s.amplitude = AMPLITUDE;
                s.sigma_x = s.sigma_y = SIGMA;
                spots.push_back(s);
            }
        }
        cv::Mat img = sim::simulateGauss(W, H, spots);
        sim::addBackgroundNoise(img, BACKGROUND, NOISE, 1000 + k);
        frames.push_back(img);
        truth.push_back(spots);
    }

    msg::FeatureTable features;
    if (!run_frames(args, frames, features)) return 1;

    std::size_t matched = 0, expected = 0;
    float max_err = 0.0f;
    for (std::size_t k = 0; k < truth.size(); ++k) {
        for (const sim::GaussSpot& s : truth[k]) {
            ++expected;
            float best = std::numeric_limits<float>::max();
            for (const msg::Feature& f : features) {
                if (f.frame != static_cast<int32_t>(k)) continue;
                best = std::min(best, std::hypot(f.x - s.x, f.y - s.y));
            }
            if (best < MATCH_PX) {
                ++matched;
                max_err = std::max(max_err, best);
            }
        }
    }

    std::cerr << "[CLI] simulate: " << matched << "/" << expected << " spots recovered, "
              << features.size() << " features, max position error "
              << max_err << " px\n";

    if (!args.output.empty() && !io::writeFeatureCsv(args.output, features, true)) {
        return 1;
    }
    return (matched == expected) ? 0 : 1;
}

int main(int argc, char** argv) {
    Args args;
    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument value: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    const char* reason = "";
    if (!loc::validateConfig(args.loc_cfg, &reason)) {
        std::cerr << "[CLI] invalid configuration: " << reason << "\n";
        return 2;
    }

    if (args.simulate > 0) {
        return run_simulation(args);
    }

    std::vector<cv::Mat> frames;
    for (const std::string& path : args.inputs) {
        if (!load_frames(path, frames)) return 1;
    }

    const uint64_t t0 = Rtos::NowUs();
    msg::FeatureTable features;
    if (!run_frames(args, frames, features)) return 1;
    const uint64_t t1 = Rtos::NowUs();

    std::cerr << "[CLI] " << frames.size() << " frame(s), " << features.size()
              << " features in " << (t1 - t0) / 1000.0 << " ms\n";

    // stdout carries the table, progress goes to stderr
    if (args.output.empty()) {
        return io::writeFeatureCsv(std::cout, features, true) ? 0 : 1;
    }
    return io::writeFeatureCsv(args.output, features, true) ? 0 : 1;
}
