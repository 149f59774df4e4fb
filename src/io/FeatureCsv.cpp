#include "cgloc/io/FeatureCsv.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace cgloc {
namespace io {

static std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, ',')) {
        // tolerate CRLF files
        if (!item.empty() && item.back() == '\r') item.pop_back();
        out.push_back(item);
    }
    return out;
}

bool writeFeatureCsv(std::ostream& os, const msg::FeatureTable& features, bool with_frame) {
    for (std::size_t c = 0; c < msg::NUM_PEAK_PARAMS; ++c) {
        if (c) os << ",";
        os << msg::PEAK_PARAMS[c];
    }
    if (with_frame) os << "," << msg::FRAME_COLUMN;
    os << "\n";

    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss << std::setprecision(6);

    for (const msg::Feature& f : features) {
        ss.str("");
        for (std::size_t c = 0; c < msg::NUM_PEAK_PARAMS; ++c) {
            if (c) ss << ",";
            ss << msg::columnValue(f, static_cast<msg::Column>(c));
        }
        if (with_frame) ss << "," << f.frame;
        ss << "\n";
        os << ss.str();
    }
    return static_cast<bool>(os);
}

bool writeFeatureCsv(const std::string& path, const msg::FeatureTable& features, bool with_frame) {
    namespace fs = std::filesystem;
    fs::path p(path);

    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            std::cerr << "[FeatureCsv] create_directories failed for "
                      << p.parent_path().string() << " : " << ec.message() << "\n";
            return false;
        }
    }

    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) {
        std::cerr << "[FeatureCsv] could not open " << path
                  << " errno=" << errno << " (" << std::strerror(errno) << ")\n";
        return false;
    }

    if (!writeFeatureCsv(f, features, with_frame)) {
        std::cerr << "[FeatureCsv] write failed: " << path << "\n";
        return false;
    }
    return true;
}

bool readFeatureCsv(std::istream& is, msg::FeatureTable& features) {
    features.clear();

    std::string line;
    if (!std::getline(is, line)) {
        std::cerr << "[FeatureCsv] missing header\n";
        return false;
    }

    // Column index of every peak parameter, and of "frame" if present
    const std::vector<std::string> header = split_csv_line(line);
    int col[msg::NUM_PEAK_PARAMS];
    int frame_col = -1;
    for (std::size_t c = 0; c < msg::NUM_PEAK_PARAMS; ++c) col[c] = -1;

    for (std::size_t i = 0; i < header.size(); ++i) {
        for (std::size_t c = 0; c < msg::NUM_PEAK_PARAMS; ++c) {
            if (header[i] == msg::PEAK_PARAMS[c]) col[c] = static_cast<int>(i);
        }
        if (header[i] == msg::FRAME_COLUMN) frame_col = static_cast<int>(i);
    }
    for (std::size_t c = 0; c < msg::NUM_PEAK_PARAMS; ++c) {
        if (col[c] < 0) {
            std::cerr << "[FeatureCsv] header lacks column " << msg::PEAK_PARAMS[c] << "\n";
            return false;
        }
    }

    std::size_t line_no = 1;
    while (std::getline(is, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;

        const std::vector<std::string> cells = split_csv_line(line);
        if (cells.size() < header.size()) {
            std::cerr << "[FeatureCsv] short row at line " << line_no << "\n";
            features.clear();
            return false;
        }

        float v[msg::NUM_PEAK_PARAMS];
        msg::Feature f{};
        try {
            for (std::size_t c = 0; c < msg::NUM_PEAK_PARAMS; ++c) {
                v[c] = std::stof(cells[col[c]]);
            }
            if (frame_col >= 0) f.frame = static_cast<int32_t>(std::stol(cells[frame_col]));
        } catch (const std::exception& e) {
            std::cerr << "[FeatureCsv] bad number at line " << line_no << ": " << e.what() << "\n";
            features.clear();
            return false;
        }

        f.x    = v[static_cast<int>(msg::Column::X)];
        f.y    = v[static_cast<int>(msg::Column::Y)];
        f.mass = v[static_cast<int>(msg::Column::MASS)];
        f.size = v[static_cast<int>(msg::Column::SIZE)];
        f.ecc  = v[static_cast<int>(msg::Column::ECC)];
        features.push_back(f);
    }
    return true;
}

} // namespace io
} // namespace cgloc
