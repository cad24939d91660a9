// filename: io_image.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/io_image.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <sstream>

namespace flowbridge {
namespace {

struct ColorStop {
    double t;
    std::array<double, 3> rgb;
};

// Blue to red ramp through cyan, green and yellow.
const std::array<ColorStop, 5> kRamp{{
    {0.00, {0.0, 0.0, 0.5}},
    {0.25, {0.0, 0.6, 1.0}},
    {0.50, {0.2, 0.9, 0.3}},
    {0.75, {1.0, 0.85, 0.0}},
    {1.00, {0.8, 0.0, 0.0}},
}};

std::array<std::uint8_t, 3> colormap(double t) {
    t = std::clamp(t, 0.0, 1.0);
    std::size_t k = 1;
    while (k + 1 < kRamp.size() && t > kRamp[k].t) {
        ++k;
    }
    const ColorStop& a = kRamp[k - 1];
    const ColorStop& b = kRamp[k];
    const double w = (t - a.t) / (b.t - a.t);
    std::array<std::uint8_t, 3> out{};
    for (std::size_t c = 0; c < 3; ++c) {
        const double value = a.rgb[c] + w * (b.rgb[c] - a.rgb[c]);
        out[c] = static_cast<std::uint8_t>(std::lround(255.0 * std::clamp(value, 0.0, 1.0)));
    }
    return out;
}

bool readHeaderToken(const std::string& bytes, std::size_t& pos, std::size_t& value) {
    while (pos < bytes.size()) {
        const unsigned char ch = static_cast<unsigned char>(bytes[pos]);
        if (ch == '#') {
            while (pos < bytes.size() && bytes[pos] != '\n') {
                ++pos;
            }
        } else if (std::isspace(ch)) {
            ++pos;
        } else {
            break;
        }
    }
    std::size_t digits = 0;
    value = 0;
    while (pos < bytes.size() && std::isdigit(static_cast<unsigned char>(bytes[pos]))) {
        value = value * 10 + static_cast<std::size_t>(bytes[pos] - '0');
        ++pos;
        ++digits;
    }
    return digits > 0;
}

}  // namespace

RgbImage renderSpeedField(const FlowGrid& grid, double colorMin, double colorMax, bool showBody) {
    RgbImage image{};
    image.width = grid.nx;
    image.height = grid.ny;
    image.rgb.resize(grid.nx * grid.ny * 3);
    const double span = colorMax > colorMin ? colorMax - colorMin : 1.0;

    for (std::size_t row = 0; row < grid.ny; ++row) {
        const std::size_t j = grid.ny - 1 - row;
        for (std::size_t i = 0; i < grid.nx; ++i) {
            const std::size_t p = grid.idx(i, j);
            std::array<std::uint8_t, 3> pixel{};
            if (showBody && grid.solid[p] != 0) {
                pixel = {40, 40, 40};
            } else {
                const double speed = std::hypot(grid.u[p], grid.v[p]);
                pixel = colormap((speed - colorMin) / span);
            }
            const std::size_t offset = (row * grid.nx + i) * 3;
            image.rgb[offset] = pixel[0];
            image.rgb[offset + 1] = pixel[1];
            image.rgb[offset + 2] = pixel[2];
        }
    }
    return image;
}

std::string encodePpm(const RgbImage& image) {
    std::ostringstream out;
    out << "P6\n" << image.width << ' ' << image.height << "\n255\n";
    out.write(reinterpret_cast<const char*>(image.rgb.data()), static_cast<std::streamsize>(image.rgb.size()));
    return out.str();
}

bool isCompletePpm(const std::string& bytes) {
    if (bytes.size() < 2 || bytes[0] != 'P' || bytes[1] != '6') {
        return false;
    }
    std::size_t pos = 2;
    std::size_t width = 0;
    std::size_t height = 0;
    std::size_t maxval = 0;
    if (!readHeaderToken(bytes, pos, width) || !readHeaderToken(bytes, pos, height) ||
        !readHeaderToken(bytes, pos, maxval)) {
        return false;
    }
    if (width == 0 || height == 0 || maxval == 0 || maxval > 255 || pos >= bytes.size()) {
        return false;
    }
    ++pos;  // single whitespace after maxval
    return bytes.size() - pos == width * height * 3;
}

}  // namespace flowbridge
