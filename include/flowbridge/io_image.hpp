// filename: io_image.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "flowbridge/grid.hpp"

namespace flowbridge {

struct RgbImage {
    std::size_t width{0};
    std::size_t height{0};
    std::vector<std::uint8_t> rgb;
};

/**
 * @brief Colours node speed into an image, row 0 at the top of the domain.
 *
 * Speeds are clamped to [colorMin, colorMax]. Solid nodes are drawn dark grey
 * when showBody is set.
 */
RgbImage renderSpeedField(const FlowGrid& grid, double colorMin, double colorMax, bool showBody);

// Binary PPM (P6, maxval 255).
std::string encodePpm(const RgbImage& image);

// True when bytes hold a whole P6 image: header parses and the pixel payload is
// exactly width * height * 3 bytes. Used to reject torn live frames.
bool isCompletePpm(const std::string& bytes);

}  // namespace flowbridge
