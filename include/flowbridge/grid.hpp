// filename: grid.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace flowbridge {

/**
 * @brief Structured uniform node grid for the 2D obstacle flow solve.
 *
 * Node (i, j) sits at (i * dx, j * dy). `sdf` is stored in cell units so it
 * matches the grid-coordinate body description.
 */
struct FlowGrid {
    std::size_t nx{0};
    std::size_t ny{0};
    double dx{1.0};
    double dy{1.0};
    std::vector<double> psi;
    std::vector<double> sdf;
    std::vector<std::uint8_t> solid;
    std::vector<double> u;
    std::vector<double> v;

    FlowGrid() = default;

    FlowGrid(std::size_t nxIn, std::size_t nyIn, double dxIn, double dyIn)
        : nx(nxIn), ny(nyIn), dx(dxIn), dy(dyIn),
          psi(nxIn * nyIn, 0.0), sdf(nxIn * nyIn, 0.0), solid(nxIn * nyIn, 0),
          u(nxIn * nyIn, 0.0), v(nxIn * nyIn, 0.0) {}

    [[nodiscard]] inline std::size_t idx(std::size_t i, std::size_t j) const {
        return j * nx + i;
    }

    [[nodiscard]] inline bool inBounds(std::size_t i, std::size_t j) const {
        return i < nx && j < ny;
    }

    [[nodiscard]] inline double& at(std::vector<double>& field, std::size_t i, std::size_t j) const {
        if (!inBounds(i, j)) {
            throw std::out_of_range("FlowGrid index out of range");
        }
        return field[idx(i, j)];
    }

    [[nodiscard]] inline std::size_t solidCount() const {
        std::size_t count = 0;
        for (const auto flag : solid) {
            count += flag != 0 ? 1U : 0U;
        }
        return count;
    }
};

}  // namespace flowbridge
