// filename: io_vtk.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <string>

#include "flowbridge/grid.hpp"

namespace flowbridge {

// Writes the solved flow as VTK ImageData (.vti) with node-centred point data:
// sdf, stream_function, velocity_x, velocity_y and speed. Raw appended Float64
// blocks with UInt64 length headers.
void writeFlowFieldVti(const std::string& path, const FlowGrid& grid);

}  // namespace flowbridge
