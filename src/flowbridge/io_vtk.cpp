// filename: io_vtk.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/io_vtk.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace flowbridge {
namespace {

bool isLittleEndian() {
    const std::uint16_t value = 1;
    return reinterpret_cast<const std::uint8_t*>(&value)[0] == 1;
}

struct DataArrayView {
    std::string name;
    const std::vector<double>* values{nullptr};
};

}  // namespace

void writeFlowFieldVti(const std::string& path, const FlowGrid& grid) {
    if (grid.nx < 2 || grid.ny < 2) {
        throw std::invalid_argument("VTK export requires at least a 2x2 grid");
    }
    const std::size_t nodeCount = grid.nx * grid.ny;
    if (grid.psi.size() != nodeCount || grid.u.size() != nodeCount || grid.v.size() != nodeCount ||
        grid.sdf.size() != nodeCount) {
        throw std::invalid_argument("VTK export requires node-aligned field arrays");
    }

    std::vector<double> speed(nodeCount);
    for (std::size_t p = 0; p < nodeCount; ++p) {
        speed[p] = std::hypot(grid.u[p], grid.v[p]);
    }

    // Points inside no polygon report +inf; clamp so readers get finite data.
    std::vector<double> sdf(grid.sdf);
    for (auto& value : sdf) {
        if (!std::isfinite(value)) {
            value = static_cast<double>(grid.nx + grid.ny);
        }
    }

    const std::vector<DataArrayView> arrays{
        {"sdf", &sdf},
        {"stream_function", &grid.psi},
        {"velocity_x", &grid.u},
        {"velocity_y", &grid.v},
        {"speed", &speed},
    };

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open VTK output: " + path);
    }

    ofs << "<?xml version=\"1.0\"?>\n";
    ofs << "<VTKFile type=\"ImageData\" version=\"0.1\" byte_order=\""
        << (isLittleEndian() ? "LittleEndian" : "BigEndian") << "\" header_type=\"UInt64\">\n";
    ofs << "  <ImageData WholeExtent=\"0 " << (grid.nx - 1) << " 0 " << (grid.ny - 1) << " 0 0\""
        << " Origin=\"0 0 0\""
        << " Spacing=\"" << grid.dx << ' ' << grid.dy << " 1\">\n";
    ofs << "    <Piece Extent=\"0 " << (grid.nx - 1) << " 0 " << (grid.ny - 1) << " 0 0\">\n";
    ofs << "      <PointData Scalars=\"speed\">\n";

    std::uint64_t offset = 0;
    for (const auto& array : arrays) {
        const std::uint64_t bytes = static_cast<std::uint64_t>(array.values->size()) * sizeof(double);
        ofs << "        <DataArray type=\"Float64\" Name=\"" << array.name
            << "\" format=\"appended\" offset=\"" << offset << "\"/>\n";
        offset += sizeof(std::uint64_t) + bytes;
    }

    ofs << "      </PointData>\n";
    ofs << "    </Piece>\n";
    ofs << "  </ImageData>\n";
    ofs << "  <AppendedData encoding=\"raw\">\n";
    ofs << '_';
    for (const auto& array : arrays) {
        const std::uint64_t bytes = static_cast<std::uint64_t>(array.values->size()) * sizeof(double);
        ofs.write(reinterpret_cast<const char*>(&bytes), sizeof(bytes));
        ofs.write(reinterpret_cast<const char*>(array.values->data()), static_cast<std::streamsize>(bytes));
    }
    ofs << "\n";
    ofs << "  </AppendedData>\n";
    ofs << "</VTKFile>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing VTK output: " + path);
    }
}

}  // namespace flowbridge
