#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace molly {

using BoxMatrix = std::array<std::array<float, 3>, 3>;

struct Frame
{
    BoxMatrix box{};
    std::vector<float> positions; // coord in flat array [x1,y1,z1,x2,y2,z2,...]
    std::size_t n_atoms = 0;      // number of positions held, after atom selection
    std::int64_t step = 0;
    float time = 0.0f;
    // Scale factor of the compressed block; 0 when the frame stores raw floats.
    float precision = 0.0f;
};

/**
 * @brief Header fields of one frame record, read without touching the coordinates.
 */
struct FrameHeader
{
    std::size_t n_atoms = 0;
    std::int64_t step = 0;
    float time = 0.0f;
    BoxMatrix box{};
};

} // namespace molly
