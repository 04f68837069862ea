#pragma once
#include <hotview/render/render_request.h>
#include <optional>
#include <string>

namespace hotview::render {

// Reads the header of a local raster image (PNG, JPEG, GIF, BMP, ...) and
// returns its pixel size without decoding it.
std::optional<Size> probe_image_size(const std::string& file_path);

// Parses SVG path data and returns the bounds of the resulting shape, or
// nullopt when the data yields no shape.
std::optional<Bounds> measure_path(const std::string& path_data);

} // namespace hotview::render
