#include <hotview/render/asset_probe.h>

#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define NANOSVG_IMPLEMENTATION
#include <nanosvg.h>

namespace hotview::render {

std::optional<Size> probe_image_size(const std::string& file_path) {
    int w = 0, h = 0, channels = 0;
    if (stbi_info(file_path.c_str(), &w, &h, &channels) != 1 || w <= 0 || h <= 0) {
        return std::nullopt;
    }
    return Size{w, h};
}

std::optional<Bounds> measure_path(const std::string& path_data) {
    if (path_data.empty() || path_data.find_first_of("\"<>&") != std::string::npos) {
        return std::nullopt;
    }

    // nsvgParse modifies the input string, so it gets a mutable copy
    std::string document =
        "<svg xmlns=\"http://www.w3.org/2000/svg\"><path d=\"" + path_data + "\"/></svg>";
    std::vector<char> buffer(document.begin(), document.end());
    buffer.push_back('\0');

    NSVGimage* image = nsvgParse(buffer.data(), "px", 96.0f);
    if (!image) {
        return std::nullopt;
    }

    std::optional<Bounds> result;
    for (NSVGshape* shape = image->shapes; shape != nullptr; shape = shape->next) {
        Bounds b{shape->bounds[0], shape->bounds[1], shape->bounds[2], shape->bounds[3]};
        if (!std::isfinite(b.min_x) || !std::isfinite(b.max_x)) continue;
        if (!result) {
            result = b;
        } else {
            result->min_x = std::fmin(result->min_x, b.min_x);
            result->min_y = std::fmin(result->min_y, b.min_y);
            result->max_x = std::fmax(result->max_x, b.max_x);
            result->max_y = std::fmax(result->max_y, b.max_y);
        }
    }
    nsvgDelete(image);
    return result;
}

} // namespace hotview::render
