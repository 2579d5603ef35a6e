#include "stl_writer.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace beardmold {

namespace {

void put_float(std::ofstream& out, double value) {
    float f = static_cast<float>(value);
    out.write(reinterpret_cast<const char*>(&f), sizeof(f));
}

void put_vec(std::ofstream& out, const Vec3& v) {
    put_float(out, v.x);
    put_float(out, v.y);
    put_float(out, v.z);
}

}  // namespace

void write_binary_stl(const IndexedMesh& mesh, const std::string& path, double scale,
                      const std::string& header) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write to file: " + path);
    }

    std::array<char, 80> head{};
    std::memcpy(head.data(), header.data(), std::min(header.size(), head.size()));
    out.write(head.data(), static_cast<std::streamsize>(head.size()));

    uint32_t count = static_cast<uint32_t>(mesh.face_count());
    out.write(reinterpret_cast<const char*>(&count), sizeof(count));

    const uint16_t attribute = 0;
    for (const auto& f : mesh.faces()) {
        const Vec3 a = mesh.vertices()[f[0]] * scale;
        const Vec3 b = mesh.vertices()[f[1]] * scale;
        const Vec3 c = mesh.vertices()[f[2]] * scale;

        put_vec(out, (b - a).cross(c - a).normalized());
        put_vec(out, a);
        put_vec(out, b);
        put_vec(out, c);
        out.write(reinterpret_cast<const char*>(&attribute), sizeof(attribute));
    }

    out.flush();
    if (!out) {
        throw std::runtime_error("Failed while writing STL: " + path);
    }
}

}  // namespace beardmold
