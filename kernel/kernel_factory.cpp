#include "mesh_kernel.hpp"
#include "native_kernel.hpp"
#include "manifold_kernel.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace beardmold {

namespace {

std::string normalize_kernel_name(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return result;
}

}  // namespace

bool boolean_kernel_available() {
#ifdef BEARDMOLD_HAS_MANIFOLD
    return true;
#else
    return false;
#endif
}

std::unique_ptr<MeshKernel> create_kernel(const std::string& name) {
    auto log = beardmold::logging::get_logger();
    const std::string n = normalize_kernel_name(name);

    if (n == "native") {
        return std::make_unique<NativeKernel>();
    }
    if (n == "manifold") {
        if (!boolean_kernel_available()) {
            log->warn("Manifold kernel requested but not compiled in; booleans and remesh will be skipped");
        }
        return std::make_unique<ManifoldKernel>();
    }
    if (n == "auto" || n.empty()) {
        if (boolean_kernel_available()) {
            return std::make_unique<ManifoldKernel>();
        }
        log->warn("No boolean kernel compiled in; ribs, holes and remesh will be skipped");
        return std::make_unique<NativeKernel>();
    }

    throw std::invalid_argument("Unknown kernel: '" + name + "'. Supported: native, manifold, auto");
}

}  // namespace beardmold
