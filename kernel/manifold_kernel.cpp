#include "manifold_kernel.hpp"
#include <common/errors.hpp>
#include "logging.hpp"

#ifdef BEARDMOLD_HAS_MANIFOLD

#include <manifold/manifold.h>
#include <string>

namespace beardmold {

namespace {

// Both sides use counter-clockwise, outward winding; no reordering needed
manifold::MeshGL64 to_mesh_gl(const IndexedMesh& mesh) {
    manifold::MeshGL64 gl;
    gl.numProp = 3;

    gl.vertProperties.reserve(mesh.vertex_count() * 3);
    for (const auto& p : mesh.vertices()) {
        gl.vertProperties.push_back(p.x);
        gl.vertProperties.push_back(p.y);
        gl.vertProperties.push_back(p.z);
    }

    gl.triVerts.reserve(mesh.face_count() * 3);
    for (const auto& f : mesh.faces()) {
        gl.triVerts.push_back(f[0]);
        gl.triVerts.push_back(f[1]);
        gl.triVerts.push_back(f[2]);
    }
    return gl;
}

IndexedMesh from_mesh_gl(const manifold::MeshGL64& gl) {
    IndexedMesh mesh;
    const size_t stride = static_cast<size_t>(gl.numProp);

    for (size_t i = 0; i + 2 < gl.vertProperties.size(); i += stride) {
        mesh.add_vertex({gl.vertProperties[i], gl.vertProperties[i + 1], gl.vertProperties[i + 2]});
    }
    for (size_t t = 0; t + 2 < gl.triVerts.size(); t += 3) {
        mesh.add_face(static_cast<VertexId>(gl.triVerts[t]),
                      static_cast<VertexId>(gl.triVerts[t + 1]),
                      static_cast<VertexId>(gl.triVerts[t + 2]));
    }
    return mesh;
}

void check_status(const manifold::Manifold& m, const std::string& operation, const char* what) {
    if (m.Status() != manifold::Manifold::Error::NoError) {
        throw KernelOperationError(operation, std::string(what) + " is not a valid manifold (status " +
                                              std::to_string(static_cast<int>(m.Status())) + ")");
    }
}

manifold::Manifold to_manifold(const Solid& solid, const std::string& operation, const char* what) {
    manifold::MeshGL64 gl = to_mesh_gl(solid.mesh());
    gl.Merge();
    manifold::Manifold m(gl);
    check_status(m, operation, what);
    return m;
}

void store_result(Solid& solid, const manifold::Manifold& result, const std::string& operation) {
    check_status(result, operation, "result");
    if (result.IsEmpty()) {
        throw KernelOperationError(operation, "result is empty");
    }
    solid.replace(from_mesh_gl(result.GetMeshGL64()));
}

}  // namespace

void ManifoldKernel::apply_boolean(Solid& target, const Solid& cutter, BooleanOp op) {
    const std::string operation = std::string("boolean ") + to_string(op);
    auto log = beardmold::logging::get_logger();

    try {
        manifold::Manifold a = to_manifold(target, operation, "target");
        manifold::Manifold b = to_manifold(cutter, operation, "cutter");
        manifold::Manifold result = a.Boolean(
            b, op == BooleanOp::Union ? manifold::OpType::Add : manifold::OpType::Subtract);
        store_result(target, result, operation);
    } catch (const KernelOperationError&) {
        throw;
    } catch (const std::exception& e) {
        throw KernelOperationError(operation, e.what());
    }

    log->debug("ManifoldKernel: {} -> {} triangles", operation, target.triangle_count());
}

void ManifoldKernel::voxel_remesh(Solid& solid, double voxel_size) {
    const std::string operation = "voxel_remesh";
    if (voxel_size <= 0.0) {
        throw KernelOperationError(operation, "voxel size must be positive");
    }

    try {
        manifold::Manifold m = to_manifold(solid, operation, "solid");
        manifold::Manifold result = m.Simplify(0.25 * voxel_size).RefineToLength(voxel_size);
        store_result(solid, result, operation);
    } catch (const KernelOperationError&) {
        throw;
    } catch (const std::exception& e) {
        throw KernelOperationError(operation, e.what());
    }
}

}  // namespace beardmold

#else  // BEARDMOLD_HAS_MANIFOLD not defined

namespace beardmold {

void ManifoldKernel::apply_boolean(Solid& target, const Solid& cutter, BooleanOp op) {
    auto log = beardmold::logging::get_logger();
    log->error("Manifold kernel not available - compile with the manifold library");
    NativeKernel::apply_boolean(target, cutter, op);
}

void ManifoldKernel::voxel_remesh(Solid& solid, double voxel_size) {
    auto log = beardmold::logging::get_logger();
    log->error("Manifold kernel not available - compile with the manifold library");
    NativeKernel::voxel_remesh(solid, voxel_size);
}

}  // namespace beardmold

#endif  // BEARDMOLD_HAS_MANIFOLD
