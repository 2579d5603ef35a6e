#ifndef BEARDMOLD_KERNEL_STL_WRITER_HPP
#define BEARDMOLD_KERNEL_STL_WRITER_HPP

#include <mesh/indexed_mesh.hpp>
#include <string>

namespace beardmold {

// Binary STL: 80-byte header, facet count, then per facet a normal, three
// corners (float32, multiplied by `scale`) and a zero attribute word.
// Throws std::runtime_error when the file cannot be written.
void write_binary_stl(const IndexedMesh& mesh, const std::string& path, double scale,
                      const std::string& header = "beardmold");

}  // namespace beardmold

#endif // BEARDMOLD_KERNEL_STL_WRITER_HPP
