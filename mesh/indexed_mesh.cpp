#include "indexed_mesh.hpp"
#include <cmath>
#include <stdexcept>

namespace beardmold {

namespace {

using WeldKey = std::array<long long, 3>;

WeldKey weld_key(const Point3& p) {
    return {
        std::llround(p.x / VERTEX_WELD_STEP),
        std::llround(p.y / VERTEX_WELD_STEP),
        std::llround(p.z / VERTEX_WELD_STEP)
    };
}

// True when faces f and g, both around v, share an edge (v, w)
bool shares_edge_at(const Face& f, const Face& g, VertexId v) {
    for (VertexId a : f) {
        if (a == v) continue;
        for (VertexId b : g) {
            if (a == b) return true;
        }
    }
    return false;
}

}  // namespace

IndexedMesh IndexedMesh::from_triangles(const TriangleList& triangles) {
    IndexedMesh mesh;
    std::map<WeldKey, VertexId> welded;

    for (const auto& tri : triangles) {
        Face face{};
        for (size_t k = 0; k < 3; ++k) {
            WeldKey key = weld_key(tri[k]);
            auto it = welded.find(key);
            if (it == welded.end()) {
                VertexId id = mesh.add_vertex(tri[k]);
                welded.emplace(key, id);
                face[k] = id;
            } else {
                face[k] = it->second;
            }
        }
        mesh.add_face(face[0], face[1], face[2]);
    }

    return mesh;
}

VertexId IndexedMesh::add_vertex(const Point3& p) {
    VertexId id = static_cast<VertexId>(vertices_.size());
    vertices_.push_back(p);
    return id;
}

bool IndexedMesh::add_face(VertexId a, VertexId b, VertexId c) {
    if (a >= vertices_.size() || b >= vertices_.size() || c >= vertices_.size()) {
        throw std::out_of_range("IndexedMesh::add_face: vertex index out of range");
    }
    if (a == b || b == c || a == c) {
        return false;
    }
    faces_.push_back({a, b, c});
    return true;
}

void IndexedMesh::append(const IndexedMesh& other) {
    VertexId offset = static_cast<VertexId>(vertices_.size());
    vertices_.insert(vertices_.end(), other.vertices_.begin(), other.vertices_.end());
    for (const auto& f : other.faces_) {
        faces_.push_back({f[0] + offset, f[1] + offset, f[2] + offset});
    }
}

std::map<EdgeKey, int> IndexedMesh::edge_incidence() const {
    std::map<EdgeKey, int> counts;
    for (const auto& f : faces_) {
        for (size_t k = 0; k < 3; ++k) {
            counts[make_edge_key(f[k], f[(k + 1) % 3])]++;
        }
    }
    return counts;
}

std::vector<BoundaryEdge> IndexedMesh::boundary_edges() const {
    std::map<EdgeKey, int> counts = edge_incidence();

    std::vector<BoundaryEdge> result;
    for (const auto& f : faces_) {
        for (size_t k = 0; k < 3; ++k) {
            VertexId from = f[k];
            VertexId to = f[(k + 1) % 3];
            if (counts[make_edge_key(from, to)] == 1) {
                result.push_back({from, to});
            }
        }
    }
    return result;
}

std::vector<std::vector<VertexId>> IndexedMesh::boundary_loops() const {
    std::vector<BoundaryEdge> edges = boundary_edges();

    // Outgoing boundary edges per vertex
    std::multimap<VertexId, size_t> outgoing;
    for (size_t i = 0; i < edges.size(); ++i) {
        outgoing.emplace(edges[i].from, i);
    }

    std::vector<bool> used(edges.size(), false);
    std::vector<std::vector<VertexId>> loops;

    for (size_t start = 0; start < edges.size(); ++start) {
        if (used[start]) continue;
        used[start] = true;

        std::vector<VertexId> loop{edges[start].from};
        VertexId current = edges[start].to;
        bool closed = false;

        while (true) {
            if (current == edges[start].from) {
                closed = true;
                break;
            }
            loop.push_back(current);

            // Take the first unused outgoing edge
            bool advanced = false;
            auto [lo, hi] = outgoing.equal_range(current);
            for (auto it = lo; it != hi; ++it) {
                if (!used[it->second]) {
                    used[it->second] = true;
                    current = edges[it->second].to;
                    advanced = true;
                    break;
                }
            }
            if (!advanced) break;
        }

        if (closed && loop.size() >= 3) {
            loops.push_back(std::move(loop));
        }
    }

    return loops;
}

size_t IndexedMesh::non_manifold_edge_count() const {
    size_t count = 0;
    for (const auto& [edge, incidence] : edge_incidence()) {
        if (incidence != 2) {
            ++count;
        }
    }
    return count;
}

bool IndexedMesh::is_closed() const {
    return !faces_.empty() && non_manifold_edge_count() == 0;
}

BoundingBox IndexedMesh::bounding_box() const {
    BoundingBox box;
    for (const auto& p : vertices_) {
        box.expand(p);
    }
    return box;
}

double IndexedMesh::signed_volume() const {
    double volume = 0.0;
    for (const auto& f : faces_) {
        const Point3& a = vertices_[f[0]];
        const Point3& b = vertices_[f[1]];
        const Point3& c = vertices_[f[2]];
        volume += a.dot(b.cross(c));
    }
    return volume / 6.0;
}

size_t IndexedMesh::split_non_manifold_vertices() {
    std::vector<std::vector<size_t>> around(vertices_.size());
    for (size_t f = 0; f < faces_.size(); ++f) {
        for (VertexId v : faces_[f]) {
            around[v].push_back(f);
        }
    }

    size_t added = 0;
    const VertexId initial_count = static_cast<VertexId>(vertices_.size());
    for (VertexId v = 0; v < initial_count; ++v) {
        const std::vector<size_t>& faces = around[v];
        if (faces.size() < 2) continue;

        // Label each face with the fan it belongs to
        std::vector<int> fan(faces.size(), -1);
        int fan_count = 0;
        for (size_t seed = 0; seed < faces.size(); ++seed) {
            if (fan[seed] >= 0) continue;
            fan[seed] = fan_count;
            std::vector<size_t> pending{seed};
            while (!pending.empty()) {
                size_t current = pending.back();
                pending.pop_back();
                for (size_t other = 0; other < faces.size(); ++other) {
                    if (fan[other] < 0 &&
                        shares_edge_at(faces_[faces[current]], faces_[faces[other]], v)) {
                        fan[other] = fan_count;
                        pending.push_back(other);
                    }
                }
            }
            ++fan_count;
        }
        if (fan_count < 2) continue;

        const Point3 position = vertices_[v];
        std::vector<VertexId> copies(static_cast<size_t>(fan_count), v);
        for (int k = 1; k < fan_count; ++k) {
            copies[static_cast<size_t>(k)] = add_vertex(position);
            ++added;
        }
        for (size_t i = 0; i < faces.size(); ++i) {
            if (fan[i] == 0) continue;
            for (VertexId& corner : faces_[faces[i]]) {
                if (corner == v) {
                    corner = copies[static_cast<size_t>(fan[i])];
                }
            }
        }
    }
    return added;
}

void IndexedMesh::remove_unreferenced_vertices() {
    constexpr VertexId UNUSED = static_cast<VertexId>(-1);
    std::vector<VertexId> remap(vertices_.size(), UNUSED);
    std::vector<Point3> kept;

    for (auto& f : faces_) {
        for (auto& v : f) {
            if (remap[v] == UNUSED) {
                remap[v] = static_cast<VertexId>(kept.size());
                kept.push_back(vertices_[v]);
            }
            v = remap[v];
        }
    }
    vertices_ = std::move(kept);
}

void IndexedMesh::flip() {
    for (auto& f : faces_) {
        std::swap(f[1], f[2]);
    }
}

TriangleList IndexedMesh::to_triangles() const {
    TriangleList list;
    for (const auto& f : faces_) {
        list.add(vertices_[f[0]], vertices_[f[1]], vertices_[f[2]]);
    }
    return list;
}

}  // namespace beardmold
