#ifndef BEARDMOLD_PIPELINE_MOLD_PAYLOAD_HPP
#define BEARDMOLD_PIPELINE_MOLD_PAYLOAD_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <mold/mold_parameters.hpp>
#include <string>

namespace beardmold {

// One mold request after parsing and contour cleanup
struct MoldPayload {
    Polyline beardline;         // Smoothed with params.smooth_passes
    Polyline neckline;          // Smoothed with params.neckline_smooth_passes; may be empty
    Polyline hole_centers;
    MoldParameters params;

    // Passthrough identifiers, only logged; empty when absent
    std::string job_id;
    std::string overlay;
};

// Parse a request object.
// Accepts "beardline" or the legacy "vertices", "holeCenters" or "holes",
// "jobID" or "job_id". Points may be {x, y, z} objects or [x, y, z] arrays.
// Throws InvalidInputError for a non-object payload, a missing or empty
// beardline, malformed points or out-of-range parameters.
MoldPayload parse_payload(const nlohmann::json& j);

// Read and parse a request file. Unreadable or malformed JSON is reported as
// InvalidInputError.
MoldPayload load_payload(const std::string& path);

}  // namespace beardmold

#endif // BEARDMOLD_PIPELINE_MOLD_PAYLOAD_HPP
