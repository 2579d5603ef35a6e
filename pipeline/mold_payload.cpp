#include "mold_payload.hpp"
#include <common/errors.hpp>
#include <geometry/polyline.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include "logging.hpp"
#include <stdexcept>

namespace beardmold {

namespace {

// Null and empty values count as absent, so an empty primary key still
// falls back to its alias
bool present(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        return false;
    }
    const nlohmann::json& value = j[key];
    return !value.is_null() && !((value.is_array() || value.is_string()) && value.empty());
}

const nlohmann::json* find_first(const nlohmann::json& j, const char* key, const char* alias) {
    if (present(j, key)) {
        return &j[key];
    }
    if (present(j, alias)) {
        return &j[alias];
    }
    return nullptr;
}

Polyline parse_points(const nlohmann::json* points, const std::string& field) {
    Polyline result;
    if (points == nullptr) {
        return result;
    }
    if (!points->is_array()) {
        throw InvalidInputError(field + " must be an array of points");
    }

    result.reserve(points->size());
    for (size_t i = 0; i < points->size(); ++i) {
        try {
            result.push_back((*points)[i].get<Vec3>());
        } catch (const nlohmann::json::exception& e) {
            throw InvalidInputError(field + "[" + std::to_string(i) + "] is not a point: " + e.what());
        } catch (const std::invalid_argument& e) {
            throw InvalidInputError(field + "[" + std::to_string(i) + "] is not a point: " + e.what());
        }
    }
    return result;
}

std::string identifier(const nlohmann::json* value) {
    if (value == nullptr) {
        return "";
    }
    return value->is_string() ? value->get<std::string>() : value->dump();
}

}  // namespace

MoldPayload parse_payload(const nlohmann::json& j) {
    auto log = beardmold::logging::get_logger();

    if (!j.is_object()) {
        throw InvalidInputError("payload must be a JSON object");
    }

    MoldPayload payload;
    payload.beardline = parse_points(find_first(j, "beardline", "vertices"), "beardline");
    if (payload.beardline.empty()) {
        throw InvalidInputError("beardline is missing or empty");
    }
    payload.neckline = parse_points(find_first(j, "neckline", "neckline"), "neckline");
    payload.hole_centers = parse_points(find_first(j, "holeCenters", "holes"), "holeCenters");

    if (j.contains("params") && !j["params"].is_null()) {
        if (!j["params"].is_object()) {
            throw InvalidInputError("params must be an object");
        }
        try {
            payload.params = j["params"].get<MoldParameters>();
        } catch (const nlohmann::json::exception& e) {
            throw InvalidInputError(std::string("params: ") + e.what());
        }
    }
    payload.params.validate();

    payload.job_id = identifier(find_first(j, "jobID", "job_id"));
    payload.overlay = identifier(find_first(j, "overlay", "overlay"));

    if (payload.beardline.size() >= 3) {
        payload.beardline = smooth(payload.beardline, payload.params.smooth_passes);
    }
    if (payload.neckline.size() >= 3) {
        payload.neckline = smooth(payload.neckline, payload.params.neckline_smooth_passes);
    }

    log->debug("Payload: beardline={} neckline={} holes={} job_id='{}'",
               payload.beardline.size(), payload.neckline.size(),
               payload.hole_centers.size(), payload.job_id);
    return payload;
}

MoldPayload load_payload(const std::string& path) {
    nlohmann::json j;
    try {
        j = json::read_json_file(path);
    } catch (const nlohmann::json::exception& e) {
        throw InvalidInputError("malformed JSON in " + path + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw InvalidInputError(e.what());
    }
    return parse_payload(j);
}

}  // namespace beardmold
