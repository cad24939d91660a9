// filename: request.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/request.hpp"

#include "flowbridge/errors.hpp"
#include "json_fields.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace flowbridge {
namespace {

using json = nlohmann::json;

constexpr const char* kParams = "simulation_parameters";

double requirePositive(const std::string& field, double value) {
    if (!(value > 0.0)) {
        throw RequestSchemaError(field + " must be positive");
    }
    return value;
}

SimulationParameters parseParameters(const json& node) {
    const std::string ctx{kParams};
    detail::requireObject<RequestSchemaError>(node, ctx);
    detail::rejectUnknownKeys<RequestSchemaError>(
        node,
        {"inlet_velocity", "domain_width", "domain_height", "grid_resolution_x", "grid_resolution_y",
         "simplify_tolerance", "max_points_per_poly", "object_scale_factor", "color_scale_min",
         "color_scale_max", "show_body", "max_iterations", "convergence_tolerance", "relaxation",
         "frame_every_iterations", "live_frame_path", "result_path"},
        ctx);

    SimulationParameters params{};
    params.inletVelocity =
        detail::readNumber<RequestSchemaError>(node, "inlet_velocity", ctx, params.inletVelocity);
    params.domainWidth = requirePositive(
        ctx + ".domain_width",
        detail::readNumber<RequestSchemaError>(node, "domain_width", ctx, params.domainWidth));
    params.domainHeight = requirePositive(
        ctx + ".domain_height",
        detail::readNumber<RequestSchemaError>(node, "domain_height", ctx, params.domainHeight));
    params.gridResolutionX =
        detail::readCount<RequestSchemaError>(node, "grid_resolution_x", ctx, params.gridResolutionX, 3);
    params.gridResolutionY =
        detail::readCount<RequestSchemaError>(node, "grid_resolution_y", ctx, params.gridResolutionY, 3);
    if (params.gridResolutionX > kMaxGridNodes / params.gridResolutionY) {
        throw RequestSchemaError(ctx + ".grid_resolution_x * grid_resolution_y must not exceed " +
                                 std::to_string(kMaxGridNodes) + " nodes");
    }

    params.simplifyTolerance =
        detail::readNumber<RequestSchemaError>(node, "simplify_tolerance", ctx, params.simplifyTolerance);
    if (!(params.simplifyTolerance >= 0.0)) {
        throw RequestSchemaError(ctx + ".simplify_tolerance must be non-negative");
    }
    params.maxPointsPerPoly =
        detail::readCount<RequestSchemaError>(node, "max_points_per_poly", ctx, params.maxPointsPerPoly, 2);
    params.objectScaleFactor =
        detail::readNumber<RequestSchemaError>(node, "object_scale_factor", ctx, params.objectScaleFactor);
    if (!(params.objectScaleFactor > 0.0) || params.objectScaleFactor > 1.0) {
        throw RequestSchemaError(ctx + ".object_scale_factor must lie in (0, 1]");
    }

    params.colorScaleMin =
        detail::readNumber<RequestSchemaError>(node, "color_scale_min", ctx, params.colorScaleMin);
    params.colorScaleMax =
        detail::readNumber<RequestSchemaError>(node, "color_scale_max", ctx, params.colorScaleMax);
    if (!(params.colorScaleMax > params.colorScaleMin)) {
        throw RequestSchemaError(ctx + ".color_scale_max must exceed color_scale_min");
    }
    params.showBody = detail::readBool<RequestSchemaError>(node, "show_body", ctx, params.showBody);

    params.maxIterations =
        detail::readCount<RequestSchemaError>(node, "max_iterations", ctx, params.maxIterations, 1);
    params.convergenceTolerance = requirePositive(
        ctx + ".convergence_tolerance",
        detail::readNumber<RequestSchemaError>(node, "convergence_tolerance", ctx,
                                               params.convergenceTolerance));
    params.relaxation = detail::readNumber<RequestSchemaError>(node, "relaxation", ctx, params.relaxation);
    if (!(params.relaxation > 0.0) || !(params.relaxation < 2.0)) {
        throw RequestSchemaError(ctx + ".relaxation must lie in (0, 2)");
    }
    params.frameEveryIterations = detail::readCount<RequestSchemaError>(
        node, "frame_every_iterations", ctx, params.frameEveryIterations, 1);

    if (node.contains("live_frame_path")) {
        params.liveFramePath = detail::readString<RequestSchemaError>(node, "live_frame_path", ctx, "");
        if (params.liveFramePath->empty()) {
            params.liveFramePath.reset();
        }
    }
    if (node.contains("result_path")) {
        params.resultPath = detail::readString<RequestSchemaError>(node, "result_path", ctx, "");
        if (params.resultPath->empty()) {
            params.resultPath.reset();
        }
    }
    return params;
}

Polyline parsePolyline(const json& node, std::size_t index) {
    const std::string ctx = "polylines[" + std::to_string(index) + "]";
    detail::requireObject<RequestSchemaError>(node, ctx);
    detail::rejectUnknownKeys<RequestSchemaError>(node, {"points", "closed"}, ctx);

    Polyline polyline;
    polyline.closed = detail::readBool<RequestSchemaError>(node, "closed", ctx, true);
    if (!node.contains("points")) {
        throw RequestSchemaError(ctx + " missing required field: points");
    }
    const auto& points = node.at("points");
    if (!points.is_array()) {
        throw RequestSchemaError(ctx + ".points must be an array");
    }

    polyline.points.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        const std::string pctx = ctx + ".points[" + std::to_string(i) + "]";
        const auto& point = points.at(i);
        detail::requireObject<RequestSchemaError>(point, pctx);
        detail::rejectUnknownKeys<RequestSchemaError>(point, {"x", "y", "z"}, pctx);
        if (!point.contains("x") || !point.contains("y")) {
            throw RequestSchemaError(pctx + " requires x and y");
        }
        Point2 p;
        p.x = detail::readNumber<RequestSchemaError>(point, "x", pctx, 0.0);
        p.y = detail::readNumber<RequestSchemaError>(point, "y", pctx, 0.0);
        (void)detail::readNumber<RequestSchemaError>(point, "z", pctx, 0.0);
        polyline.points.push_back(p);
    }
    return polyline;
}

std::vector<Polyline> parsePolylines(const json& node) {
    if (!node.is_array()) {
        throw RequestSchemaError("polylines must be an array");
    }
    std::vector<Polyline> polylines;
    polylines.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
        polylines.push_back(parsePolyline(node.at(i), i));
    }
    return polylines;
}

json parseDocument(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& ex) {
        throw RequestSchemaError(std::string("Request body is not valid JSON: ") + ex.what());
    }
}

std::string readFile(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open JSON input: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

json pointToJson(const Point2& p) {
    return json{{"x", p.x}, {"y", p.y}, {"z", 0.0}};
}

}  // namespace

SimulationRequest parseSimulationRequest(const std::string& body) {
    const json document = parseDocument(body);
    detail::requireObject<RequestSchemaError>(document, "request");
    detail::rejectUnknownKeys<RequestSchemaError>(document, {"schema_version", kParams, "polylines"},
                                                  "request");

    const std::size_t version = detail::readCount<RequestSchemaError>(
        document, "schema_version", "request", kRequestSchemaVersion, 1);
    if (version != static_cast<std::size_t>(kRequestSchemaVersion)) {
        throw RequestSchemaError("Unsupported request schema_version: " + std::to_string(version));
    }

    SimulationRequest request{};
    if (document.contains(kParams)) {
        request.parameters = parseParameters(document.at(kParams));
    }
    if (!document.contains("polylines")) {
        throw RequestSchemaError("Request missing required field: polylines");
    }
    request.polylines = parsePolylines(document.at("polylines"));
    return request;
}

SimulationRequest loadSimulationRequestFromJson(const std::string& path) {
    return parseSimulationRequest(readFile(path));
}

std::string serializeSimulationRequest(const SimulationRequest& request) {
    const SimulationParameters& p = request.parameters;
    json params{
        {"inlet_velocity", p.inletVelocity},
        {"domain_width", p.domainWidth},
        {"domain_height", p.domainHeight},
        {"grid_resolution_x", p.gridResolutionX},
        {"grid_resolution_y", p.gridResolutionY},
        {"simplify_tolerance", p.simplifyTolerance},
        {"max_points_per_poly", p.maxPointsPerPoly},
        {"object_scale_factor", p.objectScaleFactor},
        {"color_scale_min", p.colorScaleMin},
        {"color_scale_max", p.colorScaleMax},
        {"show_body", p.showBody},
        {"max_iterations", p.maxIterations},
        {"convergence_tolerance", p.convergenceTolerance},
        {"relaxation", p.relaxation},
        {"frame_every_iterations", p.frameEveryIterations},
    };
    if (p.liveFramePath) {
        params["live_frame_path"] = *p.liveFramePath;
    }
    if (p.resultPath) {
        params["result_path"] = *p.resultPath;
    }

    json polylines = json::array();
    for (const auto& polyline : request.polylines) {
        json points = json::array();
        for (const auto& point : polyline.points) {
            points.push_back(pointToJson(point));
        }
        polylines.push_back(json{{"closed", polyline.closed}, {"points", std::move(points)}});
    }

    json document{
        {"schema_version", kRequestSchemaVersion},
        {kParams, std::move(params)},
        {"polylines", std::move(polylines)},
    };
    return document.dump();
}

std::vector<Polyline> loadPolylinesFromJson(const std::string& path) {
    const json document = parseDocument(readFile(path));
    detail::requireObject<RequestSchemaError>(document, path);
    detail::rejectUnknownKeys<RequestSchemaError>(document, {"polylines"}, path);
    if (!document.contains("polylines")) {
        throw RequestSchemaError("Geometry file missing required field: polylines");
    }
    return parsePolylines(document.at("polylines"));
}

SimulationParameters loadSimulationParametersFromJson(const std::string& path) {
    return parseParameters(parseDocument(readFile(path)));
}

}  // namespace flowbridge
