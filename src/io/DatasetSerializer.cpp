#include "graphlens/io/DatasetSerializer.h"
#include "graphlens/common/Logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace graphlens {

GraphData DatasetSerializer::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        const json& nodesJson = j.at("nodes");
        if (!nodesJson.is_array()) {
            throw std::runtime_error("\"nodes\" must be an array");
        }

        std::vector<NodeRecord> records;
        records.reserve(nodesJson.size());
        for (const auto& nodeJson : nodesJson) {
            NodeRecord record;
            record.label = nodeJson.at("label").get<std::string>();
            record.position = {nodeJson.at("x").get<float>(), nodeJson.at("y").get<float>()};
            records.push_back(std::move(record));
        }

        std::vector<Edge> edges;
        if (j.contains("edges")) {
            const json& edgesJson = j["edges"];
            edges.reserve(edgesJson.size());
            for (const auto& edgeJson : edgesJson) {
                if (!edgeJson.is_array() || edgeJson.size() != 3) {
                    throw std::runtime_error("edge must be [source, target, type]");
                }
                const int64_t source = edgeJson[0].get<int64_t>();
                const int64_t target = edgeJson[1].get<int64_t>();
                auto type = edgeTypeFromIndex(edgeJson[2].get<int>());
                if (source < 0 || target < 0) {
                    throw std::runtime_error("edge endpoints must be non-negative");
                }
                if (source >= INVALID_NODE || target >= INVALID_NODE) {
                    throw std::runtime_error("edge endpoint out of node id range");
                }
                if (!type) {
                    throw std::runtime_error("unknown edge type " + edgeJson[2].dump());
                }
                edges.push_back({static_cast<NodeId>(source), static_cast<NodeId>(target), *type});
            }
        }

        const size_t maxDegree = j.value("max_degree", size_t{0});
        GraphData graph(std::move(records), std::move(edges), maxDegree);
        LOG_DEBUG("parsed dataset: {} nodes, {} edges", graph.nodeCount(), graph.edgeCount());
        return graph;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse dataset JSON: ") + e.what());
    }
}

std::string DatasetSerializer::toJson(const GraphData& graph) {
    json j;
    j["max_degree"] = graph.maxDegree();

    json nodes = json::array();
    for (const auto& node : graph.nodes()) {
        nodes.push_back({{"label", node.label}, {"x", node.position.x}, {"y", node.position.y}});
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& edge : graph.edges()) {
        edges.push_back({edge.source, edge.target, static_cast<int>(edgeTypeIndex(edge.type))});
    }
    j["edges"] = edges;

    return j.dump();
}

GraphData DatasetSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open dataset file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

}  // namespace graphlens
