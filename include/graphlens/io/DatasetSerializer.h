#pragma once

#include "graphlens/core/GraphData.h"

#include <string>

namespace graphlens {

/// Reads and writes graph datasets as JSON
///
/// Format:
/// {
///   "max_degree": 42,
///   "nodes": [{"label": "Ambient", "x": 10.5, "y": -3.0}, ...],
///   "edges": [[source, target, type], ...]
/// }
/// Node ids are array indices. Edge type is 0 (derivative), 1 (subgenre)
/// or 2 (fusion genre). "max_degree" is optional.
class DatasetSerializer {
public:
    /// @throws std::runtime_error on malformed JSON or invalid fields
    static GraphData fromJson(const std::string& json);

    static std::string toJson(const GraphData& graph);

    /// @throws std::runtime_error if the file cannot be read or parsed
    static GraphData loadFromFile(const std::string& path);
};

}  // namespace graphlens
