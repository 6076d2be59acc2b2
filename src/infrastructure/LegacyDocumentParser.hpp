/**
 * @file LegacyDocumentParser.hpp
 * @brief Tolerant decoders for older (and damaged current) document versions.
 */

#pragma once

#include <functional>
#include <map>

#include <yaml-cpp/yaml.h>

#include "domain/TaskGraph.hpp"
#include "infrastructure/DocumentErrors.hpp"

namespace taskweave::infrastructure {

/**
 * @class LegacyDocumentParser
 * @brief Maps every known document version onto the current in-memory graph.
 *
 * Each version has its own decoder, selected through a version -> decoder
 * table. All decoders default missing fields, merge node-level aliases into
 * the alias table, drop references to absent or removed slots and repair
 * the derived indices so the result satisfies the graph invariants.
 */
class LegacyDocumentParser {
public:
    using Decoder = std::function<domain::TaskGraph(const YAML::Node&)>;

    /**
     * @brief Decodes @p doc with the decoder registered for its version field.
     * @throws ParseError for missing or unknown versions and unusable payloads.
     */
    static domain::TaskGraph Parse(const YAML::Node& doc);

    /** @brief The registered decoders, keyed by document version. */
    static const std::map<int, Decoder>& Decoders();

    /** Flat nodes {message, state(none|partial|complete|pseudo), index, alias, parents, children}. */
    static domain::TaskGraph ParseV3(const YAML::Node& doc);

    /** Flat nodes {message, type(normal|date|pseudo), state, archived, index, alias, parents, children}. */
    static domain::TaskGraph ParseV4(const YAML::Node& doc);

    /** Current nested shape with every field optional. */
    static domain::TaskGraph ParseV5(const YAML::Node& doc);
};

} // namespace taskweave::infrastructure
