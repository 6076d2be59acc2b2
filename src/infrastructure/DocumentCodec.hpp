/**
 * @file DocumentCodec.hpp
 * @brief Versioned graph and blueprint documents in YAML (primary) and JSON (interchange).
 *
 * Both encodings carry the same field set:
 * @code
 * version: 5
 * graph:
 *   nodes: [ {title, type, state, date?, metadata{archived, index, alias, parents, children}} | null ]
 *   roots: [...]
 *   archived: [...]
 *   dates: {YYYY-MM-DD: handle}
 *   aliases: {alias: handle}
 * @endcode
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/Blueprint.hpp"
#include "domain/TaskGraph.hpp"
#include "infrastructure/DocumentErrors.hpp"

namespace taskweave::infrastructure {

class DocumentCodec {
public:
    /** @brief Version written by every encoder. */
    static constexpr int CurrentVersion = 5;

    static std::string EncodeYaml(const domain::TaskGraph& graph);

    /**
     * @brief Decodes a YAML document.
     *
     * Strict decoding of the current schema is tried first. Older versions,
     * or current-version documents that fail strict decoding, go through
     * LegacyDocumentParser. Empty input yields an empty graph.
     *
     * @throws ParseError when no decoder accepts the payload.
     */
    static domain::TaskGraph DecodeYaml(const std::string& text);

    /** @param indent -1 for a single line, as nlohmann::json::dump. */
    static std::string EncodeJson(const domain::TaskGraph& graph, int indent = -1);

    /** @brief JSON counterpart of DecodeYaml, with the same fallback. */
    static domain::TaskGraph DecodeJson(const std::string& text);

    static std::string EncodeBlueprint(const domain::BlueprintDocument& doc);

    /** @throws ParseError on malformed blueprints. */
    static domain::BlueprintDocument DecodeBlueprint(const std::string& text);

    // Mapping between the engine types and the JSON tree shared by both encodings.
    static nlohmann::json ToJson(const domain::TaskGraph& graph);
    static nlohmann::json NodeToJson(const domain::TaskNode& node);

    /**
     * @brief Strict decode of a current-version document tree.
     * @throws ParseError on any missing field, wrong type, wrong version or
     *         out-of-range handle.
     */
    static domain::TaskGraph FromJson(const nlohmann::json& doc);
    static domain::TaskNode NodeFromJson(const nlohmann::json& j, domain::Handle slot, std::size_t slotCount);
};

} // namespace taskweave::infrastructure
