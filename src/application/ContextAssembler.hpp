/**
 * @file ContextAssembler.hpp
 * @brief Application service to assemble structured node context for the LLM.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "domain/Node.hpp"

namespace pioneer::application {

/**
 * @struct NodeContext
 * @brief Metadata of one node plus a bounded excerpt of its focus file.
 */
struct NodeContext {
    domain::NodeId id;
    std::string name;
    std::string type;
    std::string framework;
    std::string language;
    std::vector<std::string> filePaths;
    std::string focusPath;     ///< Selected file (current node) or main file.
    std::string excerpt;       ///< At most the configured number of bytes.
    bool truncated = false;
};

/**
 * @struct ContextBundle
 * @brief A Value Object containing labeled context segments for the LLM.
 */
struct ContextBundle {
    NodeContext current;
    std::vector<NodeContext> connected; ///< Outgoing connections, in connection order.

    /** @brief Renders the bundle into a single formatted string for the system prompt. */
    std::string render() const;

    bool isEmpty() const { return current.id.empty(); }
};

/**
 * @class ContextAssembler
 * @brief Builds a ContextBundle from node snapshots. Holds no reference to the store.
 */
class ContextAssembler {
public:
    explicit ContextAssembler(std::size_t prefixChars);

    /**
     * @brief Assembles the bundle for a node.
     * @param current The node being edited.
     * @param connected Snapshots of the nodes current connects to. Unknown ones are skipped by the caller.
     */
    ContextBundle assemble(const domain::Node& current, const std::vector<domain::Node>& connected) const;

    /**
     * @brief First maxBytes of text, cut back to a UTF-8 character boundary.
     */
    static std::string Prefix(const std::string& text, std::size_t maxBytes, bool& truncated);

private:
    NodeContext describe(const domain::Node& node, bool preferSelection) const;

    std::size_t m_prefixChars;
};

} // namespace pioneer::application
