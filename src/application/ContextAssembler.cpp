/**
 * @file ContextAssembler.cpp
 * @brief Implementation of the ContextAssembler service.
 */

#include "application/ContextAssembler.hpp"

#include <sstream>

#include "domain/scaffold/ScaffoldCatalog.hpp"

namespace pioneer::application {

namespace {

const char* TypeGuidance(const std::string& typeKey) {
    switch (domain::NodeTypeFromString(typeKey)) {
        case domain::NodeType::MacOSApp:
            return "Native macOS application. Follow the macOS Human Interface Guidelines.";
        case domain::NodeType::IPhoneApp:
            return "iPhone/iPad application. Support both iPhone and iPad layouts.";
        case domain::NodeType::Website:
            return "Web application or service. Keep it responsive.";
        case domain::NodeType::CloudBackend:
            return "Cloud backend. Include error handling and logging.";
        case domain::NodeType::Custom:
            break;
    }
    return "Custom project. Generate code appropriate for the selected language.";
}

void RenderNode(std::stringstream& ss, const NodeContext& node) {
    ss << "Name: " << node.name << "\n"
       << "Type: " << domain::NodeTypeDisplayName(domain::NodeTypeFromString(node.type)) << "\n"
       << "Framework: " << node.framework << "\n"
       << "Language: " << node.language << "\n"
       << "Files:\n";
    for (const auto& path : node.filePaths) {
        ss << "  - " << path << "\n";
    }
    if (!node.focusPath.empty()) {
        ss << "--- " << node.focusPath << (node.truncated ? " (truncated)" : "") << " ---\n"
           << node.excerpt << "\n";
    }
}

} // namespace

ContextAssembler::ContextAssembler(std::size_t prefixChars) : m_prefixChars(prefixChars) {}

std::string ContextAssembler::Prefix(const std::string& text, std::size_t maxBytes, bool& truncated) {
    truncated = text.size() > maxBytes;
    if (!truncated) return text;

    std::size_t cut = maxBytes;
    // Do not split a multi-byte sequence.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

NodeContext ContextAssembler::describe(const domain::Node& node, bool preferSelection) const {
    NodeContext ctx;
    ctx.id = node.getId();
    ctx.name = node.getName();
    ctx.type = domain::NodeTypeToString(node.getType());
    ctx.framework = domain::scaffold::ScaffoldCatalog::Lookup(node.getFramework()).displayName;
    ctx.language = domain::LanguageDisplayName(node.getLanguage());
    for (const auto& file : node.getFiles()) {
        ctx.filePaths.push_back(file.path);
    }

    const domain::ProjectFile* focus = nullptr;
    if (preferSelection && node.getSelectedFileId()) {
        focus = node.findFile(*node.getSelectedFileId());
    }
    if (!focus) focus = node.mainFile();
    if (focus) {
        ctx.focusPath = focus->path;
        ctx.excerpt = Prefix(focus->content, m_prefixChars, ctx.truncated);
    }
    return ctx;
}

ContextBundle ContextAssembler::assemble(const domain::Node& current,
                                         const std::vector<domain::Node>& connected) const {
    ContextBundle bundle;
    bundle.current = describe(current, true);
    for (const auto& node : connected) {
        bundle.connected.push_back(describe(node, false));
    }
    return bundle;
}

std::string ContextBundle::render() const {
    std::stringstream ss;

    if (isEmpty()) return "";

    ss << "=== CURRENT_NODE (" << current.id << ") ===\n";
    RenderNode(ss, current);
    ss << "Guidance: " << TypeGuidance(current.type) << "\n"
       << "========================================\n\n";

    if (!connected.empty()) {
        ss << "=== CONNECTED_NODES ===\n";
        for (const auto& node : connected) {
            ss << "### " << node.id << "\n";
            RenderNode(ss, node);
        }
        ss << "========================================\n\n";
    }

    ss << "Instruction: Answer for the current node; use connected nodes only as interface context.\n";

    return ss.str();
}

} // namespace pioneer::application
