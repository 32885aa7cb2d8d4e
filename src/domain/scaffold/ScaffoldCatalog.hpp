/**
 * @file ScaffoldCatalog.hpp
 * @brief Static, table-driven description of every framework's project layout.
 *
 * Adding a framework means adding one row to the table in ScaffoldCatalog.cpp;
 * no other component branches on the framework.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/CodeLanguage.hpp"
#include "domain/scaffold/Framework.hpp"

namespace pioneer::domain::scaffold {

/**
 * @struct TemplateFile
 * @brief A file emitted from a template. Placeholders: {{name}}, {{slug}},
 *        {{ident}}, {{type}}, {{runtime_version}}.
 */
struct TemplateFile {
    std::string path;
    std::string templateText;
};

/**
 * @struct RuntimeSpec
 * @brief An installed toolchain whose version may be pinned in the manifest.
 */
struct RuntimeSpec {
    std::string tool;            ///< Executable name (e.g. "node").
    std::string versionArgs;     ///< Arguments printing the version (e.g. "--version").
    std::string defaultVersion;  ///< Used when detection fails.
};

/**
 * @struct ScaffoldEntry
 * @brief One catalog row.
 */
struct ScaffoldEntry {
    Framework framework;
    std::string key;                      ///< Stable serialization key ("purepy").
    std::string displayName;              ///< Label ("PurePy").
    CodeLanguage primaryLanguage;
    std::string mainFilePath;             ///< Relative path of the main file.
    std::vector<std::string> directories; ///< Scaffold directories, relative.
    std::optional<TemplateFile> manifest; ///< Emitted once, never overwritten.
    std::vector<TemplateFile> seedFiles;  ///< Emitted only when absent (README, .gitignore...).
    bool needsEnvironment = false;        ///< Interpreted runtimes get an isolated environment.
    std::optional<RuntimeSpec> runtime;
    std::string mainTemplate;

    /** @brief Last segment of mainFilePath. */
    std::string mainFileName() const;
};

/**
 * @struct TemplateVars
 * @brief Values substituted into catalog templates.
 */
struct TemplateVars {
    std::string name;            ///< Node display name.
    std::string typeLabel;       ///< Node type display label.
    std::string runtimeVersion;  ///< Detected or default runtime version.
};

class ScaffoldCatalog {
public:
    /** @brief Returns the row for a framework. Total: every enumerator has a row. */
    static const ScaffoldEntry& Lookup(Framework framework);

    /** @brief All rows, in enumeration order. */
    static const std::vector<ScaffoldEntry>& All();

    static std::string KeyOf(Framework framework);
    static std::optional<Framework> FrameworkFromKey(const std::string& key);

    /** @brief Framework used when a document names an unknown key. */
    static Framework DefaultFramework() { return Framework::PurePy; }

    /**
     * @brief Renders the main file content for a node of the given framework.
     */
    static std::string RenderMainFile(Framework framework, const TemplateVars& vars);

    /** @brief Substitutes every placeholder in text. */
    static std::string RenderTemplate(const std::string& text, const TemplateVars& vars);

    /** @brief Lower-case, dash-separated, filesystem and package-manager safe name. */
    static std::string Slugify(const std::string& name);

    /** @brief Alphanumeric identifier suitable for type/package names. */
    static std::string Identifier(const std::string& name);
};

} // namespace pioneer::domain::scaffold
