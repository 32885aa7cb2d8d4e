/**
 * @file CodeLanguage.hpp
 * @brief Value Object enumerating the languages a project file can be written in.
 */

#pragma once

#include <optional>
#include <string>

namespace pioneer::domain {

/**
 * @enum CodeLanguage
 * @brief Closed set of languages. Drives syntax rules and default extensions.
 */
enum class CodeLanguage {
    Swift,
    Python,
    TypeScript,
    JavaScript,
    Html,
    Css,
    Dockerfile,
    Kubernetes,
    Yaml,
    Terraform,
    CloudFormation,
    Json,
    Sql,
    Bash,
    Markdown,
    Rust,
    Go,
    Java,
    Scaffolding
};

/** @brief Stable key used in workspace documents (e.g. "python"). */
std::string LanguageToString(CodeLanguage language);

/** @brief Display label (e.g. "Python"). */
std::string LanguageDisplayName(CodeLanguage language);

/** @brief Default file extension without the dot. Empty for extensionless files. */
std::string LanguageExtension(CodeLanguage language);

std::optional<CodeLanguage> LanguageFromString(const std::string& key);

/**
 * @brief Infers a language from a relative path's file name or extension.
 * @return nullopt when the extension is unknown.
 */
std::optional<CodeLanguage> LanguageFromPath(const std::string& path);

} // namespace pioneer::domain
