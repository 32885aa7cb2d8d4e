/**
 * @file CodeLanguage.cpp
 * @brief Table-driven metadata for CodeLanguage.
 */

#include "domain/CodeLanguage.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>

namespace pioneer::domain {

namespace {

struct LanguageInfo {
    CodeLanguage language;
    const char* key;
    const char* displayName;
    const char* extension;
    std::vector<std::string> recognizedExtensions;
};

const std::vector<LanguageInfo>& LanguageTable() {
    static const std::vector<LanguageInfo> table = {
        {CodeLanguage::Swift, "swift", "Swift", "swift", {".swift"}},
        {CodeLanguage::Python, "python", "Python", "py", {".py", ".pyw"}},
        {CodeLanguage::TypeScript, "typescript", "TypeScript", "ts", {".ts", ".tsx"}},
        {CodeLanguage::JavaScript, "javascript", "JavaScript", "js", {".js", ".jsx", ".mjs", ".cjs"}},
        {CodeLanguage::Html, "html", "HTML", "html", {".html", ".htm"}},
        {CodeLanguage::Css, "css", "CSS", "css", {".css"}},
        {CodeLanguage::Dockerfile, "dockerfile", "Dockerfile", "", {".dockerfile"}},
        {CodeLanguage::Kubernetes, "kubernetes", "Kubernetes", "yaml", {}},
        {CodeLanguage::Yaml, "yaml", "YAML", "yaml", {".yaml", ".yml"}},
        {CodeLanguage::Terraform, "terraform", "Terraform", "tf", {".tf", ".tfvars"}},
        {CodeLanguage::CloudFormation, "cloudformation", "CloudFormation", "yaml", {}},
        {CodeLanguage::Json, "json", "JSON", "json", {".json"}},
        {CodeLanguage::Sql, "sql", "SQL", "sql", {".sql"}},
        {CodeLanguage::Bash, "bash", "Bash", "sh", {".sh", ".bash"}},
        {CodeLanguage::Markdown, "markdown", "Markdown", "md", {".md", ".markdown"}},
        {CodeLanguage::Rust, "rust", "Rust", "rs", {".rs"}},
        {CodeLanguage::Go, "go", "Go", "go", {".go"}},
        {CodeLanguage::Java, "java", "Java", "java", {".java"}},
        {CodeLanguage::Scaffolding, "scaffolding", "Scaffolding", "txt", {".txt"}},
    };
    return table;
}

const LanguageInfo& InfoFor(CodeLanguage language) {
    const auto& table = LanguageTable();
    auto it = std::find_if(table.begin(), table.end(),
        [language](const LanguageInfo& info) { return info.language == language; });
    // Every enumerator has a row; Scaffolding is the last row.
    return it != table.end() ? *it : table.back();
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

std::string LanguageToString(CodeLanguage language) {
    return InfoFor(language).key;
}

std::string LanguageDisplayName(CodeLanguage language) {
    return InfoFor(language).displayName;
}

std::string LanguageExtension(CodeLanguage language) {
    return InfoFor(language).extension;
}

std::optional<CodeLanguage> LanguageFromString(const std::string& key) {
    const std::string lowered = ToLower(key);
    for (const auto& info : LanguageTable()) {
        if (lowered == info.key) return info.language;
    }
    return std::nullopt;
}

std::optional<CodeLanguage> LanguageFromPath(const std::string& path) {
    std::filesystem::path p(path);
    const std::string filename = ToLower(p.filename().string());
    if (filename == "dockerfile") return CodeLanguage::Dockerfile;

    const std::string ext = ToLower(p.extension().string());
    if (ext.empty()) return std::nullopt;

    for (const auto& info : LanguageTable()) {
        if (std::find(info.recognizedExtensions.begin(), info.recognizedExtensions.end(), ext)
            != info.recognizedExtensions.end()) {
            return info.language;
        }
    }
    return std::nullopt;
}

} // namespace pioneer::domain
