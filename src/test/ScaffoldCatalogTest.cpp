#include <cassert>
#include <iostream>
#include <set>

#include "domain/CodeLanguage.hpp"
#include "domain/scaffold/ScaffoldCatalog.hpp"

using namespace pioneer::domain;
using namespace pioneer::domain::scaffold;

int main() {
    std::cout << "[Test] Starting ScaffoldCatalog Test..." << std::endl;

    // Every framework has exactly one row, at its own index.
    const auto& all = ScaffoldCatalog::All();
    assert(all.size() == kFrameworkCount && "Catalog must cover every framework.");
    std::set<std::string> keys;
    for (std::size_t i = 0; i < all.size(); ++i) {
        assert(static_cast<std::size_t>(all[i].framework) == i && "Table order must match the enum.");
        assert(!all[i].mainFilePath.empty());
        assert(!all[i].mainTemplate.empty());
        assert(keys.insert(all[i].key).second && "Keys must be unique.");
        assert(ScaffoldCatalog::FrameworkFromKey(all[i].key) == all[i].framework);
    }
    assert(!ScaffoldCatalog::FrameworkFromKey("cobol"));
    std::cout << "[PASS] Catalog is total and keys round-trip." << std::endl;

    const auto& purepy = ScaffoldCatalog::Lookup(Framework::PurePy);
    assert(purepy.mainFilePath == "src/main.py");
    assert(purepy.mainFileName() == "main.py");
    assert(purepy.primaryLanguage == CodeLanguage::Python);
    assert(purepy.needsEnvironment);
    assert(!purepy.manifest && "Plain Python has no requirements.txt.");

    const auto& flask = ScaffoldCatalog::Lookup(Framework::Flask);
    assert(flask.manifest && flask.manifest->path == "requirements.txt");

    const auto& swift = ScaffoldCatalog::Lookup(Framework::Swift);
    assert(swift.mainFilePath == "Sources/main.swift");
    assert(!swift.needsEnvironment);

    const auto& node = ScaffoldCatalog::Lookup(Framework::NodeJs);
    assert(node.runtime && node.runtime->tool == "node");
    assert(node.manifest && node.manifest->path == "package.json");
    std::cout << "[PASS] Entries describe the expected layouts." << std::endl;

    TemplateVars vars;
    vars.name = "My Cool App";
    vars.typeLabel = "Website";
    vars.runtimeVersion = "20.11.0";
    std::string rendered = ScaffoldCatalog::RenderTemplate(
        "{{name}}|{{slug}}|{{ident}}|{{type}}|{{runtime_version}}", vars);
    assert(rendered == "My Cool App|my-cool-app|MyCoolApp|Website|20.11.0");

    std::string manifest = ScaffoldCatalog::RenderTemplate(node.manifest->templateText, vars);
    assert(manifest.find("\"name\": \"my-cool-app\"") != std::string::npos);
    assert(manifest.find("\"node\": \"20.11.0\"") != std::string::npos);
    assert(manifest.find("{{") == std::string::npos && "No placeholder may survive rendering.");

    std::string main = ScaffoldCatalog::RenderMainFile(Framework::PurePy, vars);
    assert(main.find("Hello, My Cool App!") != std::string::npos);

    assert(ScaffoldCatalog::Slugify("  ") == "project");
    assert(ScaffoldCatalog::Slugify("API -- Gateway") == "api-gateway");
    assert(ScaffoldCatalog::Identifier("42 things") == "App42things");
    assert(ScaffoldCatalog::Identifier("!!") == "App");
    std::cout << "[PASS] Templates render every placeholder." << std::endl;

    assert(LanguageFromPath("src/app.tsx") == CodeLanguage::TypeScript);
    assert(LanguageFromPath("Dockerfile") == CodeLanguage::Dockerfile);
    assert(LanguageFromPath("src/main.py") == CodeLanguage::Python);
    assert(LanguageFromString(LanguageToString(CodeLanguage::Rust)) == CodeLanguage::Rust);
    assert(!LanguageFromString("klingon"));
    std::cout << "[PASS] Languages map from keys and extensions." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
