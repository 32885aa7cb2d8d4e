/**
 * @file ScaffoldCatalog.cpp
 * @brief The catalog table and template rendering.
 */

#include "domain/scaffold/ScaffoldCatalog.hpp"

#include <cctype>

namespace pioneer::domain::scaffold {

namespace {

const char* kPythonGitignore = R"TPL(__pycache__/
*.py[cod]
*$py.class
*.so
.Python
venv/
env/
ENV/
.pytest_cache/
.mypy_cache/
.coverage
htmlcov/
dist/
build/
*.egg-info/
)TPL";

const char* kNodeGitignore = R"TPL(node_modules/
dist/
build/
.env
*.log
)TPL";

std::string PythonReadme(const std::string& runCommand) {
    return "# {{name}}\n\n{{type}} project\n\n## Setup\n\n```bash\n"
           "python3 -m venv venv\nsource venv/bin/activate\npip install -r requirements.txt\n```\n\n"
           "## Run\n\n```bash\n" + runCommand + "\n```\n";
}

std::string BasicReadme(const std::string& languageLabel) {
    return "# {{name}}\n\n{{type}} project\n\nLanguage: " + languageLabel + "\n";
}

std::string PackageJson(const std::string& mainPath, const std::string& start, const std::string& build) {
    return "{\n"
           "  \"name\": \"{{slug}}\",\n"
           "  \"version\": \"1.0.0\",\n"
           "  \"description\": \"{{slug}}\",\n"
           "  \"main\": \"" + mainPath + "\",\n"
           "  \"scripts\": {\n"
           "    \"start\": \"" + start + "\",\n"
           "    \"build\": \"" + build + "\"\n"
           "  },\n"
           "  \"keywords\": [],\n"
           "  \"author\": \"\",\n"
           "  \"license\": \"ISC\",\n"
           "  \"volta\": {\n"
           "    \"node\": \"{{runtime_version}}\"\n"
           "  }\n"
           "}\n";
}

const RuntimeSpec kNodeRuntime{"node", "--version", "20.11.0"};
const RuntimeSpec kRustRuntime{"rustc", "--version", "1.75.0"};
const RuntimeSpec kGoRuntime{"go", "version", "1.22"};
const RuntimeSpec kJavaRuntime{"java", "-version", "17"};

ScaffoldEntry JsEntry(Framework fw, const char* key, const char* label, CodeLanguage lang,
                      const std::string& mainPath, const std::string& start,
                      const std::string& build, std::string mainTemplate) {
    ScaffoldEntry e;
    e.framework = fw;
    e.key = key;
    e.displayName = label;
    e.primaryLanguage = lang;
    e.mainFilePath = mainPath;
    e.directories = {"src", "dist"};
    e.manifest = TemplateFile{"package.json", PackageJson(mainPath, start, build)};
    e.seedFiles = {{".gitignore", kNodeGitignore}};
    e.needsEnvironment = true;
    e.runtime = kNodeRuntime;
    e.mainTemplate = std::move(mainTemplate);
    return e;
}

ScaffoldEntry PythonEntry(Framework fw, const char* key, const char* label,
                          const std::string& mainPath, const std::string& requirements,
                          std::string mainTemplate) {
    ScaffoldEntry e;
    e.framework = fw;
    e.key = key;
    e.displayName = label;
    e.primaryLanguage = CodeLanguage::Python;
    e.mainFilePath = mainPath;
    e.directories = {"src", "tests", "docs"};
    if (!requirements.empty()) {
        e.manifest = TemplateFile{"requirements.txt", requirements};
    }
    e.seedFiles = {
        {"src/__init__.py", ""},
        {"tests/__init__.py", ""},
        {"README.md", PythonReadme("python " + mainPath)},
        {".gitignore", kPythonGitignore},
    };
    e.needsEnvironment = true;
    e.mainTemplate = std::move(mainTemplate);
    return e;
}

ScaffoldEntry BasicEntry(Framework fw, const char* key, const char* label, CodeLanguage lang,
                         const std::string& mainPath, std::string mainTemplate) {
    ScaffoldEntry e;
    e.framework = fw;
    e.key = key;
    e.displayName = label;
    e.primaryLanguage = lang;
    e.mainFilePath = mainPath;
    e.directories = {"src"};
    e.seedFiles = {{"README.md", BasicReadme(label)}};
    e.mainTemplate = std::move(mainTemplate);
    return e;
}

std::vector<ScaffoldEntry> BuildTable() {
    std::vector<ScaffoldEntry> table;
    table.reserve(kFrameworkCount);

    table.push_back(JsEntry(Framework::NodeJs, "nodejs", "Node.js", CodeLanguage::JavaScript,
        "src/index.js", "node src/index.js", "echo 'No build step needed'",
        R"TPL(// {{name}}
// Node.js application entry point

console.log('Hello, {{name}}!');

// Add your code here
)TPL"));

    table.push_back(JsEntry(Framework::Angular, "angular", "Angular", CodeLanguage::TypeScript,
        "src/main.ts", "ng serve", "ng build",
        R"TPL(import { Component } from '@angular/core';

@Component({
  selector: 'app-root',
  template: '<h1>Hello, {{name}}!</h1>'
})
export class AppComponent {
  title = '{{name}}';
}
)TPL"));

    table.push_back(JsEntry(Framework::React, "react", "React", CodeLanguage::JavaScript,
        "src/index.js", "react-scripts start", "react-scripts build",
        R"TPL(import React from 'react';

function App() {
  return (
    <div>
      <h1>Hello, {{name}}!</h1>
    </div>
  );
}

export default App;
)TPL"));

    table.push_back(JsEntry(Framework::Vue, "vue", "Vue", CodeLanguage::JavaScript,
        "src/main.js", "vite", "vite build",
        R"TPL(<template>
  <div>
    <h1>Hello, {{name}}!</h1>
  </div>
</template>

<script>
export default {
  name: 'App'
}
</script>
)TPL"));

    {
        ScaffoldEntry next = JsEntry(Framework::NextJs, "nextjs", "Next.js", CodeLanguage::JavaScript,
            "pages/index.js", "next dev", "next build",
            R"TPL(export default function Home() {
  return (
    <div>
      <h1>Hello, {{name}}!</h1>
    </div>
  );
}
)TPL");
        next.directories = {"pages", "public"};
        table.push_back(std::move(next));
    }

    table.push_back(JsEntry(Framework::Express, "express", "Express", CodeLanguage::JavaScript,
        "src/index.js", "node src/index.js", "echo 'No build step needed'",
        R"TPL(const express = require('express');
const app = express();
const port = 3000;

app.get('/', (req, res) => {
  res.send('Hello, {{name}}!');
});

app.listen(port, () => {
  console.log(`{{name}} listening at http://localhost:${port}`);
});
)TPL"));

    table.push_back(JsEntry(Framework::NestJs, "nestjs", "NestJS", CodeLanguage::TypeScript,
        "src/main.ts", "nest start", "nest build",
        R"TPL(import { Controller, Get } from '@nestjs/common';

@Controller()
export class AppController {
  @Get()
  getHello(): string {
    return 'Hello, {{name}}!';
  }
}
)TPL"));

    table.push_back(PythonEntry(Framework::Django, "django", "Django", "manage.py", "django>=5.0\n",
        R"TPL(# {{name}} Django Project
# Django settings and configuration

from django.http import HttpResponse

def index(request):
    return HttpResponse("Hello, {{name}}!")
)TPL"));

    table.push_back(PythonEntry(Framework::Flask, "flask", "Flask", "app.py", "flask>=3.0\n",
        R"TPL(from flask import Flask

app = Flask(__name__)

@app.route('/')
def hello():
    return 'Hello, {{name}}!'

if __name__ == '__main__':
    app.run(debug=True)
)TPL"));

    table.push_back(PythonEntry(Framework::FastApi, "fastapi", "FastAPI", "main.py",
        "fastapi>=0.110\nuvicorn>=0.29\n",
        R"TPL(from fastapi import FastAPI

app = FastAPI(title="{{name}}")

@app.get("/")
def read_root():
    return {"message": "Hello, {{name}}!"}
)TPL"));

    table.push_back(PythonEntry(Framework::PurePy, "purepy", "PurePy", "src/main.py", "",
        R"TPL(# {{name}}
# Pure Python application

def main():
    print("Hello, {{name}}!")

if __name__ == "__main__":
    main()
)TPL"));

    {
        ScaffoldEntry rust = BasicEntry(Framework::Rust, "rust", "Rust", CodeLanguage::Rust, "src/main.rs",
            R"TPL(fn main() {
    println!("Hello, {{name}}!");
}
)TPL");
        rust.manifest = TemplateFile{"Cargo.toml",
            "[package]\nname = \"{{slug}}\"\nversion = \"0.1.0\"\nedition = \"2021\"\n"
            "rust-version = \"{{runtime_version}}\"\n\n[dependencies]\n"};
        rust.seedFiles.push_back({".gitignore", "target/\n"});
        rust.runtime = kRustRuntime;
        table.push_back(std::move(rust));
    }

    {
        ScaffoldEntry swift = BasicEntry(Framework::Swift, "swift", "Swift", CodeLanguage::Swift,
            "Sources/main.swift",
            R"TPL(import Foundation

print("Hello, {{name}}!")
)TPL");
        swift.directories = {"Sources", "Tests"};
        swift.manifest = TemplateFile{"Package.swift", R"TPL(// swift-tools-version: 5.9
import PackageDescription

let package = Package(
    name: "{{ident}}",
    platforms: [
        .macOS(.v13),
        .iOS(.v16)
    ],
    products: [
        .executable(
            name: "{{ident}}",
            targets: ["{{ident}}"]
        )
    ],
    targets: [
        .executableTarget(
            name: "{{ident}}",
            path: "Sources"
        )
    ]
)
)TPL"};
        swift.seedFiles = {{"README.md",
            "# {{name}}\n\n{{type}} project\n\n## Build\n\n```bash\nswift build\n```\n\n"
            "## Run\n\n```bash\nswift run\n```\n"}};
        table.push_back(std::move(swift));
    }

    {
        ScaffoldEntry swiftui = table.back();
        swiftui.framework = Framework::SwiftUI;
        swiftui.key = "swiftui";
        swiftui.displayName = "SwiftUI";
        swiftui.mainFilePath = "Sources/App.swift";
        swiftui.mainTemplate = R"TPL(import SwiftUI

@main
struct {{ident}}App: App {
    var body: some Scene {
        WindowGroup {
            ContentView()
        }
    }
}

struct ContentView: View {
    var body: some View {
        Text("Hello, {{name}}!")
            .font(.largeTitle)
            .padding()
    }
}
)TPL";
        table.push_back(std::move(swiftui));
    }

    {
        ScaffoldEntry go = BasicEntry(Framework::Go, "go", "Go", CodeLanguage::Go, "main.go",
            R"TPL(package main

import "fmt"

func main() {
    fmt.Println("Hello, {{name}}!")
}
)TPL");
        go.directories = {"internal"};
        go.manifest = TemplateFile{"go.mod", "module {{slug}}\n\ngo {{runtime_version}}\n"};
        go.runtime = kGoRuntime;
        table.push_back(std::move(go));
    }

    const std::string pom =
        "<project xmlns=\"http://maven.apache.org/POM/4.0.0\">\n"
        "  <modelVersion>4.0.0</modelVersion>\n"
        "  <groupId>com.example</groupId>\n"
        "  <artifactId>{{slug}}</artifactId>\n"
        "  <version>0.1.0</version>\n"
        "  <properties>\n"
        "    <maven.compiler.release>{{runtime_version}}</maven.compiler.release>\n"
        "  </properties>\n"
        "</project>\n";

    {
        ScaffoldEntry java = BasicEntry(Framework::Java, "java", "Java", CodeLanguage::Java,
            "src/main/java/Main.java",
            R"TPL(public class Main {
    public static void main(String[] args) {
        System.out.println("Hello, {{name}}!");
    }
}
)TPL");
        java.directories = {"src/main/java", "src/test/java"};
        java.manifest = TemplateFile{"pom.xml", pom};
        java.runtime = kJavaRuntime;
        table.push_back(std::move(java));
    }

    {
        ScaffoldEntry spring = table.back();
        spring.framework = Framework::Spring;
        spring.key = "spring";
        spring.displayName = "Spring";
        spring.mainFilePath = "src/main/java/Application.java";
        spring.mainTemplate = R"TPL(package com.example;

import org.springframework.boot.SpringApplication;
import org.springframework.boot.autoconfigure.SpringBootApplication;

@SpringBootApplication
public class Application {
    public static void main(String[] args) {
        SpringApplication.run(Application.class, args);
    }
}
)TPL";
        spring.seedFiles = {{"README.md", BasicReadme("Spring")}};
        table.push_back(std::move(spring));
    }

    {
        ScaffoldEntry docker = BasicEntry(Framework::Docker, "docker", "Docker", CodeLanguage::Dockerfile,
            "Dockerfile",
            R"TPL(FROM node:20-alpine
WORKDIR /app
COPY package*.json ./
RUN npm install
COPY . .
EXPOSE 3000
CMD ["npm", "start"]
)TPL");
        docker.seedFiles.push_back({".dockerignore", "node_modules\n.git\n"});
        table.push_back(std::move(docker));
    }

    table.push_back(BasicEntry(Framework::Kubernetes, "kubernetes", "Kubernetes", CodeLanguage::Kubernetes,
        "deployment.yaml",
        R"TPL(apiVersion: apps/v1
kind: Deployment
metadata:
  name: {{slug}}
spec:
  replicas: 1
  selector:
    matchLabels:
      app: {{slug}}
  template:
    metadata:
      labels:
        app: {{slug}}
    spec:
      containers:
      - name: app
        image: {{slug}}:latest
        ports:
        - containerPort: 3000
)TPL"));

    table.push_back(BasicEntry(Framework::Terraform, "terraform", "Terraform", CodeLanguage::Terraform,
        "main.tf",
        R"TPL(terraform {
  required_version = ">= 1.0"
}

resource "aws_instance" "example" {
  ami           = "ami-0c55b159cbfafe1f0"
  instance_type = "t2.micro"

  tags = {
    Name = "{{name}}"
  }
}
)TPL"));

    return table;
}

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::string ScaffoldEntry::mainFileName() const {
    auto pos = mainFilePath.find_last_of('/');
    return pos == std::string::npos ? mainFilePath : mainFilePath.substr(pos + 1);
}

const std::vector<ScaffoldEntry>& ScaffoldCatalog::All() {
    static const std::vector<ScaffoldEntry> table = BuildTable();
    return table;
}

const ScaffoldEntry& ScaffoldCatalog::Lookup(Framework framework) {
    return All()[static_cast<std::size_t>(framework)];
}

std::string ScaffoldCatalog::KeyOf(Framework framework) {
    return Lookup(framework).key;
}

std::optional<Framework> ScaffoldCatalog::FrameworkFromKey(const std::string& key) {
    for (const auto& entry : All()) {
        if (entry.key == key) return entry.framework;
    }
    return std::nullopt;
}

std::string ScaffoldCatalog::RenderMainFile(Framework framework, const TemplateVars& vars) {
    return RenderTemplate(Lookup(framework).mainTemplate, vars);
}

std::string ScaffoldCatalog::RenderTemplate(const std::string& text, const TemplateVars& vars) {
    std::string out = text;
    ReplaceAll(out, "{{name}}", vars.name);
    ReplaceAll(out, "{{slug}}", Slugify(vars.name));
    ReplaceAll(out, "{{ident}}", Identifier(vars.name));
    ReplaceAll(out, "{{type}}", vars.typeLabel);
    ReplaceAll(out, "{{runtime_version}}", vars.runtimeVersion);
    return out;
}

std::string ScaffoldCatalog::Slugify(const std::string& name) {
    std::string slug;
    bool pendingDash = false;
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            if (pendingDash && !slug.empty()) slug += '-';
            pendingDash = false;
            slug += static_cast<char>(std::tolower(c));
        } else {
            pendingDash = true;
        }
    }
    return slug.empty() ? "project" : slug;
}

std::string ScaffoldCatalog::Identifier(const std::string& name) {
    std::string ident;
    for (unsigned char c : name) {
        if (std::isalnum(c)) ident += static_cast<char>(c);
    }
    if (ident.empty()) return "App";
    if (std::isdigit(static_cast<unsigned char>(ident.front()))) ident = "App" + ident;
    return ident;
}

} // namespace pioneer::domain::scaffold
