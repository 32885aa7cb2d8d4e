/**
 * @file Framework.hpp
 * @brief Closed enumeration of frameworks a node can be scaffolded with.
 */

#pragma once

#include <cstddef>

namespace pioneer::domain::scaffold {

/**
 * @enum Framework
 * @brief Selects a row of the ScaffoldCatalog. Order matches the catalog table.
 */
enum class Framework {
    NodeJs,
    Angular,
    React,
    Vue,
    NextJs,
    Express,
    NestJs,
    Django,
    Flask,
    FastApi,
    PurePy,
    Rust,
    Swift,
    SwiftUI,
    Go,
    Java,
    Spring,
    Docker,
    Kubernetes,
    Terraform
};

constexpr std::size_t kFrameworkCount = static_cast<std::size_t>(Framework::Terraform) + 1;

} // namespace pioneer::domain::scaffold
