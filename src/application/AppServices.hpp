/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/PersistenceCoordinator.hpp"
#include "application/WorkspaceStore.hpp"
#include "domain/ProjectMaterializer.hpp"
#include "domain/RuntimeProbe.hpp"

namespace pioneer::application {

struct AppServices {
    std::shared_ptr<domain::RuntimeProbe> runtimeProbe;
    std::shared_ptr<domain::ProjectMaterializer> materializer;
    std::shared_ptr<PersistenceCoordinator> persistence;
    std::unique_ptr<WorkspaceStore> workspace;
};

} // namespace pioneer::application
