/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/VerificationService.hpp"
#include "domain/ChainRegistry.hpp"

namespace sourceproof::application {

struct AppServices {
    std::shared_ptr<const domain::ChainRegistry> chainRegistry;
    std::unique_ptr<VerificationService> verificationService;
    std::shared_ptr<AsyncTaskManager> taskManager;
};

} // namespace sourceproof::application
