/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/DictationService.hpp"

namespace whisperim::application {

struct AppServices {
    std::unique_ptr<DictationService> dictationService;
};

} // namespace whisperim::application
