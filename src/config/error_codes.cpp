#include "progmeter/config/error_codes.hpp"

namespace progmeter {
namespace config {

ConfigError::ConfigError(ConfigErrorCode code, const common::ErrorContext& context)
    : std::invalid_argument(ConfigErrorCodeHelper::describe(code, context)),
      code_(code),
      context_(context) {}

}}
