#pragma once

#include <memory>

#include <plog/Init.h>
#include <plog/Log.h>

namespace nip98
{
namespace internal
{
/**
 * @brief Attaches the given appender to the default plog logger.
 * @remark plog holds appenders by raw pointer, so each appender passed here is retained for
 * the lifetime of the process.  Passing the same appender more than once has no further effect.
 */
void initLogging(std::shared_ptr<plog::IAppender> appender);
} // namespace internal
} // namespace nip98
