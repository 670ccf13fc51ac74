#pragma once

#include <memory>

#include <plog/Log.h>

namespace hydrator
{
namespace internal
{
/**
 * @brief Attaches the given appender to the default plog logger.
 * @remark Components call this from their constructors.  An appender already attached is not
 * attached again, so sharing one appender across components does not duplicate log lines.
 */
void initLogging(std::shared_ptr<plog::IAppender> appender);
} // namespace internal
} // namespace hydrator
