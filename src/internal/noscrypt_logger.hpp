#pragma once

#include <plog/Log.h>
#include <noscrypt.h>

/*
* @brief Logs an error message with the function name and line number where the
* error occurred, if `result` is not `NC_SUCCESS`.
*/
#define NC_LOG_ERROR(result) hydrator::internal::printNoscryptError(result, __func__, __LINE__)

namespace hydrator
{
namespace internal
{
void printNoscryptError(NCResult result, const char* func, int line);
} // namespace internal
} // namespace hydrator
