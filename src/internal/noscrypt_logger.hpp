#pragma once

#include <string>

#include <plog/Log.h>
#include <noscrypt.h>

/**
 * @brief Logs a failed noscrypt result along with the calling function and line.
 * @returns The logged message, for inclusion in the error raised by the caller.
 */
#define NC_LOG_ERROR(result) nip98::internal::logNoscryptError(result, __func__, __LINE__)

namespace nip98
{
namespace internal
{
/**
 * @brief Describes a noscrypt result code, including the position of the offending argument.
 */
std::string describeNoscryptError(NCResult result, const char* func, int line);

std::string logNoscryptError(NCResult result, const char* func, int line);
} // namespace internal
} // namespace nip98
