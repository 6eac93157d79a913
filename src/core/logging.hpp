/*
 * Copyright 2025 Weft Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace weft::control {
struct LogConfig;
}

namespace weft::logging {

// Start the Quill backend thread (idempotent)
void init_logging_system();

// Create the application logger from config and make it the process default.
// The log file is {config.output}/{name}.log
quill::Logger* init_logger(const weft::control::LogConfig& config, std::string_view name = "weft");

// Route the calling thread to a specific logger (nullptr restores the default)
void set_thread_logger(quill::Logger* logger);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 generation for correlation IDs
std::string generate_correlation_id();

// Validate correlation ID format ({uuid}#{counter})
bool is_valid_uuid(std::string_view uuid);

// Logger for the calling thread: thread override, then process default,
// then a console logger created on first use. Never returns nullptr.
quill::Logger* get_current_logger();

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, correlation_id)       \
    LOG_INFO(logger,                                                                 \
             "Request completed: method={}, path={}, status={}, duration_us={}, " \
             "correlation_id={}",                                                    \
             method, path, status, duration_us, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

}  // namespace weft::logging
