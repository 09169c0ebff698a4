//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: AggregateError, FailureCollector, and failure diagnostics
//==========================================================================================================

#include <format>
#include <typeinfo>

#include <boost/core/demangle.hpp>

#include "dorismcp/errors/Errors.h"
#include "logging/Logger.h"

namespace dorismcp {
namespace errors {

AggregateError::AggregateError(const std::string& message, std::vector<std::exception_ptr> c)
    : std::runtime_error(std::format("{} ({} exceptions)", message, c.size())), causes(std::move(c)) {}

void FailureCollector::Add(std::exception_ptr ep) {
    if (!ep) return;
    std::lock_guard<std::mutex> lock(mutex);
    failures.push_back(std::move(ep));
}

bool FailureCollector::Empty() const {
    std::lock_guard<std::mutex> lock(mutex);
    return failures.empty();
}

std::size_t FailureCollector::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return failures.size();
}

void FailureCollector::RethrowIfAny(const std::string& message) {
    std::vector<std::exception_ptr> taken;
    {
        std::lock_guard<std::mutex> lock(mutex);
        taken.swap(failures);
    }
    if (taken.empty()) return;
    if (taken.size() == 1) std::rethrow_exception(taken.front());
    throw AggregateError(message, std::move(taken));
}

std::string DescribeException(const std::exception_ptr& ep) {
    if (!ep) return "no exception";
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return std::format("{}: {}", boost::core::demangle(typeid(e).name()), e.what());
    } catch (...) {
        return "unknown exception";
    }
}

namespace {
void logCauses(const AggregateError& agg, const std::string& indent) {
    LOG_ERROR("{}ExceptionGroup contains {} exceptions:", indent, agg.Causes().size());
    std::size_t index = 1;
    for (const auto& cause : agg.Causes()) {
        LOG_ERROR("{}  Exception {}: {}", indent, index, DescribeException(cause));
        try {
            std::rethrow_exception(cause);
        } catch (const AggregateError& nested) {
            logCauses(nested, indent + "    ");
        } catch (...) {
            // Leaf cause already described above
        }
        ++index;
    }
}
} // namespace

void LogFailureDetail(const std::string& context, const std::exception_ptr& ep) {
    LOG_ERROR("{}: {}", context, DescribeException(ep));
    if (!ep) return;
    try {
        std::rethrow_exception(ep);
    } catch (const AggregateError& agg) {
        logCauses(agg, "");
    } catch (...) {
        // Non-aggregate failures carry no sub-causes
    }
}

} // namespace errors
} // namespace dorismcp
