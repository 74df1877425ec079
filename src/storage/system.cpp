// =============================================================================
// objfs - Storage System Interface Implementation
// =============================================================================

#include "objfs/storage/system.h"

#include <algorithm>
#include <charconv>

#include <fmt/format.h>

#include "objfs/common/config.h"
#include "objfs/common/error.h"
#include "objfs/storage/error_mapping.h"

namespace objfs::storage {

namespace {

/// @brief Parse an integer header value.
template <typename T>
T parseHeaderNumber(const Header& header, std::string_view key) {
    const auto it = header.find(std::string(key));
    if (it == header.end()) {
        throw UnsupportedOperationError(fmt::format("Header has no \"{}\" field", key));
    }
    T value{};
    const std::string& text = it->second;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw BackendError(fmt::format("Invalid \"{}\" header value \"{}\"", key, text));
    }
    return value;
}

}  // namespace

// =============================================================================
// BackendTraits
// =============================================================================

std::size_t BackendTraits::clampBufferSize(std::size_t requested) const noexcept {
    if (requested == 0) {
        return defaultBufferSize;
    }
    if (requested < minimumBufferSize) {
        return minimumBufferSize;
    }
    if (maximumBufferSize != 0 && requested > maximumBufferSize) {
        return maximumBufferSize;
    }
    return requested;
}

std::size_t BackendTraits::resolveWorkers(std::size_t requested) const noexcept {
    if (requested != 0) {
        return requested;
    }
    return defaultMaxWorkers != 0 ? defaultMaxWorkers : defaultWorkerCount();
}

// =============================================================================
// ObjectBackend defaults
// =============================================================================

void ObjectBackend::flushRange(ByteSpan /*data*/, Offset /*start*/, Offset /*end*/) {
    throw UnsupportedOperationError("Backend does not support range writes");
}

std::unique_ptr<PartUpload> ObjectBackend::startPartUpload() {
    throw UnsupportedOperationError("Backend does not support multi-part uploads");
}

// =============================================================================
// System
// =============================================================================

std::string System::relpath(std::string_view path) const {
    std::size_t rootLength = 0;
    for (const auto& root : roots()) {
        if (path.starts_with(root) && root.size() > rootLength) {
            rootLength = root.size();
        }
    }
    path.remove_prefix(rootLength);
    while (path.starts_with('/')) {
        path.remove_prefix(1);
    }
    return std::string(path);
}

Header System::head(const ClientArgs& args) {
    return normalizeErrors([&]() { return headObject(args); }, ErrorContext(args.path));
}

Offset System::getSize(const Header& header) const {
    return parseHeaderNumber<Offset>(header, kContentLength);
}

std::int64_t System::getMtime(const Header& header) const {
    return parseHeaderNumber<std::int64_t>(header, kLastModified);
}

std::optional<bool> System::exists(const ClientArgs& args) {
    try {
        static_cast<void>(head(args));
        return true;
    } catch (const NotFoundError&) {
        return false;
    } catch (const PermissionDeniedError&) {
        return std::nullopt;
    }
}

}  // namespace objfs::storage
