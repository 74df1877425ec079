// =============================================================================
// objfs - Local Filesystem Storage Implementation
// =============================================================================

#include "objfs/storage/local_system.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <mutex>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "objfs/common/error.h"

namespace objfs::storage {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throwMissing(const fs::path& path) {
    throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                            path.string());
}

class LocalBackend : public ObjectBackend {
public:
    LocalBackend(fs::path path, bool createParents)
        : path_(std::move(path)), createParents_(createParents) {}

    ByteBuffer readRange(Offset start, Offset end) override {
        const Offset size = fs::file_size(path_);
        if (start >= size) {
            return {};
        }
        const Offset last = (end == 0) ? size : std::min(end, size);
        if (last <= start) {
            return {};
        }

        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            throwMissing(path_);
        }
        ByteBuffer data(last - start);
        in.seekg(static_cast<std::streamoff>(start));
        in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        data.resize(static_cast<std::size_t>(in.gcount()));
        return data;
    }

    void flush(ByteSpan data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        prepareParents();
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError(fmt::format("Cannot open \"{}\" for writing", path_.string()));
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out) {
            throw IOError(fmt::format("Write to \"{}\" failed", path_.string()));
        }
    }

    void flushRange(ByteSpan data, Offset start, Offset end) override {
        if (end - start != data.size()) {
            throw InvalidArgumentError(fmt::format("Range [{}, {}) does not match {} bytes",
                                                   start, end, data.size()));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        prepareParents();
        if (!fs::exists(path_)) {
            std::ofstream create(path_, std::ios::binary);
            if (!create) {
                throw IOError(fmt::format("Cannot create \"{}\"", path_.string()));
            }
        }
        if (fs::file_size(path_) < start) {
            fs::resize_file(path_, start);
        }
        if (data.empty()) {
            return;
        }

        std::fstream out(path_, std::ios::binary | std::ios::in | std::ios::out);
        if (!out) {
            throw IOError(fmt::format("Cannot open \"{}\" for writing", path_.string()));
        }
        out.seekp(static_cast<std::streamoff>(start));
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out) {
            throw IOError(fmt::format("Write to \"{}\" failed at offset {}", path_.string(), start));
        }
    }

private:
    void prepareParents() const {
        const fs::path parent = path_.parent_path();
        if (parent.empty() || fs::exists(parent)) {
            return;
        }
        if (!createParents_) {
            throwMissing(parent);
        }
        fs::create_directories(parent);
    }

    fs::path path_;
    bool createParents_;
    std::mutex mutex_;
};

}  // namespace

LocalSystem::LocalSystem(Parameters parameters) : parameters_(std::move(parameters)) {
    for (const auto& [name, value] : parameters_) {
        if (name != "local.create_parents") {
            throw InvalidArgumentError(fmt::format("Unknown storage parameter \"{}\"", name));
        }
        if (value == "true" || value == "1") {
            createParents_ = true;
        } else if (value == "false" || value == "0") {
            createParents_ = false;
        } else {
            throw InvalidArgumentError(
                fmt::format("Parameter \"{}\" expects true or false, got \"{}\"", name, value));
        }
    }
}

std::vector<std::string> LocalSystem::roots() const {
    return {std::string(kUrlRoot), std::string(kPathRoot)};
}

ClientArgs LocalSystem::getClientArgs(std::string_view path) const {
    std::string_view local = path;
    if (local.starts_with(kUrlRoot)) {
        local.remove_prefix(kUrlRoot.size());
    }
    const fs::path file = fs::path(local).lexically_normal();

    ClientArgs args;
    args.path = std::string(path);
    args.locator = file.parent_path().string();
    args.key = file.filename().string();
    return args;
}

fs::path LocalSystem::filePath(const ClientArgs& args) {
    return fs::path(args.locator) / args.key;
}

Header LocalSystem::headObject(const ClientArgs& args) {
    const fs::path file = filePath(args);
    const auto status = fs::status(file);
    if (!fs::exists(status)) {
        throwMissing(file);
    }
    if (fs::is_directory(status)) {
        throw UnsupportedOperationError(fmt::format("\"{}\" is a directory", file.string()));
    }

    const auto modified = std::chrono::file_clock::to_sys(fs::last_write_time(file));
    const auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(modified.time_since_epoch()).count();
    return Header{{std::string(kContentLength), std::to_string(fs::file_size(file))},
                  {std::string(kLastModified), std::to_string(seconds)}};
}

std::unique_ptr<ObjectBackend> LocalSystem::openObject(const ClientArgs& args) {
    if (args.key.empty()) {
        throw InvalidArgumentError(fmt::format("\"{}\" does not name a file", args.path));
    }
    return std::make_unique<LocalBackend>(filePath(args), createParents_);
}

BackendTraits LocalSystem::traits() const {
    BackendTraits traits;
    traits.randomWrite = true;
    return traits;
}

std::shared_ptr<System> LocalSystem::withParameters(const Parameters& parameters) const {
    Parameters merged = parameters_;
    for (const auto& [name, value] : parameters) {
        merged[name] = value;
    }
    return std::make_shared<LocalSystem>(std::move(merged));
}

}  // namespace objfs::storage
