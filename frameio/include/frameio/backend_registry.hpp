#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "backend.hpp"
#include "config.hpp"
#include "backends/buffered_backend.hpp"
#include "backends/mmap_backend.hpp"
#include "types/result.hpp"

#ifdef FRAMEIO_HAVE_LIBURING
#include "backends/uring_backend.hpp"
#endif

namespace frameio {

/// Builds a backend from its selection record
using BackendFactory = std::function<Result<std::unique_ptr<BackendStrategy>>(const nlohmann::json&)>;

/// @brief Process-wide table from backend identifier to factory
///
/// The built-in backends ("mmap", "buffered", and "uring" when built with
/// liburing) are registered when the registry is first used. Further backends
/// can be added at startup with add(); an identifier registered with an empty
/// factory is reported as not implemented.
///
/// @code{.cpp}
/// nlohmann::json record = {{"id", "buffered"}, {"buffer_size", 1 << 22}};
/// auto backend = BackendRegistry::instance().construct(record);
/// if (!backend) { /* UnknownBackend, InvalidConfig or NotImplemented */ }
/// @endcode
class BackendRegistry {
private:
    mutable std::mutex mutex_;
    std::map<std::string, BackendFactory, std::less<>> factories_;

    BackendRegistry() {
        factories_.emplace("mmap", &MMapBackend::from_json);
        factories_.emplace("buffered", &BufferedBackend::from_json);
#ifdef FRAMEIO_HAVE_LIBURING
        factories_.emplace("uring", &UringBackend::from_json);
#endif
    }

public:
    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    [[nodiscard]] static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    /// Register (or replace) the factory of id
    void add(std::string id, BackendFactory factory) {
        std::lock_guard<std::mutex> lock(mutex_);
        factories_.insert_or_assign(std::move(id), std::move(factory));
    }

    [[nodiscard]] bool contains(std::string_view id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return factories_.find(id) != factories_.end();
    }

    /// Registered identifiers, sorted
    [[nodiscard]] std::vector<std::string> ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(factories_.size());
        for (const auto& [id, factory] : factories_) {
            out.push_back(id);
        }
        return out;
    }

    /// @brief Construct the backend named by record["id"]
    /// @retval InvalidConfig Record is not an object, has no string "id", or a field has the wrong type
    /// @retval UnknownBackend No backend registered under the id
    /// @retval NotImplemented The id is registered without a factory
    [[nodiscard]] Result<std::unique_ptr<BackendStrategy>> construct(const nlohmann::json& record) const {
        auto id = config::read_id(record);
        if (!id) {
            return id.error();
        }
        BackendFactory factory;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = factories_.find(id.value());
            if (it == factories_.end()) {
                return Err(Error::Code::UnknownBackend, "no such backend: " + id.value());
            }
            factory = it->second;
        }
        if (!factory) {
            return Err(Error::Code::NotImplemented,
                       "backend '" + id.value() + "' cannot be constructed from a record");
        }
        return factory(record);
    }

    /// construct() from the JSON text of a record
    [[nodiscard]] Result<std::unique_ptr<BackendStrategy>> construct_from_text(std::string_view text) const {
        auto record = parse_config(text);
        if (!record) {
            return record.error();
        }
        return construct(record.value());
    }
};

} // namespace frameio
