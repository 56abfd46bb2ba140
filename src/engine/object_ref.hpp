/**
 * @file object_ref.hpp
 * @brief Typed, copyable handle to a future owned by an Engine.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>

namespace task_fabric {

class Engine;

/**
 * @brief Handle to the eventual result of a task (or a put value) of type T.
 *
 * Only an Engine mints non-null refs. A ref records which engine it came
 * from, so passing it to another engine is rejected at submission.
 */
template <typename T>
class ObjectRef {
public:
    using value_type = T;

    ObjectRef() = default;

    [[nodiscard]] FutureId id() const noexcept { return id_; }
    [[nodiscard]] uint64_t engine_id() const noexcept { return engine_id_; }
    [[nodiscard]] bool is_null() const noexcept { return id_.is_null(); }

    bool operator==(const ObjectRef&) const = default;

private:
    friend class Engine;

    ObjectRef(FutureId id, uint64_t engine_id) : id_(id), engine_id_(engine_id) {}

    FutureId id_;
    uint64_t engine_id_{0};
};

}  // namespace task_fabric
