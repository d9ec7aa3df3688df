#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace evhistory {

/**
 * @brief Identifier of a concrete event type within a TypeRegistry
 *
 * Handles are cheap to copy and compare by identity. Two handles are equal
 * only if they were issued by the same registry for the same declaration.
 * A default-constructed handle is invalid and covers nothing.
 */
class TypeHandle {
public:
    TypeHandle() = default;

    const std::string& name() const;
    TypeHandle parent() const;
    std::size_t depth() const;

    bool valid() const { return node_ != nullptr; }
    bool isRoot() const { return valid() && !node_->parent; }

    /**
     * @brief Hierarchy coverage check
     * @return True if @p other is this type or one of its descendants
     */
    bool isAssignableFrom(const TypeHandle& other) const;

    /** @brief Self first, root last */
    std::vector<TypeHandle> lineage() const;

    bool operator==(const TypeHandle& other) const { return node_ == other.node_; }
    bool operator!=(const TypeHandle& other) const { return node_ != other.node_; }

    std::size_t hash() const { return std::hash<const void*>{}(node_.get()); }

private:
    friend class TypeRegistry;

    struct Node {
        std::string name;
        std::shared_ptr<const Node> parent;
        std::size_t depth = 0;
    };

    explicit TypeHandle(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    std::shared_ptr<const Node> node_;
};

} // namespace evhistory

namespace std {
template <>
struct hash<evhistory::TypeHandle> {
    std::size_t operator()(const evhistory::TypeHandle& handle) const noexcept {
        return handle.hash();
    }
};
} // namespace std

namespace evhistory {

using TypeFilterSet = std::unordered_set<TypeHandle>;

/**
 * @brief Runtime table of event types and their parents
 *
 * Every type descends from the root type. New event types are declared at
 * runtime, so producers can add types without touching the recorder.
 *
 * @note declare() and find() may be called concurrently
 */
class TypeRegistry {
public:
    static constexpr const char* ROOT_TYPE_NAME = "Event";

    explicit TypeRegistry(const std::string& rootName = ROOT_TYPE_NAME);

    TypeHandle root() const { return root_; }

    /**
     * @brief Declare a type directly under the root
     * @throws std::invalid_argument on empty name or conflicting redeclaration
     */
    TypeHandle declare(const std::string& name);

    /**
     * @brief Declare a type under an already declared parent
     * @throws std::invalid_argument if the parent is unknown, or if @p name
     *         was declared before with a different parent
     */
    TypeHandle declare(const std::string& name, const std::string& parentName);
    TypeHandle declare(const std::string& name, const TypeHandle& parent);

    std::optional<TypeHandle> find(const std::string& name) const;

    /** @throws std::out_of_range for undeclared names */
    TypeHandle resolve(const std::string& name) const;

    /** @throws std::out_of_range if any name is undeclared */
    TypeFilterSet resolveAll(const std::vector<std::string>& names) const;

    /** @brief All types in declaration order, root first */
    std::vector<TypeHandle> types() const;
    std::size_t size() const;

private:
    TypeHandle declareLocked(const std::string& name, const TypeHandle& parent);

    mutable std::mutex mutex_;
    TypeHandle root_;
    std::unordered_map<std::string, TypeHandle> byName_;
    std::vector<TypeHandle> ordered_;
};

} // namespace evhistory
