#pragma once

#include "expanse/model/constructor.h"
#include "expanse/model/context.h"
#include "expanse/model/types.h"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace expanse {
namespace semantic {

class TypeEnvironment;
class VisibilityOracle;

// Constructors usable for expansion of one type, frozen at one declaration
// site. Pure derived data; never mutated after it is built.
struct ConstructorCatalog {
    model::TypeRef ownerType;
    model::SiteContext declarationContext;
    size_t generation = 0;
    std::vector<model::ConstructorCandidate> candidates;

    bool empty() const { return candidates.empty(); }
    size_t size() const { return candidates.size(); }
};

using CatalogPtr = std::shared_ptr<const ConstructorCatalog>;

class CatalogBuilder {
public:
    CatalogBuilder(const TypeEnvironment& environment, const VisibilityOracle& visibility)
        : environment_(environment), visibility_(visibility) {}

    // Every constructor declared directly on `ownerType` (never inherited),
    // declared before `declarationSite` and visible from it, in declaration
    // order. Optional types yield the wrapper's catalog.
    ConstructorCatalog build(const model::TypeRef& ownerType,
                             const model::SiteContext& declarationSite) const;

    // Current generation of the type's constructor set
    size_t generationOf(const model::TypeRef& ownerType) const;

private:
    const TypeEnvironment& environment_;
    const VisibilityOracle& visibility_;
};

// Insert-once store of catalogs keyed by (type, declaration site, generation).
// Safe for concurrent use: builds happen outside the lock, and when two
// threads race on one key the first published catalog wins.
class CatalogCache {
public:
    CatalogCache(const CatalogBuilder& builder)
        : builder_(builder), builds_(0) {}

    CatalogPtr get(const model::TypeRef& ownerType, const model::SiteContext& declarationSite);

    size_t size() const;
    // Number of times the builder ran (including lost races)
    size_t getBuildCount() const { return builds_.load(); }
    void clear();

private:
    struct Key {
        model::TypeRef type;
        model::SiteContext site;
        size_t generation;

        bool operator<(const Key& other) const;
    };

    const CatalogBuilder& builder_;
    mutable std::mutex mutex_;
    std::map<Key, CatalogPtr> entries_;
    std::atomic<size_t> builds_;
};

} // namespace semantic
} // namespace expanse
