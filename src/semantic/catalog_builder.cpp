#include "expanse/semantic/catalog_builder.h"
#include "expanse/semantic/oracles.h"
#include "expanse/semantic/type_environment.h"
#include <algorithm>

namespace expanse {
namespace semantic {

ConstructorCatalog CatalogBuilder::build(const model::TypeRef& ownerType,
                                         const model::SiteContext& declarationSite) const {
    ConstructorCatalog catalog;
    catalog.ownerType = ownerType;
    catalog.declarationContext = declarationSite;
    catalog.generation = generationOf(ownerType);

    const std::string declName = ownerType.getDeclName();
    if (declName.empty()) {
        return catalog;
    }

    // Inherited constructors would let a subclass's argument shape stand in
    // for this type's, so only the type's own are considered.
    for (const auto& candidate : environment_.getDeclaredConstructors(declName)) {
        // Declaration-site lock
        if (candidate.declaredAt.ordinal >= declarationSite.ordinal) {
            continue;
        }
        if (!visibility_.isVisible(candidate, declarationSite)) {
            continue;
        }
        catalog.candidates.push_back(candidate);
    }

    std::stable_sort(catalog.candidates.begin(), catalog.candidates.end(),
        [](const model::ConstructorCandidate& a, const model::ConstructorCandidate& b) {
            return a.declaredAt.ordinal < b.declaredAt.ordinal;
        });
    return catalog;
}

size_t CatalogBuilder::generationOf(const model::TypeRef& ownerType) const {
    return environment_.getGeneration(ownerType.getDeclName());
}

bool CatalogCache::Key::operator<(const Key& other) const {
    if (type != other.type) {
        return type < other.type;
    }
    if (!(site == other.site)) {
        return site < other.site;
    }
    return generation < other.generation;
}

CatalogPtr CatalogCache::get(const model::TypeRef& ownerType, const model::SiteContext& declarationSite) {
    Key key{ownerType, declarationSite, builder_.generationOf(ownerType)};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            return it->second;
        }
    }

    auto built = std::make_shared<const ConstructorCatalog>(builder_.build(ownerType, declarationSite));
    builds_++;

    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = entries_.emplace(key, built);
    return inserted.first->second;
}

size_t CatalogCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void CatalogCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace semantic
} // namespace expanse
