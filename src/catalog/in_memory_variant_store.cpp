#include "catalog/in_memory_variant_store.h"

namespace catalog {

bool InMemoryVariantStore::upsertWebVariant(const WebVariant &variant) {
    std::scoped_lock lock(mutex_);
    if (variant.active) {
        for (const auto &[id, existing] : web_variants_) {
            if (id != variant.id && existing.active && existing.key == variant.key) {
                return false;
            }
        }
    }
    web_variants_[variant.id] = variant;
    return true;
}

void InMemoryVariantStore::upsertLegacyVariant(const LegacyVariant &variant) {
    std::scoped_lock lock(mutex_);
    legacy_variants_[variant.id] = variant;
}

bool InMemoryVariantStore::deactivateWebVariant(VariantId variant_id) {
    std::scoped_lock lock(mutex_);
    auto it = web_variants_.find(variant_id);
    if (it == web_variants_.end()) {
        return false;
    }
    it->second.active = false;
    return true;
}

bool InMemoryVariantStore::setDisplayedStock(VariantId variant_id, Quantity displayed_stock) {
    std::scoped_lock lock(mutex_);
    auto it = web_variants_.find(variant_id);
    if (it == web_variants_.end()) {
        return false;
    }
    it->second.displayed_stock = displayed_stock;
    return true;
}

std::optional<WebVariant> InMemoryVariantStore::findWebVariant(VariantId variant_id) const {
    std::scoped_lock lock(mutex_);
    auto it = web_variants_.find(variant_id);
    if (it == web_variants_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<LegacyVariant> InMemoryVariantStore::findLegacyVariant(VariantId variant_id) const {
    std::scoped_lock lock(mutex_);
    auto it = legacy_variants_.find(variant_id);
    if (it == legacy_variants_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<WebVariant> InMemoryVariantStore::findWebVariantByKey(const VariantKey &key) const {
    std::scoped_lock lock(mutex_);
    const WebVariant *retired = nullptr;
    for (const auto &entry : web_variants_) {
        const auto &variant = entry.second;
        if (variant.key != key) {
            continue;
        }
        if (variant.active) {
            return variant;
        }
        if (retired == nullptr || variant.id < retired->id) {
            retired = &variant;
        }
    }
    if (retired == nullptr) {
        return std::nullopt;
    }
    return *retired;
}

}  // namespace catalog
