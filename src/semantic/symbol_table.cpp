#include "expanse/semantic/symbol_table.h"

namespace expanse {
namespace semantic {

bool SymbolTable::supportsOverloading(SymbolKind kind) {
    return kind == SymbolKind::Function;
}

bool SymbolTable::insert(std::unique_ptr<Symbol> symbol) {
    if (!symbol) {
        return false;
    }

    const std::string& name = symbol->getName();
    SymbolKind kind = symbol->getKind();

    auto it = symbols_.find(name);
    if (it != symbols_.end()) {
        // Overloads may only join other overloads
        if (supportsOverloading(kind) && it->second.front()->getKind() == kind) {
            it->second.push_back(std::move(symbol));
            return true;
        }
        return false;
    }

    symbols_[name].push_back(std::move(symbol));
    return true;
}

Symbol* SymbolTable::lookup(const std::string& name) const {
    auto it = symbols_.find(name);
    if (it != symbols_.end() && !it->second.empty()) {
        return it->second[0].get();
    }
    return nullptr;
}

std::vector<Symbol*> SymbolTable::lookupAll(const std::string& name) const {
    std::vector<Symbol*> results;
    auto it = symbols_.find(name);
    if (it != symbols_.end()) {
        for (const auto& symbol : it->second) {
            results.push_back(symbol.get());
        }
    }
    return results;
}

std::vector<FunctionSymbol*> SymbolTable::lookupOverloadSet(const std::string& name,
                                                            const model::ModuleId& module) const {
    std::vector<FunctionSymbol*> results;
    for (Symbol* symbol : lookupAll(name)) {
        if (symbol->getKind() != SymbolKind::Function) {
            continue;
        }
        auto* function = static_cast<FunctionSymbol*>(symbol);
        if (function->getModule() == module) {
            results.push_back(function);
        }
    }
    return results;
}

bool SymbolTable::contains(const std::string& name) const {
    auto it = symbols_.find(name);
    return it != symbols_.end() && !it->second.empty();
}

} // namespace semantic
} // namespace expanse
