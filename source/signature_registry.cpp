// signature_registry.cpp

#include <algorithm>
#include <stdexcept>

#include "signature_registry.hpp"
#include "signatures.hpp"

namespace fatxrec {

void SignatureRegistry::add(std::string name, Factory factory) {
    if (!factory) {
        throw std::invalid_argument("Signature '" + name + "' has no factory");
    }
    if (name.empty()) {
        throw std::invalid_argument("Signature name must not be empty");
    }
    if (contains(name)) {
        throw std::invalid_argument("Signature '" + name +
                                    "' is already registered");
    }
    m_entries.push_back(Entry{std::move(name), std::move(factory)});
}

bool SignatureRegistry::contains(const std::string &name) const {
    return std::any_of(m_entries.begin(), m_entries.end(),
                       [&](const Entry &e) { return e.name == name; });
}

std::vector<std::string> SignatureRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto &e : m_entries) {
        result.push_back(e.name);
    }
    return result;
}

void register_builtin_signatures(SignatureRegistry &registry) {
    registry.add<XbeSignature>();
    registry.add<XexSignature>();
    registry.add<PdbSignature>();
    registry.add<PngSignature>();
    registry.add<GzipSignature>();
}

} // namespace fatxrec
