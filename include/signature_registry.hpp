// signature_registry.hpp

#ifndef SIGNATURE_REGISTRY_H_
#define SIGNATURE_REGISTRY_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "signature.hpp"
#include "volume.hpp"

namespace fatxrec {

//! The set of signatures a carving scan tries at every offset.
class SignatureRegistry {
  public:
    using Factory =
        std::function<std::unique_ptr<Signature>(uint64_t, FatxVolume &)>;

    struct Entry {
        std::string name;
        Factory factory;
    };

    //! Registers a factory under \p name.
    //! Throws std::invalid_argument for an empty factory or a name that is
    //! already registered.
    void add(std::string name, Factory factory);

    //! Registers a concrete signature type under T::TYPE_NAME.
    template <typename T> void add() {
        add(std::string(T::TYPE_NAME), [](uint64_t offset, FatxVolume &volume) {
            return std::make_unique<T>(offset, volume);
        });
    }

    bool contains(const std::string &name) const;

    //! Entries in registration order.
    const std::vector<Entry> &entries() const { return m_entries; }
    std::size_t size() const { return m_entries.size(); }

    std::vector<std::string> names() const;

  private:
    std::vector<Entry> m_entries;
};

//! Adds every signature that ships with fatx-recover.
void register_builtin_signatures(SignatureRegistry &registry);

} // namespace fatxrec

#endif // SIGNATURE_REGISTRY_H_
