// signature_scanner.hpp

#ifndef SIGNATURE_SCANNER_H_
#define SIGNATURE_SCANNER_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "signature.hpp"
#include "signature_registry.hpp"
#include "volume.hpp"

namespace fatxrec {

//! Searches the file area for registered signatures at fixed intervals.
class SignatureScanner {
  public:
    static constexpr uint64_t DEFAULT_INTERVAL = 0x200;

    SignatureScanner(FatxVolume &volume, const SignatureRegistry &registry)
        : m_volume(volume), m_registry(registry) {}

    //! Restricts the scan to the named signatures.  An empty set means all.
    void set_filter(std::set<std::string> names) { m_filter = std::move(names); }

    //! Tries every registered signature at each multiple of \p interval in
    //! [0, length).  A \p length of 0 scans the whole file area.
    //! Returns the number of matches.
    std::size_t scan(uint64_t interval = DEFAULT_INTERVAL, uint64_t length = 0);

    const std::vector<std::unique_ptr<Signature>> &results() const {
        return m_results;
    }

    //! Dumps every match into \p dir / <type name>.  Returns the number of
    //! files written.
    std::size_t recover_all(const std::filesystem::path &dir);

  private:
    bool selected(const std::string &name) const {
        return m_filter.empty() || m_filter.count(name) != 0;
    }

    FatxVolume &m_volume;
    const SignatureRegistry &m_registry;
    std::set<std::string> m_filter;
    std::vector<std::unique_ptr<Signature>> m_results;
    SignatureNamer m_namer;
};

} // namespace fatxrec

#endif // SIGNATURE_SCANNER_H_
