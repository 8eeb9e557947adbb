// orphan_scanner.hpp

#ifndef ORPHAN_SCANNER_H_
#define ORPHAN_SCANNER_H_

#include <cstdint>
#include <filesystem>
#include <map>
#include <vector>

#include "dirent.hpp"
#include "orphan.hpp"
#include "volume.hpp"

namespace fatxrec {

//! Finds directory entries by reading every 64-byte slot of the file area,
//! ignoring the directory tree and the FAT.
class OrphanScanner {
  public:
    //! Deepest directory nesting kept in one tree.  Entries further down
    //! start new root trees.
    static constexpr std::size_t MAX_TREE_DEPTH = 256;

    explicit OrphanScanner(FatxVolume &volume)
        : OrphanScanner(volume, current_year()) {}
    OrphanScanner(FatxVolume &volume, int current_year)
        : m_volume(volume), m_current_year(current_year) {}

    //! Scans the file area and links directories to their children.
    //! Returns the number of plausible entries found.
    std::size_t scan();

    //! Plausible entries in on-disk order, without children.
    const std::vector<DirectoryEntry> &orphans() const { return m_orphans; }

    //! Entries that no directory claims, with their subtrees.
    const std::vector<DirectoryEntry> &roots() const { return m_roots; }

    //! Recovers each root into \p dir / cluster<N>.
    RecoveryStats recover_all(const std::filesystem::path &dir);

  private:
    void link();
    DirectoryEntry build_tree(std::size_t root);

    FatxVolume &m_volume;
    int m_current_year;
    std::vector<DirectoryEntry> m_orphans;
    std::vector<DirectoryEntry> m_roots;

    // scratch state for link()
    std::map<uint32_t, std::vector<std::size_t>> m_by_cluster;
    std::vector<bool> m_placed;
};

} // namespace fatxrec

#endif // ORPHAN_SCANNER_H_
