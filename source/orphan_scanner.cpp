// orphan_scanner.cpp

#include <map>
#include <span>
#include <vector>

#include "log.hpp"
#include "orphan_scanner.hpp"

namespace fatxrec {

std::size_t OrphanScanner::scan() {
    m_orphans.clear();
    m_roots.clear();

    const uint32_t bytes_per_cluster = m_volume.bytes_per_cluster();
    const uint32_t last_cluster =
        m_volume.file_area_clusters() + FatxVolume::RESERVED_CLUSTERS;

    for (uint32_t cluster = FatxVolume::RESERVED_CLUSTERS;
         cluster < last_cluster; ++cluster) {
        if (cluster % 0x10000 == 0) {
            log::debug("Orphan scan at cluster " + std::to_string(cluster) +
                       " of " + std::to_string(last_cluster - 1));
        }

        m_volume.seek_to_cluster(cluster);
        const auto data = m_volume.read(bytes_per_cluster);
        const std::span<const uint8_t> bytes(data);
        const uint64_t cluster_offset =
            m_volume.cluster_to_physical_offset(cluster);

        for (std::size_t slot = 0;
             slot + DirectoryEntry::RECORD_SIZE <= bytes.size();
             slot += DirectoryEntry::RECORD_SIZE) {
            auto entry = DirectoryEntry::parse(
                bytes.subspan(slot, DirectoryEntry::RECORD_SIZE),
                m_volume.endian(), m_volume.timestamp_epoch());
            if (!entry) {
                continue;
            }
            entry->cluster = cluster;
            entry->offset = cluster_offset + slot;
            if (is_valid_orphan(*entry, m_volume.max_clusters(),
                                m_current_year)) {
                log::debug("Found orphan '" + entry->file_name + "' at " +
                           log::hex(entry->offset));
                m_orphans.push_back(std::move(*entry));
            }
        }
    }

    link();
    log::info("Found " + std::to_string(m_orphans.size()) +
              " orphaned entries in " + std::to_string(m_roots.size()) +
              " trees");
    return m_orphans.size();
}

void OrphanScanner::link() {
    m_by_cluster.clear();
    for (std::size_t i = 0; i < m_orphans.size(); ++i) {
        m_by_cluster[m_orphans[i].cluster].push_back(i);
    }

    std::vector<bool> claimed(m_orphans.size(), false);
    for (std::size_t i = 0; i < m_orphans.size(); ++i) {
        const auto &dir = m_orphans[i];
        if (!dir.is_directory()) {
            continue;
        }
        auto it = m_by_cluster.find(dir.first_cluster);
        if (it == m_by_cluster.end()) {
            continue;
        }
        for (std::size_t child : it->second) {
            if (child != i) {
                claimed[child] = true;
            }
        }
    }

    m_placed.assign(m_orphans.size(), false);
    for (std::size_t i = 0; i < m_orphans.size(); ++i) {
        if (!claimed[i] && !m_placed[i]) {
            m_roots.push_back(build_tree(i));
        }
    }

    // Directories that only claim each other form a cycle with no root.
    // Entries cut off at MAX_TREE_DEPTH are picked up here too.
    for (std::size_t i = 0; i < m_orphans.size(); ++i) {
        if (!m_placed[i]) {
            m_roots.push_back(build_tree(i));
        }
    }

    m_by_cluster.clear();
    m_placed.clear();
}

DirectoryEntry OrphanScanner::build_tree(std::size_t root) {
    struct Frame {
        std::size_t index;
        std::size_t depth;
        std::size_t next; // position in the candidate list
    };

    // Depth-first placement, claiming children in on-disk order.
    std::map<std::size_t, std::vector<std::size_t>> children;
    std::vector<std::size_t> preorder{root};
    std::vector<Frame> stack{{root, 0, 0}};
    m_placed[root] = true;

    while (!stack.empty()) {
        Frame &top = stack.back();
        const auto &entry = m_orphans[top.index];
        auto it = entry.is_directory() ? m_by_cluster.find(entry.first_cluster)
                                       : m_by_cluster.end();
        if (it == m_by_cluster.end() || top.depth + 1 >= MAX_TREE_DEPTH) {
            stack.pop_back();
            continue;
        }

        const auto &candidates = it->second;
        while (top.next < candidates.size() && m_placed[candidates[top.next]]) {
            top.next++;
        }
        if (top.next == candidates.size()) {
            stack.pop_back();
            continue;
        }

        const std::size_t child = candidates[top.next++];
        m_placed[child] = true;
        children[top.index].push_back(child);
        preorder.push_back(child);
        const std::size_t depth = top.depth + 1;
        stack.push_back({child, depth, 0}); // invalidates top
    }

    // Children always follow their parent in preorder, so building in
    // reverse finishes every subtree before its parent needs it.
    std::map<std::size_t, DirectoryEntry> built;
    for (auto i = preorder.rbegin(); i != preorder.rend(); ++i) {
        DirectoryEntry node = m_orphans[*i];
        auto kids = children.find(*i);
        if (kids != children.end()) {
            for (std::size_t child : kids->second) {
                auto done = built.find(child);
                node.children.push_back(std::move(done->second));
                built.erase(done);
            }
        }
        built.emplace(*i, std::move(node));
    }
    return std::move(built.at(root));
}

RecoveryStats OrphanScanner::recover_all(const std::filesystem::path &dir) {
    OrphanRecovery recovery(m_volume);

    for (const auto &root : m_roots) {
        const auto cluster_dir = dir / ("cluster" + std::to_string(root.cluster));
        std::error_code ec;
        std::filesystem::create_directories(cluster_dir, ec);
        if (ec) {
            log::error("Failed to create directory: " + cluster_dir.string() +
                       ": " + ec.message());
            continue;
        }
        recovery.recover(root, cluster_dir);
    }

    const auto &stats = recovery.stats();
    log::info("Recovered " + std::to_string(stats.files) + " files and " +
              std::to_string(stats.directories) + " directories (" +
              std::to_string(stats.failures) + " failures)");
    return stats;
}

} // namespace fatxrec
