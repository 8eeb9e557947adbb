// signature_scanner.cpp

#include <stdexcept>

#include "log.hpp"
#include "signature_scanner.hpp"

namespace fatxrec {

std::size_t SignatureScanner::scan(uint64_t interval, uint64_t length) {
    if (interval == 0) {
        throw std::invalid_argument("Scan interval must be nonzero");
    }

    const uint64_t area = m_volume.file_area_length();
    if (length == 0 || length > area) {
        length = area;
    }

    m_results.clear();

    for (uint64_t offset = 0; offset < length; offset += interval) {
        if (offset % 0x10000000 == 0) {
            log::debug("Signature scan at " + log::hex(offset) + " of " +
                       log::hex(length));
        }

        for (const auto &entry : m_registry.entries()) {
            if (!selected(entry.name)) {
                continue;
            }

            auto signature = entry.factory(offset, m_volume);
            if (!signature) {
                throw std::logic_error("Factory for " + entry.name +
                                       " returned no signature");
            }
            signature->seek(0);
            try {
                if (!signature->test()) {
                    continue;
                }
            } catch (const ReadError &) {
                // truncated candidate at the end of the image
                continue;
            }

            signature->seek(0);
            try {
                signature->parse();
            } catch (const ReadError &e) {
                log::debug(std::string(e.what()) + "; not extracting");
                signature->set_length(0);
            }

            log::info("Found " + signature->to_string());
            m_results.push_back(std::move(signature));
        }
    }

    log::info("Found " + std::to_string(m_results.size()) + " signatures");
    return m_results.size();
}

std::size_t SignatureScanner::recover_all(const std::filesystem::path &dir) {
    std::size_t written = 0;
    for (const auto &signature : m_results) {
        const auto type_dir = dir / signature->type_name();
        std::error_code ec;
        std::filesystem::create_directories(type_dir, ec);
        if (ec) {
            log::error("Failed to create directory: " + type_dir.string() +
                       ": " + ec.message());
            continue;
        }
        if (signature->recover(type_dir, m_namer)) {
            written++;
        }
    }
    return written;
}

} // namespace fatxrec
