#include <stdexcept>

#include "fatx-recover-config.hpp"
#include "signature_scanner.hpp"

fatxrec::RecoverConfig::RecoverConfig(
    const std::vector<std::string> &known_signatures)
    : m_app{"Recover orphaned files and carve known formats from a FATX "
            "volume image"} {
    m_offset = 0;
    m_length = 0;
    m_orphans = false;
    m_carve = false;
    m_interval = SignatureScanner::DEFAULT_INTERVAL;
    m_list_signatures = false;
    m_verbose = false;

    m_app.add_option("-i,--image", m_image, "Disk or partition image")
        ->check(CLI::ExistingFile);
    m_app.add_option("--offset", m_offset,
                     "Byte offset of the FATX partition in the image");
    m_app.add_option("--length", m_length,
                     "Byte length of the partition (0: to end of image)");
    m_app.add_option("-o,--output", m_output, "Directory for recovered files");
    m_app.add_flag("--orphans", m_orphans,
                   "Recover directory entries found by raw scanning");
    m_app.add_flag("--carve", m_carve, "Carve files by signature");
    m_app.add_option("--interval", m_interval,
                     "Carving step in bytes")
        ->default_str("0x200")
        ->check(CLI::PositiveNumber);
    m_app.add_option("--signature", m_signatures,
                     "Only carve with this signature (repeatable)")
        ->check(CLI::IsMember(known_signatures));
    m_app.add_flag("--list-signatures", m_list_signatures,
                   "Print the available signatures and exit");
    m_app.add_flag("-v,--verbose", m_verbose, "Print verbose output");
}

void fatxrec::RecoverConfig::parse(int argc, char *argv[]) {
    // can throw CLI::ParseError
    m_app.parse(argc, argv);

    if (m_list_signatures) {
        return;
    }
    if (m_image.empty()) {
        throw std::runtime_error("--image is required");
    }
    if (m_output.empty()) {
        throw std::runtime_error("--output is required");
    }
    if (!m_orphans && !m_carve) {
        throw std::runtime_error(
            "You must specify a recovery mode via --orphans, --carve, or both.");
    }
}
