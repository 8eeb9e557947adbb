#include <bit>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>

#include "fatx-recover-config.hpp"
#include "log.hpp"
#include "orphan_scanner.hpp"
#include "signature_registry.hpp"
#include "signature_scanner.hpp"
#include "volume.hpp"

using namespace fatxrec;

int main(int argc, char *argv[]) {

    SignatureRegistry registry;
    register_builtin_signatures(registry);

    RecoverConfig conf(registry.names());
    try {
        conf.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        // --help exits 0; every usage error exits 1
        return conf.exit(e) == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception &e) {
        std::cerr << argv[0] << ": " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    log::set_level(conf.verbose() ? log::Level::debug : log::Level::info);

    if (conf.list_signatures()) {
        for (const auto &name : registry.names()) {
            std::cout << name << "\n";
        }
        return 0;
    }

    std::unique_ptr<FatxVolume> volume;
    try {
        volume = FatxVolume::open(conf.image(), conf.offset(), conf.length());
    } catch (const std::exception &e) {
        std::cerr << argv[0] << ": " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    if (conf.verbose()) {
        std::cout << "Image file:\t" << conf.image() << "\n"
                  << "Partition:\t" << log::hex(volume->offset()) << " + "
                  << log::hex(volume->length()) << "\n"
                  << "Byte order:\t"
                  << (volume->endian() == std::endian::little ? "little"
                                                              : "big")
                  << "\n"
                  << "Cluster size:\t" << volume->bytes_per_cluster() << "\n"
                  << "Max clusters:\t" << volume->max_clusters() << "\n"
                  << "File area:\t" << log::hex(volume->file_area_byte_offset())
                  << std::endl;
    }

    const std::filesystem::path output(conf.output());

    try {
        if (conf.orphans()) {
            OrphanScanner scanner(*volume);
            scanner.scan();
            scanner.recover_all(output / "orphans");
        }

        if (conf.carve()) {
            SignatureScanner scanner(*volume, registry);
            scanner.set_filter(std::set<std::string>(
                conf.signatures().begin(), conf.signatures().end()));
            scanner.scan(conf.interval());
            const auto written = scanner.recover_all(output / "carved");
            log::info("Carved " + std::to_string(written) + " files");
        }
    } catch (const std::exception &e) {
        std::cerr << argv[0] << ": " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return 0;
}
