#ifndef FATX_RECOVER_CONFIG_H_
#define FATX_RECOVER_CONFIG_H_

#include <cstdint>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

namespace fatxrec {

class RecoverConfig {
  public:
    //! \p known_signatures are the values --signature accepts.
    explicit RecoverConfig(const std::vector<std::string> &known_signatures);

    //! Can throw CLI::ParseError, or std::runtime_error for option
    //! combinations that make no sense.
    void parse(int argc, char *argv[]);

    //! Prints help or a parse error; returns the exit code.
    int exit(const CLI::ParseError &e) { return m_app.exit(e); }

    const std::string &image() const { return m_image; }
    uint64_t offset() const { return m_offset; }
    uint64_t length() const { return m_length; }
    const std::string &output() const { return m_output; }
    bool orphans() const { return m_orphans; }
    bool carve() const { return m_carve; }
    uint64_t interval() const { return m_interval; }
    const std::vector<std::string> &signatures() const { return m_signatures; }
    bool list_signatures() const { return m_list_signatures; }
    bool verbose() const { return m_verbose; }

  private:
    CLI::App m_app;
    std::string m_image;
    uint64_t m_offset;
    uint64_t m_length;
    std::string m_output;
    bool m_orphans;
    bool m_carve;
    uint64_t m_interval;
    std::vector<std::string> m_signatures;
    bool m_list_signatures;
    bool m_verbose;
};

} // namespace fatxrec

#endif // FATX_RECOVER_CONFIG_H_
