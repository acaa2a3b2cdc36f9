#ifndef ACCESS_TRACE_FILE_TRANSPORT_HPP
#define ACCESS_TRACE_FILE_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace atrace {
    /// Appends one line per entry.
    /// @throws std::runtime_error if the file cannot be opened.
    class FileTransport : public ITransport {
    public:
        explicit FileTransport(const std::string &filename) : m_filename(filename) {
            m_file.open(filename, std::ios::app);
            if (!m_file.is_open()) {
                throw std::runtime_error("FileTransport: cannot open " + filename);
            }
        }

        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_file << formattedEntry << '\n';
            m_file.flush();
        }

        const std::string &filename() const { return m_filename; }

    private:
        std::string m_filename;
        std::ofstream m_file;
        std::mutex m_mutex;
    };
} // namespace atrace

#endif // ACCESS_TRACE_FILE_TRANSPORT_HPP
